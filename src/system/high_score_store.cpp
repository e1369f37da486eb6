// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "high_score_store.h"

#include "config.h"

#include <spdlog/spdlog.h>

namespace pixsnake {

int ConfigHighScoreStore::load() {
    try {
        int score = config_.get<int>(HIGH_SCORE_KEY, 0);
        if (score < 0) {
            spdlog::warn("[HighScore] Ignoring negative stored high score {}", score);
            return 0;
        }
        spdlog::debug("[HighScore] Loaded high score: {}", score);
        return score;
    } catch (const json::exception& e) {
        spdlog::warn("[HighScore] Could not read high score: {}", e.what());
        return 0;
    }
}

void ConfigHighScoreStore::save(int score) {
    config_.set<int>(HIGH_SCORE_KEY, score);
    if (config_.save()) {
        spdlog::info("[HighScore] Saved new high score: {}", score);
    } else {
        spdlog::warn("[HighScore] Could not persist high score {}", score);
    }
}

} // namespace pixsnake
