// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file high_score_store.h
 * @brief Best-effort persistence of the single high-score value
 *
 * Neither operation reports failure to the caller: a store that cannot
 * read yields 0, a store that cannot write logs and carries on.
 */

#pragma once

namespace pixsnake {

class Config;

class HighScoreStore {
  public:
    virtual ~HighScoreStore() = default;

    /// Stored high score, 0 on any failure
    virtual int load() = 0;

    /// Persist a new high score; failures are logged, not thrown
    virtual void save(int score) = 0;
};

/// Keeps the value for the lifetime of the process only
class MemoryHighScoreStore : public HighScoreStore {
  public:
    explicit MemoryHighScoreStore(int initial = 0) : score_(initial) {}

    int load() override {
        return score_;
    }
    void save(int score) override {
        score_ = score;
    }

  private:
    int score_;
};

/**
 * @class ConfigHighScoreStore
 * @brief Stores the high score under a key of the JSON configuration file
 *
 * The config must outlive the store.
 */
class ConfigHighScoreStore : public HighScoreStore {
  public:
    static constexpr const char* HIGH_SCORE_KEY = "/high_score";

    explicit ConfigHighScoreStore(Config& config) : config_(config) {}

    int load() override;
    void save(int score) override;

  private:
    Config& config_;
};

} // namespace pixsnake
