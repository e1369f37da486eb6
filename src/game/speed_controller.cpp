// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "speed_controller.h"

#include <algorithm>
#include <stdexcept>

namespace pixsnake {

SpeedController::SpeedController(const SpeedConfig& cfg) : cfg_(cfg) {
    if (cfg_.increase_interval <= 0) {
        throw std::invalid_argument("speed increase interval must be positive");
    }
}

int SpeedController::tick_rate(int score) const {
    int steps = std::max(score, 0) / cfg_.increase_interval;
    return std::min(cfg_.initial_tick_rate + steps * cfg_.increase_amount, cfg_.max_tick_rate);
}

} // namespace pixsnake
