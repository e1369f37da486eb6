// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

namespace pixsnake {

struct SpeedConfig {
    int initial_tick_rate = 4; ///< Ticks per second at score 0
    int max_tick_rate = 15;
    int increase_interval = 30; ///< Points per speed step
    int increase_amount = 1;    ///< Ticks per second added per step
};

/**
 * @class SpeedController
 * @brief Maps cumulative score to a target tick rate
 *
 * rate = min(initial + (score / interval) * amount, max)
 *
 * Stateless: the rate is re-derived from the score every time, so it can
 * never drift from it.
 */
class SpeedController {
  public:
    /// @throws std::invalid_argument if increase_interval is not positive
    explicit SpeedController(const SpeedConfig& cfg);

    int tick_rate(int score) const;

    int initial_tick_rate() const {
        return cfg_.initial_tick_rate;
    }
    int max_tick_rate() const {
        return cfg_.max_tick_rate;
    }

  private:
    SpeedConfig cfg_;
};

} // namespace pixsnake
