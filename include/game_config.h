// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file game_config.h
 * @brief Explicit game configuration handed to GameSession at construction
 *
 * Replaces screen-size-derived module constants: every tunable that the
 * simulation reads lives here and is passed down, never looked up.
 */

#pragma once

#include "food.h"
#include "grid_model.h"
#include "snake.h"
#include "speed_controller.h"

#include <cstdint>

namespace pixsnake {

class Config;

struct GameConfig {
    GridConfig grid;
    SnakeConfig snake;
    SpeedConfig speed;
    FoodConfig food;
    uint32_t rng_seed = 0; ///< 0 = seed from std::random_device
};

/**
 * @brief Read the /game section of the configuration
 *
 * Missing keys take the built-in defaults. Values of the wrong type or
 * out of range are replaced by the default with a warning. An initial
 * snake that would not fit inside the playable area is re-centred, and a
 * food fallback cell outside it is clamped onto the nearest playable cell.
 */
GameConfig load_game_config(Config& config);

/**
 * @brief Clamp/repair a config in place
 *
 * Also grows grid_width/grid_height to hold the wall and playable area.
 * @return Number of fields that had to be corrected
 */
int validate_game_config(GameConfig& cfg);

} // namespace pixsnake
