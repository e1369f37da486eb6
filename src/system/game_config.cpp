// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "game_config.h"

#include "config.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

namespace pixsnake {

namespace {

/// Replace value with def if it is below min_value
template <typename T> int clamp_min(T& value, T min_value, T def, const char* name) {
    if (value < min_value) {
        spdlog::warn("[GameConfig] {} = {} is below {}, using {}", name, value, min_value, def);
        value = def;
        return 1;
    }
    return 0;
}

} // namespace

GameConfig load_game_config(Config& config) {
    GameConfig cfg;
    const GameConfig def;

    cfg.grid.grid_width = config.get_or("/game/grid/grid_width", def.grid.grid_width);
    cfg.grid.grid_height = config.get_or("/game/grid/grid_height", def.grid.grid_height);
    cfg.grid.wall_start_x = config.get_or("/game/grid/wall_start_x", def.grid.wall_start_x);
    cfg.grid.wall_start_y = config.get_or("/game/grid/wall_start_y", def.grid.wall_start_y);
    cfg.grid.wall_thickness = config.get_or("/game/grid/wall_thickness", def.grid.wall_thickness);
    cfg.grid.playable_width = config.get_or("/game/grid/playable_width", def.grid.playable_width);
    cfg.grid.playable_height =
        config.get_or("/game/grid/playable_height", def.grid.playable_height);
    cfg.grid.cell_size = config.get_or("/game/grid/cell_size", def.grid.cell_size);

    cfg.snake.initial_length =
        config.get_or("/game/snake/initial_length", def.snake.initial_length);
    cfg.snake.start.x = config.get_or("/game/snake/start_x", def.snake.start.x);
    cfg.snake.start.y = config.get_or("/game/snake/start_y", def.snake.start.y);

    cfg.speed.initial_tick_rate =
        config.get_or("/game/speed/initial_tick_rate", def.speed.initial_tick_rate);
    cfg.speed.max_tick_rate = config.get_or("/game/speed/max_tick_rate", def.speed.max_tick_rate);
    cfg.speed.increase_interval =
        config.get_or("/game/speed/increase_interval", def.speed.increase_interval);
    cfg.speed.increase_amount =
        config.get_or("/game/speed/increase_amount", def.speed.increase_amount);

    cfg.food.normal_value = config.get_or("/game/food/normal_value", def.food.normal_value);
    cfg.food.bonus_value = config.get_or("/game/food/bonus_value", def.food.bonus_value);
    cfg.food.bonus_spawn_chance =
        config.get_or("/game/food/bonus_spawn_chance", def.food.bonus_spawn_chance);
    cfg.food.bonus_lifetime_sec =
        config.get_or("/game/food/bonus_lifetime_sec", def.food.bonus_lifetime_sec);
    cfg.food.normal_growth = config.get_or("/game/food/normal_growth", def.food.normal_growth);
    cfg.food.bonus_growth = config.get_or("/game/food/bonus_growth", def.food.bonus_growth);
    cfg.food.max_spawn_attempts =
        config.get_or("/game/food/max_spawn_attempts", def.food.max_spawn_attempts);
    cfg.food.fallback.x = config.get_or("/game/food/fallback_x", def.food.fallback.x);
    cfg.food.fallback.y = config.get_or("/game/food/fallback_y", def.food.fallback.y);

    cfg.rng_seed = config.get_or<uint32_t>("/game/rng_seed", def.rng_seed);

    int fixed = validate_game_config(cfg);
    spdlog::debug("[GameConfig] Loaded: playable {}x{}, speed {}..{} tps, {} field(s) corrected",
                  cfg.grid.playable_width, cfg.grid.playable_height, cfg.speed.initial_tick_rate,
                  cfg.speed.max_tick_rate, fixed);
    return cfg;
}

int validate_game_config(GameConfig& cfg) {
    const GameConfig def;
    int fixed = 0;

    fixed += clamp_min(cfg.grid.playable_width, 1, def.grid.playable_width, "playable_width");
    fixed += clamp_min(cfg.grid.playable_height, 1, def.grid.playable_height, "playable_height");
    fixed += clamp_min(cfg.grid.wall_thickness, 0, def.grid.wall_thickness, "wall_thickness");
    fixed += clamp_min(cfg.grid.wall_start_x, 0, def.grid.wall_start_x, "wall_start_x");
    fixed += clamp_min(cfg.grid.wall_start_y, 0, def.grid.wall_start_y, "wall_start_y");
    fixed += clamp_min(cfg.grid.cell_size, 1, def.grid.cell_size, "cell_size");

    // Wall and playable area must lie inside the drawn board
    int min_width = cfg.grid.wall_start_x + 2 * cfg.grid.wall_thickness + cfg.grid.playable_width;
    int min_height =
        cfg.grid.wall_start_y + 2 * cfg.grid.wall_thickness + cfg.grid.playable_height;
    if (cfg.grid.grid_width < min_width) {
        spdlog::warn("[GameConfig] grid_width {} too small for the wall, using {}",
                     cfg.grid.grid_width, min_width);
        cfg.grid.grid_width = min_width;
        fixed++;
    }
    if (cfg.grid.grid_height < min_height) {
        spdlog::warn("[GameConfig] grid_height {} too small for the wall, using {}",
                     cfg.grid.grid_height, min_height);
        cfg.grid.grid_height = min_height;
        fixed++;
    }

    fixed += clamp_min(cfg.snake.initial_length, 1, def.snake.initial_length, "initial_length");

    fixed += clamp_min(cfg.speed.initial_tick_rate, 1, def.speed.initial_tick_rate,
                       "initial_tick_rate");
    fixed += clamp_min(cfg.speed.increase_interval, 1, def.speed.increase_interval,
                       "increase_interval");
    fixed += clamp_min(cfg.speed.increase_amount, 0, def.speed.increase_amount, "increase_amount");
    if (cfg.speed.max_tick_rate < cfg.speed.initial_tick_rate) {
        spdlog::warn("[GameConfig] max_tick_rate {} is below initial_tick_rate {}, raising it",
                     cfg.speed.max_tick_rate, cfg.speed.initial_tick_rate);
        cfg.speed.max_tick_rate = cfg.speed.initial_tick_rate;
        fixed++;
    }

    fixed += clamp_min(cfg.food.normal_value, 0, def.food.normal_value, "normal_value");
    fixed += clamp_min(cfg.food.bonus_value, 0, def.food.bonus_value, "bonus_value");
    fixed += clamp_min(cfg.food.bonus_lifetime_sec, 1, def.food.bonus_lifetime_sec,
                       "bonus_lifetime_sec");
    fixed += clamp_min(cfg.food.normal_growth, 0, def.food.normal_growth, "normal_growth");
    fixed += clamp_min(cfg.food.bonus_growth, 0, def.food.bonus_growth, "bonus_growth");
    fixed += clamp_min(cfg.food.max_spawn_attempts, 0, def.food.max_spawn_attempts,
                       "max_spawn_attempts");
    if (cfg.food.bonus_spawn_chance < 0.0 || cfg.food.bonus_spawn_chance > 1.0) {
        spdlog::warn("[GameConfig] bonus_spawn_chance {} outside [0,1], using {}",
                     cfg.food.bonus_spawn_chance, def.food.bonus_spawn_chance);
        cfg.food.bonus_spawn_chance = def.food.bonus_spawn_chance;
        fixed++;
    }

    // The whole initial body must fit inside the wall
    GridModel grid = GridModel::from_config(cfg.grid);
    if (cfg.snake.initial_length > grid.playable_width()) {
        spdlog::warn("[GameConfig] initial_length {} wider than the board, using {}",
                     cfg.snake.initial_length, grid.playable_width());
        cfg.snake.initial_length = grid.playable_width();
        fixed++;
    }
    Position tail{cfg.snake.start.x - (cfg.snake.initial_length - 1), cfg.snake.start.y};
    if (!grid.contains(cfg.snake.start) || !grid.contains(tail)) {
        Position origin = grid.playable_origin();
        Position centred{origin.x + (grid.playable_width() + cfg.snake.initial_length) / 2 - 1,
                         origin.y + grid.playable_height() / 2};
        spdlog::warn("[GameConfig] Snake start ({},{}) does not fit in {}, using ({},{})",
                     cfg.snake.start.x, cfg.snake.start.y, grid.describe(), centred.x, centred.y);
        cfg.snake.start = centred;
        fixed++;
    }

    // Full-board food fallback must still be a playable cell
    if (!grid.contains(cfg.food.fallback)) {
        Position origin = grid.playable_origin();
        Position clamped{
            std::min(std::max(cfg.food.fallback.x, origin.x), origin.x + grid.playable_width() - 1),
            std::min(std::max(cfg.food.fallback.y, origin.y),
                     origin.y + grid.playable_height() - 1)};
        spdlog::warn("[GameConfig] Food fallback ({},{}) outside {}, using ({},{})",
                     cfg.food.fallback.x, cfg.food.fallback.y, grid.describe(), clamped.x,
                     clamped.y);
        cfg.food.fallback = clamped;
        fixed++;
    }

    return fixed;
}

} // namespace pixsnake
