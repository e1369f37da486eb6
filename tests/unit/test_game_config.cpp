// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "game_config.h"

#include "test_helpers/temp_config.h"

#include <catch2/catch_test_macros.hpp>

using namespace pixsnake;

// ============================================================================
// load_game_config()
// ============================================================================

TEST_CASE("GameConfig: default file yields built-in defaults", "[game_config]") {
    TempConfig tmp;
    GameConfig cfg = load_game_config(tmp.load());
    const GameConfig def;

    REQUIRE(cfg.grid.playable_width == def.grid.playable_width);
    REQUIRE(cfg.grid.wall_start_x == def.grid.wall_start_x);
    REQUIRE(cfg.snake.initial_length == def.snake.initial_length);
    REQUIRE(cfg.snake.start == def.snake.start);
    REQUIRE(cfg.speed.initial_tick_rate == def.speed.initial_tick_rate);
    REQUIRE(cfg.speed.max_tick_rate == def.speed.max_tick_rate);
    REQUIRE(cfg.food.bonus_value == def.food.bonus_value);
    REQUIRE(cfg.food.bonus_spawn_chance == def.food.bonus_spawn_chance);
    REQUIRE(cfg.food.fallback == def.food.fallback);
    REQUIRE(cfg.rng_seed == 0);
}

TEST_CASE("GameConfig: file values override defaults", "[game_config]") {
    TempConfig tmp;
    tmp.write(R"({
        "game": {
            "speed": {"initial_tick_rate": 6, "max_tick_rate": 20},
            "food": {"bonus_spawn_chance": 0.5, "fallback_x": 7, "fallback_y": 8},
            "snake": {"initial_length": 5},
            "rng_seed": 77
        }
    })");

    GameConfig cfg = load_game_config(tmp.load());

    REQUIRE(cfg.speed.initial_tick_rate == 6);
    REQUIRE(cfg.speed.max_tick_rate == 20);
    REQUIRE(cfg.food.bonus_spawn_chance == 0.5);
    REQUIRE(cfg.food.fallback == Position{7, 8});
    REQUIRE(cfg.snake.initial_length == 5);
    REQUIRE(cfg.rng_seed == 77);
    // Untouched keys keep defaults
    REQUIRE(cfg.speed.increase_interval == 30);
}

TEST_CASE("GameConfig: wrong types fall back to defaults", "[game_config]") {
    TempConfig tmp;
    tmp.write(R"({"game": {"speed": {"initial_tick_rate": "fast"}, "grid": {"cell_size": [1]}}})");

    GameConfig cfg = load_game_config(tmp.load());

    REQUIRE(cfg.speed.initial_tick_rate == 4);
    REQUIRE(cfg.grid.cell_size == 32);
}

TEST_CASE("GameConfig: snake that does not fit is re-centred on load", "[game_config]") {
    TempConfig tmp;
    tmp.write(R"({"game": {"grid": {"wall_start_x": 0, "wall_start_y": 0,
                                     "playable_width": 10, "playable_height": 5}}})");

    GameConfig cfg = load_game_config(tmp.load());

    REQUIRE(cfg.snake.start == Position{6, 3});
    GridModel grid = GridModel::from_config(cfg.grid);
    REQUIRE(grid.contains(cfg.snake.start));
    REQUIRE(grid.contains({cfg.snake.start.x - cfg.snake.initial_length + 1, 3}));
}

// ============================================================================
// validate_game_config()
// ============================================================================

TEST_CASE("GameConfig: defaults need no correction", "[game_config][validate]") {
    GameConfig cfg;
    REQUIRE(validate_game_config(cfg) == 0);
}

TEST_CASE("GameConfig: out-of-range values are repaired", "[game_config][validate]") {
    GameConfig cfg;
    cfg.speed.max_tick_rate = 2;
    cfg.speed.increase_interval = 0;
    cfg.food.bonus_spawn_chance = 1.5;

    REQUIRE(validate_game_config(cfg) == 3);
    REQUIRE(cfg.speed.max_tick_rate == cfg.speed.initial_tick_rate);
    REQUIRE(cfg.speed.increase_interval == 30);
    REQUIRE(cfg.food.bonus_spawn_chance == 0.15);
}

TEST_CASE("GameConfig: initial length is limited to the board width", "[game_config][validate]") {
    GameConfig cfg;
    cfg.grid.playable_width = 5;
    cfg.snake.initial_length = 8;

    REQUIRE(validate_game_config(cfg) == 2);
    REQUIRE(cfg.snake.initial_length == 5);

    GridModel grid = GridModel::from_config(cfg.grid);
    REQUIRE(grid.contains(cfg.snake.start));
    REQUIRE(grid.contains({cfg.snake.start.x - 4, cfg.snake.start.y}));
}

TEST_CASE("GameConfig: zero-length snake is restored", "[game_config][validate]") {
    GameConfig cfg;
    cfg.snake.initial_length = 0;

    REQUIRE(validate_game_config(cfg) == 1);
    REQUIRE(cfg.snake.initial_length == 3);
}

TEST_CASE("GameConfig: board too small for the wall is enlarged", "[game_config][validate]") {
    GameConfig cfg;
    cfg.grid.grid_width = 20;
    cfg.grid.grid_height = 10;

    REQUIRE(validate_game_config(cfg) == 2);
    // wall_start + two wall cells + playable area
    REQUIRE(cfg.grid.grid_width == 4 + 2 + 30);
    REQUIRE(cfg.grid.grid_height == 3 + 2 + 15);

    GridModel grid = GridModel::from_config(cfg.grid);
    Position last{grid.playable_origin().x + grid.playable_width() - 1 + grid.wall_thickness(),
                  grid.playable_origin().y + grid.playable_height() - 1 + grid.wall_thickness()};
    REQUIRE(last.x < grid.grid_width());
    REQUIRE(last.y < grid.grid_height());
}

TEST_CASE("GameConfig: negative wall start is restored", "[game_config][validate]") {
    GameConfig cfg;
    cfg.grid.wall_start_x = -2;

    REQUIRE(validate_game_config(cfg) == 1);
    REQUIRE(cfg.grid.wall_start_x == 4);
}

TEST_CASE("GameConfig: food fallback is moved inside a small board", "[game_config][validate]") {
    GameConfig cfg;
    cfg.grid.grid_width = 7;
    cfg.grid.grid_height = 3;
    cfg.grid.wall_start_x = 0;
    cfg.grid.wall_start_y = 0;
    cfg.grid.playable_width = 5;
    cfg.grid.playable_height = 1;
    cfg.snake.initial_length = 4;
    cfg.snake.start = {4, 1};

    // Default (5,5) is below the single playable row
    REQUIRE(validate_game_config(cfg) == 1);
    REQUIRE(cfg.food.fallback == Position{5, 1});
    REQUIRE(GridModel::from_config(cfg.grid).contains(cfg.food.fallback));
}

TEST_CASE("GameConfig: food fallback outside the wall is repaired on load", "[game_config]") {
    TempConfig tmp;
    tmp.write(R"({"game": {"food": {"fallback_x": 0, "fallback_y": 99}}})");

    GameConfig cfg = load_game_config(tmp.load());

    // Playable area spans (5,4)..(34,18) by default
    REQUIRE(cfg.food.fallback == Position{5, 18});
}
