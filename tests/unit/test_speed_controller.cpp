// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "speed_controller.h"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>

using namespace pixsnake;

TEST_CASE("SpeedController: steps every interval", "[speed]") {
    SpeedController speed(SpeedConfig{});

    REQUIRE(speed.tick_rate(0) == 4);
    REQUIRE(speed.tick_rate(29) == 4);
    REQUIRE(speed.tick_rate(30) == 5);
    REQUIRE(speed.tick_rate(59) == 5);
    REQUIRE(speed.tick_rate(60) == 6);
}

TEST_CASE("SpeedController: clamps at max", "[speed]") {
    SpeedController speed(SpeedConfig{});

    REQUIRE(speed.tick_rate(330) == 15);
    REQUIRE(speed.tick_rate(450) == 15);
    REQUIRE(speed.tick_rate(100000) == 15);
}

TEST_CASE("SpeedController: negative score counts as zero", "[speed]") {
    SpeedController speed(SpeedConfig{});
    REQUIRE(speed.tick_rate(-50) == 4);
}

TEST_CASE("SpeedController: rate never decreases with score", "[speed]") {
    SpeedConfig cfg;
    cfg.increase_interval = 7;
    cfg.increase_amount = 3;
    cfg.max_tick_rate = 40;
    SpeedController speed(cfg);

    int previous = speed.tick_rate(0);
    for (int score = 1; score <= 500; score++) {
        int rate = speed.tick_rate(score);
        REQUIRE(rate >= previous);
        REQUIRE(rate <= 40);
        previous = rate;
    }
}

TEST_CASE("SpeedController: same score gives same rate", "[speed]") {
    SpeedController speed(SpeedConfig{});
    REQUIRE(speed.tick_rate(120) == speed.tick_rate(120));
    REQUIRE(speed.tick_rate(120) == 8);
}

TEST_CASE("SpeedController: rejects non-positive interval", "[speed]") {
    SpeedConfig cfg;
    cfg.increase_interval = 0;
    REQUIRE_THROWS_AS(SpeedController(cfg), std::invalid_argument);
}
