// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file food.h
 * @brief Food placement, kind selection and bonus expiry
 *
 * One food item is live at a time. Normal food stays until eaten; Bonus
 * food ("cookie") is worth more and disappears after a fixed wall-clock
 * lifetime, counted in ticks at the rate in force when it spawned.
 *
 * @threading Main thread only
 */

#pragma once

#include "grid_model.h"

#include <deque>
#include <optional>
#include <random>

namespace pixsnake {

enum class FoodKind { NORMAL, BONUS };

/// Lowercase name for logging ("normal", "bonus")
const char* food_kind_name(FoodKind kind);

struct FoodConfig {
    int normal_value = 10;
    int bonus_value = 20;
    double bonus_spawn_chance = 0.15;
    int bonus_lifetime_sec = 4;
    int normal_growth = 1; ///< grow() calls when normal food is eaten
    int bonus_growth = 2;  ///< grow() calls when bonus food is eaten
    int max_spawn_attempts = 1000;
    Position fallback{5, 5};
};

/**
 * @class Food
 * @brief Single food item with spawn and expiry lifecycle
 */
class Food {
  public:
    Food(const FoodConfig& cfg, const GridModel& grid);

    /**
     * @brief Pick a kind and a free cell for a new food item
     *
     * Random draws are rejected while they hit an excluded cell, up to
     * max_spawn_attempts. After that the free cells are enumerated and one
     * is drawn directly. A completely full board falls back to the fixed
     * fallback cell.
     *
     * @param excluded Cells the food must not land on (snake body)
     * @param tick_rate Current ticks per second, scales bonus lifetime
     * @param rng Random source owned by the session
     */
    void spawn(const std::deque<Position>& excluded, int tick_rate, std::mt19937& rng);

    /// Count down bonus lifetime; clears the position when it runs out
    void age();

    /// True if the food is present at head
    bool is_eaten_by(const Position& head) const {
        return position_ && *position_ == head;
    }

    /// Remove the food without spawning a new one
    void clear();

    const std::optional<Position>& position() const {
        return position_;
    }
    FoodKind kind() const {
        return kind_;
    }
    int value() const {
        return value_;
    }
    int ticks_remaining() const {
        return ticks_remaining_;
    }
    bool is_expired() const {
        return expired_;
    }

    /// grow() calls owed to the snake for eating this food
    int growth_units() const;

  private:
    FoodConfig cfg_;
    GridModel grid_;
    std::optional<Position> position_;
    FoodKind kind_ = FoodKind::NORMAL;
    int value_ = 0;
    int ticks_remaining_ = 0;
    bool expired_ = false;
};

} // namespace pixsnake
