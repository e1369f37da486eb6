// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file snake.h
 * @brief Snake body, direction latch and movement/growth/collision
 *
 * The body is stored head-first. Direction changes are buffered in
 * next_direction and applied at the start of the next advance(), so
 * several key presses between ticks collapse to the last accepted one.
 *
 * @threading Main thread only
 */

#pragma once

#include "grid_model.h"

#include <deque>

namespace pixsnake {

/// Initial layout: head cell and length, laid out horizontally to the left
struct SnakeConfig {
    int initial_length = 3;
    Position start{20, 11};
};

/**
 * @class Snake
 * @brief Ordered set of occupied cells with deferred growth
 *
 * ## Collision rules:
 * - Leaving the playable area is fatal.
 * - Entering any body cell is fatal, including the current tail cell: the
 *   tail is only vacated after the new head has been accepted.
 *
 * A failed advance() leaves the body untouched.
 */
class Snake {
  public:
    /// Fresh snake moving RIGHT, head at cfg.start, body extending left
    Snake(const SnakeConfig& cfg, const GridModel& grid);

    /// Scripted snake with an explicit head-first body
    Snake(std::deque<Position> body, Direction direction, const GridModel& grid);

    /**
     * @brief Request a new direction for the next advance()
     *
     * Requests that reverse the currently applied direction are dropped
     * while the snake is longer than one cell.
     */
    void set_direction(Direction dir);

    /**
     * @brief Move one cell in the buffered direction
     * @return false on wall or self collision (body unchanged)
     */
    bool advance();

    /// Keep the tail on the next advance(). Does not stack.
    void grow() {
        grow_pending_ = true;
    }

    const Position& head() const {
        return body_.front();
    }
    const std::deque<Position>& body() const {
        return body_;
    }
    int length() const {
        return static_cast<int>(body_.size());
    }
    Direction direction() const {
        return direction_;
    }
    Direction next_direction() const {
        return next_direction_;
    }
    bool grow_pending() const {
        return grow_pending_;
    }

    /// True if any body cell equals pos
    bool occupies(const Position& pos) const;

  private:
    std::deque<Position> body_;
    Direction direction_ = Direction::RIGHT;
    Direction next_direction_ = Direction::RIGHT;
    bool grow_pending_ = false;
    GridModel grid_;
};

} // namespace pixsnake
