// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "snake.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace pixsnake {

Snake::Snake(const SnakeConfig& cfg, const GridModel& grid) : grid_(grid) {
    if (cfg.initial_length < 1) {
        throw std::invalid_argument("snake initial length must be at least 1");
    }
    for (int i = 0; i < cfg.initial_length; i++) {
        body_.push_back({cfg.start.x - i, cfg.start.y});
    }
}

Snake::Snake(std::deque<Position> body, Direction direction, const GridModel& grid)
    : body_(std::move(body)), direction_(direction), next_direction_(direction), grid_(grid) {
    if (body_.empty()) {
        throw std::invalid_argument("snake body must not be empty");
    }
}

void Snake::set_direction(Direction dir) {
    // Prevent reversing into yourself
    if (body_.size() > 1 && is_opposite(dir, direction_)) {
        spdlog::trace("[Snake] Ignoring reverse turn {} while moving {}", direction_name(dir),
                      direction_name(direction_));
        return;
    }
    next_direction_ = dir;
}

bool Snake::advance() {
    direction_ = next_direction_;

    Position new_head = head() + direction_delta(direction_);

    // Wall collision
    if (!grid_.contains(new_head)) {
        spdlog::debug("[Snake] Hit wall at ({},{})", new_head.x, new_head.y);
        return false;
    }

    // Self collision (tail still counts, it has not moved yet)
    if (occupies(new_head)) {
        spdlog::debug("[Snake] Hit own body at ({},{})", new_head.x, new_head.y);
        return false;
    }

    body_.push_front(new_head);

    if (grow_pending_) {
        grow_pending_ = false;
    } else {
        body_.pop_back();
    }
    return true;
}

bool Snake::occupies(const Position& pos) const {
    return std::find(body_.begin(), body_.end(), pos) != body_.end();
}

} // namespace pixsnake
