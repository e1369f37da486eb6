// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "grid_model.h"

#include <spdlog/fmt/fmt.h>

namespace pixsnake {

Position direction_delta(Direction dir) {
    switch (dir) {
    case Direction::UP:
        return {0, -1};
    case Direction::DOWN:
        return {0, 1};
    case Direction::LEFT:
        return {-1, 0};
    case Direction::RIGHT:
        return {1, 0};
    }
    return {0, 0};
}

Direction opposite(Direction dir) {
    switch (dir) {
    case Direction::UP:
        return Direction::DOWN;
    case Direction::DOWN:
        return Direction::UP;
    case Direction::LEFT:
        return Direction::RIGHT;
    case Direction::RIGHT:
        return Direction::LEFT;
    }
    return dir;
}

const char* direction_name(Direction dir) {
    switch (dir) {
    case Direction::UP:
        return "up";
    case Direction::DOWN:
        return "down";
    case Direction::LEFT:
        return "left";
    case Direction::RIGHT:
        return "right";
    }
    return "unknown";
}

GridModel::GridModel(Position playable_origin, int playable_width, int playable_height)
    : origin_(playable_origin), playable_width_(playable_width),
      playable_height_(playable_height),
      grid_width_(playable_origin.x + playable_width + wall_thickness_),
      grid_height_(playable_origin.y + playable_height + wall_thickness_) {}

GridModel GridModel::from_config(const GridConfig& cfg) {
    Position origin{cfg.wall_start_x + cfg.wall_thickness, cfg.wall_start_y + cfg.wall_thickness};
    GridModel grid(origin, cfg.playable_width, cfg.playable_height);
    grid.wall_thickness_ = cfg.wall_thickness;
    grid.grid_width_ = cfg.grid_width;
    grid.grid_height_ = cfg.grid_height;
    return grid;
}

bool GridModel::contains(const Position& pos) const {
    return pos.x >= origin_.x && pos.x < origin_.x + playable_width_ && pos.y >= origin_.y &&
           pos.y < origin_.y + playable_height_;
}

Position GridModel::cell_at(int index) const {
    return {origin_.x + index % playable_width_, origin_.y + index / playable_width_};
}

std::string GridModel::describe() const {
    return fmt::format("{}x{} @ ({},{})", playable_width_, playable_height_, origin_.x, origin_.y);
}

} // namespace pixsnake
