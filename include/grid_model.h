// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file grid_model.h
 * @brief Grid coordinates, movement directions and playable-area bounds
 *
 * The board is a rectangle of cells. A one-cell (configurable) wall border
 * surrounds the playable area, and a background margin surrounds the wall.
 * Only cells strictly inside the wall are playable.
 *
 * @threading Main thread only
 */

#pragma once

#include <string>

namespace pixsnake {

/// Integer cell coordinate, compared by value
struct Position {
    int x = 0;
    int y = 0;

    bool operator==(const Position& o) const {
        return x == o.x && y == o.y;
    }
    bool operator!=(const Position& o) const {
        return !(*this == o);
    }
};

/// Position + direction displacement
inline Position operator+(const Position& a, const Position& b) {
    return {a.x + b.x, a.y + b.y};
}

enum class Direction { UP, DOWN, LEFT, RIGHT };

/// Unit displacement for a direction (screen coordinates, y grows downward)
Position direction_delta(Direction dir);

/// Direction with both displacement components negated
Direction opposite(Direction dir);

/// True if a and b point exactly against each other
inline bool is_opposite(Direction a, Direction b) {
    return opposite(a) == b;
}

/// Lowercase name for logging ("up", "down", "left", "right")
const char* direction_name(Direction dir);

/**
 * @brief Board geometry as read from configuration
 *
 * All values are in cells except cell_size (pixels per cell, used only by
 * the front-end).
 */
struct GridConfig {
    int grid_width = 38;  ///< Total board width including background margin
    int grid_height = 22; ///< Total board height including background margin
    int wall_start_x = 4; ///< Left wall column
    int wall_start_y = 3; ///< Top wall row
    int wall_thickness = 1;
    int playable_width = 30;
    int playable_height = 15;
    int cell_size = 32;
};

/**
 * @class GridModel
 * @brief Pure bounds logic for the playable rectangle inside the wall
 */
class GridModel {
  public:
    /// Playable rectangle only: origin cell plus width/height, no wall margin
    GridModel(Position playable_origin, int playable_width, int playable_height);

    /// Full board geometry; playable origin = wall start + wall thickness
    static GridModel from_config(const GridConfig& cfg);

    /// True if pos lies strictly inside the wall border
    bool contains(const Position& pos) const;

    /// Number of playable cells
    int cell_count() const {
        return playable_width_ * playable_height_;
    }

    /// Playable cell by row-major index in [0, cell_count())
    Position cell_at(int index) const;

    Position playable_origin() const {
        return origin_;
    }
    int playable_width() const {
        return playable_width_;
    }
    int playable_height() const {
        return playable_height_;
    }

    /// Top-left wall cell (one wall thickness outside the playable origin)
    Position wall_origin() const {
        return {origin_.x - wall_thickness_, origin_.y - wall_thickness_};
    }
    int wall_thickness() const {
        return wall_thickness_;
    }

    /// Total board size including background margin
    int grid_width() const {
        return grid_width_;
    }
    int grid_height() const {
        return grid_height_;
    }

    /// "30x15 @ (5,4)" for log lines
    std::string describe() const;

  private:
    Position origin_;
    int playable_width_;
    int playable_height_;
    int wall_thickness_ = 1;
    int grid_width_;
    int grid_height_;
};

} // namespace pixsnake
