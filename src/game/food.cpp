// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "food.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace pixsnake {

namespace {

bool is_excluded(const std::deque<Position>& excluded, const Position& pos) {
    return std::find(excluded.begin(), excluded.end(), pos) != excluded.end();
}

} // namespace

const char* food_kind_name(FoodKind kind) {
    return kind == FoodKind::BONUS ? "bonus" : "normal";
}

Food::Food(const FoodConfig& cfg, const GridModel& grid)
    : cfg_(cfg), grid_(grid), value_(cfg.normal_value) {}

void Food::spawn(const std::deque<Position>& excluded, int tick_rate, std::mt19937& rng) {
    std::uniform_real_distribution<double> chance(0.0, 1.0);
    if (chance(rng) < cfg_.bonus_spawn_chance) {
        kind_ = FoodKind::BONUS;
        value_ = cfg_.bonus_value;
        ticks_remaining_ = cfg_.bonus_lifetime_sec * tick_rate;
    } else {
        kind_ = FoodKind::NORMAL;
        value_ = cfg_.normal_value;
        ticks_remaining_ = 0;
    }
    expired_ = false;

    Position origin = grid_.playable_origin();
    std::uniform_int_distribution<int> col(origin.x, origin.x + grid_.playable_width() - 1);
    std::uniform_int_distribution<int> row(origin.y, origin.y + grid_.playable_height() - 1);

    for (int attempt = 0; attempt < cfg_.max_spawn_attempts; attempt++) {
        Position candidate{col(rng), row(rng)};
        if (!is_excluded(excluded, candidate)) {
            position_ = candidate;
            spdlog::debug("[Food] Spawned {} food at ({},{}) value={} ticks={}",
                          food_kind_name(kind_), candidate.x, candidate.y, value_,
                          ticks_remaining_);
            return;
        }
    }

    // Board is nearly full: draw from the free cells directly
    std::vector<Position> free_cells;
    for (int i = 0; i < grid_.cell_count(); i++) {
        Position cell = grid_.cell_at(i);
        if (!is_excluded(excluded, cell)) {
            free_cells.push_back(cell);
        }
    }

    if (!free_cells.empty()) {
        std::uniform_int_distribution<size_t> pick(0, free_cells.size() - 1);
        position_ = free_cells[pick(rng)];
        spdlog::debug("[Food] Random placement exhausted, picked from {} free cells",
                      free_cells.size());
        return;
    }

    position_ = cfg_.fallback;
    spdlog::warn("[Food] No free cell left, using fallback ({},{})", cfg_.fallback.x,
                 cfg_.fallback.y);
}

void Food::age() {
    if (kind_ != FoodKind::BONUS || ticks_remaining_ <= 0) {
        return;
    }
    ticks_remaining_--;
    if (ticks_remaining_ == 0) {
        expired_ = true;
        position_.reset();
        spdlog::debug("[Food] Bonus food expired");
    }
}

void Food::clear() {
    position_.reset();
    kind_ = FoodKind::NORMAL;
    value_ = cfg_.normal_value;
    ticks_remaining_ = 0;
    expired_ = false;
}

int Food::growth_units() const {
    return kind_ == FoodKind::BONUS ? cfg_.bonus_growth : cfg_.normal_growth;
}

} // namespace pixsnake
