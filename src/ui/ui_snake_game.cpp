// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file ui_snake_game.cpp
 * @brief Board rendering, HUD labels and tick timer for a GameSession
 *
 * Snake body drawn as 3D tubes (shadow/body/highlight layers).
 * All game rules live in GameSession; this file only reads snapshots.
 */

#include "ui_snake_game.h"

#include "game_session.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdio>

namespace pixsnake {

// ============================================================================
// CONSTANTS
// ============================================================================

static constexpr uint32_t BACKGROUND_COLOR = 0x101418;
static constexpr uint32_t WALL_COLOR = 0x5A6470;
static constexpr uint32_t SNAKE_COLOR = 0x00A651;
static constexpr uint32_t DEAD_SNAKE_COLOR = 0xCC2222;
static constexpr uint32_t NORMAL_FOOD_COLOR = 0xED1C24;
static constexpr uint32_t BONUS_FOOD_COLOR = 0x8B5A2B;
static constexpr int32_t HEADER_HEIGHT = 40;

namespace {

// ============================================================================
// TUBE DRAWING
// ============================================================================

/// Draw a flat line segment (base primitive for tube layers)
void draw_flat_line(lv_layer_t* layer, int32_t x1, int32_t y1, int32_t x2, int32_t y2,
                    lv_color_t color, int32_t width) {
    lv_draw_line_dsc_t line_dsc;
    lv_draw_line_dsc_init(&line_dsc);
    line_dsc.color = color;
    line_dsc.width = width;
    line_dsc.p1.x = x1;
    line_dsc.p1.y = y1;
    line_dsc.p2.x = x2;
    line_dsc.p2.y = y2;
    line_dsc.round_start = true;
    line_dsc.round_end = true;
    lv_draw_line(layer, &line_dsc);
}

/// Draw a 3D tube segment between two points (shadow/body/highlight layers)
void draw_tube_segment(lv_layer_t* layer, int32_t x1, int32_t y1, int32_t x2, int32_t y2,
                       lv_color_t color, int32_t width) {
    int32_t shadow_extra = LV_MAX(2, width / 2);
    draw_flat_line(layer, x1, y1, x2, y2, lv_color_darken(color, 90), width + shadow_extra);

    draw_flat_line(layer, x1, y1, x2, y2, color, width);

    // Highlight: narrower, lighter, offset toward top-right
    int32_t hl_width = LV_MAX(1, width * 2 / 5);
    int32_t off_amount = width / 4 + 1;
    int32_t offset_x = (x1 == x2) ? off_amount : 0;
    int32_t offset_y = (y1 == y2) ? -off_amount : 0;
    draw_flat_line(layer, x1 + offset_x, y1 + offset_y, x2 + offset_x, y2 + offset_y,
                   lv_color_lighten(color, 110), hl_width);
}

void draw_disc(lv_layer_t* layer, int32_t cx, int32_t cy, int32_t radius, lv_color_t color) {
    lv_draw_arc_dsc_t dsc;
    lv_draw_arc_dsc_init(&dsc);
    dsc.color = color;
    dsc.width = radius;
    dsc.radius = radius;
    dsc.start_angle = 0;
    dsc.end_angle = 360;
    dsc.center.x = cx;
    dsc.center.y = cy;
    lv_draw_arc(layer, &dsc);
}

lv_obj_t* create_plain_container(lv_obj_t* parent) {
    lv_obj_t* obj = lv_obj_create(parent);
    lv_obj_set_style_bg_opa(obj, LV_OPA_TRANSP, LV_PART_MAIN);
    lv_obj_set_style_border_width(obj, 0, LV_PART_MAIN);
    lv_obj_set_style_pad_all(obj, 0, LV_PART_MAIN);
    lv_obj_remove_flag(obj, LV_OBJ_FLAG_SCROLLABLE);
    return obj;
}

} // anonymous namespace

// ============================================================================
// LIFECYCLE
// ============================================================================

SnakeGameView::SnakeGameView(GameSession& session) : session_(session) {}

SnakeGameView::~SnakeGameView() {
    destroy();
}

void SnakeGameView::create(lv_obj_t* parent) {
    if (root_) {
        spdlog::warn("[SnakeView] Already created");
        return;
    }

    root_ = create_plain_container(parent);
    lv_obj_set_size(root_, LV_PCT(100), LV_PCT(100));
    lv_obj_set_style_bg_color(root_, lv_color_hex(BACKGROUND_COLOR), LV_PART_MAIN);
    lv_obj_set_style_bg_opa(root_, LV_OPA_COVER, LV_PART_MAIN);
    lv_obj_set_style_pad_all(root_, 8, LV_PART_MAIN);
    lv_obj_set_flex_flow(root_, LV_FLEX_FLOW_COLUMN);
    lv_obj_set_flex_align(root_, LV_FLEX_ALIGN_START, LV_FLEX_ALIGN_CENTER, LV_FLEX_ALIGN_CENTER);

    // === Header row (score + best) ===
    lv_obj_t* header = create_plain_container(root_);
    lv_obj_set_size(header, LV_PCT(100), HEADER_HEIGHT);
    lv_obj_set_flex_flow(header, LV_FLEX_FLOW_ROW);
    lv_obj_set_flex_align(header, LV_FLEX_ALIGN_SPACE_BETWEEN, LV_FLEX_ALIGN_CENTER,
                          LV_FLEX_ALIGN_CENTER);

    score_label_ = lv_label_create(header);
    lv_obj_set_style_text_color(score_label_, lv_color_white(), LV_PART_MAIN);
    lv_obj_set_style_text_font(score_label_, LV_FONT_DEFAULT, LV_PART_MAIN);

    best_label_ = lv_label_create(header);
    lv_obj_set_style_text_color(best_label_, lv_color_hex(0xFFD700), LV_PART_MAIN);
    lv_obj_set_style_text_font(best_label_, LV_FONT_DEFAULT, LV_PART_MAIN);

    // === Board ===
    board_ = create_plain_container(root_);
    lv_obj_set_width(board_, LV_PCT(100));
    lv_obj_set_flex_grow(board_, 1);
    lv_obj_add_event_cb(board_, draw_cb, LV_EVENT_DRAW_MAIN, this);

    // === Phase caption, floating over the board ===
    caption_label_ = lv_label_create(root_);
    lv_obj_add_flag(caption_label_, LV_OBJ_FLAG_FLOATING);
    lv_obj_set_style_text_color(caption_label_, lv_color_white(), LV_PART_MAIN);
    lv_obj_set_style_text_font(caption_label_, LV_FONT_DEFAULT, LV_PART_MAIN);
    lv_obj_set_style_text_align(caption_label_, LV_TEXT_ALIGN_CENTER, LV_PART_MAIN);
    lv_obj_set_style_bg_color(caption_label_, lv_color_black(), LV_PART_MAIN);
    lv_obj_set_style_bg_opa(caption_label_, LV_OPA_70, LV_PART_MAIN);
    lv_obj_set_style_pad_all(caption_label_, 16, LV_PART_MAIN);
    lv_obj_set_style_radius(caption_label_, 8, LV_PART_MAIN);
    lv_obj_align(caption_label_, LV_ALIGN_CENTER, 0, HEADER_HEIGHT / 2);

    lv_obj_update_layout(root_);
    layout_board();

    timer_rate_ = session_.config().speed.initial_tick_rate;
    timer_ = lv_timer_create(tick_cb, static_cast<uint32_t>(1000 / timer_rate_), this);

    refresh();

    spdlog::info("[SnakeView] Board {}x{} cells at {}px, playable {}", session_.grid().grid_width(),
                 session_.grid().grid_height(), cell_size_, session_.grid().describe());
}

void SnakeGameView::destroy() {
    if (timer_) {
        lv_timer_delete(timer_);
        timer_ = nullptr;
    }
    if (root_) {
        lv_obj_delete(root_);
        root_ = nullptr;
        board_ = nullptr;
        score_label_ = nullptr;
        best_label_ = nullptr;
        caption_label_ = nullptr;
        spdlog::debug("[SnakeView] Destroyed");
    }
}

// ============================================================================
// UPDATES
// ============================================================================

void SnakeGameView::refresh() {
    if (!root_) {
        return;
    }
    update_labels();
    update_timer_period();
    lv_obj_invalidate(board_);
}

void SnakeGameView::tick_cb(lv_timer_t* timer) {
    auto* self = static_cast<SnakeGameView*>(lv_timer_get_user_data(timer));
    if (!self) {
        return;
    }
    if (self->session_.tick() != TickResult::IDLE) {
        self->refresh();
    }
}

void SnakeGameView::update_timer_period() {
    if (!timer_) {
        return;
    }
    int rate = session_.tick_rate();
    if (rate <= 0) {
        rate = session_.config().speed.initial_tick_rate;
    }
    if (rate == timer_rate_) {
        return;
    }
    timer_rate_ = rate;
    lv_timer_set_period(timer_, static_cast<uint32_t>(1000 / rate));
    spdlog::debug("[SnakeView] Tick rate now {} ({} ms)", rate, 1000 / rate);
}

void SnakeGameView::update_labels() {
    GameSnapshot snap = session_.snapshot();

    char buf[64];
    snprintf(buf, sizeof(buf), "Score: %d", snap.score);
    lv_label_set_text(score_label_, buf);
    snprintf(buf, sizeof(buf), "Best: %d", snap.high_score);
    lv_label_set_text(best_label_, buf);

    switch (snap.phase) {
    case GamePhase::MENU:
        lv_label_set_text(caption_label_, "SNAKE\n\nSpace / Enter to start\nEsc to quit");
        break;
    case GamePhase::PAUSED:
        lv_label_set_text(caption_label_, "PAUSED\n\nSpace to resume\nEsc for menu");
        break;
    case GamePhase::GAME_OVER: {
        char over[128];
        snprintf(over, sizeof(over), "%s\n\nScore: %d\nR to restart\nEsc for menu",
                 snap.new_high_score ? "NEW HIGH SCORE!" : "GAME OVER", snap.score);
        lv_label_set_text(caption_label_, over);
        break;
    }
    case GamePhase::PLAYING:
        lv_obj_add_flag(caption_label_, LV_OBJ_FLAG_HIDDEN);
        return;
    }
    lv_obj_remove_flag(caption_label_, LV_OBJ_FLAG_HIDDEN);
}

// ============================================================================
// DRAWING
// ============================================================================

void SnakeGameView::layout_board() {
    const GridModel& grid = session_.grid();
    int32_t avail_w = lv_obj_get_content_width(board_);
    int32_t avail_h = lv_obj_get_content_height(board_);

    cell_size_ = std::max<int32_t>(
        4, std::min(avail_w / grid.grid_width(), avail_h / grid.grid_height()));
    offset_x_ = (avail_w - grid.grid_width() * cell_size_) / 2;
    offset_y_ = (avail_h - grid.grid_height() * cell_size_) / 2;
}

void SnakeGameView::draw_cb(lv_event_t* e) {
    auto* self = static_cast<SnakeGameView*>(lv_event_get_user_data(e));
    lv_obj_t* obj = lv_event_get_current_target_obj(e);
    if (!self || !obj) {
        return;
    }

    lv_area_t area;
    lv_obj_get_coords(obj, &area);
    self->draw_board(lv_event_get_layer(e), area);
}

void SnakeGameView::draw_board(lv_layer_t* layer, const lv_area_t& area) {
    const GridModel& grid = session_.grid();
    GameSnapshot snap = session_.snapshot();

    layout_board();
    const int32_t cs = cell_size_;
    const int32_t ox = area.x1 + offset_x_;
    const int32_t oy = area.y1 + offset_y_;

    auto cell_center = [&](const Position& p, int32_t& px, int32_t& py) {
        px = ox + p.x * cs + cs / 2;
        py = oy + p.y * cs + cs / 2;
    };

    // Wall frame
    {
        Position wall = grid.wall_origin();
        int32_t thickness = grid.wall_thickness();
        lv_draw_rect_dsc_t wall_dsc;
        lv_draw_rect_dsc_init(&wall_dsc);
        wall_dsc.bg_opa = LV_OPA_TRANSP;
        wall_dsc.border_color = lv_color_hex(WALL_COLOR);
        wall_dsc.border_opa = LV_OPA_COVER;
        wall_dsc.border_width = thickness * cs;

        lv_area_t wall_area = {
            ox + wall.x * cs,
            oy + wall.y * cs,
            ox + (wall.x + grid.playable_width() + 2 * thickness) * cs - 1,
            oy + (wall.y + grid.playable_height() + 2 * thickness) * cs - 1,
        };
        lv_draw_rect(layer, &wall_dsc, &wall_area);
    }

    if (snap.phase == GamePhase::MENU) {
        return;
    }

    // Food; bonus food blinks once its last second starts
    if (snap.food_position) {
        bool bonus = snap.food_kind == FoodKind::BONUS;
        bool hidden = bonus && snap.tick_rate > 0 &&
                      snap.food_ticks_remaining <= snap.tick_rate &&
                      (snap.food_ticks_remaining % 2) == 0;
        if (!hidden) {
            int32_t fx, fy;
            cell_center(*snap.food_position, fx, fy);
            lv_color_t c = lv_color_hex(bonus ? BONUS_FOOD_COLOR : NORMAL_FOOD_COLOR);
            draw_disc(layer, fx, fy, bonus ? cs / 2 - 1 : cs / 3, c);
        }
    }

    // Snake body, tail to head so the head tube is drawn last
    lv_color_t body_color =
        lv_color_hex(snap.phase == GamePhase::GAME_OVER ? DEAD_SNAKE_COLOR : SNAKE_COLOR);
    int32_t tube_width = cs * 2 / 3;

    if (snap.body.size() == 1) {
        int32_t x, y;
        cell_center(snap.body.front(), x, y);
        draw_tube_segment(layer, x, y, x, y, body_color, tube_width + 2);
    }
    for (size_t i = snap.body.size(); i-- > 1;) {
        int32_t x1, y1, x2, y2;
        cell_center(snap.body[i], x1, y1);
        cell_center(snap.body[i - 1], x2, y2);

        bool is_head = (i == 1);
        int32_t w = is_head ? tube_width + 2 : tube_width;
        lv_color_t c = is_head ? lv_color_lighten(body_color, 50) : body_color;
        draw_tube_segment(layer, x1, y1, x2, y2, c, w);
    }

    // Eyes on the head, placed by direction
    if (!snap.body.empty()) {
        int32_t hx, hy;
        cell_center(snap.body.front(), hx, hy);

        int32_t eye_offset = cs / 4;
        int32_t ex1 = hx, ey1 = hy, ex2 = hx, ey2 = hy;
        switch (snap.head_direction) {
        case Direction::UP:
        case Direction::DOWN:
            ex1 = hx - eye_offset;
            ex2 = hx + eye_offset;
            ey1 = ey2 = hy + (snap.head_direction == Direction::UP ? -eye_offset / 2
                                                                    : eye_offset / 2);
            break;
        case Direction::LEFT:
        case Direction::RIGHT:
            ey1 = hy - eye_offset;
            ey2 = hy + eye_offset;
            ex1 = ex2 = hx + (snap.head_direction == Direction::LEFT ? -eye_offset / 2
                                                                      : eye_offset / 2);
            break;
        }

        int32_t eye_r = LV_MAX(2, cs / 8);
        draw_disc(layer, ex1, ey1, eye_r, lv_color_white());
        draw_disc(layer, ex2, ey2, eye_r, lv_color_white());
        draw_disc(layer, ex1, ey1, LV_MAX(1, eye_r / 2), lv_color_black());
        draw_disc(layer, ex2, ey2, LV_MAX(1, eye_r / 2), lv_color_black());
    }
}

} // namespace pixsnake
