// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file ui_snake_game.h
 * @brief LVGL rendering of a GameSession
 *
 * Board drawn with a custom draw callback: wall frame, snake as a 3D tube
 * with eyes on the head, food as a round pellet (bonus food blinks during
 * its last second). Score, best score and phase captions are labels above
 * and on top of the board.
 *
 * The view also owns the simulation timer. Its period follows the
 * session's tick rate and is re-armed whenever the rate changes.
 *
 * @threading Main thread only
 */

#pragma once

#include "lvgl/lvgl.h"

namespace pixsnake {

class GameSession;

/**
 * @class SnakeGameView
 * @brief Full-screen board, HUD and tick timer for one GameSession
 *
 * ## Usage:
 * @code
 * SnakeGameView view(session);
 * view.create(lv_screen_active());
 * while (!session.quit_requested()) {
 *     bindings.process(...);  // commands go straight to the session
 *     view.refresh();
 *     lv_timer_handler();
 * }
 * @endcode
 */
class SnakeGameView {
  public:
    explicit SnakeGameView(GameSession& session);
    ~SnakeGameView();

    SnakeGameView(const SnakeGameView&) = delete;
    SnakeGameView& operator=(const SnakeGameView&) = delete;

    /// Build widgets under @p parent and start the tick timer
    void create(lv_obj_t* parent);

    /// Delete widgets and the timer
    void destroy();

    /// Sync labels, caption and timer period with the session; redraw the board
    void refresh();

    bool is_created() const {
        return root_ != nullptr;
    }

  private:
    static void draw_cb(lv_event_t* e);
    static void tick_cb(lv_timer_t* timer);

    void draw_board(lv_layer_t* layer, const lv_area_t& area);
    void layout_board();
    void update_labels();
    void update_timer_period();

    GameSession& session_;

    lv_obj_t* root_ = nullptr;
    lv_obj_t* board_ = nullptr;
    lv_obj_t* score_label_ = nullptr;
    lv_obj_t* best_label_ = nullptr;
    lv_obj_t* caption_label_ = nullptr;
    lv_timer_t* timer_ = nullptr;

    int32_t cell_size_ = 0;
    int32_t offset_x_ = 0; ///< Board origin inside board_ (centers the grid)
    int32_t offset_y_ = 0;
    int timer_rate_ = 0; ///< Tick rate the timer period was last set for
};

} // namespace pixsnake
