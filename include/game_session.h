// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file game_session.h
 * @brief One play-through: phase state machine and the per-tick simulation step
 *
 * ## Phases:
 * @code
 *   MENU --start--> PLAYING <--pause/resume--> PAUSED
 *                      |
 *                    tick (collision)
 *                      v
 *                  GAME_OVER --restart--> PLAYING
 *
 *   any --return_to_menu--> MENU
 * @endcode
 *
 * The session owns the Snake and Food of the current play-through and
 * re-creates both on every start. Audio and high-score collaborators are
 * borrowed and must outlive the session.
 *
 * @threading Main thread only. tick() must complete before the next tick
 *            or before snapshot() is read.
 */

#pragma once

#include "food.h"
#include "game_config.h"
#include "grid_model.h"
#include "snake.h"
#include "speed_controller.h"

#include <deque>
#include <optional>
#include <random>

namespace pixsnake {

class GameAudio;
class HighScoreStore;

enum class GamePhase { MENU, PLAYING, PAUSED, GAME_OVER };

const char* game_phase_name(GamePhase phase);

/// Result of one tick() call
enum class TickResult {
    IDLE,      ///< Not playing, nothing simulated
    CONTINUE,  ///< Step completed, game goes on
    GAME_OVER, ///< Snake collided during this step
};

/// Player intents produced by an input source
enum class GameCommand { UP, DOWN, LEFT, RIGHT, PAUSE_TOGGLE, START, RESTART, RETURN_TO_MENU, QUIT };

const char* game_command_name(GameCommand cmd);

/// Read-only copy of everything a renderer needs for one frame
struct GameSnapshot {
    std::deque<Position> body; ///< Head first
    Direction head_direction = Direction::RIGHT;
    std::optional<Position> food_position;
    FoodKind food_kind = FoodKind::NORMAL;
    int food_ticks_remaining = 0;
    int score = 0;
    int high_score = 0;
    int tick_rate = 0;
    GamePhase phase = GamePhase::MENU;
    bool new_high_score = false; ///< This session beat the previous record
};

/**
 * @class GameSession
 * @brief Orchestrates Snake, Food and SpeedController for one play-through
 */
class GameSession {
  public:
    /**
     * @param config Game tunables (copied)
     * @param audio Sound/music sink, borrowed
     * @param store High-score persistence, borrowed; loaded once here
     */
    GameSession(const GameConfig& config, GameAudio& audio, HighScoreStore& store);

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /// MENU -> PLAYING with a fresh snake, score and first food
    void start();

    /// PLAYING -> PAUSED
    void pause();

    /// PAUSED -> PLAYING
    void resume();

    /// GAME_OVER -> PLAYING, identical to start()
    void restart();

    /// Any phase -> MENU, discarding the current play-through
    void return_to_menu();

    /// Ask the driver to stop; the session itself keeps its state
    void request_quit();

    /**
     * @brief Run one simulation step
     *
     * Ages the food (respawning expired bonus food), advances the snake,
     * then scores and respawns eaten food. Does nothing outside PLAYING.
     */
    TickResult tick();

    /// Route a player command according to the current phase; others are ignored
    void handle_command(GameCommand cmd);

    /// Forward a turn request to the snake (PLAYING only)
    void set_direction(Direction dir);

    GameSnapshot snapshot() const;

    GamePhase phase() const {
        return phase_;
    }
    int score() const {
        return score_;
    }
    int high_score() const {
        return high_score_;
    }
    int tick_rate() const {
        return tick_rate_;
    }
    bool quit_requested() const {
        return quit_requested_;
    }
    const Snake& snake() const {
        return snake_;
    }
    const Food& food() const {
        return food_;
    }
    const GridModel& grid() const {
        return grid_;
    }
    const GameConfig& config() const {
        return config_;
    }

  private:
    /// Shared by start() and restart()
    void begin_play();

    void enter_game_over();
    void eat_food();
    void spawn_food();

    GameConfig config_;
    GridModel grid_;
    SpeedController speed_;
    GameAudio& audio_;
    HighScoreStore& store_;
    std::mt19937 rng_;

    Snake snake_;
    Food food_;
    int score_ = 0;
    int tick_rate_ = 0;
    int high_score_ = 0;
    bool new_high_score_ = false;
    GamePhase phase_ = GamePhase::MENU;
    bool quit_requested_ = false;
};

} // namespace pixsnake
