// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "game_session.h"

#include "game_audio.h"
#include "high_score_store.h"

#include <spdlog/spdlog.h>

namespace pixsnake {

namespace {

uint32_t make_seed(uint32_t configured) {
    if (configured != 0) {
        return configured;
    }
    std::random_device rd;
    return rd();
}

} // namespace

const char* game_phase_name(GamePhase phase) {
    switch (phase) {
    case GamePhase::MENU:
        return "menu";
    case GamePhase::PLAYING:
        return "playing";
    case GamePhase::PAUSED:
        return "paused";
    case GamePhase::GAME_OVER:
        return "game_over";
    }
    return "unknown";
}

const char* game_command_name(GameCommand cmd) {
    switch (cmd) {
    case GameCommand::UP:
        return "up";
    case GameCommand::DOWN:
        return "down";
    case GameCommand::LEFT:
        return "left";
    case GameCommand::RIGHT:
        return "right";
    case GameCommand::PAUSE_TOGGLE:
        return "pause_toggle";
    case GameCommand::START:
        return "start";
    case GameCommand::RESTART:
        return "restart";
    case GameCommand::RETURN_TO_MENU:
        return "return_to_menu";
    case GameCommand::QUIT:
        return "quit";
    }
    return "unknown";
}

GameSession::GameSession(const GameConfig& config, GameAudio& audio, HighScoreStore& store)
    : config_(config), grid_(GridModel::from_config(config.grid)), speed_(config.speed),
      audio_(audio), store_(store), rng_(make_seed(config.rng_seed)),
      snake_(config.snake, grid_), food_(config.food, grid_),
      tick_rate_(speed_.initial_tick_rate()) {
    high_score_ = store_.load();
    spdlog::info("[GameSession] Board {}, high score {}", grid_.describe(), high_score_);
    audio_.play_music(MusicTrack::MENU);
}

// ============================================================================
// PHASE TRANSITIONS
// ============================================================================

void GameSession::start() {
    if (phase_ != GamePhase::MENU) {
        spdlog::debug("[GameSession] start() ignored in phase {}", game_phase_name(phase_));
        return;
    }
    begin_play();
}

void GameSession::restart() {
    if (phase_ != GamePhase::GAME_OVER) {
        spdlog::debug("[GameSession] restart() ignored in phase {}", game_phase_name(phase_));
        return;
    }
    begin_play();
}

void GameSession::begin_play() {
    score_ = 0;
    tick_rate_ = speed_.initial_tick_rate();
    new_high_score_ = false;
    snake_ = Snake(config_.snake, grid_);
    food_ = Food(config_.food, grid_);
    spawn_food();
    phase_ = GamePhase::PLAYING;
    audio_.play_music(MusicTrack::PLAYING);
    spdlog::info("[GameSession] Game started at {} tps", tick_rate_);
}

void GameSession::pause() {
    if (phase_ != GamePhase::PLAYING) {
        return;
    }
    phase_ = GamePhase::PAUSED;
    audio_.play_sound(SoundEvent::PAUSE_TOGGLE);
    spdlog::debug("[GameSession] Paused");
}

void GameSession::resume() {
    if (phase_ != GamePhase::PAUSED) {
        return;
    }
    phase_ = GamePhase::PLAYING;
    audio_.play_sound(SoundEvent::PAUSE_TOGGLE);
    spdlog::debug("[GameSession] Resumed");
}

void GameSession::return_to_menu() {
    score_ = 0;
    tick_rate_ = speed_.initial_tick_rate();
    new_high_score_ = false;
    snake_ = Snake(config_.snake, grid_);
    food_ = Food(config_.food, grid_);
    phase_ = GamePhase::MENU;
    audio_.play_music(MusicTrack::MENU);
    spdlog::debug("[GameSession] Returned to menu");
}

void GameSession::request_quit() {
    quit_requested_ = true;
    spdlog::info("[GameSession] Quit requested");
}

// ============================================================================
// SIMULATION STEP
// ============================================================================

TickResult GameSession::tick() {
    if (phase_ != GamePhase::PLAYING) {
        return TickResult::IDLE;
    }

    // Bonus food runs out before the snake moves
    food_.age();
    if (food_.is_expired()) {
        spawn_food();
    }

    if (!snake_.advance()) {
        enter_game_over();
        return TickResult::GAME_OVER;
    }

    if (food_.is_eaten_by(snake_.head())) {
        eat_food();
        spawn_food();
    }

    return TickResult::CONTINUE;
}

void GameSession::eat_food() {
    score_ += food_.value();
    audio_.play_sound(SoundEvent::FOOD_EATEN);

    // grow() is a flag: several calls before the next advance add one segment
    for (int i = 0; i < food_.growth_units(); i++) {
        snake_.grow();
    }

    int new_rate = speed_.tick_rate(score_);
    if (new_rate != tick_rate_) {
        spdlog::info("[GameSession] Speed up: {} -> {} tps at score {}", tick_rate_, new_rate,
                     score_);
    }
    tick_rate_ = new_rate;

    spdlog::debug("[GameSession] Ate {} food (+{}), score {}", food_kind_name(food_.kind()),
                  food_.value(), score_);
}

void GameSession::spawn_food() {
    food_.spawn(snake_.body(), tick_rate_, rng_);
}

void GameSession::enter_game_over() {
    phase_ = GamePhase::GAME_OVER;

    if (score_ > high_score_) {
        high_score_ = score_;
        new_high_score_ = true;
        store_.save(high_score_);
    }

    audio_.play_music(MusicTrack::GAME_OVER);

    spdlog::info("[GameSession] Game over! Score: {} | Best: {}{}", score_, high_score_,
                 new_high_score_ ? " (NEW!)" : "");
}

// ============================================================================
// INPUT
// ============================================================================

void GameSession::set_direction(Direction dir) {
    if (phase_ != GamePhase::PLAYING) {
        return;
    }
    snake_.set_direction(dir);
}

void GameSession::handle_command(GameCommand cmd) {
    if (cmd == GameCommand::QUIT) {
        request_quit();
        return;
    }

    switch (phase_) {
    case GamePhase::MENU:
        if (cmd == GameCommand::START) {
            start();
            return;
        }
        break;

    case GamePhase::PLAYING:
        switch (cmd) {
        case GameCommand::PAUSE_TOGGLE:
            pause();
            return;
        case GameCommand::RETURN_TO_MENU:
            return_to_menu();
            return;
        case GameCommand::UP:
            set_direction(Direction::UP);
            return;
        case GameCommand::DOWN:
            set_direction(Direction::DOWN);
            return;
        case GameCommand::LEFT:
            set_direction(Direction::LEFT);
            return;
        case GameCommand::RIGHT:
            set_direction(Direction::RIGHT);
            return;
        default:
            break;
        }
        break;

    case GamePhase::PAUSED:
        if (cmd == GameCommand::PAUSE_TOGGLE) {
            resume();
            return;
        }
        if (cmd == GameCommand::RETURN_TO_MENU) {
            return_to_menu();
            return;
        }
        break;

    case GamePhase::GAME_OVER:
        if (cmd == GameCommand::RESTART) {
            restart();
            return;
        }
        if (cmd == GameCommand::RETURN_TO_MENU) {
            return_to_menu();
            return;
        }
        break;
    }

    spdlog::trace("[GameSession] Command {} ignored in phase {}", game_command_name(cmd),
                  game_phase_name(phase_));
}

GameSnapshot GameSession::snapshot() const {
    GameSnapshot snap;
    snap.body = snake_.body();
    snap.head_direction = snake_.direction();
    snap.food_position = food_.position();
    snap.food_kind = food_.kind();
    snap.food_ticks_remaining = food_.ticks_remaining();
    snap.score = score_;
    snap.high_score = high_score_;
    snap.tick_rate = tick_rate_;
    snap.phase = phase_;
    snap.new_high_score = new_high_score_;
    return snap;
}

} // namespace pixsnake
