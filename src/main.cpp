// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_snake_game.h"

#include "cli_args.h"
#include "config.h"
#include "game_config.h"
#include "game_session.h"
#include "high_score_store.h"
#include "key_bindings.h"
#include "logging_init.h"
#include "lvgl/lvgl.h"
#include "pixsnake_version.h"
#include "sdl_sound_backend.h"
#include "sound_manager.h"

#include <spdlog/spdlog.h>

#include <SDL.h>
#include <memory>

using namespace pixsnake;

namespace {

void init_logging(Config& config, const CliArgs& args) {
    logging::LogConfig log_config;

    // -v on the command line wins over the config file
    if (args.verbosity > 0) {
        log_config.level = logging::verbosity_to_level(args.verbosity);
    } else {
        log_config.level = logging::parse_level(config.get_or<std::string>("/log_level", "warn"));
    }

    std::string dest =
        args.log_dest.empty() ? config.get_or<std::string>("/log_dest", "console") : args.log_dest;
    log_config.target = logging::parse_log_target(dest);
    log_config.file_path =
        args.log_file.empty() ? config.get_or<std::string>("/log_path", "") : args.log_file;

    logging::init(log_config);
}

void bind_keys(input::KeyBindings& bindings, const GameSession& session) {
    auto in_menu = [&session]() { return session.phase() == GamePhase::MENU; };

    bindings.bind(SDL_SCANCODE_UP, GameCommand::UP);
    bindings.bind(SDL_SCANCODE_W, GameCommand::UP);
    bindings.bind(SDL_SCANCODE_DOWN, GameCommand::DOWN);
    bindings.bind(SDL_SCANCODE_S, GameCommand::DOWN);
    bindings.bind(SDL_SCANCODE_LEFT, GameCommand::LEFT);
    bindings.bind(SDL_SCANCODE_A, GameCommand::LEFT);
    bindings.bind(SDL_SCANCODE_RIGHT, GameCommand::RIGHT);
    bindings.bind(SDL_SCANCODE_D, GameCommand::RIGHT);

    // Space starts from the menu and toggles pause everywhere else
    bindings.bind_if(SDL_SCANCODE_SPACE, GameCommand::START, in_menu);
    bindings.bind(SDL_SCANCODE_SPACE, GameCommand::PAUSE_TOGGLE);
    bindings.bind(SDL_SCANCODE_RETURN, GameCommand::START);
    bindings.bind(SDL_SCANCODE_KP_ENTER, GameCommand::START);
    bindings.bind(SDL_SCANCODE_R, GameCommand::RESTART);

    // Esc leaves the game from the menu, otherwise goes back to it
    bindings.bind_if(SDL_SCANCODE_ESCAPE, GameCommand::QUIT, in_menu);
    bindings.bind(SDL_SCANCODE_ESCAPE, GameCommand::RETURN_TO_MENU);
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.info_only ? 0 : 1;
    }

    Config config;
    config.init(args.config_path);
    init_logging(config, args);

    spdlog::info("[Main] pixsnake {} starting (config: {})", PIXSNAKE_VERSION,
                 config.get_path());

    GameConfig game_config = load_game_config(config);
    if (args.seed != 0) {
        game_config.rng_seed = args.seed;
    }

    int width = args.has_size() ? args.width : config.get_or("/display/width", 1024);
    int height = args.has_size() ? args.height : config.get_or("/display/height", 576);

    lv_init();
    lv_display_t* display = lv_sdl_window_create(width, height);
    if (!display) {
        spdlog::error("[Main] Failed to create {}x{} SDL window", width, height);
        lv_deinit();
        return 1;
    }
    lv_sdl_window_set_title(display, "PixSnake");

    // Audio is optional: without a device the game runs silent
    auto backend = std::make_shared<SDLSoundBackend>();
    std::shared_ptr<SoundBackend> sound_backend;
    if (backend->initialize()) {
        sound_backend = backend;
    } else {
        spdlog::warn("[Main] No audio device, continuing without sound");
    }

    AudioSettings audio_settings = load_audio_settings(config);
    if (args.mute) {
        audio_settings.sounds_enabled = false;
        audio_settings.music_enabled = false;
    }
    SoundManager sound(audio_settings, sound_backend);
    sound.initialize();

    ConfigHighScoreStore high_scores(config);
    GameSession session(game_config, sound, high_scores);

    SnakeGameView view(session);
    view.create(lv_screen_active());

    input::KeyBindings bindings;
    bind_keys(bindings, session);

    // Main event loop - lv_timer_handler() pumps SDL events and runs the tick timer
    while (lv_display_get_next(NULL) && !session.quit_requested()) {
        const Uint8* keyboard_state = SDL_GetKeyboardState(NULL);
        bool handled = false;
        bindings.process([keyboard_state](int key) { return keyboard_state[key] != 0; },
                         [&session, &handled](GameCommand cmd) {
                             session.handle_command(cmd);
                             handled = true;
                         });
        if (handled) {
            view.refresh();
        }

        lv_timer_handler();
        SDL_Delay(5);
    }

    spdlog::info("[Main] Exiting (best score {})", session.high_score());

    view.destroy();
    sound.stop_music();
    lv_deinit();
    return 0;
}
