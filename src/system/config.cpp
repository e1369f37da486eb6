// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace pixsnake {

namespace {

/// Default game section - board geometry, initial snake, speed curve, food
json get_default_game_config() {
    return {{"grid",
             {{"grid_width", 38},
              {"grid_height", 22},
              {"wall_start_x", 4},
              {"wall_start_y", 3},
              {"wall_thickness", 1},
              {"playable_width", 30},
              {"playable_height", 15},
              {"cell_size", 32}}},
            {"snake", {{"initial_length", 3}, {"start_x", 20}, {"start_y", 11}}},
            {"speed",
             {{"initial_tick_rate", 4},
              {"max_tick_rate", 15},
              {"increase_interval", 30},
              {"increase_amount", 1}}},
            {"food",
             {{"normal_value", 10},
              {"bonus_value", 20},
              {"bonus_spawn_chance", 0.15},
              {"bonus_lifetime_sec", 4},
              {"normal_growth", 1},
              {"bonus_growth", 2},
              {"max_spawn_attempts", 1000},
              {"fallback_x", 5},
              {"fallback_y", 5}}},
            {"rng_seed", 0}};
}

/// Default audio section - clip paths relative to the working directory
json get_default_audio_config() {
    return {{"sounds_enabled", true},
            {"music_enabled", true},
            {"volume", 0.8},
            {"sounds",
             {{"food", "assets/sound_effects/food.wav"},
              {"pause", "assets/sound_effects/pause.wav"}}},
            {"music",
             {{"menu", "assets/music/title.wav"},
              {"playing", "assets/music/main.wav"},
              {"game_over", "assets/music/game_over.wav"}}}};
}

/// Merge missing keys of defaults into target; returns true if anything was added
bool fill_missing(json& target, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!target.contains(it.key()) || target[it.key()].is_null()) {
            target[it.key()] = it.value();
            modified = true;
        } else if (it.value().is_object() && target[it.key()].is_object()) {
            modified |= fill_missing(target[it.key()], it.value());
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

json Config::get_default_config() {
    return {{"log_level", "warn"},
            {"log_dest", "console"},
            {"log_path", ""},
            {"high_score", 0},
            {"display", {{"width", 1024}, {"height", 576}}},
            {"game", get_default_game_config()},
            {"audio", get_default_audio_config()}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        // Load existing config
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            std::rename(config_path.c_str(), backup_path.c_str());
            spdlog::info("[Config] Corrupt config backed up to {}", backup_path);

            data = get_default_config();
            config_modified = true;
        }

        if (!data.is_object()) {
            spdlog::warn("[Config] Top level of {} is not an object, resetting to defaults",
                         config_path);
            data = get_default_config();
            config_modified = true;
        }

        // Ensure every section exists with defaults
        if (fill_missing(data, get_default_config())) {
            config_modified = true;
        }
    } else {
        // Create default config
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;

        // Ensure config/ directory exists
        fs::path config_dir = fs::path(config_path).parent_path();
        std::error_code ec;
        if (!config_dir.empty() && !fs::exists(config_dir, ec)) {
            fs::create_directories(config_dir, ec);
            if (ec) {
                spdlog::warn("[Config] Could not create {}: {}", config_dir.string(),
                             ec.message());
            }
        }
    }

    if (config_modified) {
        save();
    }

    spdlog::debug("[Config] Initialized: high_score={}", get<int>("/high_score", 0));
}

bool Config::contains(const std::string& json_ptr) const {
    return data.contains(json::json_pointer(json_ptr));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace pixsnake
