// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sound_manager.h"

#include "config.h"
#include "sound_backend.h"

#include <spdlog/spdlog.h>

#include <utility>

namespace pixsnake {

// ============================================================================
// Names
// ============================================================================

const char* sound_event_name(SoundEvent event) {
    switch (event) {
    case SoundEvent::FOOD_EATEN:
        return "food";
    case SoundEvent::PAUSE_TOGGLE:
        return "pause";
    }
    return "unknown";
}

const char* music_track_name(MusicTrack track) {
    switch (track) {
    case MusicTrack::MENU:
        return "menu";
    case MusicTrack::PLAYING:
        return "playing";
    case MusicTrack::GAME_OVER:
        return "game_over";
    }
    return "unknown";
}

// ============================================================================
// Settings
// ============================================================================

AudioSettings load_audio_settings(Config& config) {
    AudioSettings settings;
    settings.sounds_enabled = config.get_or("/audio/sounds_enabled", settings.sounds_enabled);
    settings.music_enabled = config.get_or("/audio/music_enabled", settings.music_enabled);
    settings.volume = config.get_or("/audio/volume", settings.volume);
    if (settings.volume < 0.0f || settings.volume > 1.0f) {
        spdlog::warn("[SoundManager] volume {} outside [0,1], clamping", settings.volume);
        settings.volume = settings.volume < 0.0f ? 0.0f : 1.0f;
    }

    for (SoundEvent event : {SoundEvent::FOOD_EATEN, SoundEvent::PAUSE_TOGGLE}) {
        std::string ptr = std::string("/audio/sounds/") + sound_event_name(event);
        std::string path = config.get_or<std::string>(ptr, "");
        if (!path.empty()) {
            settings.sounds[event] = path;
        }
    }

    for (MusicTrack track : {MusicTrack::MENU, MusicTrack::PLAYING, MusicTrack::GAME_OVER}) {
        std::string ptr = std::string("/audio/music/") + music_track_name(track);
        std::string path = config.get_or<std::string>(ptr, "");
        if (!path.empty()) {
            settings.music[track] = path;
        }
    }

    return settings;
}

// ============================================================================
// SoundManager
// ============================================================================

SoundManager::SoundManager(AudioSettings settings, std::shared_ptr<SoundBackend> backend)
    : settings_(std::move(settings)), backend_(std::move(backend)) {}

void SoundManager::initialize() {
    if (initialized_) {
        spdlog::debug("[SoundManager] Already initialized");
        return;
    }

    if (!backend_) {
        spdlog::info("[SoundManager] No sound backend available, sounds disabled");
        return;
    }

    backend_->set_volume(settings_.volume);

    for (const auto& [event, path] : settings_.sounds) {
        std::string name = clip_name(event);
        if (backend_->load_clip(name, path)) {
            loaded_clips_.insert(name);
        } else {
            spdlog::warn("[SoundManager] Could not load sound '{}' from {}", name, path);
        }
    }

    if (backend_->supports_music()) {
        for (const auto& [track, path] : settings_.music) {
            std::string name = clip_name(track);
            if (backend_->load_clip(name, path)) {
                loaded_clips_.insert(name);
            } else {
                spdlog::warn("[SoundManager] Could not load music '{}' from {}", name, path);
            }
        }
    }

    initialized_ = true;
    spdlog::info("[SoundManager] Initialized with {} clip(s)", loaded_clips_.size());
}

void SoundManager::play_sound(SoundEvent event) {
    if (!settings_.sounds_enabled) {
        spdlog::trace("[SoundManager] play_sound('{}') skipped - sounds disabled",
                      sound_event_name(event));
        return;
    }

    if (!is_available()) {
        spdlog::trace("[SoundManager] play_sound('{}') skipped - no backend",
                      sound_event_name(event));
        return;
    }

    std::string name = clip_name(event);
    if (loaded_clips_.count(name) == 0) {
        spdlog::trace("[SoundManager] play_sound('{}') - clip not loaded", name);
        return;
    }

    backend_->play_effect(name);
}

void SoundManager::play_music(MusicTrack track) {
    // Already playing the right music
    if (has_current_music_ && current_music_ == track) {
        return;
    }

    if (!settings_.music_enabled || !is_available()) {
        spdlog::trace("[SoundManager] play_music('{}') skipped", music_track_name(track));
        return;
    }

    current_music_ = track;
    has_current_music_ = true;

    std::string name = clip_name(track);
    if (loaded_clips_.count(name) == 0) {
        // Keep silence rather than the previous track
        backend_->stop_music();
        spdlog::debug("[SoundManager] play_music('{}') - clip not loaded", name);
        return;
    }

    // Game over music plays only once, others loop
    backend_->play_music(name, track != MusicTrack::GAME_OVER);
    spdlog::debug("[SoundManager] Music -> {}", name);
}

void SoundManager::stop_music() {
    if (backend_) {
        backend_->stop_music();
    }
    has_current_music_ = false;
}

void SoundManager::set_music_enabled(bool enabled) {
    settings_.music_enabled = enabled;
    if (!enabled) {
        stop_music();
    }
}

bool SoundManager::is_available() const {
    return initialized_ && backend_ != nullptr;
}

std::string SoundManager::clip_name(SoundEvent event) {
    return std::string("sound_") + sound_event_name(event);
}

std::string SoundManager::clip_name(MusicTrack track) {
    return std::string("music_") + music_track_name(track);
}

} // namespace pixsnake
