// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "game_audio.h"

#include <map>
#include <memory>
#include <set>
#include <string>

namespace pixsnake {

class Config;
class SoundBackend;

/// Audio switches and clip paths from the /audio config section
struct AudioSettings {
    bool sounds_enabled = true;
    bool music_enabled = true;
    float volume = 0.8f;
    std::map<SoundEvent, std::string> sounds;
    std::map<MusicTrack, std::string> music;
};

/// Read /audio; missing or mistyped keys keep the defaults
AudioSettings load_audio_settings(Config& config);

/**
 * @brief Game audio through a clip backend
 *
 * Maps game sound events and music tracks to clip files, loads them once
 * and forwards notifications to the backend. Every failure (no backend,
 * clip missing, decode error) is logged and otherwise ignored, so the game
 * behaves the same with or without sound.
 *
 * ## Usage:
 * @code
 * SoundManager sound(load_audio_settings(config), backend);
 * sound.initialize();
 *
 * sound.play_music(MusicTrack::MENU);
 * sound.play_sound(SoundEvent::FOOD_EATEN);
 * @endcode
 */
class SoundManager : public GameAudio {
  public:
    /// @param backend May be null (sounds disabled)
    SoundManager(AudioSettings settings, std::shared_ptr<SoundBackend> backend);

    // Prevent copying
    SoundManager(const SoundManager&) = delete;
    SoundManager& operator=(const SoundManager&) = delete;

    /// Load every configured clip into the backend
    void initialize();

    // GameAudio interface
    void play_sound(SoundEvent event) override;
    void play_music(MusicTrack track) override;

    /// Stop music and forget the current track
    void stop_music();

    void set_sounds_enabled(bool enabled) {
        settings_.sounds_enabled = enabled;
    }
    void set_music_enabled(bool enabled);

    /// Check if playback is possible at all (backend present and initialized)
    [[nodiscard]] bool is_available() const;

    /// Music track currently requested from the backend, if any
    [[nodiscard]] bool has_current_music() const {
        return has_current_music_;
    }
    [[nodiscard]] MusicTrack current_music() const {
        return current_music_;
    }

  private:
    static std::string clip_name(SoundEvent event);
    static std::string clip_name(MusicTrack track);

    AudioSettings settings_;
    std::shared_ptr<SoundBackend> backend_;
    std::set<std::string> loaded_clips_;
    MusicTrack current_music_ = MusicTrack::MENU;
    bool has_current_music_ = false;
    bool initialized_ = false;
};

} // namespace pixsnake
