// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace pixsnake {

/**
 * @brief Abstract interface for audio clip output
 *
 * Clips are registered once by name, then triggered by name. One effect
 * voice and one music voice are enough for the game: a new effect cuts the
 * previous one, a new music clip replaces the current one.
 *
 * Implementations: SDLSoundBackend (desktop)
 */
class SoundBackend {
  public:
    virtual ~SoundBackend() = default;

    /// Decode a clip file and keep it under name. Returns false on failure.
    virtual bool load_clip(const std::string& name, const std::string& path) = 0;

    /// Start a one-shot effect on the effect voice
    virtual void play_effect(const std::string& name) = 0;

    /// Replace the music voice; loop=false plays the clip once
    virtual void play_music(const std::string& name, bool loop) = 0;

    /// Silence the music voice
    virtual void stop_music() = 0;

    /// Master volume 0.0-1.0
    virtual void set_volume(float /* volume */) {}

    /// Whether the backend can hold a long looping clip
    virtual bool supports_music() const {
        return true;
    }
};

} // namespace pixsnake
