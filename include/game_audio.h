// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

namespace pixsnake {

enum class SoundEvent { FOOD_EATEN, PAUSE_TOGGLE };

enum class MusicTrack { MENU, PLAYING, GAME_OVER };

const char* sound_event_name(SoundEvent event);
const char* music_track_name(MusicTrack track);

/**
 * @brief Fire-and-forget audio notifications from the game
 *
 * The session never inspects results; an implementation that cannot play
 * anything must still accept every call.
 *
 * Implementations: SoundManager (clip playback), NullGameAudio (silent)
 */
class GameAudio {
  public:
    virtual ~GameAudio() = default;

    /// Short one-shot effect
    virtual void play_sound(SoundEvent event) = 0;

    /// Switch background music (GAME_OVER plays once, others loop)
    virtual void play_music(MusicTrack track) = 0;
};

/// Silent audio sink for headless runs and tests
class NullGameAudio : public GameAudio {
  public:
    void play_sound(SoundEvent /* event */) override {}
    void play_music(MusicTrack /* track */) override {}
};

} // namespace pixsnake
