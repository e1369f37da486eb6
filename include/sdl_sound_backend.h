// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#ifdef PIXSNAKE_DISPLAY_SDL

#include "sound_backend.h"

#include <SDL.h>
#include <map>
#include <string>
#include <vector>

namespace pixsnake {

/// SDL2 audio backend -- decodes WAV clips and mixes one effect and one music voice
class SDLSoundBackend : public SoundBackend {
  public:
    SDLSoundBackend();
    ~SDLSoundBackend() override;

    // SoundBackend interface
    bool load_clip(const std::string& name, const std::string& path) override;
    void play_effect(const std::string& name) override;
    void play_music(const std::string& name, bool loop) override;
    void stop_music() override;
    void set_volume(float volume) override;

    /// Initialize SDL audio device. Returns false on failure.
    bool initialize();

    /// Shutdown SDL audio device
    void shutdown();

    /// A clip being played: mono-or-stereo float frames in device format
    struct Voice {
        const std::vector<float>* clip = nullptr;
        size_t pos = 0;
        bool loop = false;
    };

    /**
     * @brief Add a voice into an output buffer
     *
     * @param out Interleaved float samples, accumulated into
     * @param num_samples Samples in out
     * @param voice Advanced in place; clip cleared when a one-shot ends
     * @param gain Linear gain applied to the voice
     */
    static void mix_voice(float* out, int num_samples, Voice& voice, float gain);

  private:
    static void audio_callback(void* userdata, uint8_t* stream, int len);

    // Decoded clips (main thread writes only while the device is locked)
    std::map<std::string, std::vector<float>> clips_;

    // Voices (shared with audio callback, guarded by SDL_LockAudioDevice)
    Voice effect_;
    Voice music_;
    float volume_ = 0.8f;

    SDL_AudioDeviceID device_id_ = 0;
    SDL_AudioSpec spec_{};
    bool initialized_ = false;
};

} // namespace pixsnake

#endif // PIXSNAKE_DISPLAY_SDL
