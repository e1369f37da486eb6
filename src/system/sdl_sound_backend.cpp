// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifdef PIXSNAKE_DISPLAY_SDL

#include "sdl_sound_backend.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace pixsnake {

SDLSoundBackend::SDLSoundBackend() = default;

SDLSoundBackend::~SDLSoundBackend() {
    shutdown();
}

bool SDLSoundBackend::initialize() {
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
        spdlog::error("[SDLSound] SDL_InitSubSystem(AUDIO) failed: {}", SDL_GetError());
        return false;
    }

    SDL_AudioSpec desired{};
    desired.freq = 44100;
    desired.format = AUDIO_F32SYS;
    desired.channels = 2;
    desired.samples = 1024;
    desired.callback = audio_callback;
    desired.userdata = this;

    device_id_ = SDL_OpenAudioDevice(nullptr, 0, &desired, &spec_, 0);
    if (device_id_ == 0) {
        spdlog::error("[SDLSound] SDL_OpenAudioDevice failed: {}", SDL_GetError());
        return false;
    }

    SDL_PauseAudioDevice(device_id_, 0); // Start playback
    initialized_ = true;

    spdlog::info("[SDLSound] Audio initialized: {} Hz, {} channel(s), {} samples buffer",
                 spec_.freq, spec_.channels, spec_.samples);
    return true;
}

void SDLSoundBackend::shutdown() {
    if (!initialized_)
        return;
    if (device_id_) {
        SDL_CloseAudioDevice(device_id_);
        device_id_ = 0;
    }
    clips_.clear();
    initialized_ = false;
    spdlog::info("[SDLSound] Audio shutdown");
}

bool SDLSoundBackend::load_clip(const std::string& name, const std::string& path) {
    if (!initialized_) {
        return false;
    }

    SDL_AudioSpec wav_spec{};
    Uint8* wav_buf = nullptr;
    Uint32 wav_len = 0;
    if (!SDL_LoadWAV(path.c_str(), &wav_spec, &wav_buf, &wav_len)) {
        spdlog::warn("[SDLSound] Failed to load {}: {}", path, SDL_GetError());
        return false;
    }

    SDL_AudioCVT cvt;
    if (SDL_BuildAudioCVT(&cvt, wav_spec.format, wav_spec.channels, wav_spec.freq, spec_.format,
                          spec_.channels, spec_.freq) < 0) {
        spdlog::warn("[SDLSound] Cannot convert {}: {}", path, SDL_GetError());
        SDL_FreeWAV(wav_buf);
        return false;
    }

    std::vector<Uint8> work(static_cast<size_t>(wav_len) * static_cast<size_t>(cvt.len_mult));
    std::memcpy(work.data(), wav_buf, wav_len);
    SDL_FreeWAV(wav_buf);

    cvt.buf = work.data();
    cvt.len = static_cast<int>(wav_len);
    if (cvt.needed && SDL_ConvertAudio(&cvt) < 0) {
        spdlog::warn("[SDLSound] Conversion of {} failed: {}", path, SDL_GetError());
        return false;
    }

    size_t converted = cvt.needed ? static_cast<size_t>(cvt.len_cvt) : wav_len;
    std::vector<float> samples(converted / sizeof(float));
    std::memcpy(samples.data(), work.data(), samples.size() * sizeof(float));

    SDL_LockAudioDevice(device_id_);
    // Replacing a clip invalidates any voice pointing at it
    auto it = clips_.find(name);
    if (it != clips_.end()) {
        if (effect_.clip == &it->second)
            effect_ = Voice{};
        if (music_.clip == &it->second)
            music_ = Voice{};
    }
    clips_[name] = std::move(samples);
    SDL_UnlockAudioDevice(device_id_);

    spdlog::debug("[SDLSound] Loaded clip '{}' from {} ({} samples)", name, path,
                  converted / sizeof(float));
    return true;
}

void SDLSoundBackend::play_effect(const std::string& name) {
    auto it = clips_.find(name);
    if (!initialized_ || it == clips_.end())
        return;

    SDL_LockAudioDevice(device_id_);
    effect_ = Voice{&it->second, 0, false};
    SDL_UnlockAudioDevice(device_id_);
}

void SDLSoundBackend::play_music(const std::string& name, bool loop) {
    auto it = clips_.find(name);
    if (!initialized_ || it == clips_.end())
        return;

    SDL_LockAudioDevice(device_id_);
    music_ = Voice{&it->second, 0, loop};
    SDL_UnlockAudioDevice(device_id_);
}

void SDLSoundBackend::stop_music() {
    if (!initialized_)
        return;

    SDL_LockAudioDevice(device_id_);
    music_ = Voice{};
    SDL_UnlockAudioDevice(device_id_);
}

void SDLSoundBackend::set_volume(float volume) {
    volume = std::clamp(volume, 0.0f, 1.0f);
    if (!initialized_) {
        volume_ = volume;
        return;
    }
    SDL_LockAudioDevice(device_id_);
    volume_ = volume;
    SDL_UnlockAudioDevice(device_id_);
}

// --- Static helpers ---

void SDLSoundBackend::mix_voice(float* out, int num_samples, Voice& voice, float gain) {
    if (!voice.clip || voice.clip->empty())
        return;

    const std::vector<float>& clip = *voice.clip;
    for (int i = 0; i < num_samples; ++i) {
        if (voice.pos >= clip.size()) {
            if (!voice.loop) {
                voice = Voice{};
                return;
            }
            voice.pos = 0;
        }
        out[i] = std::clamp(out[i] + clip[voice.pos++] * gain, -1.0f, 1.0f);
    }
}

void SDLSoundBackend::audio_callback(void* userdata, uint8_t* stream, int len) {
    auto* self = static_cast<SDLSoundBackend*>(userdata);
    auto* out = reinterpret_cast<float*>(stream);
    int num_samples = len / static_cast<int>(sizeof(float));

    std::memset(stream, 0, static_cast<size_t>(len));

    // Music sits under the effects
    mix_voice(out, num_samples, self->music_, self->volume_ * 0.6f);
    mix_voice(out, num_samples, self->effect_, self->volume_);
}

} // namespace pixsnake

#endif // PIXSNAKE_DISPLAY_SDL
