// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "sound_manager.h"

#include "mocks/mock_sound_backend.h"
#include "test_helpers/temp_config.h"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using namespace pixsnake;

namespace {

AudioSettings full_settings() {
    AudioSettings settings;
    settings.sounds[SoundEvent::FOOD_EATEN] = "food.wav";
    settings.sounds[SoundEvent::PAUSE_TOGGLE] = "pause.wav";
    settings.music[MusicTrack::MENU] = "title.wav";
    settings.music[MusicTrack::PLAYING] = "main.wav";
    settings.music[MusicTrack::GAME_OVER] = "game_over.wav";
    return settings;
}

} // namespace

// ============================================================================
// Settings
// ============================================================================

TEST_CASE("AudioSettings: loaded from the default config", "[sound][config]") {
    TempConfig tmp;
    AudioSettings settings = load_audio_settings(tmp.load());

    REQUIRE(settings.sounds_enabled);
    REQUIRE(settings.music_enabled);
    REQUIRE(settings.volume == Catch::Approx(0.8f));
    REQUIRE(settings.sounds.at(SoundEvent::FOOD_EATEN) == "assets/sound_effects/food.wav");
    REQUIRE(settings.music.at(MusicTrack::GAME_OVER) == "assets/music/game_over.wav");
}

TEST_CASE("AudioSettings: empty paths and bad volume", "[sound][config]") {
    TempConfig tmp;
    tmp.write(R"({"audio": {"volume": 3.0, "music_enabled": false,
                            "sounds": {"food": ""}, "music": {"menu": ""}}})");
    AudioSettings settings = load_audio_settings(tmp.load());

    REQUIRE(settings.volume == Catch::Approx(1.0f));
    REQUIRE_FALSE(settings.music_enabled);
    REQUIRE(settings.sounds.count(SoundEvent::FOOD_EATEN) == 0);
    REQUIRE(settings.sounds.count(SoundEvent::PAUSE_TOGGLE) == 1);
    REQUIRE(settings.music.count(MusicTrack::MENU) == 0);
}

// ============================================================================
// SoundManager
// ============================================================================

TEST_CASE("SoundManager: initialize loads every clip", "[sound]") {
    auto backend = std::make_shared<MockSoundBackend>();
    AudioSettings settings = full_settings();
    settings.volume = 0.5f;
    SoundManager sound(settings, backend);

    REQUIRE_FALSE(sound.is_available());
    sound.initialize();

    REQUIRE(sound.is_available());
    REQUIRE(backend->loaded.size() == 5);
    REQUIRE(backend->volume == Catch::Approx(0.5f));
}

TEST_CASE("SoundManager: works without a backend", "[sound]") {
    SoundManager sound(full_settings(), nullptr);
    sound.initialize();

    REQUIRE_FALSE(sound.is_available());
    sound.play_sound(SoundEvent::FOOD_EATEN);
    sound.play_music(MusicTrack::MENU);
    sound.stop_music();
    REQUIRE_FALSE(sound.has_current_music());
}

TEST_CASE("SoundManager: effects go to the effect voice", "[sound]") {
    auto backend = std::make_shared<MockSoundBackend>();
    SoundManager sound(full_settings(), backend);
    sound.initialize();

    sound.play_sound(SoundEvent::FOOD_EATEN);
    sound.play_sound(SoundEvent::PAUSE_TOGGLE);
    REQUIRE(backend->effects == std::vector<std::string>{"sound_food", "sound_pause"});

    sound.set_sounds_enabled(false);
    sound.play_sound(SoundEvent::FOOD_EATEN);
    REQUIRE(backend->effects.size() == 2);
}

TEST_CASE("SoundManager: same track is not restarted", "[sound][music]") {
    auto backend = std::make_shared<MockSoundBackend>();
    SoundManager sound(full_settings(), backend);
    sound.initialize();

    sound.play_music(MusicTrack::MENU);
    sound.play_music(MusicTrack::MENU);
    REQUIRE(backend->music.size() == 1);
    REQUIRE(backend->music[0] == std::make_pair(std::string("music_menu"), true));
    REQUIRE(sound.current_music() == MusicTrack::MENU);

    sound.play_music(MusicTrack::PLAYING);
    REQUIRE(backend->music.size() == 2);
    REQUIRE(backend->music[1].first == "music_playing");
}

TEST_CASE("SoundManager: game over music plays once", "[sound][music]") {
    auto backend = std::make_shared<MockSoundBackend>();
    SoundManager sound(full_settings(), backend);
    sound.initialize();

    sound.play_music(MusicTrack::GAME_OVER);
    REQUIRE(backend->music.back() == std::make_pair(std::string("music_game_over"), false));
}

TEST_CASE("SoundManager: missing clip silences the previous track", "[sound][music]") {
    auto backend = std::make_shared<MockSoundBackend>();
    backend->failing_paths = {"main.wav"};
    SoundManager sound(full_settings(), backend);
    sound.initialize();
    REQUIRE(backend->loaded.size() == 4);

    sound.play_music(MusicTrack::MENU);
    sound.play_music(MusicTrack::PLAYING);

    REQUIRE(backend->music.size() == 1);
    REQUIRE(backend->stop_count == 1);
    REQUIRE(sound.current_music() == MusicTrack::PLAYING);
}

TEST_CASE("SoundManager: disabling music stops it", "[sound][music]") {
    auto backend = std::make_shared<MockSoundBackend>();
    SoundManager sound(full_settings(), backend);
    sound.initialize();

    sound.play_music(MusicTrack::MENU);
    sound.set_music_enabled(false);
    REQUIRE(backend->stop_count == 1);
    REQUIRE_FALSE(sound.has_current_music());

    sound.play_music(MusicTrack::PLAYING);
    REQUIRE(backend->music.size() == 1);

    // Re-enabled: the next request plays again
    sound.set_music_enabled(true);
    sound.play_music(MusicTrack::MENU);
    REQUIRE(backend->music.size() == 2);
}
