// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <random>

namespace fs = std::filesystem;

namespace pixsnake {

// Test fixture for Config class testing
class ConfigTestFixture {
  public:
    ConfigTestFixture() {
        std::random_device rd;
        dir = fs::temp_directory_path() / ("pixsnake_config_test_" + std::to_string(rd()));
        fs::create_directories(dir);
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

  protected:
    Config config;
    fs::path dir;

    std::string file(const std::string& name) const {
        return (dir / name).string();
    }

    void write_file(const std::string& path, const std::string& contents) {
        std::ofstream out(path);
        out << contents;
    }

    json read_file(const std::string& path) {
        std::ifstream in(path);
        return json::parse(in);
    }

    // Helper methods to access protected members
    void set_data(const json& data) {
        config.data = data;
    }

    void set_path(const std::string& path) {
        config.path = path;
    }
};

// ============================================================================
// init()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: init creates a default file", "[config][init]") {
    std::string path = file("sub/dir/pixsnake.json");

    config.init(path);

    REQUIRE(fs::exists(path));
    REQUIRE(config.get_path() == path);
    REQUIRE(config.get<int>("/high_score") == 0);
    REQUIRE(config.get<int>("/game/speed/initial_tick_rate") == 4);
    REQUIRE(config.get<std::string>("/log_level") == "warn");
    REQUIRE(read_file(path) == Config::get_default_config());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init keeps values and fills missing keys",
                 "[config][init]") {
    std::string path = file("partial.json");
    write_file(path, R"({"high_score": 42, "game": {"speed": {"max_tick_rate": 9}}})");

    config.init(path);

    REQUIRE(config.get<int>("/high_score") == 42);
    REQUIRE(config.get<int>("/game/speed/max_tick_rate") == 9);
    REQUIRE(config.get<int>("/game/speed/initial_tick_rate") == 4);
    REQUIRE(config.get<int>("/display/width") == 1024);

    // Filled keys are written back
    json on_disk = read_file(path);
    REQUIRE(on_disk["game"]["grid"]["playable_width"] == 30);
    REQUIRE(on_disk["high_score"] == 42);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: corrupt file is backed up and replaced",
                 "[config][init]") {
    std::string path = file("broken.json");
    write_file(path, "{ this is not json");

    config.init(path);

    REQUIRE(fs::exists(path + ".corrupt"));
    REQUIRE(config.get<int>("/high_score") == 0);
    REQUIRE(read_file(path) == Config::get_default_config());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: non-object top level resets to defaults",
                 "[config][init]") {
    std::string path = file("array.json");
    write_file(path, "[1, 2, 3]");

    config.init(path);

    REQUIRE(config.get<int>("/game/food/normal_value") == 10);
}

// ============================================================================
// get() / set()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: get with default", "[config][get]") {
    set_data({{"audio", {{"volume", 0.5}}}});

    REQUIRE(config.get<double>("/audio/volume", 1.0) == 0.5);
    REQUIRE(config.get<int>("/missing/key", 7) == 7);
    REQUIRE(config.get<std::string>("/log_level", "info") == "info");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get without default throws for missing key",
                 "[config][get]") {
    set_data({{"high_score", 3}});

    REQUIRE(config.get<int>("/high_score") == 3);
    REQUIRE_THROWS_AS(config.get<int>("/nope"), json::out_of_range);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: get_or falls back on a wrong type",
                 "[config][get]") {
    std::string path = file("mistyped.json");
    write_file(path, R"({"log_level": 3, "log_dest": "file", "display": {"width": "wide"}})");

    config.init(path);

    // Plain get() still reports the mismatch
    REQUIRE_THROWS_AS(config.get<std::string>("/log_level", "warn"), json::type_error);
    REQUIRE_THROWS_AS(config.get<int>("/display/width", 1024), json::type_error);

    REQUIRE(config.get_or<std::string>("/log_level", "warn") == "warn");
    REQUIRE(config.get_or("/display/width", 1024) == 1024);

    // Well-typed and filled-in values are unaffected
    REQUIRE(config.get_or<std::string>("/log_dest", "console") == "file");
    REQUIRE(config.get_or("/display/height", 0) == 576);
    REQUIRE(config.get_or("/missing/key", 7) == 7);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: contains", "[config][get]") {
    set_data({{"display", {{"width", 800}}}});

    REQUIRE(config.contains("/display/width"));
    REQUIRE_FALSE(config.contains("/display/height"));
    REQUIRE_FALSE(config.contains("/audio"));
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: set creates nested keys", "[config][set]") {
    set_data(json::object());

    config.set<int>("/game/rng_seed", 17);
    REQUIRE(config.get<int>("/game/rng_seed") == 17);
    REQUIRE(config.get_json("/game").is_object());
}

// ============================================================================
// save()
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "Config: saved values survive a reload", "[config][save]") {
    std::string path = file("roundtrip.json");
    config.init(path);

    config.set<int>("/high_score", 250);
    config.set<bool>("/audio/music_enabled", false);
    REQUIRE(config.save());

    Config reloaded;
    reloaded.init(path);
    REQUIRE(reloaded.get<int>("/high_score") == 250);
    REQUIRE(reloaded.get<bool>("/audio/music_enabled") == false);
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save reports an unwritable path", "[config][save]") {
    set_data(Config::get_default_config());
    set_path(dir.string()); // a directory cannot be opened as a file

    REQUIRE_FALSE(config.save());
}

} // namespace pixsnake
