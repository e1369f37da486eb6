// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "high_score_store.h"

#include "test_helpers/temp_config.h"

#include <catch2/catch_test_macros.hpp>

using namespace pixsnake;

TEST_CASE("MemoryHighScoreStore: keeps the last saved value", "[high_score]") {
    MemoryHighScoreStore store;
    REQUIRE(store.load() == 0);

    store.save(120);
    REQUIRE(store.load() == 120);
}

TEST_CASE("ConfigHighScoreStore: fresh config starts at zero", "[high_score]") {
    TempConfig tmp;
    ConfigHighScoreStore store(tmp.load());

    REQUIRE(store.load() == 0);
}

TEST_CASE("ConfigHighScoreStore: saved score is written to disk", "[high_score]") {
    TempConfig tmp;
    ConfigHighScoreStore store(tmp.load());

    store.save(340);
    REQUIRE(store.load() == 340);
    REQUIRE(tmp.read_back()["high_score"] == 340);

    // A second process sees it
    Config other;
    other.init(tmp.path());
    ConfigHighScoreStore reloaded(other);
    REQUIRE(reloaded.load() == 340);
}

TEST_CASE("ConfigHighScoreStore: unreadable values load as zero", "[high_score]") {
    TempConfig tmp;

    SECTION("wrong type") {
        tmp.write(R"({"high_score": "lots"})");
    }
    SECTION("negative") {
        tmp.write(R"({"high_score": -10})");
    }

    ConfigHighScoreStore store(tmp.load());
    REQUIRE(store.load() == 0);
}
