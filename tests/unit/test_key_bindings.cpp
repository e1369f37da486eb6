// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "key_bindings.h"

#include <catch2/catch_test_macros.hpp>

#include <set>
#include <vector>

using namespace pixsnake;
using namespace pixsnake::input;

namespace {

constexpr int KEY_UP = 82;
constexpr int KEY_SPACE = 44;
constexpr int KEY_ESCAPE = 41;
constexpr int KEY_R = 21;

/// Held-key set standing in for SDL_GetKeyboardState
struct FakeKeyboard {
    std::set<int> held;

    KeyBindings::KeyStateProvider provider() {
        return [this](int key) { return held.count(key) > 0; };
    }
};

struct CommandLog {
    std::vector<GameCommand> commands;

    KeyBindings::CommandSink sink() {
        return [this](GameCommand cmd) { commands.push_back(cmd); };
    }
};

} // namespace

// ============================================================================
// translate()
// ============================================================================

TEST_CASE("KeyBindings: translate unbound key", "[input]") {
    KeyBindings bindings;
    REQUIRE_FALSE(bindings.translate(KEY_UP).has_value());
}

TEST_CASE("KeyBindings: first matching binding wins", "[input]") {
    bool in_menu = true;
    KeyBindings bindings;
    bindings.bind_if(KEY_SPACE, GameCommand::START, [&in_menu]() { return in_menu; });
    bindings.bind(KEY_SPACE, GameCommand::PAUSE_TOGGLE);
    REQUIRE(bindings.size() == 2);

    REQUIRE(bindings.translate(KEY_SPACE) == GameCommand::START);
    in_menu = false;
    REQUIRE(bindings.translate(KEY_SPACE) == GameCommand::PAUSE_TOGGLE);
}

// ============================================================================
// process()
// ============================================================================

TEST_CASE("KeyBindings: fires once per press", "[input][process]") {
    KeyBindings bindings;
    bindings.bind(KEY_UP, GameCommand::UP);
    FakeKeyboard keyboard;
    CommandLog log;

    keyboard.held = {KEY_UP};
    bindings.process(keyboard.provider(), log.sink());
    bindings.process(keyboard.provider(), log.sink()); // held, no repeat
    REQUIRE(log.commands == std::vector<GameCommand>{GameCommand::UP});

    keyboard.held.clear();
    bindings.process(keyboard.provider(), log.sink());
    keyboard.held = {KEY_UP};
    bindings.process(keyboard.provider(), log.sink());
    REQUIRE(log.commands.size() == 2);
}

TEST_CASE("KeyBindings: one command per key even when several bindings match",
          "[input][process]") {
    KeyBindings bindings;
    bindings.bind(KEY_R, GameCommand::RESTART);
    bindings.bind(KEY_R, GameCommand::START);
    FakeKeyboard keyboard;
    CommandLog log;

    keyboard.held = {KEY_R};
    bindings.process(keyboard.provider(), log.sink());
    REQUIRE(log.commands == std::vector<GameCommand>{GameCommand::RESTART});
}

TEST_CASE("KeyBindings: a command cannot re-route its own key", "[input][process]") {
    // Space in the menu starts the game; the phase change it causes must not
    // also let the pause binding fire in the same poll
    bool in_menu = true;
    KeyBindings bindings;
    bindings.bind_if(KEY_SPACE, GameCommand::START, [&in_menu]() { return in_menu; });
    bindings.bind(KEY_SPACE, GameCommand::PAUSE_TOGGLE);
    FakeKeyboard keyboard;
    std::vector<GameCommand> fired;

    keyboard.held = {KEY_SPACE};
    bindings.process(keyboard.provider(), [&](GameCommand cmd) {
        fired.push_back(cmd);
        if (cmd == GameCommand::START) {
            in_menu = false;
        }
    });
    REQUIRE(fired == std::vector<GameCommand>{GameCommand::START});

    // Still held: nothing more
    bindings.process(keyboard.provider(), [&](GameCommand cmd) { fired.push_back(cmd); });
    REQUIRE(fired.size() == 1);

    // Next press toggles pause
    keyboard.held.clear();
    bindings.process(keyboard.provider(), [&](GameCommand cmd) { fired.push_back(cmd); });
    keyboard.held = {KEY_SPACE};
    bindings.process(keyboard.provider(), [&](GameCommand cmd) { fired.push_back(cmd); });
    REQUIRE(fired.back() == GameCommand::PAUSE_TOGGLE);
}

TEST_CASE("KeyBindings: separate keys fire in the same poll", "[input][process]") {
    KeyBindings bindings;
    bindings.bind(KEY_UP, GameCommand::UP);
    bindings.bind(KEY_ESCAPE, GameCommand::RETURN_TO_MENU);
    FakeKeyboard keyboard;
    CommandLog log;

    keyboard.held = {KEY_UP, KEY_ESCAPE};
    bindings.process(keyboard.provider(), log.sink());
    REQUIRE(log.commands ==
            std::vector<GameCommand>{GameCommand::UP, GameCommand::RETURN_TO_MENU});
}

TEST_CASE("KeyBindings: clear removes everything", "[input]") {
    KeyBindings bindings;
    bindings.bind(KEY_UP, GameCommand::UP);
    bindings.clear();

    REQUIRE(bindings.size() == 0);
    REQUIRE_FALSE(bindings.translate(KEY_UP).has_value());
}
