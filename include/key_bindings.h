// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file key_bindings.h
 * @brief Key code to GameCommand table with edge-triggered polling
 *
 * Decouples the command mapping from SDL for testability: key codes are
 * plain ints (SDL scancodes in the desktop build).
 */

#pragma once

#include "game_session.h"

#include <functional>
#include <optional>
#include <vector>

namespace pixsnake::input {

/**
 * @brief Key binding registry
 *
 * Usage:
 * 1. Bind keys at startup (conditional bindings let one key mean different
 *    things in different phases)
 * 2. Call process() each frame with a key state provider, or translate()
 *    for event-driven input
 * 3. Commands fire on key press edge (not repeat)
 *
 * When several bindings share a key, the first one whose condition holds
 * wins. Conditions are evaluated before any command of the same
 * process() call is delivered, so a command cannot re-route its own key.
 */
class KeyBindings {
  public:
    using Condition = std::function<bool()>;
    using KeyStateProvider = std::function<bool(int key)>;
    using CommandSink = std::function<void(GameCommand)>;

    /// Bind key to cmd unconditionally
    void bind(int key, GameCommand cmd);

    /// Bind key to cmd only while condition returns true
    void bind_if(int key, GameCommand cmd, Condition condition);

    /// Command for a single key press, nullopt if the key is unbound
    std::optional<GameCommand> translate(int key) const;

    /**
     * @brief Poll key state and deliver commands for newly pressed keys
     *
     * @param is_key_pressed Returns true while a key is held
     * @param sink Receives each fired command, in binding order
     */
    void process(const KeyStateProvider& is_key_pressed, const CommandSink& sink);

    /// Remove all bindings
    void clear();

    size_t size() const {
        return m_bindings.size();
    }

  private:
    struct Binding {
        int key;
        GameCommand command;
        Condition condition;
        bool was_pressed{false};
    };

    std::vector<Binding> m_bindings;
};

} // namespace pixsnake::input
