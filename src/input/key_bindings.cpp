// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "key_bindings.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace pixsnake::input {

void KeyBindings::bind(int key, GameCommand cmd) {
    m_bindings.push_back({key, cmd, nullptr, false});
}

void KeyBindings::bind_if(int key, GameCommand cmd, Condition condition) {
    m_bindings.push_back({key, cmd, std::move(condition), false});
}

std::optional<GameCommand> KeyBindings::translate(int key) const {
    for (const auto& binding : m_bindings) {
        if (binding.key == key && (!binding.condition || binding.condition())) {
            return binding.command;
        }
    }
    return std::nullopt;
}

void KeyBindings::process(const KeyStateProvider& is_key_pressed, const CommandSink& sink) {
    std::vector<GameCommand> fired;
    std::vector<int> fired_keys;

    for (auto& binding : m_bindings) {
        bool key_pressed = is_key_pressed(binding.key);

        // Edge detection: fire on press, not on hold
        if (key_pressed && !binding.was_pressed &&
            std::find(fired_keys.begin(), fired_keys.end(), binding.key) == fired_keys.end()) {
            if (!binding.condition || binding.condition()) {
                fired.push_back(binding.command);
                fired_keys.push_back(binding.key);
            }
        }

        binding.was_pressed = key_pressed;
    }

    for (GameCommand cmd : fired) {
        spdlog::trace("[KeyBindings] -> {}", game_command_name(cmd));
        sink(cmd);
    }
}

void KeyBindings::clear() {
    m_bindings.clear();
}

} // namespace pixsnake::input
