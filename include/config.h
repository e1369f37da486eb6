// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "spdlog/spdlog.h"

#include <string>

#include <nlohmann/json.hpp>

namespace pixsnake {

using json = nlohmann::json;

/**
 * @brief Application configuration file
 *
 * Loads and manages application configuration from a JSON file.
 * Uses JSON pointer syntax (RFC 6901) for nested value access.
 *
 * Owned by main() and handed by reference to whoever needs it; there is
 * no global instance.
 *
 * Thread safety: Not thread-safe. Main thread only.
 *
 * Example usage:
 * ```cpp
 * Config cfg;
 * cfg.init("config/pixsnake.json");
 *
 * // Get with default fallback
 * int rate = cfg.get<int>("/game/speed/initial_tick_rate", 4);
 *
 * // Set and save
 * cfg.set<int>("/high_score", 120);
 * cfg.save();
 * ```
 */
class Config {
  private:
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Loads the JSON file, or creates it with defaults if it does not exist.
     * A file that fails to parse is renamed to `<path>.corrupt` and replaced
     * with defaults. Missing sections are filled in and written back.
     *
     * @param config_path Path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path (e.g., "/game/speed/max_tick_rate")
     * @return Configuration value of type T
     * @throws nlohmann::json::exception if path not found or type mismatch
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data.at(json::json_pointer(json_ptr)).template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if path doesn't exist. A value of the wrong type
     * still throws nlohmann::json::type_error.
     *
     * @tparam T Value type to retrieve
     * @param json_ptr JSON pointer path
     * @param default_value Fallback value if path not found
     * @return Configuration value or default_value
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            return data[ptr].template get<T>();
        }
        return default_value;
    };

    /**
     * @brief Get configuration value, falling back on a missing key or wrong type
     *
     * Like get(json_ptr, default_value), but a value that cannot be converted
     * to T is logged as a warning and replaced by default_value instead of
     * throwing.
     */
    template <typename T> T get_or(const std::string& json_ptr, const T& default_value) {
        try {
            return get<T>(json_ptr, default_value);
        } catch (const json::exception& e) {
            spdlog::warn("[Config] {} has the wrong type ({}), using default", json_ptr,
                         e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths if they don't exist.
     * Changes are in-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /// True if a value exists at the JSON pointer path
    bool contains(const std::string& json_ptr) const;

    /**
     * @brief Get JSON sub-object at path
     *
     * @param json_path JSON pointer path
     * @return Reference to JSON object at path (created as null if missing)
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Writes in-memory config to disk with pretty formatting.
     *
     * @return true on success, false if the file could not be written
     */
    bool save();

    /// Path the configuration was loaded from
    std::string get_path();

    /// Built-in defaults for every key the game reads
    static json get_default_config();
};

} // namespace pixsnake
