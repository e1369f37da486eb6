// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for PixSnake
 */

#include <cstdint>
#include <string>

namespace pixsnake {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    // Configuration
    std::string config_path = "config/pixsnake.json";

    // Window size (-1 = use config)
    int width = -1;
    int height = -1;

    // Logging
    int verbosity = 0;
    std::string log_dest; // --log-dest override (empty = use config)
    std::string log_file; // --log-file override (empty = use config)

    // Game
    uint32_t seed = 0; // --seed, 0 = not set
    bool mute = false;

    // Set when -h/-V printed something and the program should exit 0
    bool info_only = false;

    /** @brief Check if a window size was given on the command line */
    bool has_size() const {
        return width > 0 && height > 0;
    }
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help/version was shown or an error occurred
 *         (args.info_only distinguishes the two)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

/**
 * @brief Parse "WxH" into width and height
 * @return false if the string is malformed or a dimension is out of range
 */
bool parse_size(const char* str, int& width, int& height);

} // namespace pixsnake
