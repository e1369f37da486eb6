// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file logging_init.h
 * @brief spdlog sink setup for the game
 *
 * Console output is always available; a rotating log file or syslog can be
 * added on top. The level comes from -v on the command line, or from the
 * config file when no -v is given.
 */

#include <spdlog/spdlog.h>

#include <string>

namespace pixsnake {
namespace logging {

/// Where log output goes besides the console
enum class LogTarget {
    Auto,    ///< Console only on a terminal, file otherwise
    Syslog,  ///< Traditional syslog (Linux only)
    File,    ///< Rotating log file
    Console, ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< Empty = default location
    bool enable_console = true;
};

/// Build sinks and install the default logger
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn"/"warning",
 *        "error", "critical", "off")
 * @return default_level for empty or unrecognized (case-sensitive) input
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// Map -v count to a level: 0 warn, 1 info, 2 debug, 3+ trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/// Parse "auto", "syslog", "file", "console"; anything else is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

} // namespace logging
} // namespace pixsnake
