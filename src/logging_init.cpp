// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <unistd.h>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace pixsnake {
namespace logging {

namespace {

/// Get XDG_DATA_HOME or default ~/.local/share
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp"; // Last resort fallback
}

/// Resolve log file path with fallback logic
std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string user_dir = get_xdg_data_home() + "/pixsnake";
    std::error_code ec;
    std::filesystem::create_directories(user_dir, ec);

    return user_dir + "/pixsnake.log";
}

/// Console when attached to a terminal, file otherwise (launched from a desktop entry)
LogTarget detect_best_target() {
    return isatty(STDOUT_FILENO) ? LogTarget::Console : LogTarget::File;
}

/// Add system sink based on target
void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
#ifdef __linux__
    case LogTarget::Syslog:
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>("pixsnake", LOG_PID, LOG_USER, false));
        break;
#endif
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        try {
            // 5MB max size, 3 rotated files
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            // Logger is not up yet; console sink (if any) still works
            std::fprintf(stderr, "[Logging] Cannot open log file %s: %s\n", path.c_str(),
                         e.what());
        }
        break;
    }
    case LogTarget::Console:
    case LogTarget::Auto:
        // Console-only or auto (which would have been resolved already)
        break;
    default:
        break;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always, unless explicitly disabled)
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    // Resolve auto-detection
    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    // Add system sink
    add_system_sink(sinks, effective_target, config.file_path);

    // Create logger with all sinks
    auto logger = std::make_shared<spdlog::logger>("pixsnake", sinks.begin(), sinks.end());
    logger->set_level(config.level);

    // Set as default logger
    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] Initialized: target={}, console={}, level={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no",
                  spdlog::level::to_string_view(config.level));
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    if (verbosity <= 0)
        return spdlog::level::warn;
    if (verbosity == 1)
        return spdlog::level::info;
    if (verbosity == 2)
        return spdlog::level::debug;
    return spdlog::level::trace;
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto; // Default for "auto" or unrecognized
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

} // namespace logging
} // namespace pixsnake
