// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include "pixsnake_version.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace pixsnake {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, long& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*endptr != '\0' || endptr == str || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = val;
    return true;
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>  Configuration file (default: config/pixsnake.json)\n");
    printf("  -s, --size <WxH>     Window size in pixels (e.g., 1280x720)\n");
    printf("  --seed <n>           Fixed random seed for food placement (1-4294967295)\n");
    printf("  --mute               Disable sound effects and music\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("  -V, --version        Show version information\n");
    printf("\nControls:\n");
    printf("  Arrows / WASD        Steer\n");
    printf("  Space                Start (menu), pause / resume\n");
    printf("  Enter                Start\n");
    printf("  R                    Restart after game over\n");
    printf("  Esc                  Back to menu (quit from menu)\n");
}

bool parse_size(const char* str, int& width, int& height) {
    char* endptr;
    long w = strtol(str, &endptr, 10);
    if (endptr == str || (*endptr != 'x' && *endptr != 'X')) {
        return false;
    }
    const char* hstr = endptr + 1;
    long h = strtol(hstr, &endptr, 10);
    if (endptr == hstr || *endptr != '\0') {
        return false;
    }
    if (w < 160 || w > 7680 || h < 120 || h > 4320) {
        return false;
    }
    width = static_cast<int>(w);
    height = static_cast<int>(h);
    return true;
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            args.info_only = true;
            return false;
        } else if (strcmp(arg, "-V") == 0 || strcmp(arg, "--version") == 0) {
            printf("pixsnake %s\n", PIXSNAKE_VERSION);
            args.info_only = true;
            return false;
        } else if (strcmp(arg, "-c") == 0 || strcmp(arg, "--config") == 0) {
            if (i + 1 >= argc) {
                printf("Error: %s requires a path\n", arg);
                return false;
            }
            args.config_path = argv[++i];
        } else if (strcmp(arg, "-s") == 0 || strcmp(arg, "--size") == 0) {
            if (i + 1 >= argc) {
                printf("Error: %s requires WxH\n", arg);
                return false;
            }
            if (!parse_size(argv[++i], args.width, args.height)) {
                printf("Error: invalid size (expected WxH, 160x120 to 7680x4320): %s\n", argv[i]);
                return false;
            }
        } else if (strcmp(arg, "--seed") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --seed requires a number\n");
                return false;
            }
            long seed = 0;
            if (!parse_int(argv[++i], 1, 4294967295L, seed, "seed")) {
                return false;
            }
            args.seed = static_cast<uint32_t>(seed);
        } else if (strcmp(arg, "--mute") == 0) {
            args.mute = true;
        } else if (strcmp(arg, "--log-dest") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-dest requires a destination\n");
                return false;
            }
            args.log_dest = argv[++i];
        } else if (strcmp(arg, "--log-file") == 0) {
            if (i + 1 >= argc) {
                printf("Error: --log-file requires a path\n");
                return false;
            }
            args.log_file = argv[++i];
        } else if (strcmp(arg, "--verbose") == 0) {
            args.verbosity++;
        } else if (arg[0] == '-' && arg[1] == 'v' && strspn(arg + 1, "v") == strlen(arg + 1)) {
            // -v, -vv, -vvv
            args.verbosity += static_cast<int>(strlen(arg + 1));
        } else {
            printf("Error: unknown argument: %s\n", arg);
            print_help(argv[0]);
            return false;
        }
    }
    return true;
}

} // namespace pixsnake
