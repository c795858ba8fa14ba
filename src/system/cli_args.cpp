// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace strata {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        printf("Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

/// Value of "--opt=value" or of the following argument
static const char* option_value(int argc, char** argv, int& i, const char* long_name) {
    size_t len = strlen(long_name);
    if (strncmp(argv[i], long_name, len) == 0 && argv[i][len] == '=') {
        return argv[i] + len + 1;
    }
    if (i + 1 < argc) {
        return argv[++i];
    }
    return nullptr;
}

static bool matches(const char* arg, const char* long_name) {
    size_t len = strlen(long_name);
    return strncmp(arg, long_name, len) == 0 && (arg[len] == '\0' || arg[len] == '=');
}

static void print_help(const char* program_name) {
    printf("Usage: %s [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <path>  Configuration file (default: strata.json)\n");
    printf("  -r, --route <name>   Initial route, e.g. /b/c (pushes /, /b, /b/c)\n");
    printf("  -s, --size <WxH>     Window size (default: from config, 800x480)\n");
    printf("  --no-animations      Run every route transition instantly\n");
    printf("  --duration <ms>      Route transition duration (0-5000)\n");
    printf("  -t, --timeout <sec>  Auto-quit after specified seconds (1-3600)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n");
    printf("  --log-file <path>    Log file path (when --log-dest=file)\n");
    printf("  -h, --help           Show this help message\n");
    printf("\nKeys:\n");
    printf("  Esc / Backspace      Back (exits on the first route)\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        // Config file
        if (strcmp(argv[i], "-c") == 0 || matches(argv[i], "--config")) {
            const char* value = option_value(argc, argv, i, "--config");
            if (!value || *value == '\0') {
                printf("Error: -c/--config requires a path argument\n");
                return false;
            }
            args.config_path = value;
        }
        // Initial route
        else if (strcmp(argv[i], "-r") == 0 || matches(argv[i], "--route")) {
            const char* value = option_value(argc, argv, i, "--route");
            if (!value || *value == '\0') {
                printf("Error: -r/--route requires a route name\n");
                return false;
            }
            args.initial_route = value;
        }
        // Window size
        else if (strcmp(argv[i], "-s") == 0 || matches(argv[i], "--size")) {
            const char* value = option_value(argc, argv, i, "--size");
            if (!value) {
                printf("Error: -s/--size requires an argument\n");
                return false;
            }
            int w = 0, h = 0;
            char trailing = 0;
            if (sscanf(value, "%dx%d%c", &w, &h, &trailing) != 2 || w <= 0 || h <= 0) {
                printf("Unknown screen size: %s\n", value);
                printf("Expected WxH, e.g. 800x480\n");
                return false;
            }
            args.screen_width = w;
            args.screen_height = h;
        }
        // Transitions
        else if (strcmp(argv[i], "--no-animations") == 0) {
            args.no_animations = true;
        } else if (matches(argv[i], "--duration")) {
            const char* value = option_value(argc, argv, i, "--duration");
            if (!value) {
                printf("Error: --duration requires a number argument\n");
                return false;
            }
            int ms = 0;
            if (!parse_int(value, 0, 5000, ms, "duration"))
                return false;
            args.transition_duration_ms = ms;
        }
        // Auto-quit
        else if (strcmp(argv[i], "-t") == 0 || matches(argv[i], "--timeout")) {
            const char* value = option_value(argc, argv, i, "--timeout");
            if (!value) {
                printf("Error: -t/--timeout requires a number argument\n");
                return false;
            }
            if (!parse_int(value, 1, 3600, args.timeout_sec, "timeout"))
                return false;
        }
        // Verbosity
        else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "-vv") == 0 ||
                 strcmp(argv[i], "-vvv") == 0) {
            const char* p = argv[i];
            while (*p == '-')
                p++;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        }
        // Log destination
        else if (matches(argv[i], "--log-dest")) {
            const char* value = option_value(argc, argv, i, "--log-dest");
            if (!value) {
                printf("Error: --log-dest requires an argument\n");
                return false;
            }
            args.log_dest = value;
            if (args.log_dest != "auto" && args.log_dest != "journal" &&
                args.log_dest != "syslog" && args.log_dest != "file" &&
                args.log_dest != "console") {
                printf("Error: invalid --log-dest value: %s\n", args.log_dest.c_str());
                printf("Valid values: auto, journal, syslog, file, console\n");
                return false;
            }
        } else if (matches(argv[i], "--log-file")) {
            const char* value = option_value(argc, argv, i, "--log-file");
            if (!value) {
                printf("Error: --log-file requires a path argument\n");
                return false;
            }
            args.log_file = value;
        }
        // Help
        else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            args.help_requested = true;
            print_help(argv[0]);
            return false;
        }
        // Unknown argument
        else {
            printf("Unknown argument: %s\n", argv[i]);
            printf("Use --help for usage information\n");
            return false;
        }
    }

    if (!args.log_file.empty() && !args.log_dest.empty() && args.log_dest != "file") {
        printf("Error: --log-file requires --log-dest file\n");
        return false;
    }

    return true;
}

} // namespace strata
