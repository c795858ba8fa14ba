// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for strata-demo
 */

#include <optional>
#include <string>

namespace strata {

/**
 * @brief Parsed command-line arguments
 *
 * Unset optionals fall back to the configuration file.
 */
struct CliArgs {
    std::string config_path = "strata.json";

    // Navigation
    std::optional<std::string> initial_route;   // -r/--route
    bool no_animations = false;                 // --no-animations
    std::optional<int> transition_duration_ms;  // --duration

    // Window
    int screen_width = -1;  // -1 = from config
    int screen_height = -1; // -1 = from config

    // Automation
    int timeout_sec = 0; // 0 = run until the window closes

    // Logging
    int verbosity = 0;
    std::string log_dest; // empty = from config
    std::string log_file;

    bool help_requested = false;
};

/**
 * @brief Parse command-line arguments
 *
 * Errors are printed to stdout.
 * @return true on success, false if help was shown or an argument was invalid
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace strata
