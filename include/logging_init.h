// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace strata {
namespace logging {

/// Where log output goes besides the console
enum class LogTarget {
    Auto,    ///< Journal if available, else syslog (Linux); console elsewhere
    Journal, ///< systemd journal
    Syslog,  ///< Traditional syslog
    File,    ///< Rotating log file
    Console, ///< Console only
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    LogTarget target = LogTarget::Auto;
    bool enable_console = true;
    /// Log file for LogTarget::File; empty picks a writable default location
    std::string file_path;
    /// Messages kept for spdlog::dump_backtrace(); 0 disables
    size_t backtrace_messages = 32;
};

/**
 * @brief Replace the default logger with a multi-sink logger built from @p config
 *
 * A target sink that fails to open is skipped with a warning; the console sink
 * still works.
 */
void init(const LogConfig& config);

LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief Parse a level name ("trace" ... "off", plus the "warning" alias)
 * @return @p default_level for empty or unrecognized input (case sensitive)
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level = spdlog::level::warn);

/// -v = info, -vv = debug, -vvv and beyond = trace, none = warn
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Pick the effective level
 *
 * CLI verbosity wins, then the config file's level, then the default
 * (debug in test mode, warn otherwise).
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level,
                                            bool test_mode);

} // namespace logging
} // namespace strata
