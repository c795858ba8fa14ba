// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <cstdlib>
#include <filesystem>
#include <utility>
#include <vector>

#ifdef __linux__
#ifdef STRATA_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace strata {
namespace logging {

namespace {

constexpr const char* IDENT = "strata";
constexpr size_t ROTATE_BYTES = 5 * 1024 * 1024;
constexpr size_t ROTATE_FILES = 3;

constexpr std::array<std::pair<const char*, LogTarget>, 5> TARGET_NAMES = {{
    {"auto", LogTarget::Auto},
    {"journal", LogTarget::Journal},
    {"syslog", LogTarget::Syslog},
    {"file", LogTarget::File},
    {"console", LogTarget::Console},
}};

constexpr std::array<std::pair<const char*, spdlog::level::level_enum>, 8> LEVEL_NAMES = {{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

bool dir_writable(const std::filesystem::path& dir) {
    std::error_code ec;
    auto status = std::filesystem::status(dir.empty() ? "." : dir, ec);
    if (ec || !std::filesystem::is_directory(status)) {
        return false;
    }
    return (status.permissions() & std::filesystem::perms::owner_write) !=
           std::filesystem::perms::none;
}

/// /var/log when writable, else $XDG_DATA_HOME/strata (or ~/.local/share/strata)
std::filesystem::path default_log_file() {
    std::filesystem::path system_log = "/var/log/strata.log";
    if (dir_writable(system_log.parent_path())) {
        return system_log;
    }

    std::filesystem::path base = "/tmp";
    if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg) {
        base = xdg;
    } else if (const char* home = std::getenv("HOME"); home && *home) {
        base = std::filesystem::path(home) / ".local" / "share";
    }

    std::filesystem::path dir = base / IDENT;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return dir / "strata.log";
}

LogTarget effective_target(LogTarget requested) {
    if (requested != LogTarget::Auto) {
        return requested;
    }
#if defined(__linux__) && defined(STRATA_HAS_SYSTEMD)
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
#ifdef __linux__
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

/// Sink for everything but the console; nullptr when @p target adds none
spdlog::sink_ptr make_target_sink(LogTarget target, const std::string& file_path) {
    switch (target) {
    case LogTarget::File:
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            file_path.empty() ? default_log_file().string() : file_path, ROTATE_BYTES,
            ROTATE_FILES);
#ifdef __linux__
    case LogTarget::Journal:
#ifdef STRATA_HAS_SYSTEMD
        return std::make_shared<spdlog::sinks::systemd_sink_mt>(IDENT);
#else
        // no journal support compiled in, use syslog
        [[fallthrough]];
#endif
    case LogTarget::Syslog:
        return std::make_shared<spdlog::sinks::syslog_sink_mt>(IDENT, LOG_PID, LOG_USER, false);
#endif
    default:
        return nullptr;
    }
}

} // namespace

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    LogTarget target = effective_target(config.target);
    std::string sink_error;
    try {
        if (auto sink = make_target_sink(target, config.file_path)) {
            sinks.push_back(std::move(sink));
        }
    } catch (const spdlog::spdlog_ex& e) {
        sink_error = e.what();
    }

    auto logger = std::make_shared<spdlog::logger>(IDENT, sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);
    if (config.backtrace_messages > 0) {
        spdlog::enable_backtrace(config.backtrace_messages);
    }

    if (!sink_error.empty()) {
        spdlog::warn("[Logging] No {} sink, console only: {}", log_target_name(target),
                     sink_error);
    }
    spdlog::debug("[Logging] target={} console={} backtrace={}", log_target_name(target),
                  config.enable_console, config.backtrace_messages);
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& [name, target] : TARGET_NAMES) {
        if (str == name) {
            return target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& [name, value] : TARGET_NAMES) {
        if (value == target) {
            return name;
        }
    }
    return "unknown";
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    for (const auto& [name, level] : LEVEL_NAMES) {
        if (str == name) {
            return level;
        }
    }
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity >= 3 ? spdlog::level::trace : spdlog::level::warn;
    }
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level,
                                            bool test_mode) {
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    return parse_level(config_level, test_mode ? spdlog::level::debug : spdlog::level::warn);
}

} // namespace logging
} // namespace strata
