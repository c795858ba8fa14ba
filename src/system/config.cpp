// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include "navigator_config.h"

#include <cstdio>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace strata {

Config* Config::instance{NULL};

namespace {

/// Add every default key missing from @p data
/// @return true if anything was added
bool fill_missing_defaults(json& data, const json& defaults) {
    bool modified = false;
    for (auto& item : defaults.flatten().items()) {
        json::json_pointer ptr(item.key());
        if (!data.contains(ptr)) {
            data[ptr] = item.value();
            spdlog::debug("[Config] Added default {} = {}", item.key(), item.value().dump());
            modified = true;
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

json Config::default_config() {
    return {{"log_level", "warn"},
            {"log_target", "auto"},
            {"navigator",
             {{"initial_route", DEFAULT_ROUTE_NAME},
              {"animations_enabled", true},
              {"transition_duration_ms", DEFAULT_TRANSITION_DURATION_MS},
              {"barrier_opa", DEFAULT_BARRIER_OPA}}},
            {"display", {{"width", 800}, {"height", 480}}}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;
    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        try {
            data = json::parse(std::fstream(config_path));
        } catch (const json::exception& e) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, e.what());
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = default_config();
            config_modified = true;
        }

        if (!data.is_object()) {
            spdlog::warn("[Config] {} does not hold a JSON object, resetting to defaults",
                         config_path);
            data = default_config();
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = default_config();
        config_modified = true;
    }

    if (fill_missing_defaults(data, default_config())) {
        config_modified = true;
    }

    if (config_modified && !save()) {
        spdlog::warn("[Config] Continuing with unsaved config for {}", config_path);
    }

    spdlog::debug("[Config] initialized: initial_route={} animations={}",
                  get<std::string>("/navigator/initial_route", DEFAULT_ROUTE_NAME),
                  get<bool>("/navigator/animations_enabled", true));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("[Config] Failed to open config file for writing: {}", path);
            return false;
        }

        o << std::setw(2) << data << std::endl;

        if (!o.good()) {
            spdlog::error("[Config] Error writing to config file: {}", path);
            return false;
        }

        o.close();
        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

} // namespace strata
