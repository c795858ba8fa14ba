// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef __STRATA_CONFIG_H__
#define __STRATA_CONFIG_H__

#include "spdlog/spdlog.h"

#include <string>

#include "hv/json.hpp"

using json = nlohmann::json;

namespace strata {

/**
 * @brief Application configuration (singleton)
 *
 * Loads a JSON file and exposes it through JSON pointer paths (RFC 6901).
 * Missing keys are filled with defaults on init() and written back.
 *
 * Thread safety: main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init("/path/to/strata.json");
 *
 * std::string route = cfg->get<std::string>("/navigator/initial_route", "/");
 * cfg->set<bool>("/navigator/animations_enabled", false);
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    friend class ConfigTestFixture;

  public:
    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Load @p config_path, creating it with defaults if it does not exist
     *
     * A file that fails to parse is renamed to `<path>.corrupt` and replaced by
     * the defaults.
     */
    void init(const std::string& config_path);

    /**
     * @brief Value at @p json_ptr
     * @throws nlohmann::json::exception if the path does not exist or has another type
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /// Value at @p json_ptr, or @p default_value if the path does not exist
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (data.contains(ptr)) {
            return data[ptr].template get<T>();
        }
        return default_value;
    };

    /// Set a value in memory (intermediate objects are created); call save() to persist
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    json& get_json(const std::string& json_path);

    /**
     * @brief Write the configuration back to its file
     * @return false (and an error log) if the file could not be written
     */
    bool save();

    std::string get_path();

    /// Default contents of a new configuration file
    static json default_config();

    static Config* get_instance();
};

} // namespace strata

#endif // __STRATA_CONFIG_H__
