// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"
#include "navigator_config.h"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

namespace strata {

// Test fixture for Config class testing
class ConfigTestFixture {
  protected:
    Config config;
    std::filesystem::path dir;

    ConfigTestFixture() {
        dir = std::filesystem::temp_directory_path() / "strata_config_test";
        std::filesystem::remove_all(dir);
        std::filesystem::create_directories(dir);
    }

    ~ConfigTestFixture() {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    std::string file(const char* name) const {
        return (dir / name).string();
    }

    void write_file(const std::string& path, const std::string& contents) {
        std::ofstream o(path);
        o << contents;
    }

    void set_data(json value) {
        config.data = std::move(value);
    }

    json& data() {
        return config.data;
    }
};

TEST_CASE_METHOD(ConfigTestFixture, "Config: get() with and without defaults",
                 "[core][config][get]") {
    set_data({{"navigator", {{"initial_route", "/b"}, {"transition_duration_ms", 150}}}});

    SECTION("existing values") {
        REQUIRE(config.get<std::string>("/navigator/initial_route") == "/b");
        REQUIRE(config.get<int>("/navigator/transition_duration_ms") == 150);
    }

    SECTION("defaults are ignored when the key exists") {
        REQUIRE(config.get<int>("/navigator/transition_duration_ms", 999) == 150);
    }

    SECTION("defaults are used for missing keys") {
        REQUIRE(config.get<bool>("/navigator/animations_enabled", false) == false);
        REQUIRE(config.get<std::string>("/display/theme", "dark") == "dark");
    }

    SECTION("missing key without default throws") {
        REQUIRE_THROWS_AS(config.get<std::string>("/navigator/missing"),
                          nlohmann::json::exception);
    }

    SECTION("type mismatch throws") {
        REQUIRE_THROWS(config.get<int>("/navigator/initial_route"));
    }
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: set() creates intermediate objects",
                 "[config][set]") {
    set_data(json::object());

    config.set<int>("/display/width", 1024);
    REQUIRE(config.get<int>("/display/width") == 1024);
    REQUIRE(data()["display"].is_object());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() creates a default file", "[config][init]") {
    std::string path = file("new.json");
    REQUIRE_FALSE(std::filesystem::exists(path));

    config.init(path);

    REQUIRE(std::filesystem::exists(path));
    REQUIRE(config.get_path() == path);
    REQUIRE(config.get<std::string>("/navigator/initial_route") == "/");
    REQUIRE(config.get<bool>("/navigator/animations_enabled") == true);
    REQUIRE(config.get<int>("/navigator/transition_duration_ms") == 200);
    REQUIRE(config.get<int>("/navigator/barrier_opa") == 127);
    REQUIRE(config.get<std::string>("/log_level") == "warn");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: init() keeps values and fills missing keys",
                 "[config][init]") {
    std::string path = file("partial.json");
    write_file(path, R"({"navigator": {"initial_route": "/b/c"}, "extra": 1})");

    config.init(path);

    REQUIRE(config.get<std::string>("/navigator/initial_route") == "/b/c");
    REQUIRE(config.get<int>("/extra") == 1);
    REQUIRE(config.get<int>("/navigator/transition_duration_ms") == 200);
    REQUIRE(config.get<int>("/display/height") == 480);

    // Filled keys were written back
    json saved = json::parse(std::ifstream(path));
    REQUIRE(saved["navigator"]["barrier_opa"] == 127);
    REQUIRE(saved["navigator"]["initial_route"] == "/b/c");
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: corrupt file is backed up and reset",
                 "[config][init]") {
    std::string path = file("corrupt.json");
    write_file(path, "{ not json");

    config.init(path);

    REQUIRE(std::filesystem::exists(path + ".corrupt"));
    REQUIRE(config.get<std::string>("/navigator/initial_route") == "/");
    json saved = json::parse(std::ifstream(path));
    REQUIRE(saved.is_object());
}

TEST_CASE_METHOD(ConfigTestFixture, "Config: save() reports unwritable paths", "[config][save]") {
    std::string path = file("saved.json");
    config.init(path);
    config.set<std::string>("/navigator/initial_route", "/b");
    REQUIRE(config.save());
    REQUIRE(json::parse(std::ifstream(path))["navigator"]["initial_route"] == "/b");

    Config broken;
    broken.init(file("ok.json"));
    std::filesystem::remove_all(dir);
    REQUIRE_FALSE(broken.save());
}

// ============================================================================
// NavigatorConfig
// ============================================================================

TEST_CASE_METHOD(ConfigTestFixture, "NavigatorConfig: defaults for an empty config",
                 "[config][navigator]") {
    set_data(json::object());

    NavigatorConfig nc = NavigatorConfig::from_config(config);
    REQUIRE(nc.initial_route == "/");
    REQUIRE(nc.animations_enabled);
    REQUIRE(nc.transition_duration_ms == DEFAULT_TRANSITION_DURATION_MS);
    REQUIRE(nc.barrier_opa == DEFAULT_BARRIER_OPA);
}

TEST_CASE_METHOD(ConfigTestFixture, "NavigatorConfig: reads the navigator section",
                 "[config][navigator]") {
    set_data({{"navigator",
               {{"initial_route", "/b/c"},
                {"animations_enabled", false},
                {"transition_duration_ms", 350},
                {"barrier_opa", 200}}}});

    NavigatorConfig nc = NavigatorConfig::from_config(config);
    REQUIRE(nc.initial_route == "/b/c");
    REQUIRE_FALSE(nc.animations_enabled);
    REQUIRE(nc.transition_duration_ms == 350);
    REQUIRE(nc.barrier_opa == 200);
}

TEST_CASE_METHOD(ConfigTestFixture, "NavigatorConfig: out-of-range values are clamped",
                 "[config][navigator]") {
    set_data({{"navigator",
               {{"initial_route", ""}, {"transition_duration_ms", -50}, {"barrier_opa", 999}}}});

    NavigatorConfig nc = NavigatorConfig::from_config(config);
    REQUIRE(nc.initial_route == "/");
    REQUIRE(nc.transition_duration_ms == 0);
    REQUIRE(nc.barrier_opa == 255);
}

TEST_CASE_METHOD(ConfigTestFixture, "NavigatorConfig: wrong types fall back to defaults",
                 "[config][navigator]") {
    set_data({{"navigator", {{"initial_route", 42}, {"animations_enabled", false}}}});

    NavigatorConfig nc = NavigatorConfig::from_config(config);
    REQUIRE(nc.initial_route == "/");
    REQUIRE(nc.animations_enabled);
}

} // namespace strata
