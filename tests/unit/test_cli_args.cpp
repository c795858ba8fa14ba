// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file test_cli_args.cpp
 * @brief Unit tests for parse_cli_args()
 */

#include "cli_args.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace strata;

namespace {

/// Runs parse_cli_args() on a program name plus @p args
bool parse(std::vector<std::string> args, CliArgs& out) {
    args.insert(args.begin(), "strata-demo");
    std::vector<char*> argv;
    for (auto& a : args) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    return parse_cli_args(static_cast<int>(args.size()), argv.data(), out);
}

} // namespace

TEST_CASE("CliArgs: defaults", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({}, args));
    REQUIRE(args.config_path == "strata.json");
    REQUIRE_FALSE(args.initial_route.has_value());
    REQUIRE_FALSE(args.no_animations);
    REQUIRE_FALSE(args.transition_duration_ms.has_value());
    REQUIRE(args.screen_width == -1);
    REQUIRE(args.timeout_sec == 0);
    REQUIRE(args.verbosity == 0);
}

TEST_CASE("CliArgs: navigation options", "[cli_args]") {
    CliArgs args;

    SECTION("short and long route forms") {
        REQUIRE(parse({"-r", "/b/c"}, args));
        REQUIRE(*args.initial_route == "/b/c");

        CliArgs eq;
        REQUIRE(parse({"--route=/b"}, eq));
        REQUIRE(*eq.initial_route == "/b");
    }

    SECTION("animations and duration") {
        REQUIRE(parse({"--no-animations", "--duration", "350"}, args));
        REQUIRE(args.no_animations);
        REQUIRE(*args.transition_duration_ms == 350);
    }

    SECTION("duration out of range") {
        REQUIRE_FALSE(parse({"--duration", "6000"}, args));
        REQUIRE_FALSE(parse({"--duration=abc"}, args));
    }

    SECTION("route without a value") {
        REQUIRE_FALSE(parse({"-r"}, args));
    }
}

TEST_CASE("CliArgs: window size", "[cli_args]") {
    CliArgs args;

    SECTION("WxH") {
        REQUIRE(parse({"-s", "1024x600"}, args));
        REQUIRE(args.screen_width == 1024);
        REQUIRE(args.screen_height == 600);
    }

    SECTION("malformed sizes are rejected") {
        REQUIRE_FALSE(parse({"--size", "1024"}, args));
        REQUIRE_FALSE(parse({"--size", "0x600"}, args));
        REQUIRE_FALSE(parse({"--size", "800x480px"}, args));
    }
}

TEST_CASE("CliArgs: timeout and verbosity", "[cli_args]") {
    CliArgs args;
    REQUIRE(parse({"-t", "5", "-vv", "--verbose"}, args));
    REQUIRE(args.timeout_sec == 5);
    REQUIRE(args.verbosity == 3);

    CliArgs bad;
    REQUIRE_FALSE(parse({"--timeout", "0"}, bad));
}

TEST_CASE("CliArgs: logging options", "[cli_args]") {
    CliArgs args;

    SECTION("file destination with a path") {
        REQUIRE(parse({"--log-dest", "file", "--log-file", "/tmp/strata.log"}, args));
        REQUIRE(args.log_dest == "file");
        REQUIRE(args.log_file == "/tmp/strata.log");
    }

    SECTION("unknown destination") {
        REQUIRE_FALSE(parse({"--log-dest", "cloud"}, args));
    }

    SECTION("log file requires the file destination") {
        REQUIRE_FALSE(parse({"--log-dest", "console", "--log-file", "/tmp/x.log"}, args));
    }
}

TEST_CASE("CliArgs: help and unknown arguments", "[cli_args]") {
    CliArgs help;
    REQUIRE_FALSE(parse({"--help"}, help));
    REQUIRE(help.help_requested);

    CliArgs unknown;
    REQUIRE_FALSE(parse({"--frobnicate"}, unknown));
    REQUIRE_FALSE(unknown.help_requested);
}
