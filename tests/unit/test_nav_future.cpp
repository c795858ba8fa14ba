// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "nav_future.h"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace strata;

TEST_CASE("Future: continuations run on completion in order", "[nav][future]") {
    Promise<int> promise;
    Future<int> future = promise.get_future();
    std::vector<std::string> calls;

    future.then([&](const int& v) { calls.push_back("a" + std::to_string(v)); });
    future.then([&](const int& v) { calls.push_back("b" + std::to_string(v)); });
    REQUIRE(calls.empty());
    REQUIRE_FALSE(future.is_ready());

    promise.set_value(7);
    REQUIRE(calls == std::vector<std::string>{"a7", "b7"});
    REQUIRE(future.get() == 7);
    REQUIRE(promise.is_completed());
}

TEST_CASE("Future: late continuation runs immediately", "[nav][future]") {
    Future<std::string> future = Future<std::string>::ready("done");
    std::string seen;
    future.then([&](const std::string& v) { seen = v; });
    REQUIRE(seen == "done");
}

TEST_CASE("Future: misuse throws NavigationError", "[nav][future]") {
    SECTION("completing twice") {
        Promise<int> promise;
        promise.set_value(1);
        REQUIRE_THROWS_AS(promise.set_value(2), NavigationError);
    }

    SECTION("get() before completion") {
        Promise<int> promise;
        REQUIRE_THROWS_AS(promise.get_future().get(), NavigationError);
    }

    SECTION("then() on a default-constructed future") {
        Future<void> future;
        REQUIRE_FALSE(future.valid());
        REQUIRE_THROWS_AS(future.then([]() {}), NavigationError);
    }
}

TEST_CASE("Future<void>: copies of a promise share one state", "[nav][future]") {
    Promise<void> promise;
    Promise<void> copy = promise;
    int calls = 0;
    promise.get_future().then([&]() { ++calls; });

    copy.set_value();
    REQUIRE(calls == 1);
    REQUIRE(promise.is_completed());
    REQUIRE_THROWS_AS(promise.set_value(), NavigationError);
}

TEST_CASE("Future: continuation may register another continuation", "[nav][future]") {
    Promise<int> promise;
    Future<int> future = promise.get_future();
    int nested = 0;

    future.then([&](const int&) { future.then([&](const int& v) { nested = v; }); });
    promise.set_value(3);
    REQUIRE(nested == 3);
}
