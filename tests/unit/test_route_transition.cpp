// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_nav_errors.h"
#include "ui_navigator.h"
#include "ui_route_transition.h"

#include "../lvgl_test_fixture.h"
#include "../mocks/recording_route.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>

using namespace strata;
using namespace strata::testing;

namespace {

constexpr uint32_t TEST_DURATION_MS = 100;

NavigatorConfig animated_config() {
    NavigatorConfig config;
    config.animations_enabled = true;
    config.transition_duration_ms = TEST_DURATION_MS;
    return config;
}

RecordingRoutePtr animated_route(const std::string& name, CallLog* log = nullptr,
                                 TransitionStyle style = TransitionStyle::Fade) {
    auto route = RecordingRoute::create(name, log, 2, true);
    route->with_transition(style, true);
    return route;
}

} // namespace

TEST_CASE("RouteTransition: style names", "[nav][transition]") {
    REQUIRE(std::string(transition_style_name(TransitionStyle::None)) == "none");
    REQUIRE(std::string(transition_style_name(TransitionStyle::Fade)) == "fade");
    REQUIRE(std::string(transition_style_name(TransitionStyle::Slide)) == "slide");
}

TEST_CASE_METHOD(LVGLTestFixture, "RouteTransition: instant when animations are off",
                 "[nav][transition]") {
    NavigatorConfig config = animated_config();
    config.animations_enabled = false;
    Navigator nav(test_screen(), config);

    nav.push(animated_route("a"));
    auto b = animated_route("b");
    Future<void> entered = b->did_push(); // without a navigator there is nothing to animate
    REQUIRE(entered.is_ready());

    auto c = animated_route("c");
    nav.push(c);
    REQUIRE(c->transition()->phase() == RouteTransition::Phase::Entered);
    REQUIRE(c->transition()->progress() == 255);
    REQUIRE(c->overlay_entries().front()->opaque());

    nav.pop();
    REQUIRE(c->is_disposed());
    REQUIRE(c->transition()->completed().is_ready());
    REQUIRE(nav.popped_route_count() == 0);
}

TEST_CASE_METHOD(LVGLTestFixture, "RouteTransition: zero duration is instant",
                 "[nav][transition]") {
    NavigatorConfig config = animated_config();
    config.transition_duration_ms = 0;
    Navigator nav(test_screen(), config);

    auto a = animated_route("a");
    nav.push(a);
    REQUIRE(a->transition()->phase() == RouteTransition::Phase::Entered);
}

TEST_CASE_METHOD(LVGLTestFixture, "RouteTransition: None style never animates",
                 "[nav][transition]") {
    Navigator nav(test_screen(), animated_config());
    auto a = animated_route("a", nullptr, TransitionStyle::None);
    nav.push(a);
    REQUIRE(a->transition()->phase() == RouteTransition::Phase::Entered);
}

TEST_CASE_METHOD(LVGLTestFixture, "RouteTransition: animated enter", "[nav][transition]") {
    Navigator nav(test_screen(), animated_config());
    auto a = animated_route("a");
    nav.push(a);
    process_lvgl(TEST_DURATION_MS + 50);

    auto b = animated_route("b");
    nav.push(b);
    RouteTransition* t = b->transition();
    REQUIRE(t->phase() == RouteTransition::Phase::Entering);
    REQUIRE_FALSE(b->overlay_entries().front()->opaque());

    // The route below stays visible while the new one enters
    REQUIRE(a->overlay_entries().back()->is_visible());

    process_lvgl(TEST_DURATION_MS + 50);
    REQUIRE(t->phase() == RouteTransition::Phase::Entered);
    REQUIRE(t->progress() == 255);
    REQUIRE(b->overlay_entries().front()->opaque());
    REQUIRE_FALSE(a->overlay_entries().back()->is_visible());
    REQUIRE(lv_obj_get_style_opa(b->overlay_entries().back()->layer(), LV_PART_MAIN) ==
            LV_OPA_COVER);
}

TEST_CASE_METHOD(LVGLTestFixture, "RouteTransition: slide ends at its resting position",
                 "[nav][transition]") {
    Navigator nav(test_screen(), animated_config());
    auto a = animated_route("a", nullptr, TransitionStyle::Slide);
    nav.push(a);
    process_lvgl(TEST_DURATION_MS + 50);

    lv_obj_t* layer = a->overlay_entries().back()->layer();
    REQUIRE(lv_obj_get_style_translate_x(layer, LV_PART_MAIN) == 0);
    REQUIRE(lv_obj_get_style_opa(layer, LV_PART_MAIN) == LV_OPA_COVER);
}

TEST_CASE_METHOD(LVGLTestFixture, "RouteTransition: animated exit defers finalization",
                 "[nav][transition]") {
    CallLog log;
    Navigator nav(test_screen(), animated_config());
    auto a = animated_route("a", &log);
    auto b = animated_route("b", &log);
    nav.push(a);
    nav.push(b);
    process_lvgl(TEST_DURATION_MS + 50);
    log.clear();

    Future<RouteResult> completed = b->transition()->completed();
    Future<RouteResult> popped = b->popped();
    REQUIRE(nav.pop(std::string("done")));

    // Left the history, resolved popped(), but still on screen
    REQUIRE(nav.current() == a.get());
    REQUIRE(popped.is_ready());
    REQUIRE_FALSE(b->is_disposed());
    REQUIRE(b->navigator() == &nav);
    REQUIRE(nav.popped_route_count() == 1);
    REQUIRE(b->transition()->phase() == RouteTransition::Phase::Exiting);
    REQUIRE(b->overlay_entries().back()->is_visible());
    REQUIRE(a->overlay_entries().back()->is_visible());
    REQUIRE_FALSE(completed.is_ready());

    process_lvgl(TEST_DURATION_MS + 50);
    REQUIRE(b->is_disposed());
    REQUIRE(nav.popped_route_count() == 0);
    REQUIRE(nav.overlay().entries().size() == 2);
    REQUIRE(*route_result_as<std::string>(completed.get()) == "done");
    REQUIRE(log == CallLog{"b:did_pop", "b:did_complete", "a:did_pop_next", "b:dispose"});
}

TEST_CASE_METHOD(LVGLTestFixture, "RouteTransition: pop during the enter reverses it",
                 "[nav][transition]") {
    Navigator nav(test_screen(), animated_config());
    nav.push(animated_route("a"));
    process_lvgl(TEST_DURATION_MS + 50);

    auto c = animated_route("c");
    nav.push(c);
    process_lvgl(TEST_DURATION_MS / 2);
    int32_t partial = c->transition()->progress();
    REQUIRE(partial > 0);
    REQUIRE(partial < 255);

    nav.pop();
    REQUIRE(c->transition()->phase() == RouteTransition::Phase::Exiting);
    REQUIRE(c->transition()->progress() <= partial);

    process_lvgl(TEST_DURATION_MS + 50);
    REQUIRE(c->is_disposed());
    REQUIRE(nav.popped_route_count() == 0);
}

TEST_CASE_METHOD(LVGLTestFixture, "RouteTransition: precondition violations",
                 "[nav][transition]") {
    Navigator nav(test_screen(), animated_config());
    auto a = animated_route("a");
    nav.push(a);
    process_lvgl(TEST_DURATION_MS + 50);

    REQUIRE_THROWS_AS(a->transition()->begin_enter(), NavigationError);
    a->transition()->begin_exit({});
    REQUIRE_THROWS_AS(a->transition()->begin_exit({}), NavigationError);
    a->transition()->stop();
}

TEST_CASE_METHOD(LVGLTestFixture, "RouteTransition: set_opaque() after the enter",
                 "[nav][transition]") {
    Navigator nav(test_screen(), animated_config());
    auto a = animated_route("a");
    auto b = animated_route("b");
    nav.push(a);
    nav.push(b);
    process_lvgl(TEST_DURATION_MS + 50);
    REQUIRE_FALSE(a->overlay_entries().back()->is_visible());

    b->transition()->set_opaque(false);
    REQUIRE_FALSE(b->transition()->opaque());
    REQUIRE(a->overlay_entries().back()->is_visible());
}

TEST_CASE_METHOD(LVGLTestFixture, "RouteTransition: navigator destroyed mid-exit",
                 "[nav][transition]") {
    auto b = animated_route("b");
    {
        Navigator nav(test_screen(), animated_config());
        nav.push(animated_route("a"));
        nav.push(b);
        process_lvgl(TEST_DURATION_MS + 50);
        nav.pop();
        REQUIRE_FALSE(b->is_disposed());
    }
    REQUIRE(b->is_disposed());
    REQUIRE(b->transition()->completed().is_ready());

    // The queued finalization finds the route already disposed
    process_lvgl(TEST_DURATION_MS + 50);
    REQUIRE(b->navigator() == nullptr);
}
