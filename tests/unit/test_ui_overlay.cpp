// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_nav_errors.h"
#include "ui_overlay.h"

#include "../lvgl_test_fixture.h"

#include <catch2/catch_test_macros.hpp>

using namespace strata;

namespace {

OverlayEntryPtr make_entry(bool opaque) {
    return OverlayEntry::create([](lv_obj_t* parent) { return lv_obj_create(parent); }, opaque);
}

} // namespace

TEST_CASE_METHOD(LVGLTestFixture, "Overlay: layer order follows entry order",
                 "[ui][overlay]") {
    Overlay overlay(test_screen());
    auto a = make_entry(false);
    auto b = make_entry(false);
    auto c = make_entry(false);

    overlay.insert(a);
    overlay.insert(c);
    overlay.insert(b, a); // between a and c

    REQUIRE(overlay.entries() == std::vector<OverlayEntryPtr>{a, b, c});
    REQUIRE(overlay.index_of(b.get()) == 1);
    for (size_t i = 0; i < overlay.entries().size(); ++i) {
        REQUIRE(lv_obj_get_child(overlay.container(), static_cast<int32_t>(i)) ==
                overlay.entries()[i]->layer());
    }
    REQUIRE(a->overlay() == &overlay);
}

TEST_CASE_METHOD(LVGLTestFixture, "Overlay: opaque entries hide everything below them",
                 "[ui][overlay]") {
    Overlay overlay(test_screen());
    auto bottom = make_entry(true);
    auto middle = make_entry(true);
    auto top = make_entry(false);
    overlay.insert_all({bottom, middle, top});

    REQUIRE(top->is_visible());
    REQUIRE(middle->is_visible());
    REQUIRE_FALSE(bottom->is_visible());

    SECTION("making the middle entry translucent reveals the bottom") {
        middle->set_opaque(false);
        REQUIRE(bottom->is_visible());
    }

    SECTION("removing the middle entry reveals the bottom") {
        middle->remove();
        REQUIRE(bottom->is_visible());
        REQUIRE(middle->layer() == nullptr);
        REQUIRE(middle->overlay() == nullptr);
        REQUIRE(overlay.entries().size() == 2);
    }

    SECTION("an opaque entry on top hides the rest") {
        auto cover = make_entry(true);
        overlay.insert(cover);
        REQUIRE(cover->is_visible());
        REQUIRE_FALSE(top->is_visible());
        REQUIRE_FALSE(middle->is_visible());
    }
}

TEST_CASE_METHOD(LVGLTestFixture, "Overlay: realize() inserts initial entries once",
                 "[ui][overlay]") {
    auto a = make_entry(true);
    auto b = make_entry(false);
    Overlay overlay(test_screen(), {a, b});

    REQUIRE(overlay.entries().empty());
    overlay.realize();
    REQUIRE(overlay.is_realized());
    REQUIRE(overlay.entries().size() == 2);
    overlay.realize();
    REQUIRE(overlay.entries().size() == 2);
}

TEST_CASE_METHOD(LVGLTestFixture, "Overlay: precondition violations", "[ui][overlay]") {
    Overlay overlay(test_screen());
    Overlay other(test_screen());
    auto entry = make_entry(false);
    overlay.insert(entry);

    SECTION("inserting an entry twice") {
        REQUIRE_THROWS_AS(overlay.insert(entry), NavigationError);
        REQUIRE_THROWS_AS(other.insert(entry), NavigationError);
    }

    SECTION("insertion point from another overlay") {
        REQUIRE_THROWS_AS(other.insert(make_entry(false), entry), NavigationError);
    }

    SECTION("duplicate entry in one batch leaves the overlay untouched") {
        auto dup = make_entry(false);
        REQUIRE_THROWS_AS(overlay.insert_all({dup, dup}), NavigationError);
        REQUIRE(overlay.entries().size() == 1);
        REQUIRE(dup->overlay() == nullptr);
    }

    SECTION("removing a detached entry") {
        entry->remove();
        REQUIRE_THROWS_AS(entry->remove(), NavigationError);
    }

    SECTION("changing opacity of a detached entry") {
        auto loose = make_entry(false);
        REQUIRE_THROWS_AS(loose->set_opaque(true), NavigationError);
        REQUIRE_NOTHROW(loose->set_opaque(false));
    }
}

TEST_CASE_METHOD(LVGLTestFixture, "Overlay: builder returning nothing gets a placeholder",
                 "[ui][overlay]") {
    Overlay overlay(test_screen());
    auto empty = OverlayEntry::create([](lv_obj_t*) -> lv_obj_t* { return nullptr; }, false);
    auto real = make_entry(false);
    overlay.insert_all({empty, real});

    REQUIRE(empty->layer() != nullptr);
    REQUIRE(lv_obj_get_child(overlay.container(), 1) == real->layer());
}

TEST_CASE_METHOD(LVGLTestFixture, "Overlay: survives its container being deleted",
                 "[ui][overlay]") {
    auto entry = make_entry(false);
    {
        Overlay overlay(create_test_screen());
        overlay.insert(entry);
        lv_obj_delete(overlay.container());
        REQUIRE(overlay.container() == nullptr);
        REQUIRE(entry->layer() == nullptr);

        auto late = make_entry(false);
        REQUIRE_THROWS_AS(overlay.insert(late), NavigationError);
        REQUIRE_THROWS_AS(overlay.insert_all({late}), NavigationError);
        REQUIRE(late->overlay() == nullptr);
        REQUIRE(late->layer() == nullptr);
        REQUIRE(overlay.entries().size() == 1);
    }
    REQUIRE(entry->overlay() == nullptr);
}
