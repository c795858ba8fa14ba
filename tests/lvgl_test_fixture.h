// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ui_update_queue.h"

#include "lvgl/lvgl.h"

#include <mutex>

/**
 * @brief Test display dimensions (standard 800x480 touchscreen)
 */
constexpr int TEST_DISPLAY_WIDTH = 800;
constexpr int TEST_DISPLAY_HEIGHT = 480;

/**
 * @brief Shared LVGL test fixture base class for Catch2 tests
 *
 * Initializes LVGL and a headless display once per test run, and gives every
 * test case a fresh screen plus a live UpdateQueue:
 *
 * @code
 * TEST_CASE_METHOD(LVGLTestFixture, "Test name", "[tags]") {
 *     Navigator nav(test_screen());
 *     ...
 *     process_lvgl(300);  // run animations and deferred finalization
 * }
 * @endcode
 */
class LVGLTestFixture {
  public:
    LVGLTestFixture();

    /// Drains pending callbacks, shuts the UpdateQueue down and deletes the test screen
    virtual ~LVGLTestFixture();

    LVGLTestFixture(const LVGLTestFixture&) = delete;
    LVGLTestFixture& operator=(const LVGLTestFixture&) = delete;
    LVGLTestFixture(LVGLTestFixture&&) = delete;
    LVGLTestFixture& operator=(LVGLTestFixture&&) = delete;

    /**
     * @brief Advance the LVGL tick by @p ms, running timers and animations
     *
     * The UpdateQueue is drained after every timer pass, so deferred route
     * finalization has happened by the time this returns.
     */
    void process_lvgl(int ms);

    /// Run queued callbacks without advancing time
    void drain_queue();

    lv_obj_t* test_screen() const {
        return m_test_screen;
    }

    /// Replace the test screen with a fresh one and make it active
    lv_obj_t* create_test_screen();

  protected:
    static void ensure_lvgl_initialized();

    lv_obj_t* m_test_screen;

    static std::once_flag s_init_flag;
    static lv_display_t* s_display;
};
