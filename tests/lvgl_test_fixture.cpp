// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "lvgl_test_fixture.h"

#include "test_helpers/update_queue_test_access.h"

using namespace strata::ui;

std::once_flag LVGLTestFixture::s_init_flag;
lv_display_t* LVGLTestFixture::s_display = nullptr;

// Width * 10 lines for partial rendering; must be LV_DRAW_BUF_ALIGN aligned
alignas(64) static lv_color_t s_display_buf[TEST_DISPLAY_WIDTH * 10];

static void test_display_flush_cb(lv_display_t* disp, const lv_area_t* /*area*/,
                                  uint8_t* /*px_map*/) {
    lv_display_flush_ready(disp);
}

LVGLTestFixture::LVGLTestFixture() : m_test_screen(nullptr) {
    ensure_lvgl_initialized();
    update_queue_init();
    m_test_screen = create_test_screen();
}

LVGLTestFixture::~LVGLTestFixture() {
    // Callbacks queued by the test may still reference its routes
    UpdateQueueTestAccess::drain_all(UpdateQueue::instance());
    update_queue_shutdown();

    if (m_test_screen != nullptr) {
        if (lv_screen_active() == m_test_screen) {
            lv_obj_t* temp = lv_obj_create(nullptr);
            lv_screen_load(temp);
        }
        lv_obj_delete(m_test_screen);
        m_test_screen = nullptr;
    }
}

void LVGLTestFixture::ensure_lvgl_initialized() {
    std::call_once(s_init_flag, []() {
        if (!lv_is_initialized()) {
            lv_init();
        }

        s_display = lv_display_create(TEST_DISPLAY_WIDTH, TEST_DISPLAY_HEIGHT);
        if (s_display != nullptr) {
            lv_display_set_buffers(s_display, s_display_buf, nullptr, sizeof(s_display_buf),
                                   LV_DISPLAY_RENDER_MODE_PARTIAL);
            lv_display_set_flush_cb(s_display, test_display_flush_cb);
        }
    });
}

lv_obj_t* LVGLTestFixture::create_test_screen() {
    if (m_test_screen != nullptr) {
        lv_obj_delete(m_test_screen);
    }

    m_test_screen = lv_obj_create(nullptr);
    if (m_test_screen != nullptr) {
        lv_screen_load(m_test_screen);
    }
    return m_test_screen;
}

void LVGLTestFixture::drain_queue() {
    UpdateQueueTestAccess::drain_all(UpdateQueue::instance());
}

void LVGLTestFixture::process_lvgl(int ms) {
    if (ms <= 0) {
        return;
    }

    constexpr int tick_interval_ms = 5;
    int elapsed = 0;
    while (elapsed < ms) {
        lv_tick_inc(tick_interval_ms);
        lv_timer_handler();
        drain_queue();
        elapsed += tick_interval_ms;
    }
}
