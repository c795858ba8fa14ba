// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file ui_update_queue.h
 * @brief Deferred work queue drained at the start of each lv_timer_handler() cycle
 *
 * Route finalization deletes LVGL objects. When that is triggered from inside an
 * animation callback (the end of an exit transition), the deletion is queued here
 * and runs on the next timer cycle, before rendering starts.
 *
 * Usage:
 * @code
 * strata::ui::queue_update([route]() { route->navigator()->finalize_route(route.get()); });
 * @endcode
 */

#pragma once

#include "lvgl/lvgl.h"

#include <spdlog/spdlog.h>

#include <functional>
#include <mutex>
#include <queue>

namespace strata::ui {

using UpdateCallback = std::function<void()>;

/**
 * @brief Singleton queue of main-thread callbacks
 *
 * init() installs a 1 ms LVGL timer that drains the queue on every
 * lv_timer_handler() call.
 */
class UpdateQueue {
  public:
    static UpdateQueue& instance() {
        static UpdateQueue instance;
        return instance;
    }

    void init() {
        if (initialized_)
            return;

        timer_ = lv_timer_create(timer_cb, 1, this);
        if (!timer_) {
            spdlog::error("[UpdateQueue] Failed to create timer!");
            return;
        }

        initialized_ = true;
        spdlog::debug("[UpdateQueue] Initialized");
    }

    /// Thread-safe. @p callback runs on the LVGL thread.
    void queue(UpdateCallback callback) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push(std::move(callback));
    }

    void shutdown() {
        if (timer_) {
            lv_timer_delete(timer_);
            timer_ = nullptr;
        }
        initialized_ = false;
    }

    bool is_initialized() const {
        return initialized_;
    }

    size_t pending_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pending_.size();
    }

  private:
    friend class UpdateQueueTestAccess;

    UpdateQueue() = default;
    ~UpdateQueue() {
        // LVGL may already be torn down at static destruction time
        if (timer_ && lv_is_initialized()) {
            lv_timer_delete(timer_);
        }
        timer_ = nullptr;
    }

    UpdateQueue(const UpdateQueue&) = delete;
    UpdateQueue& operator=(const UpdateQueue&) = delete;

    static void timer_cb(lv_timer_t* timer) {
        auto* self = static_cast<UpdateQueue*>(lv_timer_get_user_data(timer));
        if (self && self->initialized_) {
            self->process_pending();
        }
    }

    void process_pending() {
        std::queue<UpdateCallback> to_process;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::swap(to_process, pending_);
        }

        while (!to_process.empty()) {
            auto callback = std::move(to_process.front());
            to_process.pop();
            callback();
        }
    }

    std::mutex mutex_;
    std::queue<UpdateCallback> pending_;
    lv_timer_t* timer_ = nullptr;
    bool initialized_ = false;
};

inline void queue_update(UpdateCallback callback) {
    UpdateQueue::instance().queue(std::move(callback));
}

/// Call once after lv_init()
inline void update_queue_init() {
    UpdateQueue::instance().init();
}

/// Call before lv_deinit()
inline void update_queue_shutdown() {
    UpdateQueue::instance().shutdown();
}

} // namespace strata::ui
