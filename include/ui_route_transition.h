// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ui_route.h"

#include "lvgl/lvgl.h"

namespace strata {

/**
 * @brief How a route's content layer moves in and out
 */
enum class TransitionStyle {
    None,  ///< Appear and disappear instantly
    Fade,  ///< Opacity 0 <-> 255
    Slide, ///< Translate in from the right edge, fading alongside
};

const char* transition_style_name(TransitionStyle style);

/**
 * @brief Enter/exit transition capability of a route
 *
 * Owned by the route it animates. One lv_anim drives a progress value from 0
 * (off stage) to 255 (on stage), applied to the content layer (the route's last
 * overlay entry) according to the style.
 *
 * Enter: starts on did_push()/did_replace(). The route's first entry is made
 * non-opaque while the enter runs so the route below stays visible; at the end
 * it takes the route's opaque() value and the did_push() future completes.
 *
 * Exit: starts on did_pop(). Cancels a running enter (completing its future),
 * drops the first entry's opacity, and animates back to 0 from wherever the
 * enter left off. When it ends after the route has left the history, the route
 * is finalized through its navigator. Finalization from an animation callback
 * is deferred through strata::ui::queue_update() so no LVGL object is deleted
 * mid-render.
 *
 * When animations are disabled or the duration is zero both phases complete
 * synchronously.
 *
 * completed() resolves with the result recorded at exit start, once the route
 * is disposed.
 */
class RouteTransition {
  public:
    enum class Phase { Idle, Entering, Entered, Exiting, Exited };

    RouteTransition(Route& route, TransitionStyle style, bool opaque);
    ~RouteTransition();

    RouteTransition(const RouteTransition&) = delete;
    RouteTransition& operator=(const RouteTransition&) = delete;

    TransitionStyle style() const {
        return style_;
    }

    /// Whether the route hides the routes below it once entered
    bool opaque() const {
        return opaque_;
    }

    /// Takes effect on the first entry immediately if the route is fully entered
    void set_opaque(bool opaque);

    Phase phase() const {
        return phase_;
    }

    bool is_exit_finished() const {
        return phase_ == Phase::Exited;
    }

    /// Current progress, 0 = off stage, 255 = on stage
    int32_t progress() const {
        return progress_;
    }

    /**
     * @brief Start the entrance
     * @return Completes when the entrance ends or is canceled
     * @throws NavigationError unless the transition is idle
     */
    Future<void> begin_enter();

    /**
     * @brief Record @p result, cancel the entrance, start the exit
     * @throws NavigationError if the exit already started
     */
    void begin_exit(const RouteResult& result);

    /// Stop any running animation without running its end handler
    void stop();

    /**
     * @brief Resolve completed() with the recorded result; called from Route::dispose()
     *
     * Also resolves the begin_enter() future if the entrance never ended.
     */
    void complete();

    Future<RouteResult> completed() const {
        return completed_.get_future();
    }

  private:
    struct Timing {
        bool animated;
        uint32_t duration_ms;
    };

    Timing timing() const;
    void start_anim(int32_t target, lv_anim_path_cb_t path, uint32_t duration_ms);
    void apply_progress(int32_t value);
    void cancel_enter();

    void on_enter_end(bool from_anim);
    void on_exit_end(bool from_anim);

    OverlayEntry* first_entry() const;
    lv_obj_t* content_layer() const;

    static void anim_exec_cb(void* var, int32_t value);
    static void anim_completed_cb(lv_anim_t* anim);

    Route& route_;
    TransitionStyle style_;
    bool opaque_;
    Phase phase_ = Phase::Idle;
    int32_t progress_ = 0;
    bool anim_running_ = false;

    Promise<void> entered_;
    Promise<RouteResult> completed_;
    RouteResult result_;
};

} // namespace strata
