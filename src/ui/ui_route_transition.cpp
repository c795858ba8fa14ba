// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_route_transition.h"

#include "ui_nav_errors.h"
#include "ui_navigator.h"
#include "ui_update_queue.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace strata {

namespace {

// Used when the content layer has not been laid out yet
constexpr int32_t SLIDE_FALLBACK_OFFSET = 400;

constexpr int32_t PROGRESS_OFF = 0;
constexpr int32_t PROGRESS_ON = 255;

} // namespace

const char* transition_style_name(TransitionStyle style) {
    switch (style) {
    case TransitionStyle::None:
        return "none";
    case TransitionStyle::Fade:
        return "fade";
    case TransitionStyle::Slide:
        return "slide";
    }
    return "unknown";
}

RouteTransition::RouteTransition(Route& route, TransitionStyle style, bool opaque)
    : route_(route), style_(style), opaque_(opaque) {}

RouteTransition::~RouteTransition() {
    stop();
}

void RouteTransition::set_opaque(bool opaque) {
    opaque_ = opaque;
    if (phase_ == Phase::Entered) {
        if (OverlayEntry* entry = first_entry()) {
            entry->set_opaque(opaque);
        }
    }
}

RouteTransition::Timing RouteTransition::timing() const {
    Navigator* nav = route_.navigator();
    if (!nav || style_ == TransitionStyle::None) {
        return {false, 0};
    }
    const NavigatorConfig& cfg = nav->config();
    return {cfg.animations_enabled && cfg.transition_duration_ms > 0, cfg.transition_duration_ms};
}

Future<void> RouteTransition::begin_enter() {
    NAV_REQUIRE(phase_ == Phase::Idle, "[RouteTransition]",
                "enter transition of {} started twice", route_.debug_name());
    phase_ = Phase::Entering;

    if (OverlayEntry* entry = first_entry()) {
        entry->set_opaque(false);
    }

    Timing t = timing();
    if (!t.animated) {
        apply_progress(PROGRESS_ON);
        on_enter_end(false);
        spdlog::trace("[RouteTransition] {} entered instantly", route_.debug_name());
        return entered_.get_future();
    }

    apply_progress(PROGRESS_OFF);
    start_anim(PROGRESS_ON, lv_anim_path_ease_out, t.duration_ms);
    spdlog::trace("[RouteTransition] {} started {} enter ({}ms)", route_.debug_name(),
                  transition_style_name(style_), t.duration_ms);
    return entered_.get_future();
}

void RouteTransition::begin_exit(const RouteResult& result) {
    NAV_REQUIRE(phase_ != Phase::Exiting && phase_ != Phase::Exited, "[RouteTransition]",
                "exit transition of {} started twice", route_.debug_name());
    result_ = result;

    if (phase_ == Phase::Entering) {
        cancel_enter();
    } else if (phase_ == Phase::Idle) {
        // Never entered through a transition; treat the route as fully on stage
        progress_ = PROGRESS_ON;
        if (!entered_.is_completed()) {
            entered_.set_value();
        }
    }

    phase_ = Phase::Exiting;
    if (OverlayEntry* entry = first_entry()) {
        entry->set_opaque(false);
    }

    Timing t = timing();
    if (!t.animated || progress_ <= PROGRESS_OFF) {
        apply_progress(PROGRESS_OFF);
        on_exit_end(false);
        spdlog::trace("[RouteTransition] {} exited instantly", route_.debug_name());
        return;
    }

    // Exit from wherever the enter left off, at the same speed
    uint32_t duration =
        std::max<uint32_t>(1, t.duration_ms * static_cast<uint32_t>(progress_) / PROGRESS_ON);
    start_anim(PROGRESS_OFF, lv_anim_path_ease_in, duration);
    spdlog::trace("[RouteTransition] {} started {} exit ({}ms)", route_.debug_name(),
                  transition_style_name(style_), duration);
}

void RouteTransition::cancel_enter() {
    stop();
    phase_ = Phase::Entered;
    spdlog::debug("[RouteTransition] {} enter canceled at progress {}", route_.debug_name(),
                  progress_);
    if (!entered_.is_completed()) {
        entered_.set_value();
    }
}

void RouteTransition::stop() {
    if (anim_running_) {
        if (lv_is_initialized()) {
            lv_anim_delete(this, anim_exec_cb);
        }
        anim_running_ = false;
    }
}

void RouteTransition::complete() {
    // Disposed mid-enter: work waiting on the entrance still has to run
    if (!entered_.is_completed()) {
        spdlog::debug("[RouteTransition] {} disposed before its enter ended", route_.debug_name());
        entered_.set_value();
    }
    completed_.set_value(result_);
}

void RouteTransition::start_anim(int32_t target, lv_anim_path_cb_t path, uint32_t duration_ms) {
    stop();

    lv_anim_t anim;
    lv_anim_init(&anim);
    lv_anim_set_var(&anim, this);
    lv_anim_set_values(&anim, progress_, target);
    lv_anim_set_duration(&anim, duration_ms);
    lv_anim_set_path_cb(&anim, path);
    lv_anim_set_exec_cb(&anim, anim_exec_cb);
    lv_anim_set_completed_cb(&anim, anim_completed_cb);
    lv_anim_start(&anim);
    anim_running_ = true;
}

void RouteTransition::apply_progress(int32_t value) {
    progress_ = value;
    lv_obj_t* layer = content_layer();
    if (!layer) {
        return;
    }

    switch (style_) {
    case TransitionStyle::None:
        break;
    case TransitionStyle::Fade:
        lv_obj_set_style_opa(layer, static_cast<lv_opa_t>(value), LV_PART_MAIN);
        break;
    case TransitionStyle::Slide: {
        int32_t width = lv_obj_get_width(layer);
        if (width <= 0) {
            width = SLIDE_FALLBACK_OFFSET;
        }
        lv_obj_set_style_translate_x(layer, width * (PROGRESS_ON - value) / PROGRESS_ON,
                                     LV_PART_MAIN);
        lv_obj_set_style_opa(layer, static_cast<lv_opa_t>(value), LV_PART_MAIN);
        break;
    }
    }
}

void RouteTransition::on_enter_end(bool from_anim) {
    anim_running_ = false;
    phase_ = Phase::Entered;
    apply_progress(PROGRESS_ON);
    if (OverlayEntry* entry = first_entry()) {
        entry->set_opaque(opaque_);
    }
    spdlog::debug("[RouteTransition] {} entered", route_.debug_name());

    if (entered_.is_completed()) {
        return;
    }
    if (!from_anim) {
        entered_.set_value();
        return;
    }

    // Continuations may dispose other routes; never delete objects mid-render
    Promise<void> entered = entered_;
    ui::queue_update([entered]() mutable {
        if (!entered.is_completed()) {
            entered.set_value();
        }
    });
}

void RouteTransition::on_exit_end(bool from_anim) {
    anim_running_ = false;
    phase_ = Phase::Exited;
    spdlog::debug("[RouteTransition] {} exited", route_.debug_name());

    // A synchronous exit runs inside did_pop(), which finalizes the route itself
    if (!from_anim) {
        return;
    }

    std::weak_ptr<Route> weak = route_.weak_from_this();
    ui::queue_update([weak]() {
        RoutePtr route = weak.lock();
        if (!route || route->is_disposed()) {
            return;
        }
        Navigator* nav = route->navigator();
        if (!nav || route->is_active()) {
            return;
        }
        nav->finalize_route(route.get());
    });
}

OverlayEntry* RouteTransition::first_entry() const {
    const auto& entries = route_.overlay_entries();
    if (entries.empty() || entries.front()->overlay() == nullptr) {
        return nullptr;
    }
    return entries.front().get();
}

lv_obj_t* RouteTransition::content_layer() const {
    const auto& entries = route_.overlay_entries();
    if (entries.empty()) {
        return nullptr;
    }
    return entries.back()->layer();
}

void RouteTransition::anim_exec_cb(void* var, int32_t value) {
    static_cast<RouteTransition*>(var)->apply_progress(value);
}

void RouteTransition::anim_completed_cb(lv_anim_t* anim) {
    auto* self = static_cast<RouteTransition*>(anim->var);
    self->anim_running_ = false;
    if (self->phase_ == Phase::Entering) {
        self->on_enter_end(true);
    } else if (self->phase_ == Phase::Exiting) {
        self->on_exit_end(true);
    }
}

} // namespace strata
