// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_modal_route.h"

#include "ui_navigator.h"
#include "ui_update_queue.h"

#include <spdlog/spdlog.h>

namespace strata {

ModalRoute::ModalRoute(RouteSettings settings, TransitionStyle style, bool opaque,
                       bool barrier_dismissible)
    : settings_(std::move(settings)), barrier_dismissible_(barrier_dismissible),
      barrier_color_(lv_color_black()), local_history_(*this), transition_(*this, style, opaque) {}

ModalRoute::~ModalRoute() = default;

std::string ModalRoute::debug_name() const {
    return fmt::format("{}('{}')", route_kind(), settings_.name ? *settings_.name : "");
}

lv_obj_t* ModalRoute::barrier() const {
    const auto& entries = overlay_entries();
    return entries.empty() ? nullptr : entries.front()->layer();
}

RoutePredicate ModalRoute::with_name(const std::string& name) {
    return [name](const Route* route) {
        const auto* modal = dynamic_cast<const ModalRoute*>(route);
        return modal != nullptr && modal->settings().name && *modal->settings().name == name;
    };
}

std::vector<OverlayEntryPtr> ModalRoute::create_overlay_entries() {
    // Opacity of the barrier is owned by the transition (set once the route has entered)
    auto barrier = OverlayEntry::create([this](lv_obj_t* parent) { return build_barrier(parent); },
                                        false);
    auto content = OverlayEntry::create(
        [this](lv_obj_t* parent) { return build_content_layer(parent); }, false);
    return {barrier, content};
}

lv_obj_t* ModalRoute::build_barrier(lv_obj_t* parent) {
    lv_obj_t* barrier = lv_obj_create(parent);
    lv_obj_remove_style_all(barrier);
    lv_obj_set_size(barrier, LV_PCT(100), LV_PCT(100));
    lv_obj_remove_flag(barrier, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_add_flag(barrier, LV_OBJ_FLAG_CLICKABLE);

    uint8_t opa = LV_OPA_TRANSP;
    if (!opaque() && navigator()) {
        opa = navigator()->config().barrier_opa;
    }
    lv_obj_set_style_bg_color(barrier, barrier_color_, LV_PART_MAIN);
    lv_obj_set_style_bg_opa(barrier, opa, LV_PART_MAIN);
    lv_obj_add_event_cb(barrier, barrier_clicked_cb, LV_EVENT_CLICKED, this);
    return barrier;
}

lv_obj_t* ModalRoute::build_content_layer(lv_obj_t* parent) {
    // Full-size but click-through, so taps beside the content reach the barrier
    lv_obj_t* layer = lv_obj_create(parent);
    lv_obj_remove_style_all(layer);
    lv_obj_set_size(layer, LV_PCT(100), LV_PCT(100));
    lv_obj_remove_flag(layer, LV_OBJ_FLAG_SCROLLABLE);
    lv_obj_remove_flag(layer, LV_OBJ_FLAG_CLICKABLE);

    content_ = build_content(layer);
    if (!content_) {
        spdlog::warn("[ModalRoute] {} built no content", debug_name());
    }
    return layer;
}

void ModalRoute::barrier_clicked_cb(lv_event_t* e) {
    auto* self = static_cast<ModalRoute*>(lv_event_get_user_data(e));
    if (self) {
        self->on_barrier_clicked();
    }
}

void ModalRoute::on_barrier_clicked() {
    if (!barrier_dismissible_) {
        return;
    }
    spdlog::debug("[ModalRoute] Barrier of {} tapped", debug_name());

    // The pop deletes the barrier; leave the event callback first
    std::weak_ptr<Route> weak = weak_from_this();
    ui::queue_update([weak]() {
        RoutePtr route = weak.lock();
        if (!route || !route->is_current()) {
            return;
        }
        route->navigator()->pop();
    });
}

void ModalRoute::did_change_previous(Route* previous_route) {
    Route::did_change_previous(previous_route);
    if (navigator()) {
        navigator()->invalidate();
    }
}

void ModalRoute::changed_internal_state() {
    Route::changed_internal_state();
    if (navigator()) {
        navigator()->invalidate();
    }
}

void ModalRoute::dispose() {
    Route::dispose();
    content_ = nullptr;
}

// ============================================================================
// PageRoute / PopupRoute
// ============================================================================

PageRoute::PageRoute(RouteSettings settings, ContentBuilder builder)
    : ModalRoute(std::move(settings), TransitionStyle::Slide, true, false),
      builder_(std::move(builder)) {}

lv_obj_t* PageRoute::build_content(lv_obj_t* parent) {
    return builder_ ? builder_(parent) : nullptr;
}

PopupRoute::PopupRoute(RouteSettings settings, ContentBuilder builder, bool barrier_dismissible)
    : ModalRoute(std::move(settings), TransitionStyle::Fade, false, barrier_dismissible),
      builder_(std::move(builder)) {}

lv_obj_t* PopupRoute::build_content(lv_obj_t* parent) {
    return builder_ ? builder_(parent) : nullptr;
}

} // namespace strata
