// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_route.h"

#include "ui_local_history.h"
#include "ui_nav_errors.h"
#include "ui_navigator.h"
#include "ui_route_transition.h"

#include <spdlog/spdlog.h>

#include <typeinfo>

namespace strata {

const char* pop_disposition_name(PopDisposition disposition) {
    switch (disposition) {
    case PopDisposition::Pop:
        return "pop";
    case PopDisposition::DoNotPop:
        return "do_not_pop";
    case PopDisposition::Bubble:
        return "bubble";
    }
    return "unknown";
}

Route::Route() = default;

Route::~Route() {
    if (!disposed_ && !overlay_entries_.empty()) {
        spdlog::warn("[Route] Route {} destroyed with {} entries still installed", (void*)this,
                     overlay_entries_.size());
    }
}

std::string Route::debug_name() const {
    return fmt::format("Route@{}", (const void*)this);
}

bool Route::will_handle_pop_internally() const {
    const LocalHistory* history = local_history();
    return history != nullptr && !history->empty();
}

bool Route::is_current() const {
    if (!navigator_) {
        return false;
    }
    const auto& history = navigator_->history();
    return !history.empty() && history.back().get() == this;
}

bool Route::is_first() const {
    if (!navigator_) {
        return false;
    }
    const auto& history = navigator_->history();
    return !history.empty() && history.front().get() == this;
}

bool Route::is_active() const {
    if (!navigator_) {
        return false;
    }
    for (const auto& route : navigator_->history()) {
        if (route.get() == this) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Lifecycle
// ============================================================================

void Route::install(const OverlayEntryPtr& insertion_point) {
    NAV_REQUIRE(navigator_ != nullptr, "[Route]", "install() of {} without a navigator",
                debug_name());
    NAV_REQUIRE(overlay_entries_.empty(), "[Route]", "{} is already installed", debug_name());

    overlay_entries_ = create_overlay_entries();
    if (!overlay_entries_.empty()) {
        navigator_->overlay().insert_all(overlay_entries_, insertion_point);
    }
    spdlog::trace("[Route] Installed {} ({} entries)", debug_name(), overlay_entries_.size());
}

Future<void> Route::did_push() {
    if (RouteTransition* t = transition()) {
        return t->begin_enter();
    }
    return Future<void>::ready();
}

void Route::did_replace(Route* /*old_route*/) {
    if (RouteTransition* t = transition()) {
        t->begin_enter();
    }
}

Future<PopDisposition> Route::will_pop() {
    if (will_handle_pop_internally()) {
        return Future<PopDisposition>::ready(PopDisposition::Pop);
    }
    return Future<PopDisposition>::ready(is_first() ? PopDisposition::Bubble
                                                    : PopDisposition::Pop);
}

bool Route::did_pop(const RouteResult& result) {
    if (LocalHistory* history = local_history()) {
        if (history->pop_entry()) {
            return false;
        }
    }

    if (RouteTransition* t = transition()) {
        t->begin_exit(result);
    }

    did_complete(result);

    if (finished_when_popped() && navigator_) {
        navigator_->finalize_route(this);
    }
    return true;
}

void Route::did_pop_next(Route* /*next_route*/) {}

void Route::did_change_next(Route* /*next_route*/) {}

void Route::did_change_previous(Route* /*previous_route*/) {}

void Route::did_complete(const RouteResult& result) {
    NAV_REQUIRE(!popped_.is_completed(), "[Route]", "did_complete() called twice on {}",
                debug_name());
    spdlog::trace("[Route] {} completed ({})", debug_name(),
                  result.has_value() ? result.type().name() : "no result");
    popped_.set_value(result);
}

void Route::dispose() {
    NAV_REQUIRE(!disposed_, "[Route]", "dispose() called twice on {}", debug_name());
    disposed_ = true;

    RouteTransition* t = transition();
    if (t) {
        t->stop();
    }

    for (auto& entry : overlay_entries_) {
        if (entry->overlay() != nullptr) {
            entry->remove();
        }
    }
    overlay_entries_.clear();
    navigator_ = nullptr;

    spdlog::debug("[Route] Disposed {}", debug_name());

    if (t) {
        t->complete();
    }
}

bool Route::finished_when_popped() const {
    const RouteTransition* t = transition();
    return t == nullptr || t->is_exit_finished();
}

} // namespace strata
