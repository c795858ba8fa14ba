// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_navigator.h"

#include "ui_nav_errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace strata {

Navigator::Navigator(lv_obj_t* parent, NavigatorConfig config)
    : overlay_(std::make_unique<Overlay>(parent)), config_(std::move(config)) {
    spdlog::debug("[Navigator] Created (initial route '{}', animations {}, {}ms)",
                  config_.initial_route, config_.animations_enabled ? "on" : "off",
                  config_.transition_duration_ms);
}

Navigator::~Navigator() {
    for (auto* observer : observers_) {
        if (observer->navigator_ == this) {
            observer->navigator_ = nullptr;
        }
    }

    // Top-down, so every exit and every layer goes away before the overlay does
    auto popped = std::move(popped_routes_);
    popped_routes_.clear();
    for (auto& route : popped) {
        if (!route->is_disposed()) {
            route->dispose();
        }
    }
    auto history = std::move(history_);
    history_.clear();
    for (auto it = history.rbegin(); it != history.rend(); ++it) {
        if (!(*it)->is_disposed()) {
            (*it)->dispose();
        }
    }
    spdlog::debug("[Navigator] Destroyed ({} routes disposed)", popped.size() + history.size());
}

// ============================================================================
// Observers and bootstrap
// ============================================================================

void Navigator::add_observer(NavigatorObserver* observer) {
    NAV_REQUIRE(observer != nullptr, "[Navigator]", "add_observer() with a null observer");
    NAV_REQUIRE(observer->navigator_ == nullptr, "[Navigator]",
                "observer {} already belongs to navigator {}", (void*)observer,
                (void*)observer->navigator_);
    NAV_REQUIRE(std::find(observers_.begin(), observers_.end(), observer) == observers_.end(),
                "[Navigator]", "observer {} registered twice", (void*)observer);

    observers_.push_back(observer);
    if (realized_) {
        observer->navigator_ = this;
    }
}

bool Navigator::remove_observer(NavigatorObserver* observer) {
    auto it = std::find(observers_.begin(), observers_.end(), observer);
    if (it == observers_.end()) {
        return false;
    }
    if (observer->navigator_ == this) {
        observer->navigator_ = nullptr;
    }
    observers_.erase(it);
    return true;
}

void Navigator::clear_observers() {
    for (auto* observer : observers_) {
        if (observer->navigator_ == this) {
            observer->navigator_ = nullptr;
        }
    }
    observers_.clear();
}

void Navigator::realize() {
    if (realized_) {
        return;
    }
    for (auto* observer : observers_) {
        NAV_REQUIRE(observer->navigator_ == nullptr || observer->navigator_ == this,
                    "[Navigator]", "observer {} already belongs to navigator {}", (void*)observer,
                    (void*)observer->navigator_);
    }

    std::vector<RoutePtr> initial = plan_initial_routes();

    realized_ = true;
    overlay_->realize();
    for (auto* observer : observers_) {
        observer->navigator_ = this;
    }

    spdlog::info("[Navigator] Booting '{}' with {} route(s)", config_.initial_route,
                 initial.size());
    for (auto& route : initial) {
        push(route);
    }
}

RoutePtr Navigator::generate_route(const std::string& name, bool is_initial_route) const {
    if (!on_generate_route_) {
        return nullptr;
    }
    RouteSettings settings;
    settings.name = name;
    settings.is_initial_route = is_initial_route;
    return on_generate_route_(settings);
}

std::vector<RoutePtr> Navigator::plan_initial_routes() const {
    const std::string& initial =
        config_.initial_route.empty() ? std::string(DEFAULT_ROUTE_NAME) : config_.initial_route;
    std::vector<RoutePtr> planned;

    if (initial.size() > 1 && initial[0] == '/') {
        // "/a/b" -> "/", "/a", "/a/b"
        std::vector<std::string> names{DEFAULT_ROUTE_NAME};
        std::string path;
        size_t start = 1;
        while (start <= initial.size()) {
            size_t end = initial.find('/', start);
            if (end == std::string::npos) {
                end = initial.size();
            }
            if (end > start) {
                path += "/" + initial.substr(start, end - start);
                names.push_back(path);
            }
            start = end + 1;
        }

        for (const auto& name : names) {
            RoutePtr route = generate_route(name, planned.empty());
            if (!route) {
                spdlog::warn("[Navigator] Could not resolve '{}' of initial route '{}', "
                             "starting at '{}'",
                             name, initial, DEFAULT_ROUTE_NAME);
                planned.clear();
                break;
            }
            planned.push_back(std::move(route));
        }
    } else if (initial != DEFAULT_ROUTE_NAME) {
        RoutePtr route = generate_route(initial, true);
        if (route) {
            planned.push_back(std::move(route));
        } else {
            spdlog::warn("[Navigator] Could not resolve initial route '{}', starting at '{}'",
                         initial, DEFAULT_ROUTE_NAME);
        }
    }

    if (planned.empty()) {
        RoutePtr route = generate_route(DEFAULT_ROUTE_NAME, true);
        if (!route && on_unknown_route_) {
            RouteSettings settings;
            settings.name = DEFAULT_ROUTE_NAME;
            settings.is_initial_route = true;
            route = on_unknown_route_(settings);
        }
        if (!route) {
            spdlog::error("[Navigator] No route for '{}' and no unknown-route fallback",
                          DEFAULT_ROUTE_NAME);
            throw RouteConfigurationError(DEFAULT_ROUTE_NAME, this);
        }
        planned.push_back(std::move(route));
    }
    return planned;
}

RoutePtr Navigator::route_named(const std::string& name) {
    RouteSettings settings;
    settings.name = name;
    settings.is_initial_route = history_.empty();

    RoutePtr route = on_generate_route_ ? on_generate_route_(settings) : nullptr;
    if (route) {
        return route;
    }

    spdlog::debug("[Navigator] No route generated for '{}', asking unknown-route factory", name);
    route = on_unknown_route_ ? on_unknown_route_(settings) : nullptr;
    if (!route) {
        spdlog::error("[Navigator] Unknown-route factory produced no route for '{}' "
                      "(navigator {})",
                      name, (void*)this);
        throw RouteConfigurationError(name, this);
    }
    return route;
}

// ============================================================================
// Helpers
// ============================================================================

OverlayEntryPtr Navigator::current_overlay_entry() const {
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
        const auto& entries = (*it)->overlay_entries();
        if (!entries.empty()) {
            return entries.back();
        }
    }
    return nullptr;
}

int Navigator::index_of(const Route* route) const {
    for (size_t i = 0; i < history_.size(); ++i) {
        if (history_[i].get() == route) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void Navigator::retire_when_entered(const Future<void>& entered, std::vector<RoutePtr> routes,
                                    const RoutePtr& completing, const RouteResult& result) {
    for (auto& route : routes) {
        popped_routes_.push_back(route);
    }

    // Routes are disposed by the destructor if this navigator goes away first
    entered.then([this, routes, completing, result]() {
        for (auto& route : routes) {
            if (route->is_disposed()) {
                continue;
            }
            auto it = std::find(popped_routes_.begin(), popped_routes_.end(), route);
            if (it != popped_routes_.end()) {
                popped_routes_.erase(it);
            }
            if (route == completing) {
                route->did_complete(result);
            }
            route->dispose();
        }
    });
}

// ============================================================================
// Stack operations
// ============================================================================

Future<RouteResult> Navigator::push(RoutePtr route) {
    NAV_REQUIRE(route != nullptr, "[Navigator]", "push() with a null route");
    NAV_REQUIRE(route->navigator_ == nullptr && !route->is_disposed(), "[Navigator]",
                "push() of {} that already has a navigator", route->debug_name());

    Route* old_route = current();
    route->navigator_ = this;
    route->install(current_overlay_entry());
    history_.push_back(route);

    route->did_push();
    route->did_change_next(nullptr);
    if (old_route) {
        old_route->did_change_next(route.get());
    }

    spdlog::debug("[Navigator] Pushed {} (depth {})", route->debug_name(), history_.size());
    for (auto* observer : observers_) {
        observer->did_push(route.get(), old_route);
    }
    return route->popped();
}

Future<RouteResult> Navigator::push_named(const std::string& name) {
    return push(route_named(name));
}

void Navigator::replace(Route* old_route, RoutePtr new_route) {
    NAV_REQUIRE(old_route != nullptr && new_route != nullptr, "[Navigator]",
                "replace() with a null route");
    if (old_route == new_route.get()) {
        return;
    }
    NAV_REQUIRE(old_route->navigator_ == this, "[Navigator]",
                "replace() of {} that is not in this navigator", old_route->debug_name());
    NAV_REQUIRE(new_route->navigator_ == nullptr && !new_route->is_disposed(), "[Navigator]",
                "replace() with {} that already has a navigator", new_route->debug_name());
    NAV_REQUIRE(!old_route->overlay_entries().empty(), "[Navigator]",
                "replace() of {} that has no overlay entries", old_route->debug_name());
    NAV_REQUIRE(new_route->overlay_entries().empty(), "[Navigator]",
                "replace() with {} that is already installed", new_route->debug_name());

    int index = index_of(old_route);
    NAV_REQUIRE(index >= 0, "[Navigator]", "replace() of {} that is not in the history",
                old_route->debug_name());
    size_t i = static_cast<size_t>(index);
    RoutePtr keep = history_[i];

    new_route->navigator_ = this;
    new_route->install(old_route->overlay_entries().back());
    history_[i] = new_route;
    new_route->did_replace(old_route);

    if (i + 1 < history_.size()) {
        Route* next = history_[i + 1].get();
        new_route->did_change_next(next);
        next->did_change_previous(new_route.get());
    } else {
        new_route->did_change_next(nullptr);
    }
    if (i > 0) {
        history_[i - 1]->did_change_next(new_route.get());
    }

    spdlog::debug("[Navigator] Replaced {} with {} at index {}", old_route->debug_name(),
                  new_route->debug_name(), i);
    old_route->dispose();
}

Future<RouteResult> Navigator::push_replacement(RoutePtr new_route, RouteResult result) {
    NAV_REQUIRE(new_route != nullptr, "[Navigator]", "push_replacement() with a null route");
    NAV_REQUIRE(new_route->navigator_ == nullptr && !new_route->is_disposed(), "[Navigator]",
                "push_replacement() of {} that already has a navigator", new_route->debug_name());
    NAV_REQUIRE(!history_.empty(), "[Navigator]", "push_replacement() on an empty history");

    RoutePtr old_route = history_.back();
    NAV_REQUIRE(old_route->navigator_ == this, "[Navigator]",
                "push_replacement() over {} that is not in this navigator",
                old_route->debug_name());

    RouteResult resolved = result.has_value() ? result : old_route->current_result();

    new_route->navigator_ = this;
    new_route->install(current_overlay_entry());
    history_.back() = new_route;

    Future<void> entered = new_route->did_push();
    new_route->did_change_next(nullptr);
    if (history_.size() > 1) {
        history_[history_.size() - 2]->did_change_next(new_route.get());
    }

    spdlog::debug("[Navigator] {} replaces current {}", new_route->debug_name(),
                  old_route->debug_name());
    for (auto* observer : observers_) {
        observer->did_push(new_route.get(), old_route.get());
    }

    retire_when_entered(entered, {old_route}, old_route, resolved);
    return new_route->popped();
}

Future<RouteResult> Navigator::push_replacement_named(const std::string& name,
                                                      RouteResult result) {
    return push_replacement(route_named(name), std::move(result));
}

void Navigator::replace_route_below(Route* anchor_route, RoutePtr new_route) {
    NAV_REQUIRE(anchor_route != nullptr && anchor_route->navigator_ == this, "[Navigator]",
                "replace_route_below() with an anchor that is not in this navigator");
    int index = index_of(anchor_route);
    NAV_REQUIRE(index > 0, "[Navigator]", "replace_route_below(): no route below {}",
                anchor_route->debug_name());
    replace(history_[static_cast<size_t>(index) - 1].get(), std::move(new_route));
}

void Navigator::remove_route_below(Route* anchor_route) {
    NAV_REQUIRE(anchor_route != nullptr && anchor_route->navigator_ == this, "[Navigator]",
                "remove_route_below() with an anchor that is not in this navigator");
    int index = index_of(anchor_route);
    NAV_REQUIRE(index > 0, "[Navigator]", "remove_route_below(): no route below {}",
                anchor_route->debug_name());

    size_t target_index = static_cast<size_t>(index) - 1;
    RoutePtr target = history_[target_index];
    NAV_REQUIRE(target->overlay_entries().empty(), "[Navigator]",
                "remove_route_below(): {} still has {} overlay entries", target->debug_name(),
                target->overlay_entries().size());

    history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(target_index));
    Route* previous = target_index > 0 ? history_[target_index - 1].get() : nullptr;
    if (previous) {
        previous->did_change_next(anchor_route);
    }
    anchor_route->did_change_previous(previous);

    spdlog::debug("[Navigator] Removed {} below {}", target->debug_name(),
                  anchor_route->debug_name());
    target->dispose();
}

Future<RouteResult> Navigator::push_and_remove_until(RoutePtr new_route,
                                                     const RoutePredicate& predicate) {
    NAV_REQUIRE(new_route != nullptr, "[Navigator]", "push_and_remove_until() with a null route");
    NAV_REQUIRE(new_route->navigator_ == nullptr && !new_route->is_disposed(), "[Navigator]",
                "push_and_remove_until() of {} that already has a navigator",
                new_route->debug_name());

    // Validate every route to be removed before the history changes
    size_t keep = history_.size();
    while (keep > 0 && !predicate(history_[keep - 1].get())) {
        const RoutePtr& route = history_[keep - 1];
        NAV_REQUIRE(route->navigator_ == this && !route->overlay_entries().empty(), "[Navigator]",
                    "push_and_remove_until(): {} is already being removed", route->debug_name());
        --keep;
    }

    auto removed_count = static_cast<std::ptrdiff_t>(history_.size() - keep);
    std::vector<RoutePtr> removed(history_.rbegin(), history_.rbegin() + removed_count);
    history_.resize(keep);

    Route* old_route = current();
    new_route->navigator_ = this;
    new_route->install(current_overlay_entry());
    history_.push_back(new_route);

    Future<void> entered = new_route->did_push();
    new_route->did_change_next(nullptr);
    if (old_route) {
        old_route->did_change_next(new_route.get());
    }

    spdlog::debug("[Navigator] Pushed {} after removing {} route(s)", new_route->debug_name(),
                  removed.size());
    for (auto* observer : observers_) {
        observer->did_push(new_route.get(), old_route);
    }
    for (const auto& route : removed) {
        for (auto* observer : observers_) {
            observer->did_remove(route.get(), old_route);
        }
    }

    retire_when_entered(entered, std::move(removed), nullptr, {});
    return new_route->popped();
}

Future<RouteResult> Navigator::push_named_and_remove_until(const std::string& name,
                                                           const RoutePredicate& predicate) {
    return push_and_remove_until(route_named(name), predicate);
}

Future<bool> Navigator::maybe_pop(RouteResult result) {
    NAV_REQUIRE(!history_.empty(), "[Navigator]", "maybe_pop() on an empty history");

    RoutePtr route = history_.back();
    Promise<bool> answer;
    Future<bool> future = answer.get_future();

    route->will_pop().then(
        [this, route, result, answer](const PopDisposition& disposition) mutable {
            spdlog::debug("[Navigator] {} answered will_pop with {}", route->debug_name(),
                          pop_disposition_name(disposition));
            switch (disposition) {
            case PopDisposition::Bubble:
                answer.set_value(false);
                return;
            case PopDisposition::Pop:
                if (route->is_current()) {
                    pop(result);
                } else {
                    spdlog::warn("[Navigator] {} is no longer current, pop skipped",
                                 route->debug_name());
                }
                answer.set_value(true);
                return;
            case PopDisposition::DoNotPop:
                answer.set_value(true);
                return;
            }
        });
    return future;
}

bool Navigator::pop(RouteResult result) {
    NAV_REQUIRE(!history_.empty(), "[Navigator]", "pop() on an empty history");

    RoutePtr route = history_.back();
    NAV_REQUIRE(route->navigator_ == this, "[Navigator]", "pop() of {} that is not in this navigator",
                route->debug_name());

    if (history_.size() == 1 && !route->will_handle_pop_internally()) {
        spdlog::debug("[Navigator] pop() refused: {} is the only route", route->debug_name());
        return false;
    }

    RouteResult resolved = result.has_value() ? result : route->current_result();
    if (!route->did_pop(resolved)) {
        spdlog::trace("[Navigator] {} handled pop internally", route->debug_name());
        return true;
    }

    if (history_.size() == 1) {
        spdlog::warn("[Navigator] {} accepted a pop but is the only route; history unchanged",
                     route->debug_name());
        return false;
    }

    history_.pop_back();
    if (route->navigator_ != nullptr) {
        popped_routes_.push_back(route);
    }

    Route* new_top = history_.back().get();
    new_top->did_pop_next(route.get());

    spdlog::debug("[Navigator] Popped {} (depth {}, {} awaiting finalize)", route->debug_name(),
                  history_.size(), popped_routes_.size());
    for (auto* observer : observers_) {
        observer->did_pop(route.get(), new_top);
    }
    return true;
}

Future<RouteResult> Navigator::pop_and_push_named(const std::string& name, RouteResult result) {
    pop(std::move(result));
    return push_named(name);
}

void Navigator::remove_route(Route* route) {
    NAV_REQUIRE(route != nullptr && route->navigator_ == this, "[Navigator]",
                "remove_route() of a route that is not in this navigator");
    int index = index_of(route);
    NAV_REQUIRE(index >= 0, "[Navigator]", "remove_route() of {} that is not in the history",
                route->debug_name());

    size_t i = static_cast<size_t>(index);
    RoutePtr keep = history_[i];
    history_.erase(history_.begin() + index);

    Route* previous = i > 0 ? history_[i - 1].get() : nullptr;
    Route* next = i < history_.size() ? history_[i].get() : nullptr;
    if (previous) {
        previous->did_change_next(next);
    }
    if (next) {
        next->did_change_previous(previous);
    }

    spdlog::debug("[Navigator] Removed {} from index {}", route->debug_name(), i);
    for (auto* observer : observers_) {
        observer->did_remove(route, previous);
    }
    route->dispose();
}

void Navigator::finalize_route(Route* route) {
    NAV_REQUIRE(route != nullptr, "[Navigator]", "finalize_route() with a null route");
    NAV_REQUIRE(!route->is_disposed(), "[Navigator]", "finalize_route() of {} that is disposed",
                route->debug_name());

    RoutePtr keep;
    auto it = std::find_if(popped_routes_.begin(), popped_routes_.end(),
                           [route](const RoutePtr& r) { return r.get() == route; });
    if (it != popped_routes_.end()) {
        keep = *it;
        popped_routes_.erase(it);
    }

    spdlog::trace("[Navigator] Finalizing {}", route->debug_name());
    route->dispose();
}

void Navigator::pop_until(const RoutePredicate& predicate) {
    while (!predicate(current())) {
        if (!pop()) {
            spdlog::warn("[Navigator] pop_until() stopped at {}: last route cannot be popped",
                         current() ? current()->debug_name() : std::string("<empty>"));
            return;
        }
    }
}

bool Navigator::can_pop() const {
    NAV_REQUIRE(!history_.empty(), "[Navigator]", "can_pop() on an empty history");
    return history_.size() > 1 || history_.front()->will_handle_pop_internally();
}

void Navigator::invalidate() {
    ++invalidation_count_;
    if (overlay_->container()) {
        lv_obj_invalidate(overlay_->container());
    }
    if (on_invalidate_) {
        on_invalidate_();
    }
}

} // namespace strata
