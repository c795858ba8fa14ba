// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "navigator_config.h"
#include "ui_overlay.h"
#include "ui_route.h"

#include "lvgl/lvgl.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace strata {

class Navigator;

/**
 * @brief Listener for history changes
 *
 * Called synchronously, in registration order, after the change is applied.
 */
class NavigatorObserver {
  public:
    virtual ~NavigatorObserver() = default;

    /// @p route became the top route; @p previous was the top before (or nullptr)
    virtual void did_push(Route* /*route*/, Route* /*previous*/) {}

    /// @p route was popped; @p previous is the new top route
    virtual void did_pop(Route* /*route*/, Route* /*previous*/) {}

    /// @p route was removed without a pop; @p previous was the route below it (or nullptr)
    virtual void did_remove(Route* /*route*/, Route* /*previous*/) {}

    /// Navigator this observer is attached to, set when that navigator is realized
    Navigator* navigator() const {
        return navigator_;
    }

  private:
    friend class Navigator;

    Navigator* navigator_ = nullptr;
};

/// Builds a route for a name; may return nullptr when the name is unknown
using RouteFactory = std::function<RoutePtr(const RouteSettings& settings)>;

/**
 * @brief Owner of a route stack and the overlay its routes draw into
 *
 * history()[0] is the bottom route, history().back() the current one. All
 * operations run synchronously on the LVGL thread; only negotiation
 * (maybe_pop()) and transition completion report through futures.
 *
 * Usage:
 * @code
 * Navigator nav(lv_screen_active(), config);
 * nav.set_route_factory([](const RouteSettings& s) -> RoutePtr { ... });
 * nav.set_unknown_route_factory([](const RouteSettings& s) { return make_not_found(s); });
 * nav.realize();                      // pushes config.initial_route
 *
 * nav.push_named("/settings").then([](const RouteResult& r) { ... });
 * if (nav.can_pop()) nav.maybe_pop();
 * @endcode
 */
class Navigator {
  public:
    explicit Navigator(lv_obj_t* parent, NavigatorConfig config = {});
    ~Navigator();

    Navigator(const Navigator&) = delete;
    Navigator& operator=(const Navigator&) = delete;

    // ---- host hooks ------------------------------------------------------

    void set_route_factory(RouteFactory factory) {
        on_generate_route_ = std::move(factory);
    }

    /// Fallback for names the route factory rejects; must never return nullptr
    void set_unknown_route_factory(RouteFactory factory) {
        on_unknown_route_ = std::move(factory);
    }

    /// Called on every invalidate(), e.g. to request a redraw of dependent widgets
    void set_invalidate_callback(std::function<void()> callback) {
        on_invalidate_ = std::move(callback);
    }

    /**
     * @throws NavigationError if @p observer already belongs to a navigator
     */
    void add_observer(NavigatorObserver* observer);

    /// @return true if @p observer was registered
    bool remove_observer(NavigatorObserver* observer);

    void clear_observers();

    const std::vector<NavigatorObserver*>& observers() const {
        return observers_;
    }

    /**
     * @brief First-attach bootstrap
     *
     * Realizes the overlay, pushes the initial route stack and attaches the
     * registered observers. Later calls do nothing.
     */
    void realize();

    bool is_realized() const {
        return realized_;
    }

    // ---- stack operations ------------------------------------------------

    /**
     * @brief Push @p route on top of the history
     * @return The route's popped() future
     * @throws NavigationError if the route already has a navigator
     */
    Future<RouteResult> push(RoutePtr route);

    Future<RouteResult> push_named(const std::string& name);

    /**
     * @brief Put @p new_route in the slot of @p old_route and dispose the old one
     *
     * Stack order is unchanged. Observers are not notified.
     */
    void replace(Route* old_route, RoutePtr new_route);

    /**
     * @brief Replace the current route with @p new_route
     *
     * The old route completes with @p result (or its current_result()) and is
     * disposed once the new route's entrance finishes.
     */
    Future<RouteResult> push_replacement(RoutePtr new_route, RouteResult result = {});

    Future<RouteResult> push_replacement_named(const std::string& name, RouteResult result = {});

    /// replace() applied to the route directly below @p anchor_route
    void replace_route_below(Route* anchor_route, RoutePtr new_route);

    /**
     * @brief Drop the route directly below @p anchor_route
     *
     * The target must have no overlay entries left.
     */
    void remove_route_below(Route* anchor_route);

    /**
     * @brief Remove routes from the top until @p predicate holds, then push @p new_route
     *
     * Removed routes are disposed once the new route's entrance finishes.
     */
    Future<RouteResult> push_and_remove_until(RoutePtr new_route, const RoutePredicate& predicate);

    Future<RouteResult> push_named_and_remove_until(const std::string& name,
                                                    const RoutePredicate& predicate);

    /**
     * @brief Ask the current route, then pop it if it agrees
     *
     * Resolves false for PopDisposition::Bubble (the caller should handle the
     * back request itself), true otherwise.
     */
    Future<bool> maybe_pop(RouteResult result = {});

    /**
     * @brief Pop the current route without asking it
     *
     * @return true if a route left the history or a local history entry was
     *         consumed; false if the only route is left and cannot pop internally
     * @throws NavigationError if the history is empty
     */
    bool pop(RouteResult result = {});

    /// pop(@p result), then push_named(@p name)
    Future<RouteResult> pop_and_push_named(const std::string& name, RouteResult result = {});

    /**
     * @brief Remove @p route from anywhere in the history and dispose it immediately
     */
    void remove_route(Route* route);

    /**
     * @brief Dispose a popped route
     *
     * Called by routes once their exit transition finishes.
     * @throws NavigationError if @p route is already disposed
     */
    void finalize_route(Route* route);

    /**
     * @brief pop() until @p predicate holds for the current route
     *
     * Stops early when pop() reports that the last route cannot be popped.
     */
    void pop_until(const RoutePredicate& predicate);

    /// @throws NavigationError if the history is empty
    bool can_pop() const;

    /**
     * @brief Resolve @p name through the route factory, then the unknown-route factory
     * @throws RouteConfigurationError if neither produces a route
     */
    RoutePtr route_named(const std::string& name);

    /// Request a redraw of everything that depends on route state
    void invalidate();

    // ---- accessors -----------------------------------------------------------

    const std::vector<RoutePtr>& history() const {
        return history_;
    }

    /// Current (top) route, nullptr when the history is empty
    Route* current() const {
        return history_.empty() ? nullptr : history_.back().get();
    }

    Overlay& overlay() {
        return *overlay_;
    }

    const NavigatorConfig& config() const {
        return config_;
    }

    /// Routes popped but still running their exit
    size_t popped_route_count() const {
        return popped_routes_.size();
    }

    uint32_t invalidation_count() const {
        return invalidation_count_;
    }

  private:
    OverlayEntryPtr current_overlay_entry() const;
    RoutePtr generate_route(const std::string& name, bool is_initial_route) const;
    std::vector<RoutePtr> plan_initial_routes() const;
    int index_of(const Route* route) const;
    void retire_when_entered(const Future<void>& entered, std::vector<RoutePtr> routes,
                             const RoutePtr& completing, const RouteResult& result);

    std::unique_ptr<Overlay> overlay_;
    NavigatorConfig config_;

    std::vector<RoutePtr> history_;
    std::vector<NavigatorObserver*> observers_;
    std::vector<RoutePtr> popped_routes_;

    RouteFactory on_generate_route_;
    RouteFactory on_unknown_route_;
    std::function<void()> on_invalidate_;

    bool realized_ = false;
    uint32_t invalidation_count_ = 0;
};

} // namespace strata
