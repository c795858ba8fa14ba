// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "nav_future.h"
#include "ui_overlay.h"

#include <any>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata {

class LocalHistory;
class Navigator;
class Route;
class RouteTransition;

/// Value a route hands back when it is popped. An empty std::any means "no result".
using RouteResult = std::any;

using RoutePtr = std::shared_ptr<Route>;

/// Route test used by pop_until() and push_and_remove_until(). Receives nullptr
/// when the history is empty.
using RoutePredicate = std::function<bool(const Route*)>;

/**
 * @brief Answer of Route::will_pop()
 */
enum class PopDisposition {
    Pop,      ///< Proceed with the pop
    DoNotPop, ///< Swallow the back request
    Bubble    ///< Let the outer system handle it (usually: exit the application)
};

const char* pop_disposition_name(PopDisposition disposition);

/**
 * @brief Data a route factory uses to build a route
 */
struct RouteSettings {
    /// Route name such as "/settings"; empty for anonymous routes
    std::optional<std::string> name;

    /// True when this is the very first route pushed onto the navigator
    bool is_initial_route = false;
};

/**
 * @brief A participant in a Navigator's history
 *
 * Lifecycle, driven by the Navigator:
 *
 *   uninstalled -> install() -> did_push() / did_replace()
 *     -> [did_change_next / did_change_previous / did_pop_next]*
 *     -> did_pop() -> Navigator::finalize_route() -> dispose()
 *
 * A route is a set of capabilities layered on this base:
 * - Overlay: create_overlay_entries() supplies layers, inserted at install()
 *   and removed at dispose().
 * - Local history (local_history() != nullptr): absorbs pops before the route
 *   itself is popped.
 * - Transition (transition() != nullptr): enter/exit animation, deferred
 *   finalization, the completed() signal.
 *
 * The default lifecycle implementations consult the capabilities in a fixed order,
 * most specific first, then fall back to the base behaviour. Subclasses that
 * override a lifecycle method should call the Route:: version to keep that order.
 */
class Route : public std::enable_shared_from_this<Route> {
  public:
    Route();
    virtual ~Route();

    Route(const Route&) = delete;
    Route& operator=(const Route&) = delete;

    /// Navigator holding this route, nullptr before push and after dispose
    Navigator* navigator() const {
        return navigator_;
    }

    const std::vector<OverlayEntryPtr>& overlay_entries() const {
        return overlay_entries_;
    }

    /**
     * @brief Resolves once, when the route is popped or completed by a replacement
     */
    Future<RouteResult> popped() const {
        return popped_.get_future();
    }

    /// Result used when pop() is called without one
    virtual RouteResult current_result() const {
        return {};
    }

    /// Whether did_pop() would consume the pop without leaving the history
    virtual bool will_handle_pop_internally() const;

    bool is_current() const;
    bool is_first() const;
    bool is_active() const;

    bool is_disposed() const {
        return disposed_;
    }

    /// Human readable identity for logs
    virtual std::string debug_name() const;

    // ---- capabilities ------------------------------------------------------

    virtual LocalHistory* local_history() {
        return nullptr;
    }
    const LocalHistory* local_history() const {
        return const_cast<Route*>(this)->local_history();
    }

    virtual RouteTransition* transition() {
        return nullptr;
    }
    const RouteTransition* transition() const {
        return const_cast<Route*>(this)->transition();
    }

    /**
     * @brief Called whenever will_handle_pop_internally() may have changed
     */
    virtual void changed_internal_state() {}

    // ---- lifecycle -----------------------------------------------------------

    /**
     * @brief Populate overlay_entries() and insert them above @p insertion_point
     *
     * @p insertion_point is nullptr when the route goes on top of the overlay.
     */
    virtual void install(const OverlayEntryPtr& insertion_point);

    /**
     * @brief Route was pushed as the new top route
     * @return Signal that fires when the entrance transition is done
     */
    virtual Future<void> did_push();

    /// Route took the place of @p old_route through replace()
    virtual void did_replace(Route* old_route);

    /**
     * @brief Ask whether a back request should pop this route
     *
     * Local history answers Pop while it has entries; otherwise the base
     * policy answers Bubble for the first route and Pop for all others.
     */
    virtual Future<PopDisposition> will_pop();

    /**
     * @brief Handle a pop request
     * @return false if the pop was absorbed (local history), true if the route
     *         should leave the history
     */
    virtual bool did_pop(const RouteResult& result);

    /// The route above this one was popped
    virtual void did_pop_next(Route* next_route);

    /// The route above this one changed (nullptr: this is now the top route)
    virtual void did_change_next(Route* next_route);

    /// The route below this one changed (nullptr: this is now the first route)
    virtual void did_change_previous(Route* previous_route);

    /**
     * @brief Resolve popped() with @p result
     * @throws NavigationError when called twice
     */
    virtual void did_complete(const RouteResult& result);

    /**
     * @brief Remove overlay entries and detach from the navigator
     * @throws NavigationError when called twice
     */
    virtual void dispose();

  protected:
    /// Layers this route contributes to the overlay, built once at install()
    virtual std::vector<OverlayEntryPtr> create_overlay_entries() {
        return {};
    }

    /**
     * @brief Whether did_pop() finalizes the route right away
     *
     * Routes with a transition finalize themselves when the exit transition ends.
     */
    virtual bool finished_when_popped() const;

  private:
    friend class Navigator;

    Navigator* navigator_ = nullptr;
    std::vector<OverlayEntryPtr> overlay_entries_;
    Promise<RouteResult> popped_;
    bool disposed_ = false;
};

/**
 * @brief Cast helper for route results
 *
 * @return Pointer to the stored value, or nullptr if the result is empty or of
 *         another type
 */
template <typename T> const T* route_result_as(const RouteResult& result) {
    return std::any_cast<T>(&result);
}

} // namespace strata
