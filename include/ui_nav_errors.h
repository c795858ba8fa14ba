// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <stdexcept>
#include <string>

/**
 * @file ui_nav_errors.h
 * @brief Error types and precondition macros for the navigation engine
 *
 * Two kinds of failure leave the engine as exceptions:
 * - NavigationError: a caller broke a documented precondition (pushing a route
 *   that already has a navigator, popping an empty history, removing an entry twice).
 *   These are programmer errors. The operation is aborted, nothing is corrected.
 * - RouteConfigurationError: the host's route factories are misconfigured
 *   (the unknown-route factory produced no route).
 *
 * Negotiated refusals (a route vetoing a pop, local history absorbing a pop) are
 * ordinary return values and never use these types.
 *
 * Usage:
 * ```cpp
 * NAV_REQUIRE(route->navigator() == nullptr, "[Navigator]", "route {} already pushed",
 *             route->debug_name());
 * ```
 */

namespace strata {

/**
 * @brief Precondition violation inside the navigation engine
 */
class NavigationError : public std::logic_error {
  public:
    explicit NavigationError(const std::string& what) : std::logic_error(what) {}
};

/**
 * @brief Host route factories are misconfigured
 *
 * Carries the route name that could not be produced and the navigator instance
 * that asked for it.
 */
class RouteConfigurationError : public std::runtime_error {
  public:
    RouteConfigurationError(const std::string& route_name, const void* navigator)
        : std::runtime_error(fmt::format("Navigator {} could not produce a route for '{}': "
                                         "on_unknown_route returned no route",
                                         navigator, route_name)),
          route_name_(route_name), navigator_(navigator) {}

    const std::string& route_name() const {
        return route_name_;
    }

    const void* navigator() const {
        return navigator_;
    }

  private:
    std::string route_name_;
    const void* navigator_;
};

} // namespace strata

/**
 * @brief Check a precondition; log and throw NavigationError when it fails
 *
 * @param cond Condition that must hold
 * @param component Log prefix such as "[Navigator]"
 * @param msg fmt-style message, followed by its arguments
 */
#define NAV_REQUIRE(cond, component, msg, ...)                                                     \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            std::string nav_require_msg_ = fmt::format(msg, ##__VA_ARGS__);                        \
            spdlog::error("{} Precondition failed ({}): {}", component, #cond, nav_require_msg_);  \
            throw ::strata::NavigationError(nav_require_msg_);                                     \
        }                                                                                          \
    } while (0)
