// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <string>

namespace strata {

class Config;

/// Route every navigator falls back to
constexpr const char* DEFAULT_ROUTE_NAME = "/";

/// Transition duration used when nothing else is configured
constexpr uint32_t DEFAULT_TRANSITION_DURATION_MS = 200;

/// Barrier opacity used when nothing else is configured (LV_OPA_50)
constexpr uint8_t DEFAULT_BARRIER_OPA = 127;

/**
 * @brief Runtime settings for a Navigator
 */
struct NavigatorConfig {
    /// Route pushed by Navigator::realize(); "/a/b" boots as "/", "/a", "/a/b"
    std::string initial_route = DEFAULT_ROUTE_NAME;

    /// When false, every transition jumps straight to its final state
    bool animations_enabled = true;

    uint32_t transition_duration_ms = DEFAULT_TRANSITION_DURATION_MS;

    /// Opacity of modal barriers (0-255)
    uint8_t barrier_opa = DEFAULT_BARRIER_OPA;

    /**
     * @brief Read the /navigator section of @p config
     *
     * Missing keys keep their defaults. Out-of-range values are clamped with a warning.
     */
    static NavigatorConfig from_config(Config& config);
};

} // namespace strata
