// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "navigator_config.h"

#include "config.h"

#include <spdlog/spdlog.h>

namespace strata {

NavigatorConfig NavigatorConfig::from_config(Config& config) {
    NavigatorConfig nc;

    try {
        nc.initial_route =
            config.get<std::string>("/navigator/initial_route", DEFAULT_ROUTE_NAME);
        if (nc.initial_route.empty()) {
            spdlog::warn("[NavigatorConfig] Empty initial_route, using '{}'", DEFAULT_ROUTE_NAME);
            nc.initial_route = DEFAULT_ROUTE_NAME;
        }

        nc.animations_enabled = config.get<bool>("/navigator/animations_enabled", true);

        int duration = config.get<int>("/navigator/transition_duration_ms",
                                       static_cast<int>(DEFAULT_TRANSITION_DURATION_MS));
        if (duration < 0) {
            spdlog::warn("[NavigatorConfig] transition_duration_ms {} < 0, using 0", duration);
            duration = 0;
        }
        nc.transition_duration_ms = static_cast<uint32_t>(duration);

        int opa = config.get<int>("/navigator/barrier_opa", DEFAULT_BARRIER_OPA);
        if (opa < 0 || opa > 255) {
            spdlog::warn("[NavigatorConfig] barrier_opa {} outside 0-255, clamping", opa);
            opa = opa < 0 ? 0 : 255;
        }
        nc.barrier_opa = static_cast<uint8_t>(opa);
    } catch (const json::exception& e) {
        spdlog::error("[NavigatorConfig] Invalid /navigator section: {}", e.what());
        return NavigatorConfig{};
    }

    return nc;
}

} // namespace strata
