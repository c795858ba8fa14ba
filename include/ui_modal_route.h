// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ui_local_history.h"
#include "ui_route.h"
#include "ui_route_transition.h"

#include "lvgl/lvgl.h"

#include <functional>
#include <string>

namespace strata {

/**
 * @brief Route that blocks interaction with the routes below it
 *
 * Contributes two overlay entries: a full-size barrier (bottom) and a content
 * layer (top) holding whatever build_content() creates. Carries the local
 * history and transition capabilities. Tapping a dismissible barrier pops the
 * route when it is current.
 *
 * Capability order for every lifecycle call is local history, then transition,
 * then the plain route behaviour (see Route).
 */
class ModalRoute : public Route {
  public:
    ModalRoute(RouteSettings settings, TransitionStyle style, bool opaque,
               bool barrier_dismissible);
    ~ModalRoute() override;

    const RouteSettings& settings() const {
        return settings_;
    }

    bool barrier_dismissible() const {
        return barrier_dismissible_;
    }
    void set_barrier_dismissible(bool dismissible) {
        barrier_dismissible_ = dismissible;
    }

    lv_color_t barrier_color() const {
        return barrier_color_;
    }
    /// Applies to barriers built after the call
    void set_barrier_color(lv_color_t color) {
        barrier_color_ = color;
    }

    bool opaque() const {
        return transition_.opaque();
    }

    /// Resolves after the route is disposed, with the result it was popped with
    Future<RouteResult> completed() const {
        return transition_.completed();
    }

    void add_local_history_entry(const LocalHistoryEntryPtr& entry) {
        local_history_.add_entry(entry);
    }
    void remove_local_history_entry(LocalHistoryEntry* entry) {
        local_history_.remove_entry(entry);
    }

    /// Barrier layer, nullptr until installed
    lv_obj_t* barrier() const;

    /// Object returned by build_content(), nullptr until installed
    lv_obj_t* content() const {
        return content_;
    }

    LocalHistory* local_history() override {
        return &local_history_;
    }
    RouteTransition* transition() override {
        return &transition_;
    }

    void did_change_previous(Route* previous_route) override;
    void changed_internal_state() override;
    void dispose() override;

    std::string debug_name() const override;

    /// Predicate matching a ModalRoute whose settings name equals @p name
    static RoutePredicate with_name(const std::string& name);

  protected:
    /// Build the visible part of the route inside @p parent (the content layer)
    virtual lv_obj_t* build_content(lv_obj_t* parent) = 0;

    virtual const char* route_kind() const {
        return "ModalRoute";
    }

    std::vector<OverlayEntryPtr> create_overlay_entries() override;

  private:
    lv_obj_t* build_barrier(lv_obj_t* parent);
    lv_obj_t* build_content_layer(lv_obj_t* parent);
    void on_barrier_clicked();

    static void barrier_clicked_cb(lv_event_t* e);

    RouteSettings settings_;
    bool barrier_dismissible_;
    lv_color_t barrier_color_;
    lv_obj_t* content_ = nullptr;

    LocalHistory local_history_;
    RouteTransition transition_;
};

/// Builds the visible part of a page or popup inside its content layer
using ContentBuilder = std::function<lv_obj_t*(lv_obj_t* parent)>;

/**
 * @brief Full-screen, opaque route that slides in from the right
 */
class PageRoute : public ModalRoute {
  public:
    PageRoute(RouteSettings settings, ContentBuilder builder);

  protected:
    lv_obj_t* build_content(lv_obj_t* parent) override;
    const char* route_kind() const override {
        return "PageRoute";
    }

  private:
    ContentBuilder builder_;
};

/**
 * @brief Translucent route that fades in over the current one
 *
 * The routes below stay visible behind a dimmed barrier, which dismisses the
 * popup when tapped.
 */
class PopupRoute : public ModalRoute {
  public:
    PopupRoute(RouteSettings settings, ContentBuilder builder, bool barrier_dismissible = true);

  protected:
    lv_obj_t* build_content(lv_obj_t* parent) override;
    const char* route_kind() const override {
        return "PopupRoute";
    }

  private:
    ContentBuilder builder_;
};

} // namespace strata
