// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "ui_route.h"

#include <functional>
#include <memory>
#include <vector>

namespace strata {

class LocalHistory;

/**
 * @brief One step of a route's internal back stack
 *
 * Example: a search field that opens inside a page. Opening it adds an entry;
 * the next back press closes the search field (on_remove) instead of leaving
 * the page.
 */
class LocalHistoryEntry {
  public:
    explicit LocalHistoryEntry(std::function<void()> on_remove = {});

    LocalHistoryEntry(const LocalHistoryEntry&) = delete;
    LocalHistoryEntry& operator=(const LocalHistoryEntry&) = delete;

    static std::shared_ptr<LocalHistoryEntry> create(std::function<void()> on_remove = {});

    /**
     * @brief Remove this entry from its route's local history, running on_remove
     * @throws NavigationError if the entry is not in a local history
     */
    void remove();

    /// Route whose local history holds this entry, nullptr when detached
    Route* owner() const {
        return owner_;
    }

  private:
    friend class LocalHistory;

    std::function<void()> on_remove_;
    Route* owner_ = nullptr;
    LocalHistory* history_ = nullptr;
};

using LocalHistoryEntryPtr = std::shared_ptr<LocalHistoryEntry>;

/**
 * @brief Local history capability of a route
 *
 * Owned by the route it serves. While it holds entries, back requests are
 * answered with PopDisposition::Pop and each pop consumes the newest entry
 * instead of removing the route. The owning route is told through
 * Route::changed_internal_state() whenever the list switches between empty and
 * non-empty.
 */
class LocalHistory {
  public:
    explicit LocalHistory(Route& owner);
    ~LocalHistory();

    LocalHistory(const LocalHistory&) = delete;
    LocalHistory& operator=(const LocalHistory&) = delete;

    /// @throws NavigationError if @p entry already belongs to a route
    void add_entry(const LocalHistoryEntryPtr& entry);

    /**
     * @brief Remove @p entry and run its on_remove callback
     * @throws NavigationError if @p entry is not held by this local history
     */
    void remove_entry(LocalHistoryEntry* entry);

    bool empty() const {
        return entries_.empty();
    }

    size_t size() const {
        return entries_.size();
    }

    const std::vector<LocalHistoryEntryPtr>& entries() const {
        return entries_;
    }

    /**
     * @brief Consume the newest entry
     * @return true if an entry was consumed (the route stays in history)
     */
    bool pop_entry();

  private:
    void detach(LocalHistoryEntry& entry);

    Route& owner_;
    std::vector<LocalHistoryEntryPtr> entries_;
};

/**
 * @brief Route that carries only the local history capability
 *
 * Has no overlay entries of its own; useful for headless flows and as a base
 * for routes that draw through another mechanism.
 */
class LocalHistoryRoute : public Route {
  public:
    LocalHistoryRoute();

    LocalHistory* local_history() override {
        return &local_history_;
    }

    void add_local_history_entry(const LocalHistoryEntryPtr& entry) {
        local_history_.add_entry(entry);
    }

    void remove_local_history_entry(LocalHistoryEntry* entry) {
        local_history_.remove_entry(entry);
    }

  private:
    LocalHistory local_history_;
};

} // namespace strata
