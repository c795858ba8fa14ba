// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_local_history.h"

#include "ui_nav_errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace strata {

LocalHistoryEntry::LocalHistoryEntry(std::function<void()> on_remove)
    : on_remove_(std::move(on_remove)) {}

std::shared_ptr<LocalHistoryEntry> LocalHistoryEntry::create(std::function<void()> on_remove) {
    return std::make_shared<LocalHistoryEntry>(std::move(on_remove));
}

void LocalHistoryEntry::remove() {
    NAV_REQUIRE(history_ != nullptr, "[LocalHistory]",
                "remove() on local history entry {} that has no route", (void*)this);
    history_->remove_entry(this);
}

LocalHistory::LocalHistory(Route& owner) : owner_(owner) {}

LocalHistory::~LocalHistory() {
    // Entries may outlive the route; leave them detached, without running callbacks
    for (auto& entry : entries_) {
        entry->owner_ = nullptr;
        entry->history_ = nullptr;
    }
}

void LocalHistory::add_entry(const LocalHistoryEntryPtr& entry) {
    NAV_REQUIRE(entry != nullptr, "[LocalHistory]", "add_entry() with a null entry");
    NAV_REQUIRE(entry->owner_ == nullptr, "[LocalHistory]",
                "local history entry {} already belongs to route {}", (void*)entry.get(),
                entry->owner_ ? entry->owner_->debug_name() : std::string("?"));

    entry->owner_ = &owner_;
    entry->history_ = this;
    bool was_empty = entries_.empty();
    entries_.push_back(entry);
    spdlog::trace("[LocalHistory] {} added entry {} (depth {})", owner_.debug_name(),
                  (void*)entry.get(), entries_.size());

    if (was_empty) {
        owner_.changed_internal_state();
    }
}

void LocalHistory::remove_entry(LocalHistoryEntry* entry) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [entry](const LocalHistoryEntryPtr& e) { return e.get() == entry; });
    NAV_REQUIRE(it != entries_.end(), "[LocalHistory]",
                "entry {} is not in the local history of {}", (void*)entry, owner_.debug_name());

    LocalHistoryEntryPtr keep = *it;
    entries_.erase(it);
    spdlog::trace("[LocalHistory] {} removed entry {} (depth {})", owner_.debug_name(),
                  (void*)entry, entries_.size());
    detach(*keep);

    if (entries_.empty()) {
        owner_.changed_internal_state();
    }
}

bool LocalHistory::pop_entry() {
    if (entries_.empty()) {
        return false;
    }

    LocalHistoryEntryPtr entry = entries_.back();
    entries_.pop_back();
    spdlog::debug("[LocalHistory] {} consumed pop (depth {})", owner_.debug_name(),
                  entries_.size());
    detach(*entry);

    if (entries_.empty()) {
        owner_.changed_internal_state();
    }
    return true;
}

void LocalHistory::detach(LocalHistoryEntry& entry) {
    entry.owner_ = nullptr;
    entry.history_ = nullptr;
    if (entry.on_remove_) {
        entry.on_remove_();
    }
}

LocalHistoryRoute::LocalHistoryRoute() : local_history_(*this) {}

} // namespace strata
