// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "ui_overlay.h"

#include "ui_nav_errors.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace strata {

// ============================================================================
// OverlayEntry
// ============================================================================

OverlayEntry::OverlayEntry(LayerBuilder builder, bool opaque)
    : builder_(std::move(builder)), opaque_(opaque) {}

OverlayEntry::~OverlayEntry() = default;

std::shared_ptr<OverlayEntry> OverlayEntry::create(LayerBuilder builder, bool opaque) {
    return std::make_shared<OverlayEntry>(std::move(builder), opaque);
}

void OverlayEntry::set_opaque(bool opaque) {
    if (opaque_ == opaque) {
        return;
    }
    NAV_REQUIRE(overlay_ != nullptr, "[Overlay]",
                "set_opaque({}) on entry {} that is not in an overlay", opaque, (void*)this);
    opaque_ = opaque;
    overlay_->update_visibility();
}

void OverlayEntry::remove() {
    NAV_REQUIRE(overlay_ != nullptr, "[Overlay]", "remove() on entry {} that is not in an overlay",
                (void*)this);
    Overlay* overlay = overlay_;
    overlay_ = nullptr;
    overlay->remove(this);
}

bool OverlayEntry::is_visible() const {
    return layer_ != nullptr && !lv_obj_has_flag(layer_, LV_OBJ_FLAG_HIDDEN);
}

// ============================================================================
// Overlay
// ============================================================================

Overlay::Overlay(lv_obj_t* parent, std::vector<OverlayEntryPtr> initial_entries)
    : initial_entries_(std::move(initial_entries)) {
    container_ = lv_obj_create(parent);
    lv_obj_remove_style_all(container_);
    lv_obj_set_size(container_, LV_PCT(100), LV_PCT(100));
    lv_obj_remove_flag(container_, LV_OBJ_FLAG_SCROLLABLE);

    // Screen teardown deletes the container (and every layer) behind our back
    lv_obj_add_event_cb(
        container_,
        [](lv_event_t* e) {
            auto* self = static_cast<Overlay*>(lv_event_get_user_data(e));
            spdlog::trace("[Overlay] Container {} deleted externally", (void*)self->container_);
            self->container_ = nullptr;
            for (auto& entry : self->entries_) {
                entry->layer_ = nullptr;
            }
        },
        LV_EVENT_DELETE, this);

    spdlog::trace("[Overlay] Created container {} ({} initial entries)", (void*)container_,
                  initial_entries_.size());
}

Overlay::~Overlay() {
    for (auto& entry : entries_) {
        entry->overlay_ = nullptr;
        entry->layer_ = nullptr;
    }
    entries_.clear();

    if (container_ && lv_is_initialized()) {
        lv_obj_remove_event_cb_with_user_data(container_, nullptr, this);
        lv_obj_delete(container_);
    }
    container_ = nullptr;
}

void Overlay::realize() {
    if (realized_) {
        return;
    }
    realized_ = true;
    spdlog::debug("[Overlay] Realizing with {} initial entries", initial_entries_.size());
    insert_all(initial_entries_);
}

int Overlay::index_of(const OverlayEntry* entry) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [entry](const OverlayEntryPtr& e) { return e.get() == entry; });
    if (it == entries_.end()) {
        return -1;
    }
    return static_cast<int>(it - entries_.begin());
}

size_t Overlay::insertion_index(const OverlayEntryPtr& above) const {
    if (!above) {
        return entries_.size();
    }
    int index = index_of(above.get());
    NAV_REQUIRE(above->overlay_ == this && index >= 0, "[Overlay]",
                "insertion point {} is not an entry of this overlay", (void*)above.get());
    return static_cast<size_t>(index) + 1;
}

void Overlay::realize_layer(OverlayEntry& entry, size_t index) {
    lv_obj_t* layer = entry.builder_ ? entry.builder_(container_) : nullptr;
    if (!layer) {
        // Keep the child index mapping intact with an empty placeholder
        spdlog::warn("[Overlay] Layer builder for entry {} returned no object, using placeholder",
                     (void*)&entry);
        layer = lv_obj_create(container_);
        lv_obj_remove_style_all(layer);
    } else if (lv_obj_get_parent(layer) != container_) {
        lv_obj_set_parent(layer, container_);
    }
    lv_obj_move_to_index(layer, static_cast<int32_t>(index));
    entry.layer_ = layer;
}

void Overlay::insert(const OverlayEntryPtr& entry, const OverlayEntryPtr& above) {
    NAV_REQUIRE(entry != nullptr, "[Overlay]", "insert() with a null entry");
    NAV_REQUIRE(container_ != nullptr, "[Overlay]", "insert() after the container was deleted");
    NAV_REQUIRE(entry->overlay_ == nullptr, "[Overlay]", "entry {} is already in an overlay",
                (void*)entry.get());
    size_t index = insertion_index(above);

    entry->overlay_ = this;
    entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(index), entry);
    realize_layer(*entry, index);
    update_visibility();

    spdlog::trace("[Overlay] Inserted entry {} at index {} (total: {})", (void*)entry.get(), index,
                  entries_.size());
}

void Overlay::insert_all(const std::vector<OverlayEntryPtr>& entries,
                         const OverlayEntryPtr& above) {
    size_t index = insertion_index(above);
    if (entries.empty()) {
        return;
    }
    NAV_REQUIRE(container_ != nullptr, "[Overlay]",
                "insert_all() after the container was deleted");

    // Validate everything before touching state so a bad batch leaves no partial insert
    for (size_t i = 0; i < entries.size(); ++i) {
        NAV_REQUIRE(entries[i] != nullptr, "[Overlay]", "insert_all() with a null entry at {}", i);
        NAV_REQUIRE(entries[i]->overlay_ == nullptr, "[Overlay]",
                    "entry {} is already in an overlay", (void*)entries[i].get());
        for (size_t j = 0; j < i; ++j) {
            NAV_REQUIRE(entries[j] != entries[i], "[Overlay]",
                        "entry {} appears twice in insert_all()", (void*)entries[i].get());
        }
    }

    entries_.insert(entries_.begin() + static_cast<std::ptrdiff_t>(index), entries.begin(),
                    entries.end());
    for (size_t i = 0; i < entries.size(); ++i) {
        entries[i]->overlay_ = this;
        realize_layer(*entries[i], index + i);
    }
    update_visibility();

    spdlog::trace("[Overlay] Inserted {} entries at index {} (total: {})", entries.size(), index,
                  entries_.size());
}

void Overlay::remove(OverlayEntry* entry) {
    int index = index_of(entry);
    NAV_REQUIRE(index >= 0, "[Overlay]", "entry {} not found in overlay", (void*)entry);

    // Keep the entry alive until its layer is gone
    OverlayEntryPtr keep = entries_[static_cast<size_t>(index)];
    entries_.erase(entries_.begin() + index);

    if (entry->layer_ && container_) {
        lv_obj_delete(entry->layer_);
    }
    entry->layer_ = nullptr;
    update_visibility();

    spdlog::trace("[Overlay] Removed entry {} from index {} (remaining: {})", (void*)entry, index,
                  entries_.size());
}

void Overlay::update_visibility() {
    bool onstage = true;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        lv_obj_t* layer = (*it)->layer_;
        if (layer) {
            if (onstage) {
                lv_obj_remove_flag(layer, LV_OBJ_FLAG_HIDDEN);
            } else {
                lv_obj_add_flag(layer, LV_OBJ_FLAG_HIDDEN);
            }
        }
        if ((*it)->opaque_) {
            onstage = false;
        }
    }
}

} // namespace strata
