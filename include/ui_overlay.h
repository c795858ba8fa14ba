// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "lvgl/lvgl.h"

#include <functional>
#include <memory>
#include <vector>

namespace strata {

class Overlay;

/**
 * @brief A slot in an Overlay that holds one layer object
 *
 * Entries are inserted with Overlay::insert() / Overlay::insert_all() and leave
 * their overlay through remove(). An entry belongs to at most one overlay at a time.
 * The layer object is built by the entry's builder when the entry is inserted and
 * deleted when it is removed.
 */
class OverlayEntry {
  public:
    /// Builds the entry's layer as a child of @p parent (the overlay container)
    using LayerBuilder = std::function<lv_obj_t*(lv_obj_t* parent)>;

    explicit OverlayEntry(LayerBuilder builder, bool opaque = true);
    ~OverlayEntry();

    OverlayEntry(const OverlayEntry&) = delete;
    OverlayEntry& operator=(const OverlayEntry&) = delete;

    /// Convenience factory, entries are always shared between route and overlay
    static std::shared_ptr<OverlayEntry> create(LayerBuilder builder, bool opaque = true);

    /**
     * @brief Whether this entry occludes everything below it
     */
    bool opaque() const {
        return opaque_;
    }

    /**
     * @brief Change opacity and recompute the owning overlay's visibility
     *
     * No-op when the value is unchanged.
     * @throws NavigationError if the value changes while the entry has no overlay
     */
    void set_opaque(bool opaque);

    /**
     * @brief Remove this entry from its overlay and delete its layer
     *
     * Must be called once per insertion.
     * @throws NavigationError if the entry is not in an overlay
     */
    void remove();

    /// Owning overlay, nullptr when not inserted
    Overlay* overlay() const {
        return overlay_;
    }

    /// Realized layer object, nullptr when not inserted
    lv_obj_t* layer() const {
        return layer_;
    }

    /// True when the layer is on screen (not hidden by an opaque entry above it)
    bool is_visible() const;

  private:
    friend class Overlay;

    LayerBuilder builder_;
    bool opaque_;
    Overlay* overlay_ = nullptr;
    lv_obj_t* layer_ = nullptr;
};

using OverlayEntryPtr = std::shared_ptr<OverlayEntry>;

/**
 * @brief Ordered stack of layers with opacity-driven visibility
 *
 * The overlay owns one LVGL container object. Child *i* of the container is the
 * layer of entry *i* (0 = bottom). After every mutation the overlay scans its
 * entries top-down: entries are shown until and including the first opaque entry,
 * everything below it gets LV_OBJ_FLAG_HIDDEN. Hidden layers stay alive.
 *
 * Usage:
 * @code
 * Overlay overlay(lv_screen_active());
 * auto entry = OverlayEntry::create([](lv_obj_t* parent) { return lv_label_create(parent); });
 * overlay.insert(entry);
 * ...
 * entry->remove();
 * @endcode
 */
class Overlay {
  public:
    /**
     * @brief Create the overlay container as a full-size child of @p parent
     *
     * @param parent Parent object (usually a screen)
     * @param initial_entries Entries inserted by the first realize() call
     */
    explicit Overlay(lv_obj_t* parent, std::vector<OverlayEntryPtr> initial_entries = {});
    virtual ~Overlay();

    Overlay(const Overlay&) = delete;
    Overlay& operator=(const Overlay&) = delete;

    /**
     * @brief First-realization hook
     *
     * Inserts the initial entries on the first call. Later calls do nothing.
     */
    virtual void realize();

    bool is_realized() const {
        return realized_;
    }

    /**
     * @brief Insert @p entry just above @p above, or on top when @p above is null
     *
     * @throws NavigationError if @p entry already has an overlay, or @p above is
     *         not an entry of this overlay
     */
    void insert(const OverlayEntryPtr& entry, const OverlayEntryPtr& above = nullptr);

    /**
     * @brief Insert several entries, in order, just above @p above (or on top)
     *
     * Visibility is recomputed once after all layers are realized.
     * @throws NavigationError under the same conditions as insert()
     */
    void insert_all(const std::vector<OverlayEntryPtr>& entries,
                    const OverlayEntryPtr& above = nullptr);

    const std::vector<OverlayEntryPtr>& entries() const {
        return entries_;
    }

    /// Index of @p entry (0 = bottom), or -1 if it is not in this overlay
    int index_of(const OverlayEntry* entry) const;

    bool contains(const OverlayEntry* entry) const {
        return index_of(entry) >= 0;
    }

    lv_obj_t* container() const {
        return container_;
    }

  protected:
    /// Mutable initial entries, for subclasses that seed them before realize()
    std::vector<OverlayEntryPtr>& initial_entries() {
        return initial_entries_;
    }

  private:
    friend class OverlayEntry;

    void remove(OverlayEntry* entry);
    void update_visibility();
    void realize_layer(OverlayEntry& entry, size_t index);
    size_t insertion_index(const OverlayEntryPtr& above) const;

    lv_obj_t* container_ = nullptr;
    std::vector<OverlayEntryPtr> entries_;
    std::vector<OverlayEntryPtr> initial_entries_;
    bool realized_ = false;
};

} // namespace strata
