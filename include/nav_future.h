// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

/**
 * @file nav_future.h
 * @brief Single-resolution completion signals for the navigation engine
 *
 * @pattern Promise/Future pair sharing one state block. The promise side completes
 *          exactly once; continuations registered on the future run synchronously at
 *          completion time, in registration order. A continuation attached after
 *          completion runs immediately.
 * @threading Main (LVGL) thread only. Nothing here blocks or waits.
 * @gotchas Completing twice throws NavigationError. get() on a pending future throws.
 */

#pragma once

#include "ui_nav_errors.h"

#include <functional>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace strata {

namespace detail {

template <typename T> struct FutureState {
    std::optional<T> value;
    std::vector<std::function<void(const T&)>> continuations;

    void complete(T v) {
        if (value) {
            throw NavigationError("Future completed more than once");
        }
        value = std::move(v);
        // Continuations may register further continuations; take a snapshot first
        auto pending = std::move(continuations);
        continuations.clear();
        for (auto& cb : pending) {
            cb(*value);
        }
    }
};

struct VoidFutureState {
    bool done = false;
    std::vector<std::function<void()>> continuations;

    void complete() {
        if (done) {
            throw NavigationError("Future completed more than once");
        }
        done = true;
        auto pending = std::move(continuations);
        continuations.clear();
        for (auto& cb : pending) {
            cb();
        }
    }
};

} // namespace detail

template <typename T> class Promise;

/**
 * @brief Read side of a single-resolution signal carrying a value
 */
template <typename T> class Future {
  public:
    Future() = default;

    /// Future that is already resolved with @p value
    static Future ready(T value) {
        auto state = std::make_shared<detail::FutureState<T>>();
        state->complete(std::move(value));
        return Future(std::move(state));
    }

    bool valid() const {
        return state_ != nullptr;
    }

    bool is_ready() const {
        return state_ && state_->value.has_value();
    }

    /**
     * @brief Resolved value
     * @throws NavigationError if the future is invalid or still pending
     */
    const T& get() const {
        if (!is_ready()) {
            throw NavigationError("Future::get() called before completion");
        }
        return *state_->value;
    }

    /**
     * @brief Run @p callback once the value is available
     *
     * Runs immediately if already resolved.
     */
    void then(std::function<void(const T&)> callback) const {
        if (!state_) {
            throw NavigationError("Future::then() on an invalid future");
        }
        if (state_->value) {
            callback(*state_->value);
            return;
        }
        state_->continuations.push_back(std::move(callback));
    }

  private:
    friend class Promise<T>;

    explicit Future(std::shared_ptr<detail::FutureState<T>> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::FutureState<T>> state_;
};

/**
 * @brief Completion-only signal (no payload)
 */
template <> class Future<void> {
  public:
    Future() = default;

    static Future ready() {
        auto state = std::make_shared<detail::VoidFutureState>();
        state->complete();
        return Future(std::move(state));
    }

    bool valid() const {
        return state_ != nullptr;
    }

    bool is_ready() const {
        return state_ && state_->done;
    }

    void then(std::function<void()> callback) const {
        if (!state_) {
            throw NavigationError("Future::then() on an invalid future");
        }
        if (state_->done) {
            callback();
            return;
        }
        state_->continuations.push_back(std::move(callback));
    }

  private:
    friend class Promise<void>;

    explicit Future(std::shared_ptr<detail::VoidFutureState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::VoidFutureState> state_;
};

/**
 * @brief Write side of a single-resolution signal
 */
template <typename T> class Promise {
  public:
    Promise() : state_(std::make_shared<detail::FutureState<T>>()) {}

    Future<T> get_future() const {
        return Future<T>(state_);
    }

    /// @throws NavigationError on the second call
    void set_value(T value) {
        state_->complete(std::move(value));
    }

    bool is_completed() const {
        return state_->value.has_value();
    }

  private:
    std::shared_ptr<detail::FutureState<T>> state_;
};

template <> class Promise<void> {
  public:
    Promise() : state_(std::make_shared<detail::VoidFutureState>()) {}

    Future<void> get_future() const {
        return Future<void>(state_);
    }

    void set_value() {
        state_->complete();
    }

    bool is_completed() const {
        return state_->done;
    }

  private:
    std::shared_ptr<detail::VoidFutureState> state_;
};

} // namespace strata
