// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace idkspot {

/**
 * @brief Application-wide flags shared between the front-end, the tray and
 * the controller threads
 *
 * Replaces the "show window" / "app running" globals. Readers only need
 * eventual visibility, so plain atomics are enough for the flags. Observers
 * are notified on the thread that made the change, outside the internal lock.
 *
 * Example:
 * ```cpp
 * auto state = std::make_shared<AppState>();
 * auto id = state->subscribe([](AppState::Flag flag, bool value) { ... });
 * state->request_quit();
 * state->unsubscribe(id);
 * ```
 */
class AppState {
  public:
    enum class Flag { ShowWindow, AppRunning };

    using Observer = std::function<void(Flag flag, bool value)>;
    using SubscriptionId = uint64_t;

    AppState() = default;
    AppState(const AppState&) = delete;
    AppState& operator=(const AppState&) = delete;

    bool show_window() const {
        return show_window_.load();
    }

    /// Ask the front-end to show (true) or hide (false) its window
    void set_show_window(bool show);

    bool app_running() const {
        return app_running_.load();
    }

    /**
     * @brief Request clean shutdown
     *
     * Idempotent; observers are notified only on the first call.
     */
    void request_quit();

    SubscriptionId subscribe(Observer observer);
    void unsubscribe(SubscriptionId id);

  private:
    void notify(Flag flag, bool value);

    std::atomic<bool> show_window_{true};
    std::atomic<bool> app_running_{true};

    std::mutex mutex_;
    std::map<SubscriptionId, Observer> observers_; ///< Protected by mutex_
    SubscriptionId next_id_ = 1;                   ///< Protected by mutex_
};

const char* app_state_flag_name(AppState::Flag flag);

} // namespace idkspot
