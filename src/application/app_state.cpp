// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_state.h"

#include "spdlog/spdlog.h"

#include <vector>

namespace idkspot {

const char* app_state_flag_name(AppState::Flag flag) {
    switch (flag) {
    case AppState::Flag::ShowWindow:
        return "show_window";
    case AppState::Flag::AppRunning:
        return "app_running";
    }
    return "unknown";
}

void AppState::set_show_window(bool show) {
    if (show_window_.exchange(show) == show) {
        return;
    }
    spdlog::debug("[AppState] show_window -> {}", show);
    notify(Flag::ShowWindow, show);
}

void AppState::request_quit() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!app_running_.exchange(false)) {
            return;
        }
    }
    spdlog::info("[AppState] Application quit requested");
    notify(Flag::AppRunning, false);
}

AppState::SubscriptionId AppState::subscribe(Observer observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    SubscriptionId id = next_id_++;
    observers_.emplace(id, std::move(observer));
    return id;
}

void AppState::unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(id);
}

void AppState::notify(Flag flag, bool value) {
    // Copy so observers may (un)subscribe from inside the callback
    std::vector<Observer> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.reserve(observers_.size());
        for (const auto& entry : observers_) {
            snapshot.push_back(entry.second);
        }
    }

    for (const auto& observer : snapshot) {
        try {
            observer(flag, value);
        } catch (const std::exception& e) {
            spdlog::error("[AppState] Observer for {} threw: {}", app_state_flag_name(flag),
                          e.what());
        }
    }
}

} // namespace idkspot
