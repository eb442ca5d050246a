// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hotspot_session.h"

#include "utils/mac_address.h"

#include "spdlog/spdlog.h"

#include <cstdio>

namespace idkspot {

const char* hotspot_state_name(HotspotState state) {
    switch (state) {
    case HotspotState::Idle:
        return "idle";
    case HotspotState::Starting:
        return "starting";
    case HotspotState::Running:
        return "running";
    case HotspotState::Stopping:
        return "stopping";
    }
    return "unknown";
}

HotspotError HotspotConfig::validate() const {
    if (ssid.empty()) {
        return HotspotErrorHelper::invalid_parameters("Error: SSID cannot be empty");
    }
    if (password.size() < MIN_PASSWORD_LENGTH) {
        return HotspotErrorHelper::invalid_parameters(
            "Error: Password must be at least 8 characters");
    }
    if (!is_printable_credential(ssid)) {
        return HotspotErrorHelper::invalid_parameters("Error: SSID contains invalid characters");
    }
    if (!is_printable_credential(password)) {
        return HotspotErrorHelper::invalid_parameters(
            "Error: Password contains invalid characters");
    }
    return HotspotErrorHelper::success();
}

// ============================================================================
// Lifecycle
// ============================================================================

HotspotSession::HotspotSession(WirelessInterface iface,
                               std::shared_ptr<PrivilegedExecutor> executor, std::string daemon)
    : interface_(std::move(iface)), executor_(std::move(executor)), daemon_(std::move(daemon)) {
    spdlog::debug("[HotspotSession] Created for {} (channel {})", interface_.name,
                  interface_.channel);
}

HotspotSession::~HotspotSession() {
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[HotspotSession] Destructor called\n");
    wait_for_launch();
}

std::optional<HotspotConfig> HotspotSession::config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void HotspotSession::wait_for_launch() {
    std::lock_guard<std::mutex> lock(launch_mutex_);
    if (launch_thread_.joinable()) {
        launch_thread_.join();
    }
}

std::vector<std::string> HotspotSession::start_command(const HotspotConfig& config) const {
    return {daemon_,         "-c",        std::to_string(interface_.channel),
            interface_.name, interface_.name, config.ssid, config.password};
}

std::vector<std::string> HotspotSession::stop_command() const {
    return {daemon_, "--stop", interface_.name};
}

// ============================================================================
// Start / Stop
// ============================================================================

HotspotError HotspotSession::start(const std::string& ssid, const std::string& password,
                                   std::string& status) {
    HotspotConfig config{ssid, password};

    HotspotError validation = config.validate();
    if (!validation.success()) {
        spdlog::info("[HotspotSession] Start rejected: {}", validation.technical_msg);
        status = validation.user_msg;
        return validation;
    }

    if (!interface_.usable()) {
        HotspotError err =
            HotspotErrorHelper::detection_failed("Error: no usable wireless interface");
        status = err.user_msg;
        return err;
    }

    HotspotState expected = HotspotState::Idle;
    if (!state_.compare_exchange_strong(expected, HotspotState::Starting)) {
        HotspotError err = HotspotErrorHelper::already_running();
        status = err.user_msg;
        return err;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = config;
    }

    spdlog::info("[HotspotSession] Starting hotspot '{}' on {} channel {}", ssid,
                 interface_.name, interface_.channel);

    if (pre_launch_hook_) {
        pre_launch_hook_();
    }

    {
        std::lock_guard<std::mutex> lock(launch_mutex_);
        if (launch_thread_.joinable()) {
            launch_thread_.join();
        }

        // stop() may have run since the state moved to Starting
        if (state_.load() != HotspotState::Starting) {
            spdlog::info("[HotspotSession] Start of '{}' cancelled by stop", ssid);
            {
                std::lock_guard<std::mutex> config_lock(config_mutex_);
                config_.reset();
            }
            HotspotError err = HotspotErrorHelper::not_running();
            status = err.user_msg;
            return err;
        }

        // Pass argv by value; the thread must not touch config_
        launch_thread_ =
            std::thread(&HotspotSession::launch_thread_func, this, start_command(config), ssid);
    }

    // A concurrent stop() may already have moved us to Stopping
    HotspotState starting = HotspotState::Starting;
    state_.compare_exchange_strong(starting, HotspotState::Running);
    status = "Hotspot '" + ssid + "' starting on channel " + std::to_string(interface_.channel) +
             "...";
    return HotspotErrorHelper::success();
}

void HotspotSession::launch_thread_func(std::vector<std::string> argv, std::string ssid) {
    spdlog::debug("[HotspotSession] Launch thread started for '{}'", ssid);

    std::string error;
    // Credentials stay in argv; only the direct path is used
    auto route = executor_->launch_direct(argv, &error);
    if (route == PrivilegedExecutor::Route::FAILED) {
        // Not surfaced: the session already reported "starting"
        spdlog::error("[HotspotSession] Failed to launch {}: {}", daemon_, error);
        return;
    }
    spdlog::info("[HotspotSession] {} launched ({})", daemon_, route_name(route));
}

std::string HotspotSession::stop() {
    HotspotState current = state_.load();
    if (current == HotspotState::Idle) {
        spdlog::debug("[HotspotSession] stop() while idle, nothing to do");
        return HotspotErrorHelper::not_running().user_msg;
    }

    state_ = HotspotState::Stopping;
    wait_for_launch();

    spdlog::info("[HotspotSession] Stopping hotspot on {}", interface_.name);

    std::string error;
    auto route = executor_->launch(stop_command(), &error);

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_.reset();
    }
    state_ = HotspotState::Idle;

    if (route == PrivilegedExecutor::Route::FAILED) {
        spdlog::warn("[HotspotSession] Stop command failed: {}", error);
        return "Error stopping hotspot: " + error;
    }
    return "Hotspot stopped on " + interface_.name;
}

} // namespace idkspot
