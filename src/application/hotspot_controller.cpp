// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hotspot_controller.h"

#include "config.h"

#include "spdlog/spdlog.h"

#include <cstdio>

namespace idkspot {

ControllerSettings ControllerSettings::from_config(Config& config) {
    ControllerSettings settings;
    settings.daemon = config.get<std::string>("/hotspot/daemon", "create_ap");
    settings.elevation = config.get<std::string>("/hotspot/elevation", "pkexec");

    int interval_ms = config.get<int>("/tracker/poll_interval_ms", 2000);
    if (interval_ms < 100) {
        spdlog::warn("[HotspotController] poll_interval_ms {} too small, using 100", interval_ms);
        interval_ms = 100;
    }
    settings.poll_interval = std::chrono::milliseconds(interval_ms);

    settings.lease_files = config.get_lease_files();
    settings.block_list_path =
        config.get<std::string>("/block/list_path", Config::default_block_list_path());
    settings.hostapd_ctrl_dir = config.get<std::string>("/block/hostapd_ctrl_dir", "");
    settings.bridge_interface = config.get<std::string>("/block/bridge_interface", "ap0");
    return settings;
}

HotspotController::HotspotController(ControllerSettings settings,
                                     std::shared_ptr<CommandRunner> runner,
                                     std::shared_ptr<PrivilegedChannel> channel)
    : settings_(std::move(settings)), runner_(std::move(runner)), channel_(std::move(channel)) {
    if (settings_.block_list_path.empty()) {
        settings_.block_list_path = Config::default_block_list_path();
    }
    if (!channel_ && settings_.open_channel) {
        channel_ = std::make_shared<PrivilegedChannel>(settings_.elevation);
    }
}

HotspotController::~HotspotController() {
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[HotspotController] Destructor called\n");
    shutdown();
}

// ============================================================================
// Startup
// ============================================================================

void HotspotController::init() {
    if (session_) {
        spdlog::debug("[HotspotController] Already initialized");
        return;
    }

    compatibility_ = WifiCapabilityProber(runner_).probe();
    if (compatibility_.supported) {
        spdlog::info("[HotspotController] {}", compatibility_.detail);
    } else {
        spdlog::warn("[HotspotController] {}", compatibility_.detail);
    }

    resolution_ = WifiInterfaceResolver(runner_).resolve();
    interface_ = WifiInterfaceResolver::to_interface(resolution_);
    if (resolution_.error) {
        spdlog::warn("[HotspotController] Interface detection failed: {}", *resolution_.error);
    } else {
        spdlog::info("[HotspotController] Using {} at {} MHz (channel {})", interface_.name,
                     interface_.frequency_mhz, interface_.channel);
    }

    if (channel_ && settings_.open_channel) {
        if (!channel_->open()) {
            spdlog::warn("[HotspotController] Privileged helper unavailable, using one-shot "
                         "elevation per command");
        }
    }

    executor_ = std::make_shared<PrivilegedExecutor>(channel_, runner_, settings_.elevation);
    store_ = std::make_shared<BlockListStore>(settings_.block_list_path);
    enforcer_ = BlockEnforcer::create(store_, executor_, settings_.hostapd_ctrl_dir,
                                      settings_.bridge_interface);
    strategy_names_ = enforcer_->strategy_names();
    session_ = std::make_shared<HotspotSession>(interface_, executor_, settings_.daemon);
    tracker_ =
        std::make_unique<DeviceTracker>(runner_, settings_.lease_files, settings_.poll_interval);

    spdlog::debug("[HotspotController] Initialized (start {})",
                  can_start() ? "enabled" : "disabled");
}

bool HotspotController::can_start() const {
    return session_ && compatibility_.supported && interface_.usable();
}

std::string HotspotController::start_blocker() const {
    if (!session_) {
        return "Controller not initialized";
    }
    if (!compatibility_.supported) {
        return compatibility_.detail;
    }
    if (resolution_.error) {
        return *resolution_.error;
    }
    if (!interface_.usable()) {
        return "no usable wireless interface";
    }
    return "";
}

bool HotspotController::channel_open() const {
    return channel_ && channel_->is_open();
}

// ============================================================================
// Session
// ============================================================================

HotspotState HotspotController::state() const {
    return session_ ? session_->state() : HotspotState::Idle;
}

HotspotError HotspotController::start(const std::string& ssid, const std::string& password,
                                      std::string& status) {
    if (!session_) {
        HotspotError err = HotspotErrorHelper::detection_failed("Controller not initialized");
        status = err.user_msg;
        return err;
    }

    if (!compatibility_.supported) {
        // Validation still wins so the operator sees input mistakes first
        HotspotError validation = HotspotConfig{ssid, password}.validate();
        if (!validation.success()) {
            status = validation.user_msg;
            return validation;
        }
        HotspotError err = HotspotErrorHelper::hardware_unsupported(compatibility_.detail);
        status = "Error: " + compatibility_.detail;
        return err;
    }

    HotspotError result = session_->start(ssid, password, status);
    if (!result.success()) {
        return result;
    }

    start_polling();

    StartedCallback on_started;
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        on_started = started_callback_;
    }
    if (on_started) {
        on_started(ssid);
    }
    return result;
}

std::string HotspotController::stop() {
    if (!session_) {
        return HotspotErrorHelper::not_running().user_msg;
    }

    std::string status = session_->stop();
    // Session is Idle now; the polling thread exits at its next check
    tracker_->stop_polling();
    return status;
}

void HotspotController::start_polling() {
    std::shared_ptr<HotspotSession> session = session_;
    std::shared_ptr<BlockListStore> store = store_;

    tracker_->start_polling(
        interface_.name, [session] { return session->is_running(); },
        [store] { return store->all(); },
        [this](const std::vector<ConnectedDevice>& devices) {
            DevicesCallback callback;
            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                callback = devices_callback_;
            }
            if (callback) {
                callback(devices);
            }
        });
}

// ============================================================================
// Devices and blocking
// ============================================================================

std::vector<ConnectedDevice> HotspotController::devices() const {
    if (!tracker_) {
        return {};
    }
    return tracker_->last_snapshot();
}

std::vector<ConnectedDevice> HotspotController::poll_devices() {
    if (!tracker_ || !is_running()) {
        return {};
    }
    return tracker_->poll(interface_.name, store_->all());
}

void HotspotController::set_devices_callback(DevicesCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    devices_callback_ = std::move(callback);
}

void HotspotController::set_started_callback(StartedCallback callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    started_callback_ = std::move(callback);
}

BlockOutcome HotspotController::block(const std::string& mac) {
    if (!enforcer_) {
        BlockOutcome outcome;
        outcome.error = HotspotErrorHelper::detection_failed("Controller not initialized");
        return outcome;
    }
    return enforcer_->block(mac, interface_.name);
}

HotspotError HotspotController::unblock(const std::string& mac) {
    if (!enforcer_) {
        return HotspotErrorHelper::detection_failed("Controller not initialized");
    }
    return enforcer_->unblock(mac, interface_.name);
}

std::set<std::string> HotspotController::blocked() const {
    if (!store_) {
        return {};
    }
    return store_->all();
}

void HotspotController::shutdown() {
    if (shut_down_) {
        return;
    }
    shut_down_ = true;

    if (tracker_) {
        tracker_->stop_polling();
    }
    if (session_) {
        session_->wait_for_launch();
    }
    if (channel_) {
        channel_->close();
    }
}

} // namespace idkspot
