// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "block_enforcer.h"
#include "block_list.h"
#include "command_runner.h"
#include "device_tracker.h"
#include "hotspot_error.h"
#include "hotspot_session.h"
#include "privileged_channel.h"
#include "privileged_executor.h"
#include "wifi_capability_prober.h"
#include "wifi_interface_resolver.h"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace idkspot {

class Config;

/**
 * @brief Tunables for the controller, normally read from Config
 */
struct ControllerSettings {
    std::string daemon = "create_ap";
    std::string elevation = "pkexec";
    std::chrono::milliseconds poll_interval = DeviceTracker::DEFAULT_POLL_INTERVAL;
    std::vector<std::string> lease_files;
    std::string block_list_path;
    std::string hostapd_ctrl_dir;
    std::string bridge_interface = "ap0";

    /// Spawn the privileged helper during init()
    bool open_channel = true;

    static ControllerSettings from_config(Config& config);
};

/**
 * @brief Wires prober, resolver, privileged channel, session, tracker and
 * block enforcement together and exposes the operator actions
 *
 * Startup (init):
 * 1. Probe AP+managed capability (`iw list`)
 * 2. Resolve interface and channel (`iw dev`)
 * 3. Open the privileged helper (one credential prompt); failure is not fatal
 *
 * Both detection results are computed once and never refreshed.
 */
class HotspotController {
  public:
    using DevicesCallback = DeviceTracker::DevicesCallback;
    using StartedCallback = std::function<void(const std::string& ssid)>;

    /**
     * @param settings Tunables
     * @param runner Process runner shared by every component
     * @param channel Privileged helper; nullptr creates one from settings.elevation
     */
    HotspotController(ControllerSettings settings, std::shared_ptr<CommandRunner> runner,
                      std::shared_ptr<PrivilegedChannel> channel = nullptr);
    ~HotspotController();

    HotspotController(const HotspotController&) = delete;
    HotspotController& operator=(const HotspotController&) = delete;

    /**
     * @brief Run detection and open the privileged channel
     */
    void init();

    bool is_initialized() const {
        return session_ != nullptr;
    }

    const CompatibilityResult& compatibility() const {
        return compatibility_;
    }

    const InterfaceResolution& resolution() const {
        return resolution_;
    }

    /// Resolved interface (empty name when detection failed)
    const WirelessInterface& interface() const {
        return interface_;
    }

    /// Start is enabled only when both detections succeeded
    bool can_start() const;

    /// Human-readable reason start is disabled, empty if enabled
    std::string start_blocker() const;

    bool channel_open() const;

    // ========================================================================
    // Session
    // ========================================================================

    /**
     * @brief Validate and start the hotspot, then begin device polling
     *
     * @param[out] status Operator message (success or error)
     */
    HotspotError start(const std::string& ssid, const std::string& password,
                       std::string& status);

    /**
     * @brief Stop the hotspot and device polling
     *
     * @return Operator message
     */
    std::string stop();

    HotspotState state() const;

    bool is_running() const {
        return state() == HotspotState::Running;
    }

    bool inputs_editable() const {
        return !is_running();
    }

    // ========================================================================
    // Devices and blocking
    // ========================================================================

    /// Latest snapshot from the polling thread (empty when not running)
    std::vector<ConnectedDevice> devices() const;

    /// Poll once on the calling thread
    std::vector<ConnectedDevice> poll_devices();

    /// Called from the polling thread after every tick
    void set_devices_callback(DevicesCallback callback);

    /// Called after a successful start (used to persist the SSID)
    void set_started_callback(StartedCallback callback);

    BlockOutcome block(const std::string& mac);
    HotspotError unblock(const std::string& mac);
    std::set<std::string> blocked() const;

    const std::vector<std::string>& block_strategy_names() const {
        return strategy_names_;
    }

    /**
     * @brief Stop polling and close the privileged channel
     *
     * A running AP daemon is left running. Idempotent.
     */
    void shutdown();

  private:
    void start_polling();

    ControllerSettings settings_;
    std::shared_ptr<CommandRunner> runner_;
    std::shared_ptr<PrivilegedChannel> channel_;

    CompatibilityResult compatibility_;
    InterfaceResolution resolution_;
    WirelessInterface interface_;

    std::shared_ptr<PrivilegedExecutor> executor_;
    std::shared_ptr<BlockListStore> store_;
    std::unique_ptr<BlockEnforcer> enforcer_;
    std::shared_ptr<HotspotSession> session_;
    std::unique_ptr<DeviceTracker> tracker_;
    std::vector<std::string> strategy_names_;

    mutable std::mutex callback_mutex_;
    DevicesCallback devices_callback_; ///< Protected by callback_mutex_
    StartedCallback started_callback_; ///< Protected by callback_mutex_

    bool shut_down_ = false;
};

} // namespace idkspot
