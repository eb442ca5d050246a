// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "hotspot_error.h"
#include "privileged_executor.h"
#include "wifi_interface_resolver.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace idkspot {

/**
 * @brief Hotspot session lifecycle
 *
 * Idle -> Starting -> Running -> Stopping -> Idle. There is no failure
 * branch out of Stopping: stop() always lands in Idle.
 */
enum class HotspotState { Idle, Starting, Running, Stopping };

const char* hotspot_state_name(HotspotState state);

/**
 * @brief Operator-supplied hotspot credentials
 */
struct HotspotConfig {
    std::string ssid;     ///< Non-empty
    std::string password; ///< At least MIN_PASSWORD_LENGTH characters

    static constexpr size_t MIN_PASSWORD_LENGTH = 8;

    /**
     * @brief Validate credentials before any process is touched
     */
    HotspotError validate() const;
};

/**
 * @brief Owns the hotspot session and the AP daemon (create_ap) lifecycle
 *
 * Transitions are optimistic: start() reports "starting" and moves to
 * Running as soon as validation passes and the launch is handed to a
 * background thread. A daemon that fails to come up is only logged. stop()
 * lands in Idle even if the stop command could not be issued.
 *
 * Only the controller mutates the session; the device tracker sees it
 * through is_running().
 */
class HotspotSession {
  public:
    /**
     * @param iface Resolved wireless interface (AP and upstream share it)
     * @param executor Privileged command routing for the daemon
     * @param daemon AP daemon executable (default "create_ap")
     */
    HotspotSession(WirelessInterface iface, std::shared_ptr<PrivilegedExecutor> executor,
                   std::string daemon = "create_ap");
    ~HotspotSession();

    HotspotSession(const HotspotSession&) = delete;
    HotspotSession& operator=(const HotspotSession&) = delete;

    /**
     * @brief Validate credentials and launch the AP daemon in the background
     *
     * @param ssid Network name
     * @param password WPA passphrase (>= 8 characters)
     * @param[out] status "Hotspot '<ssid>' starting on channel <n>..." on success
     * @return INVALID_PARAMETERS, DETECTION_FAILED, ALREADY_RUNNING, NOT_RUNNING (stopped
     *         before the launch was handed off), or SUCCESS
     */
    HotspotError start(const std::string& ssid, const std::string& password,
                       std::string& status);

    /**
     * @brief Issue the daemon's stop command and return to Idle
     *
     * Idempotent: when already Idle nothing is launched.
     *
     * @return Status text for the operator
     */
    std::string stop();

    HotspotState state() const {
        return state_.load();
    }

    bool is_running() const {
        return state_.load() == HotspotState::Running;
    }

    /// SSID/password are editable only while no session is running
    bool inputs_editable() const {
        return !is_running();
    }

    const WirelessInterface& interface() const {
        return interface_;
    }

    /// Credentials of the current session, if any
    std::optional<HotspotConfig> config() const;

    /**
     * @brief Block until a pending background launch has been issued
     */
    void wait_for_launch();

    /**
     * @brief Daemon argv for start (without elevation wrapper)
     */
    std::vector<std::string> start_command(const HotspotConfig& config) const;

    /**
     * @brief Daemon argv for stop (without elevation wrapper)
     */
    std::vector<std::string> stop_command() const;

    /**
     * @brief Run hook on the start() thread after the state moves to Starting,
     * before the launch is handed off (for testing)
     */
    void set_pre_launch_hook_for_testing(std::function<void()> hook) {
        pre_launch_hook_ = std::move(hook);
    }

  private:
    void launch_thread_func(std::vector<std::string> argv, std::string ssid);

    const WirelessInterface interface_;
    std::shared_ptr<PrivilegedExecutor> executor_;
    std::string daemon_;

    std::atomic<HotspotState> state_{HotspotState::Idle};

    mutable std::mutex config_mutex_;
    std::optional<HotspotConfig> config_; ///< Protected by config_mutex_

    std::mutex launch_mutex_; ///< Serializes start/stop against the launch thread handle
    std::thread launch_thread_;

    std::function<void()> pre_launch_hook_;
};

} // namespace idkspot
