// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "command_runner.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace idkspot {

/**
 * @brief Client currently associated with the hotspot
 *
 * Rebuilt on every poll from a fresh snapshot; nothing is carried over.
 */
struct ConnectedDevice {
    std::string mac;      ///< Canonical upper-case, colon separated
    std::string hostname; ///< From DHCP leases, may be empty
    std::string ip;       ///< From leases or neighbor table, may be empty

    bool operator==(const ConnectedDevice& other) const {
        return mac == other.mac && hostname == other.hostname && ip == other.ip;
    }
};

/**
 * @brief One DHCP lease entry (dnsmasq format)
 */
struct LeaseEntry {
    std::string mac;
    std::string ip;
    std::string hostname; ///< Empty when the lease records "*"
};

/**
 * @brief Enumerates clients of the hotspot and filters them against the block list
 *
 * Sources:
 * - Primary: `iw dev <iface> station dump` ("Station <mac> (on <iface>)")
 * - Fallback, only when the primary yields nothing: `ip neigh show`
 *
 * Hostnames come from the first DHCP lease file that lists the MAC.
 *
 * Polling runs on a background thread (same pattern as the WiFi status
 * thread): every interval while the session reports running, stopping by
 * itself as soon as it does not.
 */
class DeviceTracker {
  public:
    using DevicesCallback = std::function<void(const std::vector<ConnectedDevice>&)>;
    using RunningPredicate = std::function<bool()>;
    using BlockListProvider = std::function<std::set<std::string>()>;

    static constexpr auto DEFAULT_POLL_INTERVAL = std::chrono::milliseconds(2000);

    /**
     * @param runner Process runner for iw / ip
     * @param lease_patterns Lease file path patterns (see expand_path_pattern)
     * @param interval Poll interval
     */
    DeviceTracker(std::shared_ptr<CommandRunner> runner, std::vector<std::string> lease_patterns,
                  std::chrono::milliseconds interval = DEFAULT_POLL_INTERVAL);
    ~DeviceTracker();

    DeviceTracker(const DeviceTracker&) = delete;
    DeviceTracker& operator=(const DeviceTracker&) = delete;

    // ========================================================================
    // One-shot enumeration
    // ========================================================================

    /**
     * @brief Take one snapshot of connected, non-blocked devices
     *
     * @param interface AP interface
     * @param blocked Canonical MACs to exclude
     * @return Devices in no particular order
     */
    std::vector<ConnectedDevice> poll(const std::string& interface,
                                      const std::set<std::string>& blocked);

    // ========================================================================
    // Background polling
    // ========================================================================

    /**
     * @brief Start polling every interval while is_running() holds
     *
     * The block list is re-read on every tick. on_update is called from the
     * polling thread after each tick.
     */
    void start_polling(const std::string& interface, RunningPredicate is_running,
                       BlockListProvider block_list, DevicesCallback on_update);

    /**
     * @brief Stop and join the polling thread
     */
    void stop_polling();

    bool is_polling() const {
        return polling_.load();
    }

    /// Most recent snapshot from the polling thread
    std::vector<ConnectedDevice> last_snapshot() const;

    std::chrono::milliseconds interval() const {
        return interval_;
    }

    // ========================================================================
    // Parsers (exposed for unit tests)
    // ========================================================================

    /**
     * @brief Extract canonical MACs from `iw dev <iface> station dump`
     */
    static std::vector<std::string> parse_station_dump(const std::string& output);

    /**
     * @brief Extract (ip, mac) pairs from `ip neigh show`
     *
     * Lines naming another device, and FAILED/INCOMPLETE entries, are skipped.
     *
     * @param output Neighbor table text
     * @param interface Keep only entries on this device (empty keeps all)
     */
    static std::vector<std::pair<std::string, std::string>>
    parse_neighbor_table(const std::string& output, const std::string& interface);

    /**
     * @brief Find the lease for a MAC in dnsmasq lease-file text
     *
     * Line format: "<expiry> <mac> <ip> <hostname> <client-id>". MAC
     * comparison is case-insensitive.
     *
     * @return true and fill entry when found
     */
    static bool find_lease(const std::string& lease_text, const std::string& mac,
                           LeaseEntry& entry);

  private:
    bool lookup_lease(const std::string& interface, const std::string& mac, LeaseEntry& entry);
    void polling_thread_func(std::string interface, RunningPredicate is_running,
                             BlockListProvider block_list, DevicesCallback on_update);

    std::shared_ptr<CommandRunner> runner_;
    std::vector<std::string> lease_patterns_;
    std::chrono::milliseconds interval_;

    std::thread poll_thread_;
    std::atomic<bool> polling_{false};
    std::mutex poll_cv_mutex_; ///< Dedicated mutex for condvar wait
    std::condition_variable poll_cv_;

    mutable std::mutex snapshot_mutex_;
    std::vector<ConnectedDevice> snapshot_; ///< Protected by snapshot_mutex_
};

} // namespace idkspot
