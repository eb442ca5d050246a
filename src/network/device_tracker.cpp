// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "device_tracker.h"

#include "utils/mac_address.h"
#include "utils/path_pattern.h"

#include "spdlog/spdlog.h"

#include <cstdio>
#include <fstream>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace idkspot {

DeviceTracker::DeviceTracker(std::shared_ptr<CommandRunner> runner,
                             std::vector<std::string> lease_patterns,
                             std::chrono::milliseconds interval)
    : runner_(std::move(runner)), lease_patterns_(std::move(lease_patterns)),
      interval_(interval) {}

DeviceTracker::~DeviceTracker() {
    // Use fprintf - spdlog may be destroyed during static cleanup
    fprintf(stderr, "[DeviceTracker] Destructor called\n");
    stop_polling();
}

// ============================================================================
// Parsing
// ============================================================================

std::vector<std::string> DeviceTracker::parse_station_dump(const std::string& output) {
    static const std::regex station_re(R"(Station\s+([0-9A-Fa-f]{2}(?::[0-9A-Fa-f]{2}){5}))");

    std::vector<std::string> macs;
    std::istringstream stream(output);
    std::string line;
    std::smatch match;

    while (std::getline(stream, line)) {
        if (std::regex_search(line, match, station_re)) {
            std::string mac = canonical_mac(match[1].str());
            if (!mac.empty()) {
                macs.push_back(mac);
            }
        }
    }
    return macs;
}

std::vector<std::pair<std::string, std::string>>
DeviceTracker::parse_neighbor_table(const std::string& output, const std::string& interface) {
    // 192.168.12.34 dev wlan0 lladdr aa:bb:cc:dd:ee:ff REACHABLE
    static const std::regex neigh_re(
        R"(^\s*(\d{1,3}(?:\.\d{1,3}){3})\s.*?([0-9A-Fa-f]{2}(?::[0-9A-Fa-f]{2}){5}))");
    static const std::regex dev_re(R"(\bdev\s+(\S+))");

    std::vector<std::pair<std::string, std::string>> entries;
    std::istringstream stream(output);
    std::string line;
    std::smatch match;

    while (std::getline(stream, line)) {
        if (line.find("FAILED") != std::string::npos ||
            line.find("INCOMPLETE") != std::string::npos) {
            continue;
        }
        if (!std::regex_search(line, match, neigh_re)) {
            continue;
        }
        std::string ip = match[1].str();
        std::string mac = canonical_mac(match[2].str());
        if (mac.empty()) {
            continue;
        }

        std::smatch dev_match;
        if (!interface.empty() && std::regex_search(line, dev_match, dev_re) &&
            dev_match[1].str() != interface) {
            continue;
        }

        entries.emplace_back(ip, mac);
    }
    return entries;
}

bool DeviceTracker::find_lease(const std::string& lease_text, const std::string& mac,
                               LeaseEntry& entry) {
    std::string target = canonical_mac(mac);
    if (target.empty()) {
        return false;
    }

    std::istringstream stream(lease_text);
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string expiry, lease_mac, ip, hostname;
        if (!(fields >> expiry >> lease_mac >> ip)) {
            continue;
        }
        fields >> hostname;

        if (canonical_mac(lease_mac) != target) {
            continue;
        }

        entry.mac = target;
        entry.ip = ip;
        entry.hostname = (hostname == "*") ? "" : hostname;
        return true;
    }
    return false;
}

// ============================================================================
// Enumeration
// ============================================================================

bool DeviceTracker::lookup_lease(const std::string& interface, const std::string& mac,
                                 LeaseEntry& entry) {
    for (const auto& pattern : lease_patterns_) {
        for (const auto& path : expand_path_pattern(pattern, interface)) {
            std::ifstream file(path);
            if (!file.is_open()) {
                spdlog::trace("[DeviceTracker] Cannot read lease file {}", path);
                continue;
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            if (find_lease(buffer.str(), mac, entry)) {
                spdlog::trace("[DeviceTracker] {} found in {}", mac, path);
                return true;
            }
        }
    }
    return false;
}

std::vector<ConnectedDevice> DeviceTracker::poll(const std::string& interface,
                                                 const std::set<std::string>& blocked) {
    std::vector<ConnectedDevice> devices;
    std::unordered_set<std::string> seen;

    CommandOutput stations = runner_->run({"iw", "dev", interface, "station", "dump"});
    if (stations.launched) {
        for (const auto& mac : parse_station_dump(stations.output)) {
            if (blocked.count(mac) > 0 || !seen.insert(mac).second) {
                continue;
            }
            ConnectedDevice device;
            device.mac = mac;
            LeaseEntry lease;
            if (lookup_lease(interface, mac, lease)) {
                device.hostname = lease.hostname;
                device.ip = lease.ip;
            }
            devices.push_back(std::move(device));
        }
    } else {
        spdlog::debug("[DeviceTracker] Station dump unavailable: {}", stations.error);
    }

    if (!devices.empty()) {
        return devices;
    }

    // Fallback: neighbor table
    CommandOutput neighbors = runner_->run({"ip", "neigh", "show"});
    if (!neighbors.launched) {
        spdlog::debug("[DeviceTracker] Neighbor table unavailable: {}", neighbors.error);
        return devices;
    }

    for (const auto& [ip, mac] : parse_neighbor_table(neighbors.output, interface)) {
        if (blocked.count(mac) > 0 || !seen.insert(mac).second) {
            continue;
        }
        ConnectedDevice device;
        device.mac = mac;
        device.ip = ip;
        LeaseEntry lease;
        if (lookup_lease(interface, mac, lease)) {
            device.hostname = lease.hostname;
        }
        devices.push_back(std::move(device));
    }

    spdlog::trace("[DeviceTracker] Neighbor fallback found {} devices", devices.size());
    return devices;
}

// ============================================================================
// Background polling
// ============================================================================

void DeviceTracker::start_polling(const std::string& interface, RunningPredicate is_running,
                                  BlockListProvider block_list, DevicesCallback on_update) {
    stop_polling();

    spdlog::debug("[DeviceTracker] Polling {} every {} ms", interface, interval_.count());
    polling_ = true;
    poll_thread_ = std::thread(&DeviceTracker::polling_thread_func, this, interface,
                               std::move(is_running), std::move(block_list),
                               std::move(on_update));
}

void DeviceTracker::stop_polling() {
    {
        std::lock_guard<std::mutex> lock(poll_cv_mutex_);
        polling_ = false;
    }
    poll_cv_.notify_all();

    // MUST join, not detach - the thread uses this
    if (poll_thread_.joinable()) {
        poll_thread_.join();
    }
}

std::vector<ConnectedDevice> DeviceTracker::last_snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_;
}

void DeviceTracker::polling_thread_func(std::string interface, RunningPredicate is_running,
                                        BlockListProvider block_list,
                                        DevicesCallback on_update) {
    spdlog::debug("[DeviceTracker] Polling thread started");

    while (polling_ && is_running()) {
        std::vector<ConnectedDevice> devices = poll(interface, block_list());

        {
            std::lock_guard<std::mutex> lock(snapshot_mutex_);
            snapshot_ = devices;
        }

        if (on_update) {
            try {
                on_update(devices);
            } catch (const std::exception& e) {
                spdlog::error("[DeviceTracker] Exception in update callback: {}", e.what());
            }
        }

        std::unique_lock<std::mutex> lock(poll_cv_mutex_);
        poll_cv_.wait_for(lock, interval_, [this] { return !polling_.load(); });
    }

    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snapshot_.clear();
    }
    polling_ = false;
    spdlog::debug("[DeviceTracker] Polling thread exiting");
}

} // namespace idkspot
