// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "block_list.h"

#include "utils/mac_address.h"

#include "spdlog/spdlog.h"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace idkspot {

BlockListStore::BlockListStore(std::string path) : path_(std::move(path)) {}

bool BlockListStore::ensure_parent_dir() const {
    fs::path dir = fs::path(path_).parent_path();
    if (dir.empty()) {
        return true;
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        spdlog::error("[BlockList] Cannot create {}: {}", dir.string(), ec.message());
        return false;
    }
    return true;
}

std::set<std::string> BlockListStore::load_locked() const {
    std::set<std::string> macs;
    std::ifstream file(path_);
    if (!file.is_open()) {
        return macs;
    }

    std::string line;
    while (std::getline(file, line)) {
        std::string mac = canonical_mac(line);
        if (!mac.empty()) {
            macs.insert(mac);
        } else if (line.find_first_not_of(" \t\r") != std::string::npos) {
            spdlog::trace("[BlockList] Ignoring invalid line '{}'", line);
        }
    }
    return macs;
}

std::set<std::string> BlockListStore::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_locked();
}

bool BlockListStore::contains(const std::string& mac) const {
    std::string canonical = canonical_mac(mac);
    if (canonical.empty()) {
        return false;
    }
    return all().count(canonical) > 0;
}

HotspotError BlockListStore::add(const std::string& mac) {
    std::string canonical = canonical_mac(mac);
    if (canonical.empty()) {
        return HotspotErrorHelper::invalid_parameters("Invalid MAC address: " + mac);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (load_locked().count(canonical) > 0) {
        spdlog::debug("[BlockList] {} already blocked", canonical);
        return HotspotErrorHelper::success();
    }

    if (!ensure_parent_dir()) {
        return HotspotErrorHelper::io_error(path_, "cannot create directory");
    }

    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) {
        return HotspotErrorHelper::io_error(path_, strerror(errno));
    }
    file << canonical << '\n';
    file.close();
    if (file.fail()) {
        return HotspotErrorHelper::io_error(path_, "write failed");
    }

    spdlog::info("[BlockList] Added {}", canonical);
    return HotspotErrorHelper::success();
}

HotspotError BlockListStore::remove(const std::string& mac) {
    std::string canonical = canonical_mac(mac);
    if (canonical.empty()) {
        return HotspotErrorHelper::invalid_parameters("Invalid MAC address: " + mac);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> macs = load_locked();
    if (macs.erase(canonical) == 0) {
        spdlog::debug("[BlockList] {} not in block list", canonical);
        return HotspotErrorHelper::success();
    }

    // Rewrite via temp file + rename so a crash never truncates the list
    std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream file(tmp_path, std::ios::trunc);
        if (!file.is_open()) {
            return HotspotErrorHelper::io_error(tmp_path, strerror(errno));
        }
        for (const auto& entry : macs) {
            file << entry << '\n';
        }
        file.close();
        if (file.fail()) {
            std::remove(tmp_path.c_str());
            return HotspotErrorHelper::io_error(tmp_path, "write failed");
        }
    }

    if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
        int err = errno;
        std::remove(tmp_path.c_str());
        return HotspotErrorHelper::io_error(path_, strerror(err));
    }

    spdlog::info("[BlockList] Removed {}", canonical);
    return HotspotErrorHelper::success();
}

} // namespace idkspot
