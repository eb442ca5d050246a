// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sys/stat.h>

namespace fs = std::filesystem;

namespace idkspot {

Config* Config::instance{NULL};

namespace {

/// Recursively add keys present in defaults but missing from data
/// @return true if anything was added
bool merge_missing_defaults(json& data, const json& defaults) {
    bool modified = false;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!data.contains(it.key())) {
            data[it.key()] = it.value();
            spdlog::debug("[Config] Added missing key '{}'", it.key());
            modified = true;
        } else if (it.value().is_object() && data[it.key()].is_object()) {
            modified = merge_missing_defaults(data[it.key()], it.value()) || modified;
        }
    }
    return modified;
}

} // namespace

Config::Config() {}

Config* Config::get_instance() {
    if (instance == nullptr) {
        instance = new Config();
    }
    return instance;
}

std::string Config::config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && xdg[0] != '\0') {
        return std::string(xdg) + "/idkspot";
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.config/idkspot";
    }

    return "/tmp/idkspot"; // Last resort fallback
}

std::string Config::default_config_path() {
    return config_dir() + "/settings.json";
}

std::string Config::default_block_list_path() {
    return config_dir() + "/blocked_macs.txt";
}

json Config::get_default_config() {
    return {{"config_version", 1},
            {"log_level", "warn"},
            {"hotspot",
             {{"ssid", DEFAULT_SSID}, {"daemon", "create_ap"}, {"elevation", "pkexec"}}},
            {"tracker",
             {{"poll_interval_ms", 2000},
              {"lease_files",
               {"/var/lib/misc/dnsmasq.leases", "/var/lib/dnsmasq/dnsmasq.leases",
                "/tmp/create_ap.{iface}.conf.*/dnsmasq.leases"}}}},
            {"block",
             {{"list_path", default_block_list_path()},
              {"hostapd_ctrl_dir", "/tmp/create_ap.{iface}.conf.*/hostapd_ctrl"},
              {"bridge_interface", "ap0"}}}};
}

void Config::init(const std::string& config_path) {
    path = config_path;
    struct stat buffer;

    bool config_modified = false;

    if (stat(config_path.c_str(), &buffer) == 0) {
        spdlog::info("[Config] Loading config from {}", config_path);
        std::string parse_error;
        try {
            data = json::parse(std::fstream(config_path));
            if (!data.is_object()) {
                parse_error = "top-level value is not an object";
            }
        } catch (const json::exception& e) {
            parse_error = e.what();
        }

        if (!parse_error.empty()) {
            spdlog::error("[Config] Failed to parse {}: {}", config_path, parse_error);
            spdlog::warn("[Config] Config file is corrupt, resetting to defaults");

            // Backup the corrupt file for diagnosis
            std::string backup_path = config_path + ".corrupt";
            if (std::rename(config_path.c_str(), backup_path.c_str()) == 0) {
                spdlog::info("[Config] Corrupt config backed up to {}", backup_path);
            } else {
                spdlog::warn("[Config] Could not back up corrupt config to {}", backup_path);
            }

            data = get_default_config();
            config_modified = true;
        }

        if (merge_missing_defaults(data, get_default_config())) {
            config_modified = true;
        }
    } else {
        spdlog::info("[Config] Creating default config at {}", config_path);
        data = get_default_config();
        config_modified = true;
    }

    if (config_modified && !save()) {
        spdlog::warn("[Config] Running with in-memory defaults only");
    }

    spdlog::debug("[Config] initialized: ssid={}, daemon={}, poll={}ms",
                  get<std::string>("/hotspot/ssid", DEFAULT_SSID),
                  get<std::string>("/hotspot/daemon", "create_ap"),
                  get<int>("/tracker/poll_interval_ms", 2000));
}

std::string Config::get_path() {
    return path;
}

json& Config::get_json(const std::string& json_path) {
    return data[json::json_pointer(json_path)];
}

bool Config::save() {
    spdlog::trace("[Config] Saving config to {}", path);

    try {
        fs::path config_dir = fs::path(path).parent_path();
        if (!config_dir.empty() && !fs::exists(config_dir)) {
            fs::create_directories(config_dir);
        }

        std::string tmp_path = path + ".tmp";
        {
            std::ofstream o(tmp_path);
            if (!o.is_open()) {
                spdlog::error("[Config] Failed to open config file for writing: {}", tmp_path);
                return false;
            }

            o << std::setw(2) << data << std::endl;

            if (!o.good()) {
                spdlog::error("[Config] Error writing to config file: {}", tmp_path);
                std::remove(tmp_path.c_str());
                return false;
            }
        }

        if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
            spdlog::error("[Config] Failed to replace {}", path);
            std::remove(tmp_path.c_str());
            return false;
        }

        spdlog::trace("[Config] saved successfully to {}", path);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("[Config] Exception while saving config to {}: {}", path, e.what());
        return false;
    }
}

std::string Config::get_last_ssid() {
    return get<std::string>("/hotspot/ssid", DEFAULT_SSID);
}

void Config::set_last_ssid(const std::string& ssid) {
    if (ssid.empty() || get_last_ssid() == ssid) {
        return;
    }
    set<std::string>("/hotspot/ssid", ssid);
    if (!save()) {
        spdlog::warn("[Config] Could not persist SSID");
    }
}

std::vector<std::string> Config::get_lease_files() {
    return get<std::vector<std::string>>(
        "/tracker/lease_files",
        get_default_config()["tracker"]["lease_files"].get<std::vector<std::string>>());
}

} // namespace idkspot
