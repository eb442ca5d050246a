// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "spdlog/spdlog.h"

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace idkspot {

using json = nlohmann::json;

/**
 * @brief Application configuration manager (singleton)
 *
 * Loads and manages settings from a JSON file. Uses JSON pointer syntax
 * (RFC 6901) for nested value access.
 *
 * Thread safety: Not thread-safe. Should be initialized once at startup
 * and accessed from main thread only.
 *
 * Example usage:
 * ```cpp
 * Config* cfg = Config::get_instance();
 * cfg->init(Config::default_config_path());
 *
 * // Get with default fallback
 * std::string ssid = cfg->get<std::string>("/hotspot/ssid", "idkspot");
 *
 * // Set and save
 * cfg->set<std::string>("/hotspot/ssid", "lab");
 * cfg->save();
 * ```
 */
class Config {
  private:
    static Config* instance;
    std::string path;

  protected:
    json data;

    /// Allow test fixture to access protected members
    friend class ConfigTestFixture;

  public:
    static constexpr const char* DEFAULT_SSID = "idkspot";

    Config();

    Config(Config& o) = delete;
    void operator=(const Config&) = delete;

    /**
     * @brief Initialize configuration from file
     *
     * Creates the file with defaults if it doesn't exist. A file that fails
     * to parse is moved aside to "<path>.corrupt" and replaced with defaults.
     * Missing keys are filled in from the defaults.
     *
     * @param config_path Absolute path to JSON configuration file
     */
    void init(const std::string& config_path);

    /**
     * @brief Get configuration value at JSON pointer path
     *
     * @throws nlohmann::json::exception if path not found
     */
    template <typename T> T get(const std::string& json_ptr) {
        return data[json::json_pointer(json_ptr)].template get<T>();
    };

    /**
     * @brief Get configuration value with default fallback
     *
     * Returns default_value if the path doesn't exist or holds the wrong type.
     */
    template <typename T> T get(const std::string& json_ptr, const T& default_value) {
        json::json_pointer ptr(json_ptr);
        if (!data.contains(ptr)) {
            return default_value;
        }
        try {
            return data[ptr].template get<T>();
        } catch (const json::exception& e) {
            spdlog::warn("[Config] {} has unexpected type: {}", json_ptr, e.what());
            return default_value;
        }
    };

    /**
     * @brief Set configuration value at JSON pointer path
     *
     * Creates intermediate paths. In-memory only until save() is called.
     */
    template <typename T> T set(const std::string& json_ptr, T v) {
        return data[json::json_pointer(json_ptr)] = v;
    };

    /**
     * @brief Get JSON sub-object at path
     */
    json& get_json(const std::string& json_path);

    /**
     * @brief Save current configuration to file
     *
     * Written atomically (temp file + rename).
     *
     * @return true on success
     */
    bool save();

    std::string get_path();

    /// Default settings document
    static json get_default_config();

    /// $XDG_CONFIG_HOME/idkspot (or ~/.config/idkspot)
    static std::string config_dir();

    /// config_dir() + "/settings.json"
    static std::string default_config_path();

    /// config_dir() + "/blocked_macs.txt"
    static std::string default_block_list_path();

    // ========================================================================
    // Typed accessors
    // ========================================================================

    /// Last SSID used for a successful start
    std::string get_last_ssid();

    /// Persist the SSID (the password is never stored)
    void set_last_ssid(const std::string& ssid);

    std::vector<std::string> get_lease_files();

    static Config* get_instance();
};

} // namespace idkspot
