// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace idkspot {

/**
 * @brief Hotspot operation result with detailed error information
 */
enum class HotspotResult {
    SUCCESS = 0,          ///< Operation succeeded
    INVALID_PARAMETERS,   ///< Empty SSID, short password, malformed MAC, etc.
    TOOL_LAUNCH_FAILED,   ///< External tool could not be spawned
    DETECTION_FAILED,     ///< No wireless interface or frequency detected
    HARDWARE_UNSUPPORTED, ///< Adapter cannot run AP and managed mode together
    ALREADY_RUNNING,      ///< A hotspot session is already active
    NOT_RUNNING,          ///< No hotspot session to act on
    PERMISSION_DENIED,    ///< Elevation refused or unavailable
    NOT_ENFORCED,         ///< Request recorded locally but not enforced
    IO_ERROR,             ///< Reading or writing a local file failed
    UNKNOWN_ERROR         ///< Unexpected error condition
};

/**
 * @brief Detailed error information for hotspot operations
 */
struct HotspotError {
    HotspotResult result;      ///< Primary error code
    std::string technical_msg; ///< Technical details for logging/debugging
    std::string user_msg;      ///< User-friendly message for display
    std::string suggestion;    ///< Suggested action for user (optional)

    HotspotError(HotspotResult r = HotspotResult::SUCCESS, const std::string& tech = "",
                 const std::string& user = "", const std::string& suggest = "")
        : result(r), technical_msg(tech), user_msg(user), suggestion(suggest) {}

    bool success() const {
        return result == HotspotResult::SUCCESS;
    }
    explicit operator bool() const {
        return success();
    }
};

/**
 * @brief Factory for user-friendly hotspot error messages
 */
class HotspotErrorHelper {
  public:
    static HotspotError invalid_parameters(const std::string& user_msg) {
        return HotspotError(HotspotResult::INVALID_PARAMETERS, user_msg, user_msg,
                            "Check the values you entered and try again");
    }

    static HotspotError tool_launch_failed(const std::string& tool, const std::string& detail) {
        return HotspotError(HotspotResult::TOOL_LAUNCH_FAILED,
                            "Failed to run " + tool + ": " + detail, "Failed to run " + tool,
                            "Check that " + tool + " is installed and in PATH");
    }

    static HotspotError detection_failed(const std::string& detail) {
        return HotspotError(HotspotResult::DETECTION_FAILED, detail, detail,
                            "Connect the wireless adapter to a network first");
    }

    static HotspotError hardware_unsupported(const std::string& detail) {
        return HotspotError(HotspotResult::HARDWARE_UNSUPPORTED, detail,
                            "Hardware not supported",
                            "The adapter must support simultaneous AP and managed mode");
    }

    static HotspotError already_running() {
        return HotspotError(HotspotResult::ALREADY_RUNNING, "Hotspot session already running",
                            "Hotspot is already running", "Stop the hotspot first");
    }

    static HotspotError not_running() {
        return HotspotError(HotspotResult::NOT_RUNNING, "No active hotspot session",
                            "Hotspot is not running");
    }

    static HotspotError not_enforced(const std::string& mac) {
        return HotspotError(HotspotResult::NOT_ENFORCED,
                            "No enforcing block method succeeded for " + mac,
                            "Device " + mac + " recorded as blocked, but NOT enforced",
                            "Check iptables/hostapd_cli availability and privileges");
    }

    static HotspotError io_error(const std::string& path, const std::string& detail) {
        return HotspotError(HotspotResult::IO_ERROR, path + ": " + detail,
                            "Could not access " + path);
    }

    static HotspotError success() {
        return HotspotError(HotspotResult::SUCCESS);
    }
};

/**
 * @brief Short, stable name for a result code (logging)
 */
const char* hotspot_result_name(HotspotResult result);

} // namespace idkspot
