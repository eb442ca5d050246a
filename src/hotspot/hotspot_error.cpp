// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hotspot_error.h"

namespace idkspot {

const char* hotspot_result_name(HotspotResult result) {
    switch (result) {
    case HotspotResult::SUCCESS:
        return "success";
    case HotspotResult::INVALID_PARAMETERS:
        return "invalid_parameters";
    case HotspotResult::TOOL_LAUNCH_FAILED:
        return "tool_launch_failed";
    case HotspotResult::DETECTION_FAILED:
        return "detection_failed";
    case HotspotResult::HARDWARE_UNSUPPORTED:
        return "hardware_unsupported";
    case HotspotResult::ALREADY_RUNNING:
        return "already_running";
    case HotspotResult::NOT_RUNNING:
        return "not_running";
    case HotspotResult::PERMISSION_DENIED:
        return "permission_denied";
    case HotspotResult::NOT_ENFORCED:
        return "not_enforced";
    case HotspotResult::IO_ERROR:
        return "io_error";
    case HotspotResult::UNKNOWN_ERROR:
        return "unknown_error";
    }
    return "unknown";
}

} // namespace idkspot
