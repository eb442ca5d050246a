// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <vector>

#ifdef __linux__
#ifdef IDKSPOT_HAS_SYSTEMD
#include <spdlog/sinks/systemd_sink.h>
#endif
#include <spdlog/sinks/syslog_sink.h>
#endif

namespace idkspot {
namespace logging {

namespace {

/// Get XDG_DATA_HOME or default ~/.local/share
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp"; // Last resort fallback
}

/// Resolve log file path, creating the directory for the default location
std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string path = default_log_file_path();
    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(path).parent_path(), ec);
    return path;
}

/// Detect best available logging target at runtime
LogTarget detect_best_target() {
#ifdef __linux__
#ifdef IDKSPOT_HAS_SYSTEMD
    // Check for systemd journal socket
    std::error_code ec;
    if (std::filesystem::exists("/run/systemd/journal/socket", ec)) {
        return LogTarget::Journal;
    }
#endif
    // Syslog is always available on Linux
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

/// Add system sink based on target
void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
#ifdef __linux__
    case LogTarget::Journal:
#ifdef IDKSPOT_HAS_SYSTEMD
        sinks.push_back(std::make_shared<spdlog::sinks::systemd_sink_mt>("idkspot"));
        break;
#endif
        // Without systemd support fall through to syslog
    case LogTarget::Syslog:
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>("idkspot", LOG_PID, LOG_USER, false));
        break;
#endif
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        try {
            // 5MB max size, 3 rotated files
            sinks.push_back(
                std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        } catch (const spdlog::spdlog_ex& e) {
            // Console keeps working; report once there
            fprintf(stderr, "[Logging] Cannot open log file %s: %s\n", path.c_str(), e.what());
        }
        break;
    }
    default:
        // Console-only, or a system target this platform lacks
        break;
    }
}

} // namespace

std::string default_log_file_path() {
    return get_xdg_data_home() + "/idkspot/idkspot.log";
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (always, unless explicitly disabled)
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    }

    // Resolve auto-detection
    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;

    add_system_sink(sinks, effective_target, config.file_path);

    auto logger = std::make_shared<spdlog::logger>("idkspot", sinks.begin(), sinks.end());
    logger->set_level(config.level);

    spdlog::set_default_logger(logger);

    spdlog::debug("[Logging] Initialized: target={}, console={}",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no");
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str == "trace")
        return spdlog::level::trace;
    if (str == "debug")
        return spdlog::level::debug;
    if (str == "info")
        return spdlog::level::info;
    if (str == "warn" || str == "warning")
        return spdlog::level::warn;
    if (str == "error")
        return spdlog::level::err;
    if (str == "critical")
        return spdlog::level::critical;
    if (str == "off")
        return spdlog::level::off;
    return default_level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity > 2 ? spdlog::level::trace : spdlog::level::warn;
    }
}

spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& config_level) {
    if (verbosity > 0) {
        return verbosity_to_level(verbosity);
    }
    return parse_level(config_level, spdlog::level::warn);
}

LogTarget parse_log_target(const std::string& str) {
    if (str == "journal")
        return LogTarget::Journal;
    if (str == "syslog")
        return LogTarget::Syslog;
    if (str == "file")
        return LogTarget::File;
    if (str == "console")
        return LogTarget::Console;
    return LogTarget::Auto; // Default for "auto" or unrecognized
}

const char* log_target_name(LogTarget target) {
    switch (target) {
    case LogTarget::Auto:
        return "auto";
    case LogTarget::Journal:
        return "journal";
    case LogTarget::Syslog:
        return "syslog";
    case LogTarget::File:
        return "file";
    case LogTarget::Console:
        return "console";
    }
    return "unknown";
}

} // namespace logging
} // namespace idkspot
