// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file logging_init.h
 * @brief spdlog setup: console plus one optional system sink
 */

#include <spdlog/spdlog.h>

#include <string>

namespace idkspot {
namespace logging {

/**
 * @brief Where log output goes besides the console
 */
enum class LogTarget {
    Auto,    ///< Syslog on Linux, console elsewhere
    Journal, ///< systemd journal (syslog when built without systemd support)
    Syslog,  ///< syslog(3)
    File,    ///< Rotating file, 5 MB x 3
    Console  ///< Console only
};

/**
 * @brief Logging configuration, filled from CLI flags and the config file
 */
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true;
    LogTarget target = LogTarget::Auto;
    std::string file_path; ///< Override for LogTarget::File (empty = default location)
};

/**
 * @brief Build the default logger from the configured sinks
 *
 * Safe to call more than once; the previous default logger is replaced.
 */
void init(const LogConfig& config);

/**
 * @brief Parse a level name ("trace" ... "off", "warning" alias)
 *
 * Case sensitive; unrecognized input returns default_level.
 */
spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level =
                                          spdlog::level::warn);

/**
 * @brief Map -v count to a level: 0=warn, 1=info, 2=debug, 3+=trace
 */
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Effective level: CLI verbosity, then the config value, then warn
 *
 * @param verbosity -v count (0 = not given)
 * @param config_level "log_level" from settings (may be empty)
 */
spdlog::level::level_enum resolve_log_level(int verbosity, const std::string& config_level);

/**
 * @brief Parse a --log-dest value; unknown values map to Auto
 */
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/// Default log file path ($XDG_DATA_HOME/idkspot/idkspot.log)
std::string default_log_file_path();

} // namespace logging
} // namespace idkspot
