// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for the idkspot console front-end
 */

#include <string>

namespace idkspot {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    // Logging
    int verbosity = 0;
    std::string log_dest; // --log-dest: auto, journal, syslog, file, console (empty = config)
    std::string log_file; // --log-file: path when log_dest is "file"

    // Configuration
    std::string config_path; // --config: settings file (empty = XDG default)

    bool help_shown = false;
};

/**
 * @brief Parse command-line arguments
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false if help was shown or an error occurred
 *         (args.help_shown tells the two apart)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

} // namespace idkspot
