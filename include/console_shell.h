// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "app_state.h"
#include "device_tracker.h"
#include "hotspot_controller.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace idkspot {

/**
 * @brief Line-oriented operator front-end for the controller
 *
 * Each input line is one command; execute() returns the text to print.
 * "show"/"hide" toggle AppState::show_window, which gates whether live
 * device updates are printed.
 */
class ConsoleShell {
  public:
    ConsoleShell(HotspotController& controller, std::shared_ptr<AppState> app_state,
                 std::string default_ssid);

    /**
     * @brief Run one command line
     *
     * @return Output for the operator (may be empty)
     */
    std::string execute(const std::string& line);

    using PrintFn = std::function<void(const std::string&)>;

    /**
     * @brief Read and execute command lines from input_fd until quit
     *
     * Returns when quit is requested (by a command or from another thread),
     * or on EOF or a read error, which request quit themselves. A final line
     * without a newline is still executed at EOF. Non-empty command output
     * goes to print.
     */
    void run(int input_fd, const PrintFn& print);

    /// Capability/interface summary shown at startup
    std::string banner() const;

    static std::string help_text();

    /// "AA:BB:...  hostname  ip" lines, or a placeholder when empty
    static std::string format_devices(const std::vector<ConnectedDevice>& devices);

    /// SSID used when "start" is given only a password
    const std::string& default_ssid() const {
        return default_ssid_;
    }

  private:
    std::string cmd_start(const std::string& line);
    std::string cmd_status() const;
    std::string cmd_block(const std::vector<std::string>& args);
    std::string cmd_unblock(const std::vector<std::string>& args);
    std::string cmd_blocked() const;

    HotspotController& controller_;
    std::shared_ptr<AppState> app_state_;
    std::string default_ssid_;
};

/**
 * @brief Split on whitespace; the last field keeps the rest of the line
 *
 * split_command("start net my pass", 3) -> {"start", "net", "my pass"}
 *
 * @param max_fields 0 for no limit
 */
std::vector<std::string> split_command(const std::string& line, size_t max_fields = 0);

/**
 * @brief Split on whitespace, treating "..." as part of one field
 *
 * Quotes are removed and have no escapes. split_quoted("start \"My Net\" pw", f)
 * gives {"start", "My Net", "pw"}.
 *
 * @return false on an unterminated quote
 */
bool split_quoted(const std::string& line, std::vector<std::string>& fields);

} // namespace idkspot
