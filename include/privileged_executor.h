// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "command_runner.h"
#include "privileged_channel.h"

#include <memory>
#include <string>
#include <vector>

namespace idkspot {

/**
 * @brief Runs privileged commands: helper channel first, one-shot elevation second
 *
 * Every privileged mutation goes through here. When the channel is open and
 * accepts the line, the command is considered issued (the helper never
 * acknowledges). Otherwise the command is run directly under the elevation
 * wrapper, which may prompt again.
 */
class PrivilegedExecutor {
  public:
    enum class Route {
        CHANNEL, ///< Line accepted by the helper (outcome unknown)
        DIRECT,  ///< One-shot elevated run succeeded (or launched)
        FAILED   ///< Neither path worked
    };

    /**
     * @param channel Helper channel, may be null (direct path only)
     * @param runner Process runner for the direct path
     * @param elevation Elevation wrapper, e.g. "pkexec"; empty runs unelevated
     */
    PrivilegedExecutor(std::shared_ptr<PrivilegedChannel> channel,
                       std::shared_ptr<CommandRunner> runner, std::string elevation);

    /**
     * @brief Issue a command and, on the direct path, wait for its exit code
     */
    Route execute(const std::vector<std::string>& argv);

    /**
     * @brief Start a long-running command without waiting for it
     *
     * Through the channel the line is backgrounded ("... &") so the helper
     * keeps serving later commands.
     */
    Route launch(const std::vector<std::string>& argv, std::string* error = nullptr);

    /**
     * @brief Start a long-running command under the elevation wrapper, bypassing the channel
     *
     * For commands carrying operator-supplied text (SSID, password): argv is
     * handed to exec unchanged and never becomes a shell line.
     *
     * @return DIRECT or FAILED
     */
    Route launch_direct(const std::vector<std::string>& argv, std::string* error = nullptr);

    /**
     * @brief Prefix argv with the elevation wrapper
     */
    std::vector<std::string> elevated(const std::vector<std::string>& argv) const;

    const std::shared_ptr<CommandRunner>& runner() const {
        return runner_;
    }

  private:
    bool try_channel(const std::string& line);

    std::shared_ptr<PrivilegedChannel> channel_;
    std::shared_ptr<CommandRunner> runner_;
    std::string elevation_;
};

const char* route_name(PrivilegedExecutor::Route route);

} // namespace idkspot
