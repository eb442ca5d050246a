// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "command_runner.h"

#include <memory>
#include <string>

namespace idkspot {

/**
 * @brief Whether the adapter can run an AP next to its managed connection
 */
struct CompatibilityResult {
    bool supported = false;
    std::string detail;
};

/**
 * @brief Detects simultaneous AP + managed mode support from `iw list`
 *
 * Looks for a "valid interface combinations" section and a line in it
 * listing both a #{ managed } and a #{ AP } group, e.g.
 *
 *     valid interface combinations:
 *          * #{ managed } <= 1, #{ AP, P2P-client, P2P-GO } <= 1,
 *            total <= 3, #channels <= 2
 *
 * Runs once at startup; the result never changes afterwards.
 */
class WifiCapabilityProber {
  public:
    explicit WifiCapabilityProber(std::shared_ptr<CommandRunner> runner);

    /**
     * @brief Run `iw list` and classify its output
     *
     * Launch failure yields supported=false with the failure detail.
     */
    CompatibilityResult probe();

    /**
     * @brief Classify raw `iw list` output
     *
     * Inside the section, a line belongs to it while it is indented or
     * blank; the first unindented non-blank line ends the section. The two
     * mode tokens match case-insensitively on word boundaries and may sit in
     * the same or different brace groups. First qualifying line wins.
     */
    static CompatibilityResult parse_capabilities(const std::string& iw_list_output);

  private:
    std::shared_ptr<CommandRunner> runner_;
};

} // namespace idkspot
