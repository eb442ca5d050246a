// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "command_runner.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace idkspot {

/**
 * @brief Wireless interface the hotspot is created on
 *
 * Immutable once resolved at startup. channel is always
 * freq_to_channel(frequency_mhz); 0 means unknown.
 */
struct WirelessInterface {
    std::string name;
    uint32_t frequency_mhz = 0;
    uint32_t channel = 0;

    bool usable() const {
        return !name.empty() && channel != 0;
    }
};

/**
 * @brief Raw resolution result from `iw dev`
 */
struct InterfaceResolution {
    std::string interface;
    uint32_t frequency_mhz = 0;
    std::optional<std::string> error; ///< Set when detection failed
};

/**
 * @brief Map an operating frequency to its Wi-Fi channel number
 *
 * Exact table for 2.4 GHz channels 1-14 and the common 5 GHz control
 * channels; otherwise (f-2407)/5 for 2412-2484 MHz, (f-5000)/5 for
 * 5180-5825 MHz, and 0 for anything else.
 */
uint32_t freq_to_channel(uint32_t frequency_mhz);

/**
 * @brief Resolves the active wireless interface and its frequency from `iw dev`
 *
 * When several interfaces are listed the LAST "Interface <name>" and the
 * LAST "channel <n> (<freq> MHz)" win, so the active interface follows the
 * order in which iw prints them.
 */
class WifiInterfaceResolver {
  public:
    explicit WifiInterfaceResolver(std::shared_ptr<CommandRunner> runner);

    /**
     * @brief Run `iw dev` and extract interface + frequency
     */
    InterfaceResolution resolve();

    /**
     * @brief Parse raw `iw dev` output
     *
     * Errors: "no wireless interface found", "could not detect frequency".
     */
    static InterfaceResolution parse_iw_dev(const std::string& iw_dev_output);

    /**
     * @brief Build the immutable interface record from a resolution
     */
    static WirelessInterface to_interface(const InterfaceResolution& resolution);

  private:
    std::shared_ptr<CommandRunner> runner_;
};

} // namespace idkspot
