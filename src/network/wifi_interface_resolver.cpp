// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_interface_resolver.h"

#include "utils/mac_address.h"

#include "spdlog/spdlog.h"

#include <regex>
#include <sstream>
#include <unordered_map>

namespace idkspot {

namespace {

// 2.4 GHz channels 1-14 and the common 5 GHz 20 MHz control channels
const std::unordered_map<uint32_t, uint32_t> kChannelTable = {
    {2412, 1},   {2417, 2},   {2422, 3},   {2427, 4},   {2432, 5},   {2437, 6},
    {2442, 7},   {2447, 8},   {2452, 9},   {2457, 10},  {2462, 11},  {2467, 12},
    {2472, 13},  {2484, 14},  {5180, 36},  {5200, 40},  {5220, 44},  {5240, 48},
    {5260, 52},  {5280, 56},  {5300, 60},  {5320, 64},  {5500, 100}, {5520, 104},
    {5540, 108}, {5560, 112}, {5580, 116}, {5600, 120}, {5620, 124}, {5640, 128},
    {5660, 132}, {5680, 136}, {5700, 140}, {5720, 144}, {5745, 149}, {5765, 153},
    {5785, 157}, {5805, 161}, {5825, 165},
};

} // namespace

uint32_t freq_to_channel(uint32_t frequency_mhz) {
    auto it = kChannelTable.find(frequency_mhz);
    if (it != kChannelTable.end()) {
        return it->second;
    }
    if (frequency_mhz >= 2412 && frequency_mhz <= 2484) {
        return (frequency_mhz - 2407) / 5;
    }
    if (frequency_mhz >= 5180 && frequency_mhz <= 5825) {
        return (frequency_mhz - 5000) / 5;
    }
    return 0;
}

WifiInterfaceResolver::WifiInterfaceResolver(std::shared_ptr<CommandRunner> runner)
    : runner_(std::move(runner)) {}

InterfaceResolution WifiInterfaceResolver::resolve() {
    spdlog::debug("[InterfaceResolver] Querying wireless devices (iw dev)");

    CommandOutput out = runner_->run({"iw", "dev"});
    if (!out.launched) {
        InterfaceResolution result;
        result.error = "Failed to run iw dev: " + out.error;
        spdlog::warn("[InterfaceResolver] {}", *result.error);
        return result;
    }

    InterfaceResolution result = parse_iw_dev(out.output);
    if (result.error) {
        spdlog::warn("[InterfaceResolver] {}", *result.error);
    } else {
        spdlog::info("[InterfaceResolver] Interface {} at {} MHz (channel {})", result.interface,
                     result.frequency_mhz, freq_to_channel(result.frequency_mhz));
    }
    return result;
}

InterfaceResolution WifiInterfaceResolver::parse_iw_dev(const std::string& iw_dev_output) {
    static const std::regex iface_re(R"(Interface\s+(\w+))");
    static const std::regex freq_re(R"(channel\s+\d+\s+\((\d+)\s+MHz\))");

    InterfaceResolution result;
    std::istringstream stream(iw_dev_output);
    std::string line;
    std::smatch match;

    while (std::getline(stream, line)) {
        if (std::regex_search(line, match, iface_re)) {
            result.interface = match[1].str();
        }
        if (std::regex_search(line, match, freq_re)) {
            try {
                result.frequency_mhz = static_cast<uint32_t>(std::stoul(match[1].str()));
            } catch (const std::exception&) {
                spdlog::trace("[InterfaceResolver] Unparseable frequency in: {}", line);
            }
        }
    }

    if (result.interface.empty()) {
        result.error = "no wireless interface found";
    } else if (!is_valid_interface_name(result.interface)) {
        spdlog::warn("[InterfaceResolver] Suspicious interface name '{}', ignoring",
                     result.interface);
        result.interface.clear();
        result.error = "no wireless interface found";
    } else if (result.frequency_mhz == 0) {
        result.error = "could not detect frequency";
    }

    return result;
}

WirelessInterface WifiInterfaceResolver::to_interface(const InterfaceResolution& resolution) {
    WirelessInterface iface;
    iface.name = resolution.interface;
    iface.frequency_mhz = resolution.frequency_mhz;
    iface.channel = freq_to_channel(resolution.frequency_mhz);
    return iface;
}

} // namespace idkspot
