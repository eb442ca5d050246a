// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "wifi_capability_prober.h"

#include "spdlog/spdlog.h"

#include <regex>
#include <sstream>

namespace idkspot {

namespace {

const char* const kSectionHeader = "valid interface combinations";
const char* const kSupportedDetail = "Simultaneous AP+Managed mode supported";
const char* const kUnsupportedDetail = "AP+Managed simultaneous mode not found";

} // namespace

WifiCapabilityProber::WifiCapabilityProber(std::shared_ptr<CommandRunner> runner)
    : runner_(std::move(runner)) {}

CompatibilityResult WifiCapabilityProber::probe() {
    spdlog::debug("[CapabilityProber] Querying wireless capabilities (iw list)");

    CommandOutput out = runner_->run({"iw", "list"});
    if (!out.launched) {
        CompatibilityResult result;
        result.supported = false;
        result.detail = "Failed to run iw list: " + out.error;
        spdlog::warn("[CapabilityProber] {}", result.detail);
        return result;
    }

    CompatibilityResult result = parse_capabilities(out.output);
    spdlog::info("[CapabilityProber] AP+managed: {} ({})", result.supported ? "yes" : "no",
                 result.detail);
    return result;
}

CompatibilityResult WifiCapabilityProber::parse_capabilities(const std::string& iw_list_output) {
    static const std::regex managed_re(R"(#\{[^}]*\bmanaged\b[^}]*\})", std::regex::icase);
    static const std::regex ap_re(R"(#\{[^}]*\bap\b[^}]*\})", std::regex::icase);

    std::istringstream stream(iw_list_output);
    std::string line;
    bool in_section = false;

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        if (line.find(kSectionHeader) != std::string::npos) {
            in_section = true;
            continue;
        }

        if (!in_section) {
            continue;
        }

        if (!line.empty() && line[0] != ' ' && line[0] != '\t') {
            in_section = false;
            continue;
        }

        if (std::regex_search(line, managed_re) && std::regex_search(line, ap_re)) {
            spdlog::debug("[CapabilityProber] Qualifying combination: {}", line);
            return {true, kSupportedDetail};
        }
    }

    return {false, kUnsupportedDetail};
}

} // namespace idkspot
