// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>
#include <vector>

namespace idkspot {

/**
 * @brief Expand a configured path pattern into existing paths
 *
 * Patterns support two features:
 * - "{iface}" is replaced by the interface name
 * - a single '*' inside one path component matches any run of characters
 *   (e.g. "/tmp/create_ap.{iface}.conf.*\/dnsmasq.leases")
 *
 * Only paths that exist are returned, sorted for deterministic order.
 * A pattern without '*' yields itself when it exists.
 *
 * @param pattern Path pattern
 * @param interface Interface name substituted for "{iface}"
 * @return Matching existing paths
 */
std::vector<std::string> expand_path_pattern(const std::string& pattern,
                                             const std::string& interface);

/**
 * @brief Replace every "{iface}" in text with the interface name
 */
std::string substitute_interface(const std::string& text, const std::string& interface);

} // namespace idkspot
