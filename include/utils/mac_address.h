// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <string>

namespace idkspot {

/**
 * @brief Canonicalize a MAC address to upper-case, colon-separated form
 *
 * Accepts "aa:bb:cc:dd:ee:ff" and "aa-bb-cc-dd-ee-ff" (surrounding
 * whitespace is ignored).
 *
 * @param mac MAC address in any accepted form
 * @return "AA:BB:CC:DD:EE:FF", or empty string if the input is malformed
 */
std::string canonical_mac(const std::string& mac);

/**
 * @brief Check whether a string is a well-formed MAC address
 */
bool is_valid_mac(const std::string& mac);

/**
 * @brief Validate a network interface name
 *
 * Interface names are composed into privileged command lines, so only
 * alphanumerics, '-', '_' and '.' are accepted, 1-15 characters (IFNAMSIZ-1).
 */
bool is_valid_interface_name(const std::string& name);

/**
 * @brief Validate SSID/password text
 *
 * Rejects control characters (0x00-0x1F, 0x7F) and strings over 255 bytes.
 * Emptiness and minimum length are checked by the caller.
 */
bool is_printable_credential(const std::string& text);

} // namespace idkspot
