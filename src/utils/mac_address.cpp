// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/mac_address.h"

#include <cctype>

namespace idkspot {

std::string canonical_mac(const std::string& mac) {
    size_t start = mac.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = mac.find_last_not_of(" \t\r\n");
    std::string trimmed = mac.substr(start, end - start + 1);

    // xx:xx:xx:xx:xx:xx
    if (trimmed.size() != 17) {
        return "";
    }

    std::string result;
    result.reserve(17);
    for (size_t i = 0; i < trimmed.size(); ++i) {
        char c = trimmed[i];
        if (i % 3 == 2) {
            if (c != ':' && c != '-') {
                return "";
            }
            result += ':';
            continue;
        }
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return "";
        }
        result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

bool is_valid_mac(const std::string& mac) {
    return !canonical_mac(mac).empty();
}

bool is_valid_interface_name(const std::string& name) {
    if (name.empty() || name.size() > 15) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_' && c != '.') {
            return false;
        }
    }
    return true;
}

bool is_printable_credential(const std::string& text) {
    if (text.size() > 255) {
        return false;
    }
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (c < 32 || c == 127) {
            return false;
        }
    }
    return true;
}

} // namespace idkspot
