// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "utils/path_pattern.h"

#include "spdlog/spdlog.h"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace idkspot {

std::string substitute_interface(const std::string& text, const std::string& interface) {
    static const std::string kPlaceholder = "{iface}";
    std::string result = text;
    size_t pos = 0;
    while ((pos = result.find(kPlaceholder, pos)) != std::string::npos) {
        result.replace(pos, kPlaceholder.size(), interface);
        pos += interface.size();
    }
    return result;
}

std::vector<std::string> expand_path_pattern(const std::string& pattern,
                                             const std::string& interface) {
    std::vector<std::string> matches;
    std::string path = substitute_interface(pattern, interface);
    std::error_code ec;

    size_t star = path.find('*');
    if (star == std::string::npos) {
        if (fs::exists(path, ec)) {
            matches.push_back(path);
        }
        return matches;
    }

    // Split "<dir>/<prefix>*<suffix>[/<rest>]"
    size_t component_start = path.rfind('/', star);
    size_t component_end = path.find('/', star);
    std::string dir;
    size_t name_begin = 0;
    if (component_start == std::string::npos) {
        dir = ".";
    } else {
        dir = (component_start == 0) ? "/" : path.substr(0, component_start);
        name_begin = component_start + 1;
    }
    std::string component = path.substr(name_begin, component_end == std::string::npos
                                                         ? std::string::npos
                                                         : component_end - name_begin);
    std::string rest = (component_end == std::string::npos) ? "" : path.substr(component_end);

    size_t local_star = component.find('*');
    std::string prefix = component.substr(0, local_star);
    std::string suffix = component.substr(local_star + 1);

    if (!fs::is_directory(dir, ec)) {
        return matches;
    }

    for (const auto& entry : fs::directory_iterator(dir, ec)) {
        std::string name = entry.path().filename().string();
        if (name.size() < prefix.size() + suffix.size()) {
            continue;
        }
        if (name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) {
            continue;
        }
        std::string candidate = entry.path().string() + rest;
        if (fs::exists(candidate, ec)) {
            matches.push_back(candidate);
        }
    }

    if (ec) {
        spdlog::debug("[PathPattern] Error listing {}: {}", dir, ec.message());
    }

    std::sort(matches.begin(), matches.end());
    return matches;
}

} // namespace idkspot
