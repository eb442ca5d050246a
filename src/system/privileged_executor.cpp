// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "privileged_executor.h"

#include "spdlog/spdlog.h"

namespace idkspot {

PrivilegedExecutor::PrivilegedExecutor(std::shared_ptr<PrivilegedChannel> channel,
                                       std::shared_ptr<CommandRunner> runner,
                                       std::string elevation)
    : channel_(std::move(channel)), runner_(std::move(runner)), elevation_(std::move(elevation)) {
}

std::vector<std::string> PrivilegedExecutor::elevated(const std::vector<std::string>& argv) const {
    std::vector<std::string> full;
    full.reserve(argv.size() + 1);
    if (!elevation_.empty()) {
        full.push_back(elevation_);
    }
    full.insert(full.end(), argv.begin(), argv.end());
    return full;
}

bool PrivilegedExecutor::try_channel(const std::string& line) {
    if (!channel_ || !channel_->is_open()) {
        return false;
    }
    return channel_->submit(line);
}

PrivilegedExecutor::Route PrivilegedExecutor::execute(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return Route::FAILED;
    }

    if (try_channel(to_shell_command(argv))) {
        spdlog::debug("[PrivilegedExecutor] '{}' issued via helper channel", argv[0]);
        return Route::CHANNEL;
    }

    spdlog::debug("[PrivilegedExecutor] Channel unavailable, running '{}' directly", argv[0]);
    CommandOutput out = runner_->run(elevated(argv));
    if (!out.launched) {
        spdlog::warn("[PrivilegedExecutor] Could not run '{}': {}", argv[0], out.error);
        return Route::FAILED;
    }
    if (out.exit_code != 0) {
        spdlog::warn("[PrivilegedExecutor] '{}' exited with code {}", argv[0], out.exit_code);
        return Route::FAILED;
    }
    return Route::DIRECT;
}

PrivilegedExecutor::Route PrivilegedExecutor::launch(const std::vector<std::string>& argv,
                                                     std::string* error) {
    if (argv.empty()) {
        if (error) {
            *error = "empty command";
        }
        return Route::FAILED;
    }

    if (try_channel(to_shell_command(argv) + " >/dev/null 2>&1 &")) {
        spdlog::debug("[PrivilegedExecutor] '{}' launched via helper channel", argv[0]);
        return Route::CHANNEL;
    }

    return launch_direct(argv, error);
}

PrivilegedExecutor::Route PrivilegedExecutor::launch_direct(const std::vector<std::string>& argv,
                                                            std::string* error) {
    if (argv.empty()) {
        if (error) {
            *error = "empty command";
        }
        return Route::FAILED;
    }

    HotspotError result = runner_->spawn(elevated(argv));
    if (!result.success()) {
        if (error) {
            *error = result.technical_msg;
        }
        return Route::FAILED;
    }
    return Route::DIRECT;
}

const char* route_name(PrivilegedExecutor::Route route) {
    switch (route) {
    case PrivilegedExecutor::Route::CHANNEL:
        return "channel";
    case PrivilegedExecutor::Route::DIRECT:
        return "direct";
    case PrivilegedExecutor::Route::FAILED:
        return "failed";
    }
    return "unknown";
}

} // namespace idkspot
