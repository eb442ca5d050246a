// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "privileged_channel.h"

#include "command_runner.h"

#include "spdlog/spdlog.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <thread>
#include <sys/wait.h>
#include <unistd.h>

namespace idkspot {

namespace {

constexpr auto EXIT_GRACE = std::chrono::milliseconds(2000);
constexpr auto EXIT_POLL_INTERVAL = std::chrono::milliseconds(20);

/// Poll for child exit for up to grace; true once reaped
bool reap_within(pid_t pid, std::chrono::milliseconds grace) {
    auto deadline = std::chrono::steady_clock::now() + grace;
    while (true) {
        int status = 0;
        pid_t rc = waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            return true;
        }
        if (rc < 0 && errno != EINTR) {
            // ECHILD: already reaped elsewhere
            return errno == ECHILD;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(EXIT_POLL_INTERVAL);
    }
}

} // namespace

PrivilegedChannel::PrivilegedChannel(std::string elevation) : elevation_(std::move(elevation)) {}

PrivilegedChannel::~PrivilegedChannel() {
    // Use fprintf - spdlog may be destroyed during static cleanup
    if (is_open()) {
        fprintf(stderr, "[PrivilegedChannel] Closing helper in destructor\n");
    }
    close();
}

std::vector<std::string> PrivilegedChannel::helper_command() const {
    std::vector<std::string> argv;
    if (!elevation_.empty()) {
        argv.push_back(elevation_);
    }
    argv.push_back("sh");
    argv.push_back("-c");
    argv.push_back(HELPER_SCRIPT);
    return argv;
}

bool PrivilegedChannel::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ > 0) {
        spdlog::debug("[PrivilegedChannel] Already open (pid {})", pid_);
        return true;
    }

    // A write to a helper that has exited must fail with EPIPE, not kill us
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });

    spdlog::info("[PrivilegedChannel] Starting privileged helper via '{}'",
                 elevation_.empty() ? "sh" : elevation_);

    std::string error;
    int fd = -1;
    pid_t pid = spawn_with_stdin_pipe(helper_command(), fd, error);
    if (pid < 0) {
        spdlog::warn("[PrivilegedChannel] Helper not started: {}", error);
        return false;
    }

    pid_ = pid;
    stdin_fd_ = fd;
    spdlog::debug("[PrivilegedChannel] Helper running (pid {})", pid_);
    return true;
}

bool PrivilegedChannel::submit(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stdin_fd_ < 0) {
        spdlog::trace("[PrivilegedChannel] submit() on closed channel");
        return false;
    }

    std::string line = command + "\n";
    const char* data = line.data();
    size_t remaining = line.size();

    // Raw fd: each write() hands the bytes to the pipe, no user-space buffer to flush
    while (remaining > 0) {
        ssize_t n = write(stdin_fd_, data, remaining);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            // EPIPE: helper exited (auth cancelled or killed)
            spdlog::warn("[PrivilegedChannel] Write to helper failed: {}", strerror(errno));
            return false;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    // Lines may carry credentials; log the size only
    spdlog::debug("[PrivilegedChannel] Submitted {} byte command", line.size());
    return true;
}

void PrivilegedChannel::close() {
    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pid_ <= 0) {
            return;
        }
        pid = pid_;
        if (stdin_fd_ >= 0) {
            // EOF ends the helper's read loop after queued lines have run
            ::close(stdin_fd_);
            stdin_fd_ = -1;
        }
        pid_ = -1;
    }

    if (reap_within(pid, EXIT_GRACE)) {
        return;
    }

    // Signalling an elevated helper may fail with EPERM; EOF above is the real stop
    if (kill(pid, SIGTERM) < 0) {
        fprintf(stderr, "[PrivilegedChannel] kill(%d) failed: %s\n", static_cast<int>(pid),
                strerror(errno));
    }
    if (!reap_within(pid, EXIT_GRACE)) {
        fprintf(stderr, "[PrivilegedChannel] Helper %d did not exit\n", static_cast<int>(pid));
    }
}

bool PrivilegedChannel::is_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stdin_fd_ >= 0;
}

} // namespace idkspot
