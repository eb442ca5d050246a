// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_PRIVILEGED_CHANNEL_H
#define MOCK_PRIVILEGED_CHANNEL_H

/**
 * @file mock_privileged_channel.h
 * @brief Privileged channel that records submitted lines instead of spawning a helper
 */

#include "privileged_channel.h"

#include <mutex>
#include <string>
#include <vector>

using namespace idkspot;

class MockPrivilegedChannel : public PrivilegedChannel {
  public:
    MockPrivilegedChannel() : PrivilegedChannel("") {}
    ~MockPrivilegedChannel() override = default;

    bool open() override {
        std::lock_guard<std::mutex> lock(mock_mutex_);
        open_ = open_succeeds_;
        open_calls_++;
        return open_;
    }

    bool submit(const std::string& command) override {
        std::lock_guard<std::mutex> lock(mock_mutex_);
        if (!open_ || submit_fails_) {
            return false;
        }
        lines_.push_back(command);
        return true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mock_mutex_);
        if (open_) {
            close_calls_++;
        }
        open_ = false;
    }

    bool is_open() const override {
        std::lock_guard<std::mutex> lock(mock_mutex_);
        return open_;
    }

    // Configuration
    void set_open_succeeds(bool succeeds) {
        std::lock_guard<std::mutex> lock(mock_mutex_);
        open_succeeds_ = succeeds;
    }

    /// Simulate a helper that died (EPIPE on every write)
    void set_submit_fails(bool fails) {
        std::lock_guard<std::mutex> lock(mock_mutex_);
        submit_fails_ = fails;
    }

    // Inspection
    std::vector<std::string> lines() const {
        std::lock_guard<std::mutex> lock(mock_mutex_);
        return lines_;
    }

    int open_calls() const {
        std::lock_guard<std::mutex> lock(mock_mutex_);
        return open_calls_;
    }

    int close_calls() const {
        std::lock_guard<std::mutex> lock(mock_mutex_);
        return close_calls_;
    }

  private:
    mutable std::mutex mock_mutex_;
    bool open_ = false;
    bool open_succeeds_ = true;
    bool submit_fails_ = false;
    int open_calls_ = 0;
    int close_calls_ = 0;
    std::vector<std::string> lines_;
};

#endif // MOCK_PRIVILEGED_CHANNEL_H
