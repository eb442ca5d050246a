// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef MOCK_COMMAND_RUNNER_H
#define MOCK_COMMAND_RUNNER_H

/**
 * @file mock_command_runner.h
 * @brief Canned-output process runner for testing
 *
 * Provides a CommandRunner that:
 * - Never forks or execs anything
 * - Returns configured output per command line (argv joined with spaces)
 * - Records every run() and spawn() call for later inspection
 *
 * Commands without a configured response "launch" and exit 0 with no output,
 * unless set_unknown_launch_fails(true) was called.
 *
 * @example
 * auto runner = std::make_shared<MockCommandRunner>();
 * runner->set_output("iw dev", "Interface wlan0\n\tchannel 6 (2437 MHz)\n");
 * WifiInterfaceResolver resolver(runner);
 * auto res = resolver.resolve();
 */

#include "command_runner.h"

#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

using namespace idkspot;

class MockCommandRunner : public CommandRunner {
  public:
    MockCommandRunner() = default;
    ~MockCommandRunner() override = default;

    // Non-copyable
    MockCommandRunner(const MockCommandRunner&) = delete;
    MockCommandRunner& operator=(const MockCommandRunner&) = delete;

    CommandOutput run(const std::vector<std::string>& argv) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string key = join_command(argv);
        runs_.push_back(key);

        auto it = responses_.find(key);
        if (it != responses_.end()) {
            return it->second;
        }

        CommandOutput out;
        if (unknown_launch_fails_ || launch_failures_.count(argv.empty() ? "" : argv[0]) > 0) {
            out.error = "No such file or directory";
            return out;
        }
        out.launched = true;
        out.exit_code = 0;
        return out;
    }

    HotspotError spawn(const std::vector<std::string>& argv) override {
        std::lock_guard<std::mutex> lock(mutex_);
        spawns_.push_back(argv);
        if (spawn_fails_ || launch_failures_.count(argv.empty() ? "" : argv[0]) > 0) {
            return HotspotErrorHelper::tool_launch_failed(argv.empty() ? "" : argv[0],
                                                          "No such file or directory");
        }
        return HotspotErrorHelper::success();
    }

    // ========================================================================
    // Configuration
    // ========================================================================

    /// Command exits 0 with this stdout
    void set_output(const std::string& command_line, const std::string& output) {
        CommandOutput out;
        out.launched = true;
        out.exit_code = 0;
        out.output = output;
        set_response(command_line, out);
    }

    /// Command launches but exits with exit_code
    void set_exit_code(const std::string& command_line, int exit_code,
                       const std::string& output = "") {
        CommandOutput out;
        out.launched = true;
        out.exit_code = exit_code;
        out.output = output;
        set_response(command_line, out);
    }

    /// Command cannot be launched at all
    void set_launch_failure(const std::string& command_line,
                            const std::string& error = "No such file or directory") {
        CommandOutput out;
        out.error = error;
        set_response(command_line, out);
    }

    void set_response(const std::string& command_line, const CommandOutput& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_[command_line] = out;
    }

    /// Every invocation of this program fails to launch (run and spawn)
    void fail_program(const std::string& program) {
        std::lock_guard<std::mutex> lock(mutex_);
        launch_failures_.insert(program);
    }

    void set_unknown_launch_fails(bool fails) {
        std::lock_guard<std::mutex> lock(mutex_);
        unknown_launch_fails_ = fails;
    }

    void set_spawn_fails(bool fails) {
        std::lock_guard<std::mutex> lock(mutex_);
        spawn_fails_ = fails;
    }

    // ========================================================================
    // Inspection
    // ========================================================================

    std::vector<std::string> runs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return runs_;
    }

    std::vector<std::vector<std::string>> spawns() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return spawns_;
    }

    bool was_run(const std::string& command_line) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& run : runs_) {
            if (run == command_line) {
                return true;
            }
        }
        return false;
    }

    /// Number of run() calls whose command line starts with prefix
    size_t count_runs_with_prefix(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t count = 0;
        for (const auto& run : runs_) {
            if (run.compare(0, prefix.size(), prefix) == 0) {
                count++;
            }
        }
        return count;
    }

    void clear_history() {
        std::lock_guard<std::mutex> lock(mutex_);
        runs_.clear();
        spawns_.clear();
    }

  private:
    mutable std::mutex mutex_;
    std::map<std::string, CommandOutput> responses_;
    std::set<std::string> launch_failures_;
    bool unknown_launch_fails_ = false;
    bool spawn_fails_ = false;
    std::vector<std::string> runs_;
    std::vector<std::vector<std::string>> spawns_;
};

#endif // MOCK_COMMAND_RUNNER_H
