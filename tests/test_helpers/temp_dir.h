// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Unique scratch directory, removed with everything in it on destruction
 */
class TempDir {
  public:
    explicit TempDir(const std::string& tag) {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("idkspot_" + tag + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 "_" + std::to_string(counter++));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const {
        return path_;
    }

    /// Absolute path of a child entry, as a string
    std::string file(const std::string& name) const {
        return (path_ / name).string();
    }

    /// Write content to a child file (creating parent directories)
    std::string write(const std::string& name, const std::string& content) const {
        fs::path target = path_ / name;
        fs::create_directories(target.parent_path());
        std::ofstream out(target);
        out << content;
        return target.string();
    }

    static std::string read(const std::string& file_path) {
        std::ifstream in(file_path);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

  private:
    fs::path path_;
};
