// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "hotspot_error.h"

#include <mutex>
#include <set>
#include <string>

namespace idkspot {

/**
 * @brief Durable set of blocked MAC addresses
 *
 * Backed by one plain-text file, one canonical MAC per line. The file is the
 * only state: every call re-reads it, so an entry added by another instance
 * (or by hand) is seen on the next poll.
 *
 * A missing file is an empty list. Lines that are not valid MACs are ignored.
 */
class BlockListStore {
  public:
    explicit BlockListStore(std::string path);

    /**
     * @brief Append a MAC (no-op if already present)
     *
     * @param mac MAC in any case, ':' or '-' separated
     * @return INVALID_PARAMETERS for a malformed MAC, IO_ERROR if the file
     *         cannot be written
     */
    HotspotError add(const std::string& mac);

    /**
     * @brief Rewrite the file without the MAC (no-op if absent)
     */
    HotspotError remove(const std::string& mac);

    /// All blocked MACs, canonical form
    std::set<std::string> all() const;

    bool contains(const std::string& mac) const;

    const std::string& path() const {
        return path_;
    }

  private:
    std::set<std::string> load_locked() const;
    bool ensure_parent_dir() const;

    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace idkspot
