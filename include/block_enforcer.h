// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "block_list.h"
#include "command_runner.h"
#include "hotspot_error.h"
#include "privileged_executor.h"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace idkspot {

/**
 * @brief Result of a block request
 */
struct BlockOutcome {
    std::string method;  ///< Name of the strategy that handled the request
    bool enforced = false;
    HotspotError error;  ///< NOT_ENFORCED for the local-only path

    bool recorded() const {
        return error.success() || error.result == HotspotResult::NOT_ENFORCED;
    }
};

/**
 * @brief One way of keeping a client off the hotspot
 *
 * Strategies are tried in order until one reports success.
 */
class BlockStrategy {
  public:
    virtual ~BlockStrategy() = default;

    virtual const char* name() const = 0;

    /// False only for strategies that merely record intent
    virtual bool enforces() const {
        return true;
    }

    /**
     * @param mac Canonical MAC
     * @param interface AP interface (validated)
     * @return true if the block took effect (or, for the channel, was issued)
     */
    virtual bool apply(const std::string& mac, const std::string& interface) = 0;
};

/**
 * @brief iptables DROP rules on the FORWARD and INPUT chains
 */
class FirewallDropStrategy : public BlockStrategy {
  public:
    /**
     * @param executor Privileged routing (helper channel, then direct)
     * @param settle Wait after a channel submit, since the helper never acknowledges
     */
    FirewallDropStrategy(std::shared_ptr<PrivilegedExecutor> executor,
                         std::chrono::milliseconds settle = std::chrono::milliseconds(100));

    const char* name() const override {
        return "firewall";
    }
    bool apply(const std::string& mac, const std::string& interface) override;

    /**
     * @brief iptables argv for one rule
     *
     * @param op "-I" to insert, "-D" to delete
     * @param chain "FORWARD" or "INPUT"
     */
    static std::vector<std::string> rule_command(const std::string& op, const std::string& chain,
                                                 const std::string& mac);

    static const std::vector<std::string>& chains();

  private:
    std::shared_ptr<PrivilegedExecutor> executor_;
    std::chrono::milliseconds settle_;
};

/**
 * @brief Deauthenticate through hostapd_cli
 *
 * Three variants, tried in this order by the default chain:
 * - CONTROL_SOCKET: `hostapd_cli -p <ctrl_dir>`, also adds the
 *   MAC to the deny ACL so the client cannot simply re-associate
 * - BRIDGE_INTERFACE: `hostapd_cli -i <bridge>` (create_ap's virtual AP)
 * - SUDO: same as BRIDGE_INTERFACE under `sudo -n` (passwordless only)
 */
class HostapdDeauthStrategy : public BlockStrategy {
  public:
    enum class Target { CONTROL_SOCKET, BRIDGE_INTERFACE, SUDO };

    /**
     * @param target Variant
     * @param runner Process runner (these calls are never elevated via pkexec)
     * @param ctrl_dir_pattern Control directory pattern ({iface} and one '*' allowed)
     * @param bridge_pattern Bridge interface name ({iface} allowed)
     */
    HostapdDeauthStrategy(Target target, std::shared_ptr<CommandRunner> runner,
                          std::string ctrl_dir_pattern, std::string bridge_pattern);

    const char* name() const override;
    bool apply(const std::string& mac, const std::string& interface) override;

    /// Control directories that currently exist for the interface
    std::vector<std::string> control_dirs(const std::string& interface) const;

    /// Bridge interface name for the interface, empty if invalid
    std::string bridge_interface(const std::string& interface) const;

  private:
    bool run_ok(const std::vector<std::string>& argv);

    Target target_;
    std::shared_ptr<CommandRunner> runner_;
    std::string ctrl_dir_pattern_;
    std::string bridge_pattern_;
};

/**
 * @brief Final fallback: record the MAC, enforce nothing
 */
class LocalRecordStrategy : public BlockStrategy {
  public:
    const char* name() const override {
        return "local block list";
    }
    bool enforces() const override {
        return false;
    }
    bool apply(const std::string&, const std::string&) override {
        return true;
    }
};

/**
 * @brief Ordered block/unblock chain plus persistence
 */
class BlockEnforcer {
  public:
    BlockEnforcer(std::vector<std::unique_ptr<BlockStrategy>> strategies,
                  std::shared_ptr<BlockListStore> store,
                  std::shared_ptr<PrivilegedExecutor> executor,
                  std::string ctrl_dir_pattern = "");

    /**
     * @brief Default chain: firewall, control socket, bridge, sudo, local record
     */
    static std::unique_ptr<BlockEnforcer> create(std::shared_ptr<BlockListStore> store,
                                                 std::shared_ptr<PrivilegedExecutor> executor,
                                                 const std::string& ctrl_dir_pattern,
                                                 const std::string& bridge_pattern);

    /**
     * @brief Try each strategy until one succeeds, then persist the MAC
     *
     * @param mac MAC in any accepted form
     * @param interface AP interface
     * @return Outcome; error is INVALID_PARAMETERS, IO_ERROR, NOT_ENFORCED or SUCCESS
     */
    BlockOutcome block(const std::string& mac, const std::string& interface);

    /**
     * @brief Best-effort reversal, then remove from the store
     *
     * Only malformed input or a store write failure is reported.
     */
    HotspotError unblock(const std::string& mac, const std::string& interface);

    std::vector<std::string> strategy_names() const;

    const std::shared_ptr<BlockListStore>& store() const {
        return store_;
    }

  private:
    std::vector<std::unique_ptr<BlockStrategy>> strategies_;
    std::shared_ptr<BlockListStore> store_;
    std::shared_ptr<PrivilegedExecutor> executor_;
    std::string ctrl_dir_pattern_;
};

} // namespace idkspot
