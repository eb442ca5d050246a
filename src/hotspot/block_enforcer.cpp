// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "block_enforcer.h"

#include "utils/mac_address.h"
#include "utils/path_pattern.h"

#include "spdlog/spdlog.h"

#include <thread>

namespace idkspot {

// ============================================================================
// Firewall
// ============================================================================

FirewallDropStrategy::FirewallDropStrategy(std::shared_ptr<PrivilegedExecutor> executor,
                                           std::chrono::milliseconds settle)
    : executor_(std::move(executor)), settle_(settle) {}

const std::vector<std::string>& FirewallDropStrategy::chains() {
    static const std::vector<std::string> kChains = {"FORWARD", "INPUT"};
    return kChains;
}

std::vector<std::string> FirewallDropStrategy::rule_command(const std::string& op,
                                                            const std::string& chain,
                                                            const std::string& mac) {
    return {"iptables", op, chain, "-m", "mac", "--mac-source", mac, "-j", "DROP"};
}

bool FirewallDropStrategy::apply(const std::string& mac, const std::string& /*interface*/) {
    bool via_channel = false;
    for (const auto& chain : chains()) {
        auto route = executor_->execute(rule_command("-I", chain, mac));
        if (route == PrivilegedExecutor::Route::FAILED) {
            spdlog::debug("[FirewallDrop] {} rule for {} failed", chain, mac);
            return false;
        }
        via_channel = via_channel || route == PrivilegedExecutor::Route::CHANNEL;
    }

    // No acknowledgment from the helper; give it time to run both lines
    if (via_channel && settle_.count() > 0) {
        std::this_thread::sleep_for(settle_);
    }
    return true;
}

// ============================================================================
// hostapd_cli deauthentication
// ============================================================================

HostapdDeauthStrategy::HostapdDeauthStrategy(Target target, std::shared_ptr<CommandRunner> runner,
                                             std::string ctrl_dir_pattern,
                                             std::string bridge_pattern)
    : target_(target), runner_(std::move(runner)), ctrl_dir_pattern_(std::move(ctrl_dir_pattern)),
      bridge_pattern_(std::move(bridge_pattern)) {}

const char* HostapdDeauthStrategy::name() const {
    switch (target_) {
    case Target::CONTROL_SOCKET:
        return "hostapd control socket";
    case Target::BRIDGE_INTERFACE:
        return "AP bridge deauth";
    case Target::SUDO:
        return "sudo deauth";
    }
    return "hostapd";
}

std::vector<std::string> HostapdDeauthStrategy::control_dirs(const std::string& interface) const {
    if (ctrl_dir_pattern_.empty()) {
        return {};
    }
    return expand_path_pattern(ctrl_dir_pattern_, interface);
}

std::string HostapdDeauthStrategy::bridge_interface(const std::string& interface) const {
    std::string bridge = substitute_interface(bridge_pattern_, interface);
    return is_valid_interface_name(bridge) ? bridge : "";
}

bool HostapdDeauthStrategy::run_ok(const std::vector<std::string>& argv) {
    CommandOutput out = runner_->run(argv);
    if (!out.launched) {
        spdlog::debug("[HostapdDeauth] Could not run {}: {}", argv[0], out.error);
        return false;
    }
    // hostapd_cli exits 0 even when the daemon answers FAIL
    return out.exit_code == 0 && out.output.find("OK") != std::string::npos;
}

bool HostapdDeauthStrategy::apply(const std::string& mac, const std::string& interface) {
    switch (target_) {
    case Target::CONTROL_SOCKET: {
        for (const auto& dir : control_dirs(interface)) {
            // Deny ACL first; a miss here still leaves deauth worth trying
            if (!run_ok({"hostapd_cli", "-p", dir, "deny_acl", "ADD_MAC", mac})) {
                spdlog::debug("[HostapdDeauth] deny_acl not accepted via {}", dir);
            }
            if (run_ok({"hostapd_cli", "-p", dir, "deauthenticate", mac})) {
                spdlog::debug("[HostapdDeauth] {} deauthenticated via {}", mac, dir);
                return true;
            }
        }
        return false;
    }
    case Target::BRIDGE_INTERFACE: {
        std::string bridge = bridge_interface(interface);
        if (bridge.empty()) {
            return false;
        }
        return run_ok({"hostapd_cli", "-i", bridge, "deauthenticate", mac});
    }
    case Target::SUDO: {
        std::string bridge = bridge_interface(interface);
        if (bridge.empty()) {
            return false;
        }
        return run_ok({"sudo", "-n", "hostapd_cli", "-i", bridge, "deauthenticate", mac});
    }
    }
    return false;
}

// ============================================================================
// Enforcer
// ============================================================================

BlockEnforcer::BlockEnforcer(std::vector<std::unique_ptr<BlockStrategy>> strategies,
                             std::shared_ptr<BlockListStore> store,
                             std::shared_ptr<PrivilegedExecutor> executor,
                             std::string ctrl_dir_pattern)
    : strategies_(std::move(strategies)), store_(std::move(store)),
      executor_(std::move(executor)), ctrl_dir_pattern_(std::move(ctrl_dir_pattern)) {
    // The chain must always end in a strategy that records
    if (strategies_.empty() || strategies_.back()->enforces()) {
        strategies_.push_back(std::make_unique<LocalRecordStrategy>());
    }
}

std::unique_ptr<BlockEnforcer> BlockEnforcer::create(std::shared_ptr<BlockListStore> store,
                                                     std::shared_ptr<PrivilegedExecutor> executor,
                                                     const std::string& ctrl_dir_pattern,
                                                     const std::string& bridge_pattern) {
    auto runner = executor->runner();
    std::vector<std::unique_ptr<BlockStrategy>> chain;
    chain.push_back(std::make_unique<FirewallDropStrategy>(executor));
    chain.push_back(std::make_unique<HostapdDeauthStrategy>(
        HostapdDeauthStrategy::Target::CONTROL_SOCKET, runner, ctrl_dir_pattern, bridge_pattern));
    chain.push_back(std::make_unique<HostapdDeauthStrategy>(
        HostapdDeauthStrategy::Target::BRIDGE_INTERFACE, runner, ctrl_dir_pattern,
        bridge_pattern));
    chain.push_back(std::make_unique<HostapdDeauthStrategy>(HostapdDeauthStrategy::Target::SUDO,
                                                            runner, ctrl_dir_pattern,
                                                            bridge_pattern));
    chain.push_back(std::make_unique<LocalRecordStrategy>());
    return std::make_unique<BlockEnforcer>(std::move(chain), std::move(store),
                                           std::move(executor), ctrl_dir_pattern);
}

std::vector<std::string> BlockEnforcer::strategy_names() const {
    std::vector<std::string> names;
    for (const auto& strategy : strategies_) {
        names.emplace_back(strategy->name());
    }
    return names;
}

BlockOutcome BlockEnforcer::block(const std::string& mac, const std::string& interface) {
    BlockOutcome outcome;

    std::string canonical = canonical_mac(mac);
    if (canonical.empty()) {
        outcome.error = HotspotErrorHelper::invalid_parameters("Invalid MAC address: " + mac);
        return outcome;
    }
    if (!is_valid_interface_name(interface)) {
        outcome.error =
            HotspotErrorHelper::invalid_parameters("Invalid interface name: " + interface);
        return outcome;
    }

    for (const auto& strategy : strategies_) {
        spdlog::debug("[BlockEnforcer] Trying '{}' for {}", strategy->name(), canonical);
        if (strategy->apply(canonical, interface)) {
            outcome.method = strategy->name();
            outcome.enforced = strategy->enforces();
            break;
        }
    }

    HotspotError stored = store_->add(canonical);
    if (!stored.success()) {
        spdlog::error("[BlockEnforcer] Could not persist {}: {}", canonical,
                      stored.technical_msg);
        outcome.error = stored;
        return outcome;
    }

    if (outcome.enforced) {
        spdlog::info("[BlockEnforcer] Blocked {} via {}", canonical, outcome.method);
        outcome.error = HotspotErrorHelper::success();
    } else {
        spdlog::warn("[BlockEnforcer] {} recorded but NOT enforced", canonical);
        outcome.error = HotspotErrorHelper::not_enforced(canonical);
    }
    return outcome;
}

HotspotError BlockEnforcer::unblock(const std::string& mac, const std::string& interface) {
    std::string canonical = canonical_mac(mac);
    if (canonical.empty()) {
        return HotspotErrorHelper::invalid_parameters("Invalid MAC address: " + mac);
    }

    for (const auto& chain : FirewallDropStrategy::chains()) {
        auto route = executor_->execute(FirewallDropStrategy::rule_command("-D", chain, canonical));
        if (route == PrivilegedExecutor::Route::FAILED) {
            spdlog::debug("[BlockEnforcer] No {} rule removed for {}", chain, canonical);
        }
    }

    if (is_valid_interface_name(interface) && !ctrl_dir_pattern_.empty()) {
        for (const auto& dir : expand_path_pattern(ctrl_dir_pattern_, interface)) {
            CommandOutput out = executor_->runner()->run(
                {"hostapd_cli", "-p", dir, "deny_acl", "DEL_MAC", canonical});
            if (!out.ok()) {
                spdlog::debug("[BlockEnforcer] deny_acl DEL_MAC not accepted via {}", dir);
            }
        }
    }

    HotspotError removed = store_->remove(canonical);
    if (removed.success()) {
        spdlog::info("[BlockEnforcer] Unblocked {}", canonical);
    }
    return removed;
}

} // namespace idkspot
