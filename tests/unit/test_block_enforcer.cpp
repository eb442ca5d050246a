// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "block_enforcer.h"

#include "../mocks/mock_command_runner.h"
#include "../mocks/mock_privileged_channel.h"
#include "../test_helpers/temp_dir.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>

using namespace idkspot;

namespace {

const std::string kMac = "AA:BB:CC:DD:EE:01";

std::string iptables(const std::string& op, const std::string& chain) {
    return "pkexec iptables " + op + " " + chain + " -m mac --mac-source " + kMac + " -j DROP";
}

class EnforcerFixture {
  public:
    EnforcerFixture()
        : tmp("enforcer"),
          store(std::make_shared<BlockListStore>(tmp.file("blocked_macs.txt"))),
          executor(std::make_shared<PrivilegedExecutor>(nullptr, runner, "pkexec")),
          ctrl_pattern(tmp.path().string() + "/create_ap.{iface}.conf.*/hostapd_ctrl") {}

    std::unique_ptr<BlockEnforcer> make_default() {
        return BlockEnforcer::create(store, executor, ctrl_pattern, "ap0");
    }

    std::string make_ctrl_dir() {
        std::string dir = tmp.file("create_ap.wlan0.conf.Ab12/hostapd_ctrl");
        fs::create_directories(dir);
        return dir;
    }

    TempDir tmp;
    std::shared_ptr<MockCommandRunner> runner = std::make_shared<MockCommandRunner>();
    std::shared_ptr<BlockListStore> store;
    std::shared_ptr<PrivilegedExecutor> executor;
    std::string ctrl_pattern;
};

} // namespace

// ============================================================================
// Chain construction
// ============================================================================

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: default chain order", "[hotspot][block]") {
    auto enforcer = make_default();
    REQUIRE(enforcer->strategy_names() ==
            std::vector<std::string>{"firewall", "hostapd control socket", "AP bridge deauth",
                                     "sudo deauth", "local block list"});
}

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: local record is always appended",
                 "[hotspot][block]") {
    std::vector<std::unique_ptr<BlockStrategy>> chain;
    chain.push_back(std::make_unique<FirewallDropStrategy>(executor));
    BlockEnforcer enforcer(std::move(chain), store, executor);
    REQUIRE(enforcer.strategy_names() ==
            std::vector<std::string>{"firewall", "local block list"});

    BlockEnforcer empty({}, store, executor);
    REQUIRE(empty.strategy_names() == std::vector<std::string>{"local block list"});
}

TEST_CASE("FirewallDropStrategy: rule command", "[hotspot][block]") {
    REQUIRE(FirewallDropStrategy::rule_command("-I", "FORWARD", kMac) ==
            std::vector<std::string>{"iptables", "-I", "FORWARD", "-m", "mac", "--mac-source",
                                     kMac, "-j", "DROP"});
    REQUIRE(FirewallDropStrategy::chains() == std::vector<std::string>{"FORWARD", "INPUT"});
}

// ============================================================================
// block()
// ============================================================================

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: firewall succeeds first", "[hotspot][block]") {
    auto enforcer = make_default();
    auto outcome = enforcer->block("aa:bb:cc:dd:ee:01", "wlan0");

    REQUIRE(outcome.error.success());
    REQUIRE(outcome.enforced);
    REQUIRE(outcome.method == "firewall");
    REQUIRE(outcome.recorded());
    REQUIRE(runner->was_run(iptables("-I", "FORWARD")));
    REQUIRE(runner->was_run(iptables("-I", "INPUT")));
    REQUIRE(runner->count_runs_with_prefix("hostapd_cli") == 0);
    REQUIRE(store->contains(kMac));
}

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: firewall through the helper channel",
                 "[hotspot][block]") {
    auto channel = std::make_shared<MockPrivilegedChannel>();
    channel->open();
    auto channel_executor = std::make_shared<PrivilegedExecutor>(channel, runner, "pkexec");

    std::vector<std::unique_ptr<BlockStrategy>> chain;
    chain.push_back(
        std::make_unique<FirewallDropStrategy>(channel_executor, std::chrono::milliseconds(0)));
    BlockEnforcer enforcer(std::move(chain), store, channel_executor);

    auto outcome = enforcer.block(kMac, "wlan0");
    REQUIRE(outcome.enforced);
    REQUIRE(outcome.method == "firewall");

    auto lines = channel->lines();
    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0] == "'iptables' '-I' 'FORWARD' '-m' 'mac' '--mac-source' "
                        "'AA:BB:CC:DD:EE:01' '-j' 'DROP'");
    REQUIRE(lines[1].find("'INPUT'") != std::string::npos);
    REQUIRE(runner->runs().empty());
}

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: falls through to the control socket",
                 "[hotspot][block]") {
    std::string dir = make_ctrl_dir();
    runner->set_exit_code(iptables("-I", "FORWARD"), 1);
    runner->set_output("hostapd_cli -p " + dir + " deauthenticate " + kMac, "OK\n");

    auto enforcer = make_default();
    auto outcome = enforcer->block(kMac, "wlan0");

    REQUIRE(outcome.error.success());
    REQUIRE(outcome.method == "hostapd control socket");
    REQUIRE(runner->was_run("hostapd_cli -p " + dir + " deny_acl ADD_MAC " + kMac));
    REQUIRE_FALSE(runner->was_run(iptables("-I", "INPUT")));
}

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: bridge and sudo deauth", "[hotspot][block]") {
    runner->fail_program("pkexec");

    SECTION("bridge interface") {
        runner->set_output("hostapd_cli -i ap0 deauthenticate " + kMac, "OK\n");
        auto outcome = make_default()->block(kMac, "wlan0");
        REQUIRE(outcome.method == "AP bridge deauth");
        REQUIRE(outcome.enforced);
    }

    SECTION("sudo") {
        runner->set_output("hostapd_cli -i ap0 deauthenticate " + kMac, "FAIL\n");
        runner->set_output("sudo -n hostapd_cli -i ap0 deauthenticate " + kMac, "OK\n");
        auto outcome = make_default()->block(kMac, "wlan0");
        REQUIRE(outcome.method == "sudo deauth");
        REQUIRE(outcome.enforced);
    }
}

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: bridge pattern follows the interface",
                 "[hotspot][block]") {
    HostapdDeauthStrategy strategy(HostapdDeauthStrategy::Target::BRIDGE_INTERFACE, runner, "",
                                   "{iface}_ap");
    REQUIRE(strategy.bridge_interface("wlan0") == "wlan0_ap");

    HostapdDeauthStrategy bad(HostapdDeauthStrategy::Target::BRIDGE_INTERFACE, runner, "",
                              "ap0; reboot");
    REQUIRE(bad.bridge_interface("wlan0").empty());
    REQUIRE_FALSE(bad.apply(kMac, "wlan0"));
    REQUIRE(runner->runs().empty());
}

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: nothing enforces, MAC still recorded",
                 "[hotspot][block]") {
    runner->fail_program("pkexec");
    make_ctrl_dir();

    auto outcome = make_default()->block(kMac, "wlan0");

    REQUIRE(outcome.error.result == HotspotResult::NOT_ENFORCED);
    REQUIRE_FALSE(outcome.enforced);
    REQUIRE(outcome.method == "local block list");
    REQUIRE(outcome.recorded());
    REQUIRE(outcome.error.user_msg ==
            "Device AA:BB:CC:DD:EE:01 recorded as blocked, but NOT enforced");
    REQUIRE(store->contains(kMac));
}

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: input validation", "[hotspot][block]") {
    auto enforcer = make_default();

    SECTION("malformed MAC") {
        auto outcome = enforcer->block("AA:BB:CC", "wlan0");
        REQUIRE(outcome.error.result == HotspotResult::INVALID_PARAMETERS);
        REQUIRE(outcome.error.user_msg == "Invalid MAC address: AA:BB:CC");
        REQUIRE_FALSE(outcome.recorded());
    }

    SECTION("hostile interface name") {
        auto outcome = enforcer->block(kMac, "wlan0;id");
        REQUIRE(outcome.error.user_msg == "Invalid interface name: wlan0;id");
    }

    REQUIRE(runner->runs().empty());
    REQUIRE(store->all().empty());
}

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: persistence failure is reported",
                 "[hotspot][block]") {
    std::string blocker = tmp.write("not_a_dir", "x");
    auto broken = std::make_shared<BlockListStore>(blocker + "/blocked_macs.txt");
    auto enforcer = BlockEnforcer::create(broken, executor, ctrl_pattern, "ap0");

    auto outcome = enforcer->block(kMac, "wlan0");
    REQUIRE(outcome.error.result == HotspotResult::IO_ERROR);
    REQUIRE(outcome.method == "firewall");
}

// ============================================================================
// unblock()
// ============================================================================

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: unblock reverses and forgets",
                 "[hotspot][block]") {
    std::string dir = make_ctrl_dir();
    auto enforcer = make_default();
    REQUIRE(enforcer->block(kMac, "wlan0").error.success());
    runner->clear_history();

    REQUIRE(enforcer->unblock("aa-bb-cc-dd-ee-01", "wlan0").success());
    REQUIRE(runner->was_run(iptables("-D", "FORWARD")));
    REQUIRE(runner->was_run(iptables("-D", "INPUT")));
    REQUIRE(runner->was_run("hostapd_cli -p " + dir + " deny_acl DEL_MAC " + kMac));
    REQUIRE_FALSE(store->contains(kMac));
}

TEST_CASE_METHOD(EnforcerFixture, "BlockEnforcer: unblock is best effort", "[hotspot][block]") {
    REQUIRE(store->add(kMac).success());
    runner->fail_program("pkexec");
    runner->fail_program("hostapd_cli");

    auto enforcer = make_default();
    REQUIRE(enforcer->unblock(kMac, "wlan0").success());
    REQUIRE(store->all().empty());

    REQUIRE(enforcer->unblock("junk", "wlan0").result == HotspotResult::INVALID_PARAMETERS);
}
