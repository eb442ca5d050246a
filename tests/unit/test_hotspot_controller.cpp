// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "hotspot_controller.h"

#include "config.h"

#include "../test_helpers/controller_fixture.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <thread>

using namespace idkspot;

namespace {

template <typename Pred> bool wait_until(Pred pred) {
    for (int i = 0; i < 200; i++) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace

// ============================================================================
// Startup detection
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "HotspotController: detection enables start",
                 "[application][controller]") {
    auto& ctrl = init_controller();

    REQUIRE(ctrl.is_initialized());
    REQUIRE(ctrl.compatibility().supported);
    REQUIRE(ctrl.interface().name == "wlan0");
    REQUIRE(ctrl.interface().channel == 6);
    REQUIRE(ctrl.can_start());
    REQUIRE(ctrl.start_blocker().empty());
    REQUIRE(ctrl.channel_open());
    REQUIRE(channel->open_calls() == 1);
    REQUIRE(ctrl.block_strategy_names().size() == 5);
}

TEST_CASE_METHOD(ControllerFixture, "HotspotController: detection failures disable start",
                 "[application][controller]") {
    SECTION("unsupported hardware") {
        runner->set_output("iw list", "Wiphy phy0\n");
        auto& ctrl = init_controller();
        REQUIRE_FALSE(ctrl.can_start());
        REQUIRE(ctrl.start_blocker() == "AP+Managed simultaneous mode not found");
    }

    SECTION("no interface") {
        runner->set_output("iw dev", "phy#0\n");
        auto& ctrl = init_controller();
        REQUIRE_FALSE(ctrl.can_start());
        REQUIRE(ctrl.start_blocker() == "no wireless interface found");
    }

    SECTION("no frequency") {
        runner->set_output("iw dev", "phy#0\n\tInterface wlan0\n");
        auto& ctrl = init_controller();
        REQUIRE_FALSE(ctrl.can_start());
        REQUIRE(ctrl.start_blocker() == "could not detect frequency");
    }
}

TEST_CASE_METHOD(ControllerFixture, "HotspotController: helper failure is not fatal",
                 "[application][controller]") {
    channel->set_open_succeeds(false);
    auto& ctrl = init_controller();

    REQUIRE_FALSE(ctrl.channel_open());
    REQUIRE(ctrl.can_start());

    std::string status;
    REQUIRE(ctrl.start("net", "password123", status).success());
    ctrl.stop();

    // Fell back to one-shot elevation
    auto spawns = runner->spawns();
    REQUIRE(spawns.size() == 2);
    REQUIRE(spawns[0][0] == "pkexec");
    REQUIRE(spawns[1] == std::vector<std::string>{"pkexec", "create_ap", "--stop", "wlan0"});
}

TEST_CASE_METHOD(ControllerFixture, "HotspotController: uninitialized controller",
                 "[application][controller]") {
    auto& ctrl = controller();
    std::string status;

    REQUIRE_FALSE(ctrl.is_initialized());
    REQUIRE_FALSE(ctrl.can_start());
    REQUIRE(ctrl.start_blocker() == "Controller not initialized");
    REQUIRE(ctrl.start("net", "password123", status).result == HotspotResult::DETECTION_FAILED);
    REQUIRE(ctrl.stop() == "Hotspot is not running");
    REQUIRE(ctrl.state() == HotspotState::Idle);
    REQUIRE(ctrl.devices().empty());
    REQUIRE(ctrl.blocked().empty());
}

// ============================================================================
// Start / Stop
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "HotspotController: start and stop",
                 "[application][controller]") {
    auto& ctrl = init_controller();

    std::string started_ssid;
    ctrl.set_started_callback([&started_ssid](const std::string& ssid) { started_ssid = ssid; });

    std::string status;
    REQUIRE(ctrl.start("net", "password123", status).success());
    REQUIRE(status == "Hotspot 'net' starting on channel 6...");
    REQUIRE(ctrl.is_running());
    REQUIRE_FALSE(ctrl.inputs_editable());
    REQUIRE(started_ssid == "net");

    REQUIRE(ctrl.stop() == "Hotspot stopped on wlan0");
    REQUIRE(ctrl.state() == HotspotState::Idle);
    REQUIRE(ctrl.inputs_editable());
    REQUIRE(ctrl.devices().empty());

    // Credentials go straight to exec; only the stop command uses the helper
    auto spawns = runner->spawns();
    REQUIRE(spawns.size() == 1);
    REQUIRE(spawns[0] == std::vector<std::string>{"pkexec", "create_ap", "-c", "6", "wlan0",
                                                  "wlan0", "net", "password123"});
    REQUIRE(channel->lines() ==
            std::vector<std::string>{"'create_ap' '--stop' 'wlan0' >/dev/null 2>&1 &"});
}

TEST_CASE_METHOD(ControllerFixture, "HotspotController: validation precedes hardware check",
                 "[application][controller]") {
    runner->set_output("iw list", "");
    auto& ctrl = init_controller();
    std::string status;

    SECTION("bad input") {
        auto err = ctrl.start("net", "short", status);
        REQUIRE(err.result == HotspotResult::INVALID_PARAMETERS);
        REQUIRE(status == "Error: Password must be at least 8 characters");
    }

    SECTION("good input") {
        auto err = ctrl.start("net", "password123", status);
        REQUIRE(err.result == HotspotResult::HARDWARE_UNSUPPORTED);
        REQUIRE(status == "Error: AP+Managed simultaneous mode not found");
    }

    REQUIRE(ctrl.state() == HotspotState::Idle);
    REQUIRE(channel->lines().empty());
}

TEST_CASE_METHOD(ControllerFixture, "HotspotController: rejected start does not notify",
                 "[application][controller]") {
    auto& ctrl = init_controller();
    bool notified = false;
    ctrl.set_started_callback([&notified](const std::string&) { notified = true; });

    std::string status;
    REQUIRE_FALSE(ctrl.start("", "password123", status).success());
    REQUIRE_FALSE(notified);
}

// ============================================================================
// Devices
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "HotspotController: polling excludes blocked devices",
                 "[application][controller][slow]") {
    runner->set_output("iw dev wlan0 station dump", "Station aa:bb:cc:dd:ee:01 (on wlan0)\n"
                                                    "Station aa:bb:cc:dd:ee:02 (on wlan0)\n");
    auto& ctrl = init_controller();

    std::atomic<size_t> last_count{99};
    ctrl.set_devices_callback(
        [&last_count](const std::vector<ConnectedDevice>& devices) { last_count = devices.size(); });

    REQUIRE(ctrl.poll_devices().empty()); // not running yet

    std::string status;
    REQUIRE(ctrl.start("net", "password123", status).success());
    REQUIRE(wait_until([&] { return last_count.load() == 2; }));
    REQUIRE(ctrl.poll_devices().size() == 2);

    REQUIRE(ctrl.block("AA:BB:CC:DD:EE:01").error.success());
    REQUIRE(wait_until([&] { return last_count.load() == 1; }));

    auto devices = ctrl.poll_devices();
    REQUIRE(devices.size() == 1);
    REQUIRE(devices[0].mac == "AA:BB:CC:DD:EE:02");

    ctrl.stop();
    REQUIRE(ctrl.devices().empty());
    REQUIRE(ctrl.poll_devices().empty());
}

// ============================================================================
// Blocking
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "HotspotController: block and unblock",
                 "[application][controller]") {
    auto& ctrl = init_controller();

    auto outcome = ctrl.block("aa:bb:cc:dd:ee:07");
    REQUIRE(outcome.error.success());
    REQUIRE(outcome.method == "firewall");
    REQUIRE(ctrl.blocked() == std::set<std::string>{"AA:BB:CC:DD:EE:07"});
    REQUIRE(TempDir::read(settings.block_list_path) == "AA:BB:CC:DD:EE:07\n");

    REQUIRE(ctrl.unblock("AA:BB:CC:DD:EE:07").success());
    REQUIRE(ctrl.blocked().empty());

    REQUIRE(ctrl.block("nonsense").error.result == HotspotResult::INVALID_PARAMETERS);
}

// ============================================================================
// Shutdown
// ============================================================================

TEST_CASE_METHOD(ControllerFixture, "HotspotController: shutdown leaves the daemon running",
                 "[application][controller]") {
    auto& ctrl = init_controller();
    std::string status;
    REQUIRE(ctrl.start("net", "password123", status).success());

    ctrl.shutdown();
    ctrl.shutdown();

    REQUIRE(channel->close_calls() == 1);
    REQUIRE_FALSE(channel->is_open());
    REQUIRE(runner->spawns().size() == 1);
    REQUIRE(channel->lines().empty()); // no stop command issued
}

// ============================================================================
// Settings
// ============================================================================

TEST_CASE("ControllerSettings: from_config", "[application][controller]") {
    TempDir tmp("controller_settings");
    tmp.write("settings.json", R"({"hotspot": {"daemon": "/opt/create_ap", "elevation": ""},
                                   "tracker": {"poll_interval_ms": 10},
                                   "block": {"bridge_interface": "{iface}ap"}})");
    Config config;
    config.init(tmp.file("settings.json"));

    auto settings = ControllerSettings::from_config(config);
    REQUIRE(settings.daemon == "/opt/create_ap");
    REQUIRE(settings.elevation.empty());
    REQUIRE(settings.poll_interval == std::chrono::milliseconds(100)); // clamped
    REQUIRE(settings.bridge_interface == "{iface}ap");
    REQUIRE(settings.hostapd_ctrl_dir == "/tmp/create_ap.{iface}.conf.*/hostapd_ctrl");
    REQUIRE(settings.lease_files.size() == 3);
    REQUIRE_FALSE(settings.block_list_path.empty());
}
