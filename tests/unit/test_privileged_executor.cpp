// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "privileged_executor.h"

#include "../mocks/mock_command_runner.h"
#include "../mocks/mock_privileged_channel.h"

#include <catch2/catch_test_macros.hpp>

#include <memory>

using namespace idkspot;

namespace {

struct ExecutorFixture {
    std::shared_ptr<MockCommandRunner> runner = std::make_shared<MockCommandRunner>();
    std::shared_ptr<MockPrivilegedChannel> channel = std::make_shared<MockPrivilegedChannel>();
};

} // namespace

TEST_CASE_METHOD(ExecutorFixture, "PrivilegedExecutor: elevated prefixes the wrapper",
                 "[system][executor]") {
    PrivilegedExecutor pkexec(nullptr, runner, "pkexec");
    REQUIRE(pkexec.elevated({"iptables", "-L"}) ==
            std::vector<std::string>{"pkexec", "iptables", "-L"});

    PrivilegedExecutor plain(nullptr, runner, "");
    REQUIRE(plain.elevated({"iptables", "-L"}) == std::vector<std::string>{"iptables", "-L"});
}

TEST_CASE_METHOD(ExecutorFixture, "PrivilegedExecutor: open channel takes the command",
                 "[system][executor]") {
    channel->open();
    PrivilegedExecutor executor(channel, runner, "pkexec");

    SECTION("execute") {
        REQUIRE(executor.execute({"iptables", "-I", "FORWARD"}) ==
                PrivilegedExecutor::Route::CHANNEL);
        REQUIRE(channel->lines() == std::vector<std::string>{"'iptables' '-I' 'FORWARD'"});
        REQUIRE(runner->runs().empty());
    }

    SECTION("launch backgrounds the line") {
        REQUIRE(executor.launch({"create_ap", "--stop", "wlan0"}) ==
                PrivilegedExecutor::Route::CHANNEL);
        REQUIRE(channel->lines() ==
                std::vector<std::string>{"'create_ap' '--stop' 'wlan0' >/dev/null 2>&1 &"});
        REQUIRE(runner->spawns().empty());
    }

    SECTION("launch_direct skips the channel") {
        REQUIRE(executor.launch_direct({"create_ap", "wlan0", "net", "pass$(id)word"}) ==
                PrivilegedExecutor::Route::DIRECT);
        REQUIRE(channel->lines().empty());
        auto spawns = runner->spawns();
        REQUIRE(spawns.size() == 1);
        REQUIRE(spawns[0] ==
                std::vector<std::string>{"pkexec", "create_ap", "wlan0", "net", "pass$(id)word"});
    }
}

TEST_CASE_METHOD(ExecutorFixture, "PrivilegedExecutor: falls back to one-shot elevation",
                 "[system][executor]") {
    SECTION("channel never opened") {
        PrivilegedExecutor executor(channel, runner, "pkexec");
        REQUIRE(executor.execute({"iptables", "-L"}) == PrivilegedExecutor::Route::DIRECT);
        REQUIRE(runner->was_run("pkexec iptables -L"));
    }

    SECTION("channel write fails") {
        channel->open();
        channel->set_submit_fails(true);
        PrivilegedExecutor executor(channel, runner, "pkexec");
        REQUIRE(executor.execute({"iptables", "-L"}) == PrivilegedExecutor::Route::DIRECT);
        REQUIRE(runner->was_run("pkexec iptables -L"));
    }

    SECTION("no channel at all") {
        PrivilegedExecutor executor(nullptr, runner, "pkexec");
        REQUIRE(executor.launch({"create_ap", "--stop", "wlan0"}) ==
                PrivilegedExecutor::Route::DIRECT);
        auto spawns = runner->spawns();
        REQUIRE(spawns.size() == 1);
        REQUIRE(spawns[0] == std::vector<std::string>{"pkexec", "create_ap", "--stop", "wlan0"});
    }
}

TEST_CASE_METHOD(ExecutorFixture, "PrivilegedExecutor: direct failures", "[system][executor]") {
    PrivilegedExecutor executor(nullptr, runner, "pkexec");

    SECTION("non-zero exit") {
        runner->set_exit_code("pkexec iptables -L", 126);
        REQUIRE(executor.execute({"iptables", "-L"}) == PrivilegedExecutor::Route::FAILED);
    }

    SECTION("wrapper missing") {
        runner->fail_program("pkexec");
        REQUIRE(executor.execute({"iptables", "-L"}) == PrivilegedExecutor::Route::FAILED);

        std::string error;
        REQUIRE(executor.launch({"create_ap"}, &error) == PrivilegedExecutor::Route::FAILED);
        REQUIRE(error.find("pkexec") != std::string::npos);
    }

    SECTION("empty argv") {
        std::string error;
        REQUIRE(executor.execute({}) == PrivilegedExecutor::Route::FAILED);
        REQUIRE(executor.launch({}, &error) == PrivilegedExecutor::Route::FAILED);
        REQUIRE(error == "empty command");
    }
}

TEST_CASE("route_name: stable names", "[system][executor]") {
    REQUIRE(std::string(route_name(PrivilegedExecutor::Route::CHANNEL)) == "channel");
    REQUIRE(std::string(route_name(PrivilegedExecutor::Route::DIRECT)) == "direct");
    REQUIRE(std::string(route_name(PrivilegedExecutor::Route::FAILED)) == "failed");
}
