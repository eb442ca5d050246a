// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_state.h"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace idkspot;

TEST_CASE("AppState: defaults", "[application][app_state]") {
    AppState state;
    REQUIRE(state.show_window());
    REQUIRE(state.app_running());
}

TEST_CASE("AppState: show_window notifies on change only", "[application][app_state]") {
    AppState state;
    std::vector<std::pair<AppState::Flag, bool>> events;
    state.subscribe([&events](AppState::Flag flag, bool value) { events.emplace_back(flag, value); });

    state.set_show_window(true); // unchanged
    REQUIRE(events.empty());

    state.set_show_window(false);
    state.set_show_window(false);
    state.set_show_window(true);

    REQUIRE(events.size() == 2);
    REQUIRE(events[0].first == AppState::Flag::ShowWindow);
    REQUIRE_FALSE(events[0].second);
    REQUIRE(events[1].second);
}

TEST_CASE("AppState: request_quit is idempotent", "[application][app_state]") {
    AppState state;
    int quit_events = 0;
    state.subscribe([&quit_events](AppState::Flag flag, bool value) {
        if (flag == AppState::Flag::AppRunning && !value) {
            quit_events++;
        }
    });

    state.request_quit();
    state.request_quit();

    REQUIRE_FALSE(state.app_running());
    REQUIRE(quit_events == 1);
}

TEST_CASE("AppState: unsubscribe stops notifications", "[application][app_state]") {
    AppState state;
    int calls = 0;
    auto first = state.subscribe([&calls](AppState::Flag, bool) { calls++; });
    auto second = state.subscribe([&calls](AppState::Flag, bool) { calls += 10; });
    REQUIRE(first != second);

    state.unsubscribe(first);
    state.set_show_window(false);
    REQUIRE(calls == 10);

    state.unsubscribe(second);
    state.unsubscribe(second); // unknown id is ignored
    state.set_show_window(true);
    REQUIRE(calls == 10);
}

TEST_CASE("AppState: throwing observer does not block others", "[application][app_state]") {
    AppState state;
    bool reached = false;
    state.subscribe([](AppState::Flag, bool) { throw std::runtime_error("observer failure"); });
    state.subscribe([&reached](AppState::Flag, bool) { reached = true; });

    state.set_show_window(false);
    REQUIRE(reached);
}

TEST_CASE("app_state_flag_name: names", "[application][app_state]") {
    REQUIRE(std::string(app_state_flag_name(AppState::Flag::ShowWindow)) == "show_window");
    REQUIRE(std::string(app_state_flag_name(AppState::Flag::AppRunning)) == "app_running");
}
