// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "app_state.h"
#include "cli_args.h"
#include "command_runner.h"
#include "config.h"
#include "console_shell.h"
#include "hotspot_controller.h"
#include "logging_init.h"

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <mutex>
#include <signal.h>
#include <string>
#include <thread>
#include <unistd.h>

using namespace idkspot;

namespace {

/// Serializes console output between the main loop and the polling thread
std::mutex g_output_mutex;

void print_line(const std::string& text) {
    if (text.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << text << std::endl;
}

/// SIGINT/SIGTERM are blocked in every thread and collected here
void signal_watcher(sigset_t signals, std::shared_ptr<AppState> app_state) {
    timespec timeout{0, 200 * 1000 * 1000};
    while (app_state->app_running()) {
        int sig = sigtimedwait(&signals, nullptr, &timeout);
        if (sig == SIGINT || sig == SIGTERM) {
            spdlog::info("[Main] Received signal {}, quitting", sig);
            app_state->request_quit();
        }
    }
}

void configure_logging(const CliArgs& args, Config& config) {
    logging::LogConfig log_config;
    log_config.level =
        logging::resolve_log_level(args.verbosity, config.get<std::string>("/log_level", ""));
    log_config.target = args.log_dest.empty() ? logging::LogTarget::Console
                                              : logging::parse_log_target(args.log_dest);
    log_config.file_path = args.log_file;
    logging::init(log_config);
}

} // namespace

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        return args.help_shown ? 0 : 1;
    }

    // Block before any thread exists so every thread inherits the mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    // Console-only logging until the config (and its log level) is loaded
    logging::LogConfig bootstrap;
    bootstrap.level = logging::verbosity_to_level(args.verbosity);
    bootstrap.target = logging::LogTarget::Console;
    logging::init(bootstrap);

    Config* config = Config::get_instance();
    config->init(args.config_path.empty() ? Config::default_config_path() : args.config_path);
    configure_logging(args, *config);

    auto app_state = std::make_shared<AppState>();
    std::thread watcher(signal_watcher, signals, app_state);

    HotspotController controller(ControllerSettings::from_config(*config),
                                 CommandRunner::create());
    controller.init();

    controller.set_started_callback(
        [config](const std::string& ssid) { config->set_last_ssid(ssid); });
    controller.set_devices_callback(
        [app_state](const std::vector<ConnectedDevice>& devices) {
            if (app_state->show_window()) {
                print_line("-- devices --\n" + ConsoleShell::format_devices(devices));
            }
        });

    ConsoleShell shell(controller, app_state, config->get_last_ssid());
    print_line(shell.banner());
    print_line("Type 'help' for commands.");

    shell.run(STDIN_FILENO, print_line);

    spdlog::info("[Main] Shutting down");
    controller.shutdown();
    if (watcher.joinable()) {
        watcher.join();
    }
    spdlog::shutdown();
    return 0;
}
