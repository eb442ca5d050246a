// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "console_shell.h"

#include "spdlog/spdlog.h"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sstream>
#include <unistd.h>

namespace idkspot {

namespace {

/// Self-pipe that turns a quit notification into a readable fd
class WakePipe {
  public:
    WakePipe() {
        if (pipe(fds_) != 0) {
            fds_[0] = fds_[1] = -1;
        }
    }

    ~WakePipe() {
        for (int fd : fds_) {
            if (fd >= 0) {
                close(fd);
            }
        }
    }

    WakePipe(const WakePipe&) = delete;
    WakePipe& operator=(const WakePipe&) = delete;

    bool valid() const {
        return fds_[0] >= 0;
    }

    int read_fd() const {
        return fds_[0];
    }

    void wake() {
        char byte = 'q';
        if (write(fds_[1], &byte, 1) < 0) {
            spdlog::debug("[ConsoleShell] Wake write failed: {}", strerror(errno));
        }
    }

  private:
    int fds_[2] = {-1, -1};
};

/**
 * @brief Append what input_fd has to pending
 *
 * @return false on EOF or a read error
 */
bool read_input(int input_fd, std::string& pending) {
    char buf[512];
    ssize_t n;
    do {
        n = read(input_fd, buf, sizeof(buf));
    } while (n < 0 && errno == EINTR);

    if (n < 0) {
        spdlog::warn("[ConsoleShell] Input read failed: {}", strerror(errno));
        return false;
    }
    if (n == 0) {
        return false;
    }
    pending.append(buf, static_cast<size_t>(n));
    return true;
}

} // namespace

std::vector<std::string> split_command(const std::string& line, size_t max_fields) {
    std::vector<std::string> fields;
    size_t pos = 0;
    const char* ws = " \t\r\n";

    while (true) {
        pos = line.find_first_not_of(ws, pos);
        if (pos == std::string::npos) {
            break;
        }
        if (max_fields != 0 && fields.size() + 1 == max_fields) {
            size_t end = line.find_last_not_of(ws);
            fields.push_back(line.substr(pos, end - pos + 1));
            break;
        }
        size_t end = line.find_first_of(ws, pos);
        fields.push_back(line.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
        if (end == std::string::npos) {
            break;
        }
        pos = end;
    }
    return fields;
}

bool split_quoted(const std::string& line, std::vector<std::string>& fields) {
    fields.clear();
    std::string current;
    bool in_field = false;
    bool quoted = false;

    for (char c : line) {
        if (quoted) {
            if (c == '"') {
                quoted = false;
            } else {
                current += c;
            }
            continue;
        }
        if (c == '"') {
            quoted = true;
            in_field = true;
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            if (in_field) {
                fields.push_back(current);
                current.clear();
                in_field = false;
            }
            continue;
        }
        current += c;
        in_field = true;
    }

    if (quoted) {
        return false;
    }
    if (in_field) {
        fields.push_back(current);
    }
    return true;
}

ConsoleShell::ConsoleShell(HotspotController& controller, std::shared_ptr<AppState> app_state,
                           std::string default_ssid)
    : controller_(controller), app_state_(std::move(app_state)),
      default_ssid_(std::move(default_ssid)) {}

std::string ConsoleShell::help_text() {
    return "Commands:\n"
           "  start [ssid] <password>  Start the hotspot (ssid defaults to the last one used;\n"
           "                           quote a password containing spaces)\n"
           "  stop                     Stop the hotspot\n"
           "  status                   Show hotspot state\n"
           "  devices                  List connected devices\n"
           "  block <mac>              Block a device\n"
           "  unblock <mac>            Unblock a device\n"
           "  blocked                  List blocked devices\n"
           "  show | hide              Print or suppress live device updates\n"
           "  help                     Show this help\n"
           "  quit                     Exit (a running hotspot keeps running)";
}

std::string ConsoleShell::format_devices(const std::vector<ConnectedDevice>& devices) {
    if (devices.empty()) {
        return "No connected devices";
    }
    std::ostringstream out;
    for (size_t i = 0; i < devices.size(); i++) {
        const auto& device = devices[i];
        out << device.mac << "  " << (device.hostname.empty() ? "(unknown)" : device.hostname);
        if (!device.ip.empty()) {
            out << "  " << device.ip;
        }
        if (i + 1 < devices.size()) {
            out << '\n';
        }
    }
    return out.str();
}

std::string ConsoleShell::banner() const {
    std::ostringstream out;
    const auto& compat = controller_.compatibility();
    out << (compat.supported ? "[ok] " : "[!!] ") << compat.detail << '\n';

    const auto& resolution = controller_.resolution();
    if (resolution.error) {
        out << "[!!] Interface: " << *resolution.error << '\n';
    } else {
        const auto& iface = controller_.interface();
        out << "[ok] Interface: " << iface.name << " (" << iface.frequency_mhz << " MHz, channel "
            << iface.channel << ")\n";
    }

    out << (controller_.channel_open() ? "[ok] Privileged helper ready"
                                       : "[!!] Privileged helper unavailable (one-shot elevation)");
    if (!controller_.can_start()) {
        out << "\nStart disabled: " << controller_.start_blocker();
    }
    return out.str();
}

std::string ConsoleShell::execute(const std::string& line) {
    std::vector<std::string> head = split_command(line, 2);
    if (head.empty()) {
        return "";
    }
    const std::string& cmd = head[0];
    spdlog::debug("[ConsoleShell] Command '{}'", cmd);

    if (cmd == "start") {
        return cmd_start(line);
    }
    if (cmd == "stop") {
        return controller_.stop();
    }
    if (cmd == "status") {
        return cmd_status();
    }
    if (cmd == "devices") {
        if (!controller_.is_running()) {
            return "Hotspot is not running";
        }
        return format_devices(controller_.poll_devices());
    }
    if (cmd == "block") {
        return cmd_block(split_command(line));
    }
    if (cmd == "unblock") {
        return cmd_unblock(split_command(line));
    }
    if (cmd == "blocked") {
        return cmd_blocked();
    }
    if (cmd == "show" || cmd == "hide") {
        app_state_->set_show_window(cmd == "show");
        return cmd == "show" ? "Live device updates on" : "Live device updates off";
    }
    if (cmd == "help" || cmd == "?") {
        return help_text();
    }
    if (cmd == "quit" || cmd == "exit") {
        app_state_->request_quit();
        return "";
    }
    return "Unknown command: " + cmd + " (try 'help')";
}

void ConsoleShell::run(int input_fd, const PrintFn& print) {
    // Shared with the observer, which may still be running after unsubscribe
    auto wake = std::make_shared<WakePipe>();
    if (!wake->valid()) {
        spdlog::error("[ConsoleShell] Cannot create wake pipe: {}", strerror(errno));
        app_state_->request_quit();
        return;
    }

    auto subscription = app_state_->subscribe([wake](AppState::Flag flag, bool value) {
        if (flag == AppState::Flag::AppRunning && !value) {
            wake->wake();
        }
    });

    auto emit = [&print](const std::string& text) {
        if (!text.empty()) {
            print(text);
        }
    };

    std::string pending;
    while (app_state_->app_running()) {
        pollfd fds[2] = {{input_fd, POLLIN, 0}, {wake->read_fd(), POLLIN, 0}};
        int rc = poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("[ConsoleShell] poll() failed: {}", strerror(errno));
            app_state_->request_quit();
            break;
        }
        if (fds[1].revents != 0) {
            break;
        }
        if (fds[0].revents == 0) {
            continue;
        }

        bool open = read_input(input_fd, pending);

        size_t newline;
        while (app_state_->app_running() && (newline = pending.find('\n')) != std::string::npos) {
            std::string line = pending.substr(0, newline);
            pending.erase(0, newline + 1);
            emit(execute(line));
        }

        if (!open) {
            if (!pending.empty() && app_state_->app_running()) {
                emit(execute(pending));
            }
            spdlog::debug("[ConsoleShell] Input closed");
            app_state_->request_quit();
        }
    }

    app_state_->unsubscribe(subscription);
}

std::string ConsoleShell::cmd_start(const std::string& line) {
    std::vector<std::string> args;
    if (!split_quoted(line, args)) {
        return "Error: unterminated quote";
    }

    std::string ssid;
    std::string password;
    if (args.size() == 2) {
        ssid = default_ssid_;
        password = args[1];
    } else if (args.size() >= 3) {
        // Password is always the last field; unquoted SSID words are rejoined
        password = args.back();
        for (size_t i = 1; i + 1 < args.size(); i++) {
            if (i > 1) {
                ssid += ' ';
            }
            ssid += args[i];
        }
    } else {
        return "Usage: start [ssid] <password>";
    }

    if (!controller_.inputs_editable()) {
        return "Hotspot is already running";
    }

    std::string status;
    HotspotError result = controller_.start(ssid, password, status);
    if (result.success()) {
        default_ssid_ = ssid;
    } else {
        spdlog::debug("[ConsoleShell] start failed: {}", hotspot_result_name(result.result));
    }
    return status;
}

std::string ConsoleShell::cmd_status() const {
    std::ostringstream out;
    out << "State: " << hotspot_state_name(controller_.state());
    const auto& iface = controller_.interface();
    if (!iface.name.empty()) {
        out << "\nInterface: " << iface.name << " (channel " << iface.channel << ")";
    }
    out << "\nStart: " << (controller_.can_start() ? "enabled" : "disabled");
    out << "\nPrivileged helper: " << (controller_.channel_open() ? "open" : "closed");
    return out.str();
}

std::string ConsoleShell::cmd_block(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return "Usage: block <mac>";
    }

    BlockOutcome outcome = controller_.block(args[1]);
    if (outcome.error.result == HotspotResult::NOT_ENFORCED) {
        return outcome.error.user_msg;
    }
    if (!outcome.error.success()) {
        return "Error: " + outcome.error.user_msg;
    }
    return "Blocked " + args[1] + " (" + outcome.method + ")";
}

std::string ConsoleShell::cmd_unblock(const std::vector<std::string>& args) {
    if (args.size() != 2) {
        return "Usage: unblock <mac>";
    }

    HotspotError result = controller_.unblock(args[1]);
    if (!result.success()) {
        return "Error: " + result.user_msg;
    }
    return "Unblocked " + args[1];
}

std::string ConsoleShell::cmd_blocked() const {
    std::set<std::string> macs = controller_.blocked();
    if (macs.empty()) {
        return "No blocked devices";
    }
    std::ostringstream out;
    bool first = true;
    for (const auto& mac : macs) {
        if (!first) {
            out << '\n';
        }
        out << mac;
        first = false;
    }
    return out.str();
}

} // namespace idkspot
