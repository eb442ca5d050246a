// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "command_runner.h"

#include "spdlog/spdlog.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace idkspot {

namespace {

/// Build a C-style argv array; pointers stay valid while args lives
std::vector<char*> make_c_argv(const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

/// waitpid() that retries on EINTR
int wait_child(pid_t pid, int& status) {
    int rc;
    do {
        rc = waitpid(pid, &status, 0);
    } while (rc < 0 && errno == EINTR);
    return rc;
}

/// Read the exec status pipe: 0 bytes means exec succeeded
bool read_exec_errno(int fd, int& child_errno) {
    ssize_t n;
    do {
        n = read(fd, &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    return n == static_cast<ssize_t>(sizeof(child_errno));
}

/// Redirect a standard descriptor to /dev/null (child side only)
void redirect_to_devnull(int target_fd, int flags) {
    int devnull = open("/dev/null", flags);
    if (devnull >= 0) {
        dup2(devnull, target_fd);
        close(devnull);
    }
}

/// Undo the controller's signal setup (blocked mask, ignored SIGPIPE) before exec
void reset_child_signals() {
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);
    signal(SIGPIPE, SIG_DFL);
}

} // namespace

std::shared_ptr<CommandRunner> CommandRunner::create() {
    return std::make_shared<SystemCommandRunner>();
}

// ============================================================================
// run(): fork/exec with captured stdout
// ============================================================================

CommandOutput SystemCommandRunner::run(const std::vector<std::string>& argv) {
    CommandOutput result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    spdlog::trace("[CommandRunner] run: {}", join_command(argv));

    int out_pipe[2];
    if (pipe2(out_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("pipe() failed: ") + strerror(errno);
        return result;
    }
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("pipe() failed: ") + strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    auto c_argv = make_c_argv(argv);
    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork() failed: ") + strerror(errno);
        spdlog::error("[CommandRunner] {}", result.error);
        for (int fd : {out_pipe[0], out_pipe[1], status_pipe[0], status_pipe[1]}) {
            close(fd);
        }
        return result;
    }

    if (pid == 0) {
        // Child: stdout to pipe, stderr and stdin to /dev/null
        dup2(out_pipe[1], STDOUT_FILENO);
        redirect_to_devnull(STDERR_FILENO, O_WRONLY);
        redirect_to_devnull(STDIN_FILENO, O_RDONLY);
        reset_child_signals();
        execvp(c_argv[0], c_argv.data());
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(out_pipe[1]);
    close(status_pipe[1]);

    int child_errno = 0;
    bool exec_failed = read_exec_errno(status_pipe[0], child_errno);
    close(status_pipe[0]);

    char buf[4096];
    ssize_t n;
    while ((n = read(out_pipe[0], buf, sizeof(buf))) != 0) {
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        result.output.append(buf, static_cast<size_t>(n));
    }
    close(out_pipe[0]);

    int status = 0;
    if (wait_child(pid, status) < 0) {
        result.error = std::string("waitpid() failed: ") + strerror(errno);
        spdlog::error("[CommandRunner] {}", result.error);
        return result;
    }

    if (exec_failed) {
        result.error = strerror(child_errno);
        spdlog::debug("[CommandRunner] exec '{}' failed: {}", argv[0], result.error);
        return result;
    }

    result.launched = true;
    result.exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (result.exit_code != 0) {
        spdlog::trace("[CommandRunner] '{}' exited with code {}", argv[0], result.exit_code);
    }
    return result;
}

// ============================================================================
// spawn(): double fork, report exec failure only
// ============================================================================

HotspotError SystemCommandRunner::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return HotspotErrorHelper::invalid_parameters("Empty command");
    }

    spdlog::debug("[CommandRunner] spawn: {}", join_command(argv));

    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        return HotspotErrorHelper::tool_launch_failed(argv[0], strerror(errno));
    }

    auto c_argv = make_c_argv(argv);
    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        spdlog::error("[CommandRunner] fork() failed: {}", strerror(err));
        return HotspotErrorHelper::tool_launch_failed(argv[0], strerror(err));
    }

    if (pid == 0) {
        // Intermediate child: new session, fork the real process and exit
        setsid();
        pid_t grandchild = fork();
        if (grandchild < 0) {
            int err = errno;
            ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(1);
        }
        if (grandchild > 0) {
            _exit(0);
        }

        redirect_to_devnull(STDIN_FILENO, O_RDONLY);
        redirect_to_devnull(STDOUT_FILENO, O_WRONLY);
        redirect_to_devnull(STDERR_FILENO, O_WRONLY);
        reset_child_signals();
        execvp(c_argv[0], c_argv.data());
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(status_pipe[1]);

    int status = 0;
    if (wait_child(pid, status) < 0) {
        spdlog::warn("[CommandRunner] waitpid() on intermediate child failed: {}",
                     strerror(errno));
    }

    int child_errno = 0;
    bool exec_failed = read_exec_errno(status_pipe[0], child_errno);
    close(status_pipe[0]);

    if (exec_failed) {
        spdlog::warn("[CommandRunner] spawn '{}' failed: {}", argv[0], strerror(child_errno));
        return HotspotErrorHelper::tool_launch_failed(argv[0], strerror(child_errno));
    }

    return HotspotErrorHelper::success();
}

// ============================================================================
// Privileged helper spawn
// ============================================================================

pid_t spawn_with_stdin_pipe(const std::vector<std::string>& argv, int& stdin_fd,
                            std::string& error) {
    stdin_fd = -1;
    if (argv.empty()) {
        error = "empty command";
        return -1;
    }

    int in_pipe[2];
    if (pipe2(in_pipe, O_CLOEXEC) < 0) {
        error = std::string("pipe() failed: ") + strerror(errno);
        return -1;
    }
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) < 0) {
        error = std::string("pipe() failed: ") + strerror(errno);
        close(in_pipe[0]);
        close(in_pipe[1]);
        return -1;
    }

    auto c_argv = make_c_argv(argv);
    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork() failed: ") + strerror(errno);
        for (int fd : {in_pipe[0], in_pipe[1], status_pipe[0], status_pipe[1]}) {
            close(fd);
        }
        return -1;
    }

    if (pid == 0) {
        dup2(in_pipe[0], STDIN_FILENO);
        redirect_to_devnull(STDOUT_FILENO, O_WRONLY);
        reset_child_signals();
        execvp(c_argv[0], c_argv.data());
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(in_pipe[0]);
    close(status_pipe[1]);

    int child_errno = 0;
    bool exec_failed = read_exec_errno(status_pipe[0], child_errno);
    close(status_pipe[0]);

    if (exec_failed) {
        error = std::string("exec '") + argv[0] + "' failed: " + strerror(child_errno);
        close(in_pipe[1]);
        int status = 0;
        wait_child(pid, status);
        return -1;
    }

    stdin_fd = in_pipe[1];
    return pid;
}

// ============================================================================
// Command line helpers
// ============================================================================

std::string join_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += arg;
    }
    return line;
}

std::string shell_quote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

std::string to_shell_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) {
            line += ' ';
        }
        line += shell_quote(arg);
    }
    return line;
}

} // namespace idkspot
