// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include "hotspot_error.h"

#include <memory>
#include <string>
#include <sys/types.h>
#include <vector>

namespace idkspot {

/**
 * @brief Result of running an external command to completion
 */
struct CommandOutput {
    bool launched = false; ///< False if fork/exec failed (see error)
    int exit_code = -1;    ///< Exit code, -1 if killed by a signal or not launched
    std::string output;    ///< Captured stdout
    std::string error;     ///< Launch failure detail

    bool ok() const {
        return launched && exit_code == 0;
    }
};

/**
 * @brief Process execution seam for every external tool the controller drives
 *
 * All commands are argv vectors executed via fork/exec with no shell in
 * between, so SSIDs, passwords and MAC addresses are never interpreted.
 *
 * Implementations:
 * - SystemCommandRunner: real fork/exec
 * - MockCommandRunner (tests/mocks): canned output keyed by command line
 *
 * No timeouts: a hung tool blocks the caller until it exits.
 */
class CommandRunner {
  public:
    virtual ~CommandRunner() = default;

    /**
     * @brief Run a command and wait for it, capturing stdout
     *
     * stderr is discarded. Blocks until the child exits.
     *
     * @param argv Program and arguments (argv[0] is looked up in PATH)
     * @return Output, exit code, or launch failure detail
     */
    virtual CommandOutput run(const std::vector<std::string>& argv) = 0;

    /**
     * @brief Launch a command detached from the controller
     *
     * The child is double-forked so it is never left as a zombie. Only
     * exec failure is reported; the child's later exit status is not.
     *
     * @param argv Program and arguments
     * @return SUCCESS once exec succeeded, TOOL_LAUNCH_FAILED otherwise
     */
    virtual HotspotError spawn(const std::vector<std::string>& argv) = 0;

    /**
     * @brief Create the real fork/exec runner
     */
    static std::shared_ptr<CommandRunner> create();
};

/**
 * @brief fork/exec implementation of CommandRunner
 */
class SystemCommandRunner : public CommandRunner {
  public:
    CommandOutput run(const std::vector<std::string>& argv) override;
    HotspotError spawn(const std::vector<std::string>& argv) override;
};

/**
 * @brief Spawn a child whose stdin is the read end of a new pipe
 *
 * Used for the long-lived privileged helper. exec failure is detected
 * through a close-on-exec status pipe, so a missing binary is reported here
 * rather than as a child that silently exits 127.
 *
 * @param argv Program and arguments
 * @param[out] stdin_fd Write end of the child's stdin pipe (caller owns it)
 * @param[out] error Failure detail when -1 is returned
 * @return Child pid, or -1 on failure
 */
pid_t spawn_with_stdin_pipe(const std::vector<std::string>& argv, int& stdin_fd,
                            std::string& error);

/**
 * @brief Join argv into a printable command line (logging and mock keys)
 */
std::string join_command(const std::vector<std::string>& argv);

/**
 * @brief Quote a string for POSIX sh using single quotes
 *
 * "it's" becomes 'it'\''s'. Used only for lines sent to the privileged helper.
 */
std::string shell_quote(const std::string& arg);

/**
 * @brief Build a shell command line from argv with every element quoted
 */
std::string to_shell_command(const std::vector<std::string>& argv);

} // namespace idkspot
