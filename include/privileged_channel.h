// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <mutex>
#include <string>
#include <sys/types.h>
#include <vector>

namespace idkspot {

/**
 * @brief Single long-lived elevated helper, so the credential prompt fires once
 *
 * open() spawns `<elevation> sh -c '<read-eval loop>'` with its stdin on a
 * pipe. Each submit() writes one line, which the helper evaluates as a shell
 * command before reading the next. There is no acknowledgment: submit()
 * only reports whether the line reached the pipe. Callers that need the
 * effect to be visible wait briefly after submitting.
 *
 * Lines must be built with to_shell_command() from validated arguments;
 * the helper runs them as root.
 *
 * Thread safety: submit() and close() may be called from any thread; the
 * lock covers only the write (or the pipe teardown), never a process wait.
 */
class PrivilegedChannel {
  public:
    /// Read-eval loop run by the helper shell
    static constexpr const char* HELPER_SCRIPT =
        "while IFS= read -r line; do eval \"$line\"; done";

    /**
     * @param elevation Elevation wrapper (e.g. "pkexec"); empty runs unelevated
     */
    explicit PrivilegedChannel(std::string elevation = "pkexec");
    virtual ~PrivilegedChannel();

    PrivilegedChannel(const PrivilegedChannel&) = delete;
    PrivilegedChannel& operator=(const PrivilegedChannel&) = delete;

    /**
     * @brief Spawn the helper (prompts for credentials once)
     *
     * Failure leaves the channel unopened; callers fall back to one-shot
     * elevated invocations.
     *
     * @return true if the helper process was started
     */
    virtual bool open();

    /**
     * @brief Send one command line to the helper
     *
     * @param command Shell command line (no trailing newline)
     * @return true only if the write and flush both succeeded
     */
    virtual bool submit(const std::string& command);

    /**
     * @brief Terminate the helper; safe to call more than once
     */
    virtual void close();

    virtual bool is_open() const;

    /**
     * @brief Full helper argv for the configured elevation wrapper
     */
    std::vector<std::string> helper_command() const;

  private:
    std::string elevation_;
    mutable std::mutex mutex_; ///< Guards pid_ and stdin_fd_
    pid_t pid_ = -1;
    int stdin_fd_ = -1;
};

} // namespace idkspot
