/*
 * guards.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

/**
 * @file guards.hpp
 * @brief Enforcement layers installed by lockbox-harness before user code
 * @date 2024
 * @version 1.0.0
 *
 * Installed strictly in this order, and only inside the harness process:
 * - Resource limits (setrlimit)
 * - Wall-clock deadline (ITIMER_REAL, consumed with sigtimedwait)
 * - Network gate (seccomp-bpf)
 * - Filesystem gate (Landlock)
 */

#ifndef LOCKBOX_SANDBOX_GUARDS_GUARDS_HPP
#define LOCKBOX_SANDBOX_GUARDS_GUARDS_HPP

#include "sandbox/harness_config.hpp"

#include <chrono>
#include <expected>
#include <stdexcept>
#include <string>
#include <vector>

#include <signal.h>
#include <sys/types.h>

namespace lockbox::sandbox::guards {

/**
 * @brief Why a guard could not be installed
 */
struct GuardError {
    std::string stage;    ///< "rlimits", "deadline", "network", "filesystem"
    std::string message;
    int error{0};         ///< errno at the point of failure
};

using GuardResult = std::expected<void, GuardError>;

// ============================================================================
// Resource limits
// ============================================================================

/**
 * @brief Apply CPU, address space, core, file size and descriptor limits
 *
 * CPU soft limit is cpuLimitSec (SIGXCPU), the hard limit one second later.
 */
[[nodiscard]] GuardResult applyResourceLimits(const HarnessConfig& config);

// ============================================================================
// Deadline
// ============================================================================

/**
 * @brief Raised when the wall-clock backstop expires
 */
class DeadlineExceeded : public std::runtime_error {
public:
    DeadlineExceeded() : std::runtime_error("wall-clock deadline exceeded") {}
};

/**
 * @brief One-shot ITIMER_REAL backstop
 *
 * SIGALRM and SIGCHLD are blocked while armed and consumed synchronously,
 * so no handler ever runs.
 */
class DeadlineTimer {
public:
    DeadlineTimer() = default;
    ~DeadlineTimer();

    DeadlineTimer(const DeadlineTimer&) = delete;
    DeadlineTimer& operator=(const DeadlineTimer&) = delete;

    [[nodiscard]] GuardResult arm(std::chrono::milliseconds timeout);

    /**
     * @brief Stop the timer and restore the signal mask
     */
    void disarm() noexcept;

    /**
     * @brief Block until the child exits
     * @return Raw wait status
     * @throws DeadlineExceeded if the timer fires first
     * @throws std::system_error if waiting fails
     */
    int waitForChild(pid_t pid);

    /**
     * @brief Signal mask in effect before arm(), for restoring in children
     */
    [[nodiscard]] const sigset_t& originalMask() const noexcept {
        return originalMask_;
    }

    [[nodiscard]] bool armed() const noexcept { return armed_; }

private:
    sigset_t waitSet_{};
    sigset_t originalMask_{};
    bool armed_{false};
};

// ============================================================================
// Network gate
// ============================================================================

/**
 * @brief Deny socket creation for every address family
 *
 * Sets PR_SET_NO_NEW_PRIVS and loads a seccomp filter. socket(2),
 * socketcall(2) and io_uring_setup(2) fail with EACCES; a syscall made
 * through a foreign architecture ABI kills the process.
 */
[[nodiscard]] GuardResult installNetworkGate();

/**
 * @brief Pin the calling process and its descendants to their process group
 *
 * Loads a second seccomp filter making setsid(2) and setpgid(2) fail with
 * EPERM, so a kill of the group reaches every descendant. Called in the
 * interpreter child after its own setpgid(0, 0) and before exec.
 * @return 0 on success, otherwise the errno of the failure
 */
[[nodiscard]] int lockProcessGroup() noexcept;

// ============================================================================
// Filesystem gate
// ============================================================================

/**
 * @brief Highest Landlock ABI supported by the running kernel, 0 if none
 */
[[nodiscard]] int landlockAbiVersion() noexcept;

/**
 * @brief Restrict filesystem access with Landlock
 * @param readWrite Full access beneath each entry
 * @param readOnly Read and execute beneath each entry
 * @return The Landlock ABI version in use
 *
 * Entries that do not exist are skipped.
 */
[[nodiscard]] std::expected<int, GuardError> installFilesystemGate(
    const std::vector<std::string>& readWrite,
    const std::vector<std::string>& readOnly);

}  // namespace lockbox::sandbox::guards

#endif  // LOCKBOX_SANDBOX_GUARDS_GUARDS_HPP
