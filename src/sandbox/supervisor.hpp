/*
 * supervisor.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#ifndef LOCKBOX_SANDBOX_SUPERVISOR_HPP
#define LOCKBOX_SANDBOX_SUPERVISOR_HPP

#include "config/sandbox_config.hpp"
#include "session.hpp"
#include "types.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace lockbox::sandbox {

/**
 * @brief Runs lockbox-harness for one session and watches it
 *
 * Captures stdout, stderr and the report channel, enforces the external
 * deadline (time limit plus grace margin) and cancellation by killing the
 * harness and interpreter process groups, and reaps the harness.
 */
class ProcessSupervisor {
public:
    static constexpr const char* TRUNCATION_MARKER = "\n[output truncated]\n";

    explicit ProcessSupervisor(const config::SandboxConfig& config);
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * @brief Supervise one execution of a populated session
     *
     * Moves the session to Running and then to Completed, TimedOut or
     * Failed. Never throws for child behaviour.
     */
    [[nodiscard]] RawOutcome run(SandboxSession& session);

    /**
     * @brief Ask the current run to stop; safe from any thread
     */
    void cancel() noexcept;

    /**
     * @brief Forget a cancellation requested before the next run
     */
    void reset() noexcept;

    [[nodiscard]] bool isRunning() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    /**
     * @brief Environment handed to the harness, built from scratch
     */
    [[nodiscard]] static std::vector<std::string> buildEnvironment(
        const config::SandboxConfig& config,
        const std::filesystem::path& workingDir);

    /**
     * @brief External deadline for a policy
     */
    [[nodiscard]] std::chrono::milliseconds externalDeadline(
        const ExecutionPolicy& policy) const noexcept;

private:
    void superviseOutput(int stdoutFd, int stderrFd, int reportFd,
                         pid_t harnessPid,
                         std::chrono::steady_clock::time_point deadline,
                         RawOutcome& outcome);
    void killAll(pid_t harnessPid, const RawOutcome& outcome) noexcept;

    const config::SandboxConfig& config_;
    int wakeFd_{-1};
    std::atomic<bool> cancelRequested_{false};
    std::atomic<bool> running_{false};
};

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_SUPERVISOR_HPP
