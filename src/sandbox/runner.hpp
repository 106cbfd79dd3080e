/*
 * runner.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

/**
 * @file runner.hpp
 * @brief Sandboxed code runner - Public API
 * @date 2024
 * @version 1.0.0
 *
 * This is the main public interface for sandboxed execution. It ties the
 * session, harness generator, supervisor and reporter together.
 */

#ifndef LOCKBOX_SANDBOX_RUNNER_HPP
#define LOCKBOX_SANDBOX_RUNNER_HPP

#include "config/sandbox_config.hpp"
#include "types.hpp"

#include <future>
#include <memory>
#include <string>
#include <string_view>

namespace lockbox::sandbox {

/**
 * @brief Sandboxed code runner
 *
 * Runs one session at a time; concurrent calls on the same runner are
 * serialized. Separate runners share nothing and may run in parallel.
 */
class SandboxRunner {
public:
    /**
     * @brief Constructs a runner with default configuration
     */
    SandboxRunner();

    /**
     * @brief Constructs a runner with the given configuration
     */
    explicit SandboxRunner(const config::SandboxConfig& config);

    /**
     * @brief Destructor - cancels every session still in flight
     *
     * Sessions started with runCodeAsync finish on their own thread and
     * report Cancelled through their future.
     */
    ~SandboxRunner();

    // Disable copy
    SandboxRunner(const SandboxRunner&) = delete;
    SandboxRunner& operator=(const SandboxRunner&) = delete;

    // Enable move
    SandboxRunner(SandboxRunner&&) noexcept;
    SandboxRunner& operator=(SandboxRunner&&) noexcept;

    // =========================================================================
    // Configuration
    // =========================================================================

    /**
     * @brief Replaces the configuration; waits for a running session
     */
    void setConfig(const config::SandboxConfig& config);

    [[nodiscard]] const config::SandboxConfig& getConfig() const;

    /**
     * @brief Validates the configuration and discovers the interpreter,
     * harness and guard prelude
     */
    [[nodiscard]] Result<void> validateConfig() const;

    // =========================================================================
    // Execution
    // =========================================================================

    /**
     * @brief Runs code to completion
     * @param code Python source
     * @param options Caller limits and allowlist
     * @return Execution result; never throws
     */
    [[nodiscard]] ExecutionResult runCode(std::string_view code,
                                          const RunOptions& options = {});

    /**
     * @brief Runs code on a background thread
     *
     * The session keeps the runner state alive, so the future stays valid
     * after the runner is moved or destroyed.
     */
    [[nodiscard]] std::future<ExecutionResult> runCodeAsync(
        std::string code, RunOptions options = {});

    // =========================================================================
    // Control
    // =========================================================================

    /**
     * @brief Cancels every session in flight
     *
     * Covers sessions still being prepared or waiting for the runner; those
     * finish as Cancelled without starting a process.
     * @return true if a session was in flight
     */
    bool cancel();

    /**
     * @brief Whether a runCode or runCodeAsync call has not yet returned
     */
    [[nodiscard]] bool isRunning() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl_;
};

/**
 * @brief One-shot convenience wrapper around SandboxRunner
 */
[[nodiscard]] ExecutionResult runCode(
    std::string_view code, const RunOptions& options = {},
    const config::SandboxConfig& config = config::SandboxConfig{});

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_RUNNER_HPP
