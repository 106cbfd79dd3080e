/*
 * types.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

/**
 * @file types.hpp
 * @brief Sandbox execution engine type definitions
 * @date 2024
 * @version 1.0.0
 */

#ifndef LOCKBOX_SANDBOX_TYPES_HPP
#define LOCKBOX_SANDBOX_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace lockbox::sandbox {

/**
 * @brief Error codes for the sandbox plumbing
 *
 * These never reach the caller of runCode(); they are folded into an
 * ExecutionResult by the runner.
 */
enum class SandboxError {
    Success = 0,
    InvalidConfiguration,
    InterpreterNotFound,
    HarnessNotFound,
    GuardScriptNotFound,
    WorkingDirectoryFailed,
    HarnessGenerationFailed,
    PipeCreationFailed,
    ProcessSpawnFailed,
    ProcessWaitFailed,
    IllegalStateTransition,
    ReportDecodeFailed,
    Cancelled,
    Unknown
};

/**
 * @brief Get string representation of SandboxError
 */
[[nodiscard]] constexpr std::string_view sandboxErrorToString(
    SandboxError error) noexcept {
    switch (error) {
        case SandboxError::Success: return "Success";
        case SandboxError::InvalidConfiguration: return "Invalid configuration";
        case SandboxError::InterpreterNotFound: return "Interpreter not found";
        case SandboxError::HarnessNotFound: return "Harness executable not found";
        case SandboxError::GuardScriptNotFound: return "Guard script not found";
        case SandboxError::WorkingDirectoryFailed: return "Working directory failed";
        case SandboxError::HarnessGenerationFailed: return "Harness generation failed";
        case SandboxError::PipeCreationFailed: return "Pipe creation failed";
        case SandboxError::ProcessSpawnFailed: return "Process spawn failed";
        case SandboxError::ProcessWaitFailed: return "Process wait failed";
        case SandboxError::IllegalStateTransition: return "Illegal state transition";
        case SandboxError::ReportDecodeFailed: return "Report decode failed";
        case SandboxError::Cancelled: return "Cancelled";
        case SandboxError::Unknown: return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for sandbox plumbing operations
 */
template <typename T>
using Result = std::expected<T, SandboxError>;

/**
 * @brief Exception raised by session setup and harness generation
 */
class SandboxException : public std::runtime_error {
public:
    SandboxException(SandboxError error, const std::string& message)
        : std::runtime_error(message), error_(error) {}

    [[nodiscard]] SandboxError error() const noexcept { return error_; }

private:
    SandboxError error_;
};

/**
 * @brief Process exit codes shared by the harness and the reporter
 *
 * Mirrors the convention of timeout(1).
 */
struct ExitCodes {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = 1;
    static constexpr int TIMEOUT = 124;
    static constexpr int SETUP_FAILED = 125;
    static constexpr int CANNOT_EXECUTE = 126;
    static constexpr int NOT_FOUND = 127;
};

/**
 * @brief Caller supplied limits and allowlist, all optional
 *
 * Signed so that negative or oversized input can be clamped.
 */
struct RunOptions {
    std::optional<int64_t> timeLimitSec;
    std::optional<int64_t> cpuLimitSec;
    std::optional<int64_t> memLimitMb;
    std::optional<std::vector<std::string>> fsAllowlist;
};

/**
 * @brief Canonical, immutable execution policy of one session
 */
struct ExecutionPolicy {
    uint32_t timeLimitSec{3};
    uint32_t cpuLimitSec{3};
    uint32_t memLimitMb{256};
    std::vector<std::filesystem::path> fsAllowlist;  ///< Canonical, unique

    bool operator==(const ExecutionPolicy&) const = default;
};

/**
 * @brief Lifecycle of a sandbox session
 */
enum class SessionState {
    Created,    ///< Working directory exists, policy resolved
    Populated,  ///< Harness files written
    Running,    ///< Child process active
    Completed,  ///< Child exited on its own
    TimedOut,   ///< Deadline hit
    Failed,     ///< Spawn or supervision failure
    Cleaned     ///< Working directory removed
};

[[nodiscard]] constexpr std::string_view sessionStateToString(
    SessionState state) noexcept {
    switch (state) {
        case SessionState::Created: return "Created";
        case SessionState::Populated: return "Populated";
        case SessionState::Running: return "Running";
        case SessionState::Completed: return "Completed";
        case SessionState::TimedOut: return "TimedOut";
        case SessionState::Failed: return "Failed";
        case SessionState::Cleaned: return "Cleaned";
    }
    return "Unknown";
}

/**
 * @brief Files the harness generator placed in a session directory
 */
struct HarnessFiles {
    std::filesystem::path harnessEntry;     ///< lockbox-harness executable
    std::filesystem::path configPath;       ///< Typed harness configuration
    std::filesystem::path guardScriptPath;  ///< Interpreter-level guard prelude
    std::filesystem::path userCodePath;
};

/**
 * @brief Which enforcement layers the harness managed to install
 */
struct GuardReport {
    bool received{false};        ///< A report arrived from the harness
    bool rlimits{false};
    bool deadline{false};
    std::string network{"unavailable"};     ///< "seccomp" or "unavailable"
    std::string filesystem{"unavailable"};  ///< "landlock" or "unavailable"
    int landlockAbi{0};
    uint64_t addressSpaceMb{0};  ///< RLIMIT_AS in force, interpreter overhead included
    bool degraded{true};
};

/**
 * @brief Unprocessed outcome of a supervised run
 */
struct RawOutcome {
    bool spawned{false};
    std::optional<int> exitCode;    ///< Harness exit status
    std::optional<int> termSignal;  ///< Signal that killed the harness
    bool timedOut{false};           ///< External deadline fired
    bool cancelled{false};
    bool harnessDeadline{false};    ///< Harness backstop timer fired
    std::optional<int> childPid;    ///< Interpreter pid from the harness
    std::optional<int> childSignal; ///< Signal that killed the interpreter
    std::string stdoutData;
    std::string stderrData;
    std::chrono::milliseconds elapsed{0};
    std::chrono::milliseconds cpuTime{0};
    size_t peakRssKb{0};
    GuardReport guards;
    std::optional<std::string> setupFailure;       ///< From the harness
    std::optional<std::string> supervisorFailure;  ///< From this process
};

/**
 * @brief Overall verdict
 */
enum class ExecutionStatus { Success, Error };

/**
 * @brief Why an execution did not succeed
 */
enum class ErrorReason {
    Timeout,
    Violation,
    Unhandled,
    SupervisorFailure,
    Cancelled
};

[[nodiscard]] constexpr std::string_view errorReasonToString(
    ErrorReason reason) noexcept {
    switch (reason) {
        case ErrorReason::Timeout: return "timeout";
        case ErrorReason::Violation: return "violation";
        case ErrorReason::Unhandled: return "unhandled";
        case ErrorReason::SupervisorFailure: return "supervisor_failure";
        case ErrorReason::Cancelled: return "cancelled";
    }
    return "unhandled";
}

/**
 * @brief Final result handed to the caller
 *
 * status == Success exactly when exitCode == 0 and errorReason is empty.
 */
struct ExecutionResult {
    ExecutionStatus status{ExecutionStatus::Error};
    std::string stdoutData;
    std::string stderrData;
    int exitCode{-1};
    std::chrono::milliseconds elapsed{0};
    std::optional<ErrorReason> errorReason;
    ExecutionPolicy policySnapshot;
    GuardReport enforcement;
    std::string diagnostic;  ///< Human readable detail, not on the wire

    [[nodiscard]] bool succeeded() const noexcept {
        return status == ExecutionStatus::Success;
    }
};

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_TYPES_HPP
