/*
 * result_reporter.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#ifndef LOCKBOX_SANDBOX_RESULT_REPORTER_HPP
#define LOCKBOX_SANDBOX_RESULT_REPORTER_HPP

#include "types.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <string>
#include <string_view>

namespace lockbox::sandbox {

using json = nlohmann::json;

/**
 * @brief Turns a raw outcome into the caller-facing result
 *
 * First match wins:
 * 1. spawn failure, harness setup failure or exit 125..127: SupervisorFailure
 * 2. cancellation: Cancelled
 * 3. external deadline, harness deadline, exit 124 or SIGXCPU: Timeout
 * 4. exit 0: success
 * 5. permission-denied text on stderr: Violation
 * 6. anything else: Unhandled
 */
class ResultReporter {
public:
    static constexpr std::array<std::string_view, 5> VIOLATION_PATTERNS = {
        "File access denied by sandbox",
        "Network access is disabled in sandbox",
        "PermissionError",
        "Permission denied",
        "Operation not permitted"};

    /**
     * @brief Build the result
     */
    [[nodiscard]] static ExecutionResult report(const RawOutcome& outcome,
                                                const ExecutionPolicy& policy);

    /**
     * @brief Result for a failure before anything was spawned
     */
    [[nodiscard]] static ExecutionResult supervisorFailure(
        const ExecutionPolicy& policy, std::string diagnostic);

    /**
     * @brief Wire representation
     */
    [[nodiscard]] static json toJson(const ExecutionResult& result);

    [[nodiscard]] static json policyToJson(const ExecutionPolicy& policy,
                                           const GuardReport& enforcement);

    [[nodiscard]] static bool looksLikeViolation(std::string_view stderrData);

    /**
     * @brief Replace every invalid UTF-8 sequence with U+FFFD
     */
    [[nodiscard]] static std::string sanitizeUtf8(std::string_view data);

private:
    [[nodiscard]] static ErrorReason classifyFailure(const RawOutcome& outcome);
    [[nodiscard]] static std::string describe(const RawOutcome& outcome,
                                              ErrorReason reason);
};

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_RESULT_REPORTER_HPP
