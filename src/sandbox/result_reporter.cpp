/*
 * result_reporter.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "result_reporter.hpp"
#include "ipc/report_message.hpp"

#include <algorithm>

#include <signal.h>

namespace lockbox::sandbox {

namespace {

bool isSupervisorFailure(const RawOutcome& outcome) {
    if (outcome.supervisorFailure || outcome.setupFailure) {
        return true;
    }
    if (!outcome.spawned && !outcome.cancelled) {
        return true;
    }
    return outcome.exitCode && *outcome.exitCode >= ExitCodes::SETUP_FAILED &&
           *outcome.exitCode <= ExitCodes::NOT_FOUND;
}

bool isTimeout(const RawOutcome& outcome) {
    return outcome.timedOut || outcome.harnessDeadline ||
           outcome.exitCode == ExitCodes::TIMEOUT ||
           outcome.termSignal == SIGXCPU;
}

}  // namespace

ExecutionResult ResultReporter::report(const RawOutcome& outcome,
                                       const ExecutionPolicy& policy) {
    ExecutionResult result;
    result.policySnapshot = policy;
    result.enforcement = outcome.guards;
    result.stdoutData = outcome.stdoutData;
    result.stderrData = outcome.stderrData;
    result.elapsed = outcome.elapsed;

    if (outcome.exitCode) {
        result.exitCode = *outcome.exitCode;
    } else if (outcome.termSignal && !outcome.timedOut && !outcome.cancelled) {
        result.exitCode = 128 + *outcome.termSignal;
    } else {
        result.exitCode = -1;
    }

    if (!isSupervisorFailure(outcome) && !outcome.cancelled &&
        !isTimeout(outcome) && result.exitCode == ExitCodes::SUCCESS) {
        result.status = ExecutionStatus::Success;
        return result;
    }

    auto reason = classifyFailure(outcome);
    result.status = ExecutionStatus::Error;
    result.errorReason = reason;
    result.diagnostic = describe(outcome, reason);
    return result;
}

ExecutionResult ResultReporter::supervisorFailure(const ExecutionPolicy& policy,
                                                  std::string diagnostic) {
    ExecutionResult result;
    result.status = ExecutionStatus::Error;
    result.errorReason = ErrorReason::SupervisorFailure;
    result.policySnapshot = policy;
    result.diagnostic = std::move(diagnostic);
    return result;
}

ErrorReason ResultReporter::classifyFailure(const RawOutcome& outcome) {
    if (isSupervisorFailure(outcome)) {
        return ErrorReason::SupervisorFailure;
    }
    if (outcome.cancelled) {
        return ErrorReason::Cancelled;
    }
    if (isTimeout(outcome)) {
        return ErrorReason::Timeout;
    }
    if (looksLikeViolation(outcome.stderrData)) {
        return ErrorReason::Violation;
    }
    return ErrorReason::Unhandled;
}

std::string ResultReporter::describe(const RawOutcome& outcome,
                                     ErrorReason reason) {
    switch (reason) {
        case ErrorReason::SupervisorFailure:
            if (outcome.supervisorFailure) {
                return *outcome.supervisorFailure;
            }
            if (outcome.setupFailure) {
                return "sandbox setup failed: " + *outcome.setupFailure;
            }
            if (outcome.exitCode) {
                return "harness exited with " +
                       std::to_string(*outcome.exitCode);
            }
            return "harness was not started";
        case ErrorReason::Cancelled:
            return "execution cancelled";
        case ErrorReason::Timeout:
            if (outcome.timedOut) {
                return "killed at the external deadline";
            }
            if (outcome.termSignal == SIGXCPU || outcome.childSignal == SIGXCPU) {
                return "CPU time limit exceeded";
            }
            return "time limit exceeded";
        case ErrorReason::Violation:
            return "sandbox policy violation";
        case ErrorReason::Unhandled:
            if (outcome.childSignal) {
                return "interpreter killed by signal " +
                       std::to_string(*outcome.childSignal);
            }
            return "user code failed";
    }
    return {};
}

bool ResultReporter::looksLikeViolation(std::string_view stderrData) {
    return std::any_of(VIOLATION_PATTERNS.begin(), VIOLATION_PATTERNS.end(),
                       [stderrData](std::string_view pattern) {
                           return stderrData.find(pattern) !=
                                  std::string_view::npos;
                       });
}

json ResultReporter::policyToJson(const ExecutionPolicy& policy,
                                  const GuardReport& enforcement) {
    json allowlist = json::array();
    for (const auto& path : policy.fsAllowlist) {
        allowlist.push_back(sanitizeUtf8(path.string()));
    }
    return {{"network", "denied"},
            {"fs_allowlist", allowlist},
            {"limits",
             {{"cpu_sec", policy.cpuLimitSec},
              {"time_sec", policy.timeLimitSec},
              {"mem_mb", policy.memLimitMb}}},
            {"enforcement", ipc::guardReportToJson(enforcement)}};
}

json ResultReporter::toJson(const ExecutionResult& result) {
    json j = {{"status", result.succeeded() ? "success" : "error"},
              {"stdout", sanitizeUtf8(result.stdoutData)},
              {"stderr", sanitizeUtf8(result.stderrData)},
              {"exit_code", result.exitCode},
              {"time_ms", result.elapsed.count()},
              {"policy", policyToJson(result.policySnapshot, result.enforcement)}};
    if (result.errorReason) {
        j["error"] = std::string(errorReasonToString(*result.errorReason));
    }
    return j;
}

std::string ResultReporter::sanitizeUtf8(std::string_view data) {
    static constexpr std::string_view REPLACEMENT = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(data.size());
    size_t i = 0;
    while (i < data.size()) {
        auto c = static_cast<unsigned char>(data[i]);
        size_t length = 0;
        uint32_t minimum = 0;
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            length = 2;
            minimum = 0x80;
        } else if ((c & 0xF0) == 0xE0) {
            length = 3;
            minimum = 0x800;
        } else if ((c & 0xF8) == 0xF0) {
            length = 4;
            minimum = 0x10000;
        } else {
            out.append(REPLACEMENT);
            ++i;
            continue;
        }

        if (i + length > data.size()) {
            out.append(REPLACEMENT);
            ++i;
            continue;
        }

        uint32_t codepoint = c & (0xFF >> (length + 1));
        bool valid = true;
        for (size_t k = 1; k < length; ++k) {
            auto next = static_cast<unsigned char>(data[i + k]);
            if ((next & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            codepoint = (codepoint << 6) | (next & 0x3F);
        }
        if (!valid || codepoint < minimum || codepoint > 0x10FFFF ||
            (codepoint >= 0xD800 && codepoint <= 0xDFFF)) {
            out.append(REPLACEMENT);
            ++i;
            continue;
        }
        out.append(data.substr(i, length));
        i += length;
    }
    return out;
}

}  // namespace lockbox::sandbox
