/*
 * policy_resolver.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "policy_resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <system_error>

namespace lockbox::sandbox {

namespace {

uint32_t clampTo(int64_t value, uint32_t low, uint32_t high) {
    if (value < static_cast<int64_t>(low)) return low;
    if (value > static_cast<int64_t>(high)) return high;
    return static_cast<uint32_t>(value);
}

}  // namespace

PolicyResolver::PolicyResolver(const config::SandboxConfig& config)
    : config_(config) {}

ExecutionPolicy PolicyResolver::resolve(
    const RunOptions& options, const std::filesystem::path& workingDir) const {
    ExecutionPolicy policy;

    const uint32_t maxTime =
        std::max(config_.maxTimeLimitSec, MIN_TIME_LIMIT_SEC);
    policy.timeLimitSec = clampTo(
        options.timeLimitSec.value_or(config_.defaultTimeLimitSec),
        MIN_TIME_LIMIT_SEC, maxTime);

    // CPU time can never exceed wall clock
    const int64_t defaultCpu =
        std::min<int64_t>(policy.timeLimitSec, config_.defaultCpuLimitSec);
    policy.cpuLimitSec = clampTo(options.cpuLimitSec.value_or(defaultCpu), 1,
                                 policy.timeLimitSec);

    const uint32_t maxMem = std::max(config_.maxMemLimitMb, MIN_MEM_LIMIT_MB);
    policy.memLimitMb =
        clampTo(options.memLimitMb.value_or(config_.defaultMemLimitMb),
                MIN_MEM_LIMIT_MB, maxMem);

    const auto& requested =
        options.fsAllowlist ? *options.fsAllowlist : config_.defaultFsAllowlist;
    for (const auto& entry : requested) {
        if (entry.empty()) {
            continue;
        }
        auto canonical = canonicalize(entry);
        if (!canonical) {
            spdlog::warn("Dropping allowlist entry '{}': cannot canonicalize",
                         entry);
            continue;
        }
        if (std::find(policy.fsAllowlist.begin(), policy.fsAllowlist.end(),
                      *canonical) == policy.fsAllowlist.end()) {
            policy.fsAllowlist.push_back(std::move(*canonical));
        }
    }

    auto sessionDir = canonicalize(workingDir.string());
    auto workDir = sessionDir ? *sessionDir : workingDir.lexically_normal();
    auto it = std::find(policy.fsAllowlist.begin(), policy.fsAllowlist.end(),
                        workDir);
    if (it != policy.fsAllowlist.end()) {
        policy.fsAllowlist.erase(it);
    }
    policy.fsAllowlist.push_back(std::move(workDir));

    spdlog::debug("Resolved policy: time={}s cpu={}s mem={}MB allowlist={}",
                  policy.timeLimitSec, policy.cpuLimitSec, policy.memLimitMb,
                  policy.fsAllowlist.size());
    return policy;
}

std::optional<std::filesystem::path> PolicyResolver::canonicalize(
    std::string_view entry) {
    if (entry.empty()) {
        return std::nullopt;
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(std::filesystem::path(entry), ec);
    if (ec) {
        return std::nullopt;
    }
    auto canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        return std::nullopt;
    }

    // weakly_canonical keeps a trailing separator for directories given as "a/"
    auto text = canonical.string();
    while (text.size() > 1 && text.back() == '/') {
        text.pop_back();
    }
    return std::filesystem::path(text);
}

bool PolicyResolver::isWithin(const std::filesystem::path& path,
                              const std::vector<std::filesystem::path>& roots) {
    for (const auto& root : roots) {
        auto [rootIt, pathIt] =
            std::mismatch(root.begin(), root.end(), path.begin(), path.end());
        if (rootIt == root.end()) {
            return true;
        }
        // "/a/" has a trailing empty element
        if (std::next(rootIt) == root.end() && rootIt->empty()) {
            return true;
        }
    }
    return false;
}

}  // namespace lockbox::sandbox
