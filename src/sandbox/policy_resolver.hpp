/*
 * policy_resolver.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#ifndef LOCKBOX_SANDBOX_POLICY_RESOLVER_HPP
#define LOCKBOX_SANDBOX_POLICY_RESOLVER_HPP

#include "config/sandbox_config.hpp"
#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace lockbox::sandbox {

/**
 * @brief Turns caller options into a bounded ExecutionPolicy
 *
 * Never fails: out-of-range values are clamped and unusable allowlist
 * entries are dropped.
 */
class PolicyResolver {
public:
    static constexpr uint32_t MIN_MEM_LIMIT_MB = 16;
    static constexpr uint32_t MIN_TIME_LIMIT_SEC = 1;

    explicit PolicyResolver(const config::SandboxConfig& config);

    /**
     * @brief Resolve options for a session
     * @param options Caller supplied overrides
     * @param workingDir Session directory, always appended to the allowlist
     */
    [[nodiscard]] ExecutionPolicy resolve(
        const RunOptions& options,
        const std::filesystem::path& workingDir) const;

    /**
     * @brief Canonicalize one allowlist entry
     *
     * Relative paths are taken against the current directory. Symlinks in
     * the existing prefix are resolved.
     */
    [[nodiscard]] static std::optional<std::filesystem::path> canonicalize(
        std::string_view entry);

    /**
     * @brief True when path equals or lies beneath one of the roots
     *
     * Compares whole path components, so "/tmp/ab" is not under "/tmp/a".
     */
    [[nodiscard]] static bool isWithin(
        const std::filesystem::path& path,
        const std::vector<std::filesystem::path>& roots);

private:
    const config::SandboxConfig& config_;
};

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_POLICY_RESOLVER_HPP
