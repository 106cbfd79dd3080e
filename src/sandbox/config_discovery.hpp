/*
 * config_discovery.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#ifndef LOCKBOX_SANDBOX_CONFIG_DISCOVERY_HPP
#define LOCKBOX_SANDBOX_CONFIG_DISCOVERY_HPP

#include "config/sandbox_config.hpp"
#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace lockbox::sandbox {

/**
 * @brief Locates the interpreter, the harness executable and the guard
 * prelude, and validates configuration
 */
class ConfigDiscovery {
public:
    /**
     * @brief Find the Python interpreter
     * @param configured Explicit path from configuration (may be empty)
     * @return Canonical path of the interpreter binary
     */
    [[nodiscard]] static Result<std::filesystem::path> findInterpreter(
        const std::string& configured);

    /**
     * @brief Find the lockbox-harness executable
     */
    [[nodiscard]] static Result<std::filesystem::path> findHarness(
        const std::string& configured);

    /**
     * @brief Find the guard prelude script
     */
    [[nodiscard]] static Result<std::filesystem::path> findGuardScript(
        const std::string& configured);

    /**
     * @brief Installation prefix of an interpreter (".../bin/python3" -> "...")
     */
    [[nodiscard]] static std::optional<std::filesystem::path>
    interpreterPrefix(const std::filesystem::path& interpreter);

    /**
     * @brief Validate configuration and every location it depends on
     */
    [[nodiscard]] static Result<void> validateConfig(
        const config::SandboxConfig& config);

private:
    [[nodiscard]] static std::optional<std::filesystem::path> executableDir();
    [[nodiscard]] static bool isExecutable(const std::filesystem::path& path);
};

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_CONFIG_DISCOVERY_HPP
