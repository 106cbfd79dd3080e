/*
 * sandbox_config.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

/*************************************************

Date: 2024-12-02

Description: Sandbox engine configuration

**************************************************/

#ifndef LOCKBOX_CONFIG_SANDBOX_CONFIG_HPP
#define LOCKBOX_CONFIG_SANDBOX_CONFIG_HPP

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace lockbox::config {

using json = nlohmann::json;

/**
 * @brief Logging section
 */
struct LoggingConfig {
    std::string consoleLevel{"warn"};   ///< Level of the stderr sink
    std::string file;                   ///< Rotating log file (empty = none)
    std::string fileLevel{"debug"};     ///< Level of the file sink
    size_t maxFileSize{10 * 1024 * 1024};
    size_t maxFiles{3};

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static LoggingConfig fromJson(const json& j);
};

/**
 * @brief Engine-wide sandbox configuration
 *
 * Per-request limits are resolved against the defaults and maxima held here.
 */
struct SandboxConfig {
    // Policy defaults and clamps
    uint32_t defaultTimeLimitSec{3};
    uint32_t defaultCpuLimitSec{3};
    uint32_t defaultMemLimitMb{256};
    uint32_t maxTimeLimitSec{300};
    uint32_t maxMemLimitMb{8192};
    std::vector<std::string> defaultFsAllowlist;

    // Supervision
    uint32_t graceMarginMs{1000};      ///< External deadline past time limit
    uint32_t deadlineSlackMs{250};     ///< Harness backstop past time limit
    size_t maxOutputBytes{1024 * 1024};  ///< Per captured stream

    // Child process limits
    uint32_t interpreterOverheadMb{64};  ///< Address space for the runtime itself
    uint32_t maxFileSizeMb{64};
    uint32_t maxOpenFiles{256};
    bool requireKernelIsolation{false};  ///< Fail instead of degrading
    std::vector<std::string> runtimeReadOnlyPaths{
        "/usr", "/lib", "/lib64", "/lib32", "/bin", "/sbin",
        "/etc/ld.so.cache", "/etc/localtime", "/dev/null", "/dev/zero",
        "/dev/urandom", "/dev/random"};

    // Locations (empty = discover)
    std::string interpreter;
    std::string harnessExecutable;
    std::string guardScript;
    std::string tempRoot;
    std::map<std::string, std::string> extraEnvironment;

    LoggingConfig logging;

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static SandboxConfig fromJson(const json& j);

    /**
     * @brief Check internal consistency
     * @return Empty on success, otherwise a description of the problem
     */
    [[nodiscard]] std::expected<void, std::string> validate() const;

    /**
     * @brief Load a configuration file
     *
     * Keys missing from the file keep their defaults. Environment overrides
     * are not applied here.
     */
    [[nodiscard]] static std::expected<SandboxConfig, std::string> loadFromFile(
        const std::filesystem::path& path);

    /**
     * @brief Apply LOCKBOX_* environment overrides in place
     */
    void applyEnvironment();
};

}  // namespace lockbox::config

#endif  // LOCKBOX_CONFIG_SANDBOX_CONFIG_HPP
