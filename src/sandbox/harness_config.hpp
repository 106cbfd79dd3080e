/*
 * harness_config.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#ifndef LOCKBOX_SANDBOX_HARNESS_CONFIG_HPP
#define LOCKBOX_SANDBOX_HARNESS_CONFIG_HPP

#include <nlohmann/json.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace lockbox::sandbox {

using json = nlohmann::json;

/**
 * @brief Typed configuration handed from the supervisor to lockbox-harness
 *
 * Written as harness.json into the session directory. The harness never
 * receives source text, only this description of what to enforce and run.
 */
struct HarnessConfig {
    // Limits
    uint32_t timeLimitSec{3};
    uint32_t cpuLimitSec{3};
    uint32_t memLimitMb{256};
    uint32_t interpreterOverheadMb{64};
    uint32_t maxFileSizeMb{64};
    uint32_t maxOpenFiles{256};
    uint32_t deadlineSlackMs{250};

    // Filesystem
    std::vector<std::string> fsAllowlist;       ///< Full access beneath
    std::vector<std::string> runtimeReadOnly;   ///< Read and execute beneath

    // What to run
    std::string interpreter;
    std::vector<std::string> interpreterArgs{"-I", "-S", "-B"};
    std::string guardScript;
    std::string userCode;

    bool requireKernelIsolation{false};
    std::string logLevel{"warn"};

    /**
     * @brief Address space ceiling in bytes
     */
    [[nodiscard]] uint64_t addressSpaceBytes() const noexcept {
        return (static_cast<uint64_t>(memLimitMb) + interpreterOverheadMb) *
               1024 * 1024;
    }

    /**
     * @brief In-process wall-clock backstop in milliseconds
     */
    [[nodiscard]] uint64_t deadlineMs() const noexcept {
        return static_cast<uint64_t>(timeLimitSec) * 1000 + deadlineSlackMs;
    }

    [[nodiscard]] json toJson() const;
    [[nodiscard]] static HarnessConfig fromJson(const json& j);

    /**
     * @brief Write as JSON with mode 0600
     */
    [[nodiscard]] std::expected<void, std::string> save(
        const std::filesystem::path& path) const;

    [[nodiscard]] static std::expected<HarnessConfig, std::string> load(
        const std::filesystem::path& path);
};

/**
 * @brief Create a new file readable only by its owner and fill it
 *
 * Fails if the file already exists.
 */
[[nodiscard]] std::expected<void, std::string> writePrivateFile(
    const std::filesystem::path& path, std::string_view content);

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_HARNESS_CONFIG_HPP
