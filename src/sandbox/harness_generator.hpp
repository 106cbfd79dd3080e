/*
 * harness_generator.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#ifndef LOCKBOX_SANDBOX_HARNESS_GENERATOR_HPP
#define LOCKBOX_SANDBOX_HARNESS_GENERATOR_HPP

#include "config/sandbox_config.hpp"
#include "harness_config.hpp"
#include "session.hpp"
#include "types.hpp"

#include <filesystem>
#include <string_view>

namespace lockbox::sandbox {

/**
 * @brief Populates a session directory with everything the harness needs
 *
 * Produces user_code.py, harness.json and a copy of the guard prelude, all
 * with mode 0600.
 */
class HarnessGenerator {
public:
    static constexpr const char* USER_CODE_FILE = "user_code.py";
    static constexpr const char* CONFIG_FILE = "harness.json";
    static constexpr const char* GUARD_FILE = "sandbox_guard.py";

    explicit HarnessGenerator(const config::SandboxConfig& config);

    /**
     * @brief Write the harness files and move the session to Populated
     * @throws SandboxException on any failure
     */
    HarnessFiles generate(SandboxSession& session, std::string_view sourceCode);

    /**
     * @brief Build the harness configuration for a policy
     * @param policy Resolved policy of the session
     * @param files Paths inside the session directory
     * @param interpreter Canonical interpreter path
     */
    [[nodiscard]] HarnessConfig buildConfig(
        const ExecutionPolicy& policy, const HarnessFiles& files,
        const std::filesystem::path& interpreter) const;

private:
    const config::SandboxConfig& config_;
};

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_HARNESS_GENERATOR_HPP
