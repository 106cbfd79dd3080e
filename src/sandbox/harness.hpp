/*
 * harness.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

/**
 * @file harness.hpp
 * @brief Fixed entrypoint that runs inside the sandboxed child
 * @date 2024
 * @version 1.0.0
 *
 * lockbox-harness installs every guard before any user code exists in the
 * process tree, then runs the interpreter and maps its fate to an exit code
 * following timeout(1).
 */

#ifndef LOCKBOX_SANDBOX_HARNESS_HPP
#define LOCKBOX_SANDBOX_HARNESS_HPP

#include "guards/guards.hpp"
#include "harness_config.hpp"
#include "ipc/report_message.hpp"
#include "types.hpp"

#include <filesystem>
#include <string>
#include <vector>

#include <sys/types.h>

namespace lockbox::sandbox {

class Harness {
public:
    /**
     * @param config Parsed harness.json
     * @param configPath Path of harness.json, handed to the guard prelude
     * @param reportFd Descriptor of the report pipe, -1 for none
     */
    Harness(HarnessConfig config, std::filesystem::path configPath,
            int reportFd);

    /**
     * @brief Install guards, run the interpreter, wait for it
     * @return Process exit code for lockbox-harness
     */
    [[nodiscard]] int run();

    /**
     * @brief Map an interpreter wait status to the harness exit code
     *
     * SIGXCPU becomes 124, any other signal 1. Exit codes reserved for the
     * harness (125..127) are folded to 1.
     */
    [[nodiscard]] static int mapChildStatus(int status) noexcept;

    /**
     * @brief Report a setup failure and return the matching exit code
     */
    int setupFailed(const std::string& stage, const std::string& message,
                    int error = 0, int exitCode = ExitCodes::SETUP_FAILED);

private:
    [[nodiscard]] bool installGuards(GuardReport& installed);
    [[nodiscard]] std::vector<std::string> buildArgv() const;
    [[noreturn]] void execChild(int errorFd);
    [[nodiscard]] int superviseChild(pid_t pid);
    void report(ipc::ReportType type, const ipc::json& payload);

    HarnessConfig config_;
    std::filesystem::path configPath_;
    int reportFd_;
    uint32_t sequence_{0};
    guards::DeadlineTimer deadline_;
    bool lockGroup_{false};  ///< seccomp works; pin the interpreter group
};

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_HARNESS_HPP
