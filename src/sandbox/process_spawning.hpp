/*
 * process_spawning.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#ifndef LOCKBOX_SANDBOX_PROCESS_SPAWNING_HPP
#define LOCKBOX_SANDBOX_PROCESS_SPAWNING_HPP

#include "types.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <sys/resource.h>
#include <sys/types.h>

namespace lockbox::sandbox {

/**
 * @brief What to run and where
 */
struct SpawnRequest {
    std::filesystem::path executable;
    std::vector<std::string> arguments;    ///< Without argv[0]
    std::filesystem::path workingDirectory;
    std::vector<std::string> environment;  ///< Complete, "KEY=VALUE"
};

/**
 * @brief A running process and the parent ends of its pipes
 *
 * The child sees stdin as /dev/null, stdout and stderr as pipes and the
 * report pipe as descriptor 3.
 */
struct SpawnedProcess {
    pid_t pid{-1};
    int stdoutFd{-1};
    int stderrFd{-1};
    int reportFd{-1};
};

/**
 * @brief Exit status and resource usage of a reaped process
 */
struct ReapedProcess {
    int status{0};
    std::chrono::milliseconds cpuTime{0};
    size_t peakRssKb{0};
};

/**
 * @brief Spawns and reaps process groups
 */
class ProcessSpawner {
public:
    static constexpr int REPORT_FD = 3;

    /**
     * @brief Spawn a process leading its own process group
     * @return The process or ProcessSpawnFailed / PipeCreationFailed
     */
    [[nodiscard]] static Result<SpawnedProcess> spawn(
        const SpawnRequest& request);

    /**
     * @brief SIGKILL a whole process group, then the leader itself
     */
    static void killGroup(pid_t pgid) noexcept;

    /**
     * @brief Reap a process, collecting rusage
     * @param timeout Upper bound to wait; the process is killed afterwards
     */
    [[nodiscard]] static Result<ReapedProcess> reap(
        pid_t pid, std::chrono::milliseconds timeout);

    /**
     * @brief Close a descriptor and mark it closed
     */
    static void closeFd(int& fd) noexcept;
};

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_PROCESS_SPAWNING_HPP
