/*
 * session.hpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#ifndef LOCKBOX_SANDBOX_SESSION_HPP
#define LOCKBOX_SANDBOX_SESSION_HPP

#include "config/sandbox_config.hpp"
#include "types.hpp"

#include <filesystem>
#include <mutex>
#include <string>

namespace lockbox::sandbox {

/**
 * @brief One bounded attempt to execute untrusted code
 *
 * Owns a freshly created, uniquely named working directory for its whole
 * lifetime and removes it on destruction, whatever path led there.
 *
 * State machine:
 * Created -> Populated -> Running -> {Completed | TimedOut | Failed} -> Cleaned
 * Failed and Cleaned are also reachable from Created and Populated.
 */
class SandboxSession {
public:
    /**
     * @brief Create the working directory and resolve the policy
     * @throws SandboxException if the directory cannot be created
     */
    SandboxSession(const RunOptions& options,
                   const config::SandboxConfig& config);

    /**
     * @brief Removes the working directory if still present
     */
    ~SandboxSession();

    SandboxSession(const SandboxSession&) = delete;
    SandboxSession& operator=(const SandboxSession&) = delete;
    SandboxSession(SandboxSession&&) = delete;
    SandboxSession& operator=(SandboxSession&&) = delete;

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const ExecutionPolicy& policy() const noexcept {
        return policy_;
    }
    [[nodiscard]] const std::filesystem::path& workingDir() const noexcept {
        return workingDir_;
    }
    [[nodiscard]] const HarnessFiles& files() const noexcept { return files_; }
    [[nodiscard]] SessionState state() const;

    /**
     * @brief Record the generated files and move to Populated
     */
    [[nodiscard]] Result<void> markPopulated(HarnessFiles files);

    /**
     * @brief Move to another state
     * @return IllegalStateTransition if the edge does not exist
     */
    [[nodiscard]] Result<void> transition(SessionState next);

    /**
     * @brief Remove the working directory and move to Cleaned
     *
     * Safe to call more than once.
     */
    void cleanup() noexcept;

    /**
     * @brief Whether the state machine has an edge from -> to
     */
    [[nodiscard]] static bool isValidTransition(SessionState from,
                                                SessionState to) noexcept;

private:
    static std::string generateId();
    static std::filesystem::path createWorkingDir(
        const std::filesystem::path& root, const std::string& id);

    std::string id_;
    std::filesystem::path workingDir_;
    ExecutionPolicy policy_;
    HarnessFiles files_;

    mutable std::mutex mutex_;
    SessionState state_{SessionState::Created};
};

}  // namespace lockbox::sandbox

#endif  // LOCKBOX_SANDBOX_SESSION_HPP
