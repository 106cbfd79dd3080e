/*
 * session.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "session.hpp"
#include "policy_resolver.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <random>
#include <system_error>
#include <vector>

#include <stdlib.h>

namespace lockbox::sandbox {

SandboxSession::SandboxSession(const RunOptions& options,
                               const config::SandboxConfig& config)
    : id_(generateId()) {
    std::filesystem::path root = config.tempRoot;
    if (root.empty()) {
        std::error_code ec;
        root = std::filesystem::temp_directory_path(ec);
        if (ec) {
            root = "/tmp";
        }
    }

    workingDir_ = createWorkingDir(root, id_);
    try {
        policy_ = PolicyResolver(config).resolve(options, workingDir_);
    } catch (...) {
        // The destructor does not run for a half-built session
        std::error_code ec;
        std::filesystem::remove_all(workingDir_, ec);
        throw;
    }
    spdlog::debug("Session {} created in {}", id_, workingDir_.string());
}

SandboxSession::~SandboxSession() { cleanup(); }

SessionState SandboxSession::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

Result<void> SandboxSession::markPopulated(HarnessFiles files) {
    auto result = transition(SessionState::Populated);
    if (result) {
        files_ = std::move(files);
    }
    return result;
}

Result<void> SandboxSession::transition(SessionState next) {
    std::lock_guard lock(mutex_);
    if (!isValidTransition(state_, next)) {
        spdlog::error("Session {}: illegal transition {} -> {}", id_,
                      sessionStateToString(state_),
                      sessionStateToString(next));
        return std::unexpected(SandboxError::IllegalStateTransition);
    }
    spdlog::trace("Session {}: {} -> {}", id_, sessionStateToString(state_),
                  sessionStateToString(next));
    state_ = next;
    return {};
}

void SandboxSession::cleanup() noexcept {
    std::lock_guard lock(mutex_);
    if (state_ == SessionState::Cleaned) {
        return;
    }

    // Running without a terminal verdict means supervision was interrupted
    if (state_ == SessionState::Running) {
        state_ = SessionState::Failed;
    }

    if (!workingDir_.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(workingDir_, ec);
        if (ec) {
            spdlog::error("Session {}: failed to remove {}: {}", id_,
                          workingDir_.string(), ec.message());
        }
    }
    state_ = SessionState::Cleaned;
}

bool SandboxSession::isValidTransition(SessionState from,
                                       SessionState to) noexcept {
    switch (from) {
        case SessionState::Created:
            return to == SessionState::Populated ||
                   to == SessionState::Failed || to == SessionState::Cleaned;
        case SessionState::Populated:
            return to == SessionState::Running || to == SessionState::Failed ||
                   to == SessionState::Cleaned;
        case SessionState::Running:
            return to == SessionState::Completed ||
                   to == SessionState::TimedOut || to == SessionState::Failed;
        case SessionState::Completed:
        case SessionState::TimedOut:
        case SessionState::Failed:
            return to == SessionState::Cleaned;
        case SessionState::Cleaned:
            return false;
    }
    return false;
}

std::string SandboxSession::generateId() {
    static constexpr char HEX[] = "0123456789abcdef";
    std::random_device device;
    std::mt19937_64 engine(
        (static_cast<uint64_t>(device()) << 32) ^ device());
    uint64_t value = engine();

    std::string id(16, '0');
    for (auto& c : id) {
        c = HEX[value & 0xF];
        value >>= 4;
    }
    return id;
}

std::filesystem::path SandboxSession::createWorkingDir(
    const std::filesystem::path& root, const std::string& id) {
    auto pattern = (root / ("lockbox_sandbox_" + id + "_XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    // mkdtemp creates the directory with mode 0700
    if (mkdtemp(buffer.data()) == nullptr) {
        throw SandboxException(
            SandboxError::WorkingDirectoryFailed,
            "cannot create working directory under " + root.string() + ": " +
                std::strerror(errno));
    }
    return std::filesystem::path(buffer.data());
}

}  // namespace lockbox::sandbox
