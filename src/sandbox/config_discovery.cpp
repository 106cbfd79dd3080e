/*
 * config_discovery.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "config_discovery.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <sstream>
#include <system_error>
#include <vector>

#include <unistd.h>

namespace lockbox::sandbox {

namespace {

std::optional<std::filesystem::path> firstExisting(
    const std::vector<std::filesystem::path>& candidates) {
    for (const auto& path : candidates) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(path, ec)) {
            auto canonical = std::filesystem::canonical(path, ec);
            return ec ? path : canonical;
        }
    }
    return std::nullopt;
}

}  // namespace

Result<std::filesystem::path> ConfigDiscovery::findInterpreter(
    const std::string& configured) {
    if (!configured.empty()) {
        std::error_code ec;
        auto canonical = std::filesystem::canonical(configured, ec);
        if (ec || !isExecutable(canonical)) {
            spdlog::error("Configured interpreter '{}' is not executable",
                          configured);
            return std::unexpected(SandboxError::InterpreterNotFound);
        }
        return canonical;
    }

    std::vector<std::filesystem::path> searchPaths = {
        "/usr/bin/python3",
        "/usr/local/bin/python3",
        "/usr/bin/python"
    };

    if (const char* pathEnv = std::getenv("PATH")) {
        std::stringstream ss(pathEnv);
        std::string dir;
        while (std::getline(ss, dir, ':')) {
            if (!dir.empty()) {
                searchPaths.emplace_back(std::filesystem::path(dir) / "python3");
            }
        }
    }

    for (const auto& candidate : searchPaths) {
        std::error_code ec;
        auto canonical = std::filesystem::canonical(candidate, ec);
        if (!ec && isExecutable(canonical)) {
            return canonical;
        }
    }
    return std::unexpected(SandboxError::InterpreterNotFound);
}

Result<std::filesystem::path> ConfigDiscovery::findHarness(
    const std::string& configured) {
    if (!configured.empty()) {
        if (!isExecutable(configured)) {
            spdlog::error("Configured harness '{}' is not executable",
                          configured);
            return std::unexpected(SandboxError::HarnessNotFound);
        }
        return std::filesystem::path(configured);
    }

    std::vector<std::filesystem::path> searchPaths;
#ifdef LOCKBOX_DEFAULT_HARNESS
    searchPaths.emplace_back(LOCKBOX_DEFAULT_HARNESS);
#endif
    if (auto dir = executableDir()) {
        searchPaths.push_back(*dir / "lockbox-harness");
        searchPaths.push_back(*dir / ".." / "libexec" / "lockbox" /
                              "lockbox-harness");
    }
    searchPaths.emplace_back("/usr/local/libexec/lockbox/lockbox-harness");
    searchPaths.emplace_back("/usr/libexec/lockbox/lockbox-harness");

    for (const auto& path : searchPaths) {
        if (isExecutable(path)) {
            std::error_code ec;
            auto canonical = std::filesystem::canonical(path, ec);
            return ec ? path : canonical;
        }
    }
    return std::unexpected(SandboxError::HarnessNotFound);
}

Result<std::filesystem::path> ConfigDiscovery::findGuardScript(
    const std::string& configured) {
    if (!configured.empty()) {
        auto found = firstExisting({configured});
        if (!found) {
            spdlog::error("Configured guard script '{}' does not exist",
                          configured);
            return std::unexpected(SandboxError::GuardScriptNotFound);
        }
        return *found;
    }

    std::vector<std::filesystem::path> searchPaths;
#ifdef LOCKBOX_DEFAULT_GUARD_SCRIPT
    searchPaths.emplace_back(LOCKBOX_DEFAULT_GUARD_SCRIPT);
#endif
    if (auto dir = executableDir()) {
        searchPaths.push_back(*dir / ".." / "share" / "lockbox" / "python" /
                              "executor" / "sandbox_guard.py");
    }
    searchPaths.emplace_back(
        "/usr/local/share/lockbox/python/executor/sandbox_guard.py");
    searchPaths.emplace_back("/usr/share/lockbox/python/executor/sandbox_guard.py");

    if (auto found = firstExisting(searchPaths)) {
        return *found;
    }
    return std::unexpected(SandboxError::GuardScriptNotFound);
}

std::optional<std::filesystem::path> ConfigDiscovery::interpreterPrefix(
    const std::filesystem::path& interpreter) {
    std::error_code ec;
    auto canonical = std::filesystem::canonical(interpreter, ec);
    if (ec) {
        return std::nullopt;
    }
    auto binDir = canonical.parent_path();
    auto prefix = binDir.parent_path();
    // "/bin/python3" must not open up the whole filesystem
    if (binDir.filename() != "bin" || prefix == prefix.root_path()) {
        return binDir;
    }
    return prefix;
}

Result<void> ConfigDiscovery::validateConfig(
    const config::SandboxConfig& config) {
    if (auto valid = config.validate(); !valid) {
        spdlog::error("Invalid sandbox configuration: {}", valid.error());
        return std::unexpected(SandboxError::InvalidConfiguration);
    }
    if (auto interpreter = findInterpreter(config.interpreter); !interpreter) {
        return std::unexpected(interpreter.error());
    }
    if (auto harness = findHarness(config.harnessExecutable); !harness) {
        return std::unexpected(harness.error());
    }
    if (auto guard = findGuardScript(config.guardScript); !guard) {
        return std::unexpected(guard.error());
    }
    return {};
}

std::optional<std::filesystem::path> ConfigDiscovery::executableDir() {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return std::nullopt;
    }
    return self.parent_path();
}

bool ConfigDiscovery::isExecutable(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) &&
           ::access(path.c_str(), X_OK) == 0;
}

}  // namespace lockbox::sandbox
