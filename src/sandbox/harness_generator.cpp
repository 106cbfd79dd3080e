/*
 * harness_generator.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "harness_generator.hpp"
#include "config_discovery.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>

namespace lockbox::sandbox {

namespace {

[[noreturn]] void fail(SandboxError error, const std::string& message) {
    spdlog::error("Harness generation failed: {}", message);
    throw SandboxException(error, message);
}

std::string readFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        fail(SandboxError::HarnessGenerationFailed,
             "cannot read " + path.string());
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

HarnessGenerator::HarnessGenerator(const config::SandboxConfig& config)
    : config_(config) {}

HarnessFiles HarnessGenerator::generate(SandboxSession& session,
                                        std::string_view sourceCode) {
    auto interpreter = ConfigDiscovery::findInterpreter(config_.interpreter);
    if (!interpreter) {
        fail(interpreter.error(), "no usable Python interpreter");
    }
    auto harness = ConfigDiscovery::findHarness(config_.harnessExecutable);
    if (!harness) {
        fail(harness.error(), "lockbox-harness executable not found");
    }
    auto guard = ConfigDiscovery::findGuardScript(config_.guardScript);
    if (!guard) {
        fail(guard.error(), "sandbox guard script not found");
    }

    const auto& dir = session.workingDir();
    HarnessFiles files;
    files.harnessEntry = *harness;
    files.configPath = dir / CONFIG_FILE;
    files.guardScriptPath = dir / GUARD_FILE;
    files.userCodePath = dir / USER_CODE_FILE;

    if (auto written = writePrivateFile(files.userCodePath, sourceCode);
        !written) {
        fail(SandboxError::HarnessGenerationFailed, written.error());
    }
    if (auto written =
            writePrivateFile(files.guardScriptPath, readFile(*guard));
        !written) {
        fail(SandboxError::HarnessGenerationFailed, written.error());
    }
    auto harnessConfig = buildConfig(session.policy(), files, *interpreter);
    if (auto saved = harnessConfig.save(files.configPath); !saved) {
        fail(SandboxError::HarnessGenerationFailed, saved.error());
    }

    if (auto populated = session.markPopulated(files); !populated) {
        fail(populated.error(), "session " + session.id() + " in state " +
                                    std::string(sessionStateToString(
                                        session.state())));
    }

    spdlog::debug("Session {}: harness files written (interpreter {})",
                  session.id(), interpreter->string());
    return files;
}

HarnessConfig HarnessGenerator::buildConfig(
    const ExecutionPolicy& policy, const HarnessFiles& files,
    const std::filesystem::path& interpreter) const {
    HarnessConfig cfg;
    cfg.timeLimitSec = policy.timeLimitSec;
    cfg.cpuLimitSec = policy.cpuLimitSec;
    cfg.memLimitMb = policy.memLimitMb;
    cfg.interpreterOverheadMb = config_.interpreterOverheadMb;
    cfg.maxFileSizeMb = config_.maxFileSizeMb;
    cfg.maxOpenFiles = config_.maxOpenFiles;
    cfg.deadlineSlackMs = config_.deadlineSlackMs;

    std::transform(policy.fsAllowlist.begin(), policy.fsAllowlist.end(),
                   std::back_inserter(cfg.fsAllowlist),
                   [](const std::filesystem::path& p) { return p.string(); });

    cfg.runtimeReadOnly = config_.runtimeReadOnlyPaths;
    if (auto prefix = ConfigDiscovery::interpreterPrefix(interpreter)) {
        auto root = prefix->string();
        if (std::find(cfg.runtimeReadOnly.begin(), cfg.runtimeReadOnly.end(),
                      root) == cfg.runtimeReadOnly.end()) {
            cfg.runtimeReadOnly.push_back(root);
        }
    }

    cfg.interpreter = interpreter.string();
    cfg.guardScript = files.guardScriptPath.string();
    cfg.userCode = files.userCodePath.string();
    cfg.requireKernelIsolation = config_.requireKernelIsolation;
    cfg.logLevel = config_.logging.consoleLevel;
    return cfg;
}

}  // namespace lockbox::sandbox
