/*
 * sandbox_config.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "sandbox_config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace lockbox::config {

json LoggingConfig::toJson() const {
    return {{"consoleLevel", consoleLevel},
            {"file", file},
            {"fileLevel", fileLevel},
            {"maxFileSize", maxFileSize},
            {"maxFiles", maxFiles}};
}

LoggingConfig LoggingConfig::fromJson(const json& j) {
    LoggingConfig cfg;
    cfg.consoleLevel = j.value("consoleLevel", cfg.consoleLevel);
    cfg.file = j.value("file", cfg.file);
    cfg.fileLevel = j.value("fileLevel", cfg.fileLevel);
    cfg.maxFileSize = j.value("maxFileSize", cfg.maxFileSize);
    cfg.maxFiles = j.value("maxFiles", cfg.maxFiles);
    return cfg;
}

json SandboxConfig::toJson() const {
    return {{"defaultTimeLimitSec", defaultTimeLimitSec},
            {"defaultCpuLimitSec", defaultCpuLimitSec},
            {"defaultMemLimitMb", defaultMemLimitMb},
            {"maxTimeLimitSec", maxTimeLimitSec},
            {"maxMemLimitMb", maxMemLimitMb},
            {"defaultFsAllowlist", defaultFsAllowlist},
            {"graceMarginMs", graceMarginMs},
            {"deadlineSlackMs", deadlineSlackMs},
            {"maxOutputBytes", maxOutputBytes},
            {"interpreterOverheadMb", interpreterOverheadMb},
            {"maxFileSizeMb", maxFileSizeMb},
            {"maxOpenFiles", maxOpenFiles},
            {"requireKernelIsolation", requireKernelIsolation},
            {"runtimeReadOnlyPaths", runtimeReadOnlyPaths},
            {"interpreter", interpreter},
            {"harnessExecutable", harnessExecutable},
            {"guardScript", guardScript},
            {"tempRoot", tempRoot},
            {"extraEnvironment", extraEnvironment},
            {"logging", logging.toJson()}};
}

SandboxConfig SandboxConfig::fromJson(const json& j) {
    SandboxConfig cfg;
    cfg.defaultTimeLimitSec =
        j.value("defaultTimeLimitSec", cfg.defaultTimeLimitSec);
    cfg.defaultCpuLimitSec = j.value("defaultCpuLimitSec", cfg.defaultCpuLimitSec);
    cfg.defaultMemLimitMb = j.value("defaultMemLimitMb", cfg.defaultMemLimitMb);
    cfg.maxTimeLimitSec = j.value("maxTimeLimitSec", cfg.maxTimeLimitSec);
    cfg.maxMemLimitMb = j.value("maxMemLimitMb", cfg.maxMemLimitMb);
    if (j.contains("defaultFsAllowlist") && j["defaultFsAllowlist"].is_array()) {
        cfg.defaultFsAllowlist =
            j["defaultFsAllowlist"].get<std::vector<std::string>>();
    }
    cfg.graceMarginMs = j.value("graceMarginMs", cfg.graceMarginMs);
    cfg.deadlineSlackMs = j.value("deadlineSlackMs", cfg.deadlineSlackMs);
    cfg.maxOutputBytes = j.value("maxOutputBytes", cfg.maxOutputBytes);
    cfg.interpreterOverheadMb =
        j.value("interpreterOverheadMb", cfg.interpreterOverheadMb);
    cfg.maxFileSizeMb = j.value("maxFileSizeMb", cfg.maxFileSizeMb);
    cfg.maxOpenFiles = j.value("maxOpenFiles", cfg.maxOpenFiles);
    cfg.requireKernelIsolation =
        j.value("requireKernelIsolation", cfg.requireKernelIsolation);
    if (j.contains("runtimeReadOnlyPaths") &&
        j["runtimeReadOnlyPaths"].is_array()) {
        cfg.runtimeReadOnlyPaths =
            j["runtimeReadOnlyPaths"].get<std::vector<std::string>>();
    }
    cfg.interpreter = j.value("interpreter", cfg.interpreter);
    cfg.harnessExecutable = j.value("harnessExecutable", cfg.harnessExecutable);
    cfg.guardScript = j.value("guardScript", cfg.guardScript);
    cfg.tempRoot = j.value("tempRoot", cfg.tempRoot);
    if (j.contains("extraEnvironment") && j["extraEnvironment"].is_object()) {
        cfg.extraEnvironment =
            j["extraEnvironment"].get<std::map<std::string, std::string>>();
    }
    if (j.contains("logging") && j["logging"].is_object()) {
        cfg.logging = LoggingConfig::fromJson(j["logging"]);
    }
    return cfg;
}

std::expected<void, std::string> SandboxConfig::validate() const {
    if (defaultTimeLimitSec == 0 || maxTimeLimitSec == 0) {
        return std::unexpected("time limits must be positive");
    }
    if (defaultTimeLimitSec > maxTimeLimitSec) {
        return std::unexpected("defaultTimeLimitSec exceeds maxTimeLimitSec");
    }
    if (defaultCpuLimitSec == 0) {
        return std::unexpected("defaultCpuLimitSec must be positive");
    }
    if (maxMemLimitMb < 16) {
        return std::unexpected("maxMemLimitMb must be at least 16");
    }
    if (defaultMemLimitMb > maxMemLimitMb) {
        return std::unexpected("defaultMemLimitMb exceeds maxMemLimitMb");
    }
    if (graceMarginMs <= deadlineSlackMs) {
        return std::unexpected(
            "graceMarginMs must be greater than deadlineSlackMs");
    }
    if (maxOutputBytes == 0) {
        return std::unexpected("maxOutputBytes must be positive");
    }
    if (maxOpenFiles < 16) {
        return std::unexpected("maxOpenFiles must be at least 16");
    }
    return {};
}

std::expected<SandboxConfig, std::string> SandboxConfig::loadFromFile(
    const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected("cannot open " + path.string());
    }

    json j;
    try {
        j = json::parse(file, nullptr, true, true);
    } catch (const json::parse_error& e) {
        return std::unexpected("malformed config " + path.string() + ": " +
                               e.what());
    }
    if (!j.is_object()) {
        return std::unexpected("config root must be an object");
    }

    try {
        auto cfg = fromJson(j);
        auto valid = cfg.validate();
        if (!valid) {
            return std::unexpected(valid.error());
        }
        spdlog::debug("Loaded sandbox configuration from {}", path.string());
        return cfg;
    } catch (const json::exception& e) {
        return std::unexpected("invalid value in " + path.string() + ": " +
                               e.what());
    }
}

void SandboxConfig::applyEnvironment() {
    auto env = [](const char* name) -> std::string {
        const char* value = std::getenv(name);
        return value ? std::string(value) : std::string{};
    };

    if (auto v = env("LOCKBOX_INTERPRETER"); !v.empty()) interpreter = v;
    if (auto v = env("LOCKBOX_HARNESS"); !v.empty()) harnessExecutable = v;
    if (auto v = env("LOCKBOX_GUARD_SCRIPT"); !v.empty()) guardScript = v;
    if (auto v = env("LOCKBOX_TEMP_ROOT"); !v.empty()) tempRoot = v;
    if (auto v = env("LOCKBOX_LOG_LEVEL"); !v.empty()) logging.consoleLevel = v;
    if (auto v = env("LOCKBOX_REQUIRE_ISOLATION"); !v.empty()) {
        requireKernelIsolation = (v == "1" || v == "true" || v == "yes");
    }
}

}  // namespace lockbox::config
