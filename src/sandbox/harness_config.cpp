/*
 * harness_config.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "harness_config.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>

#include <fcntl.h>
#include <unistd.h>

namespace lockbox::sandbox {

namespace {

std::vector<std::string> stringList(const json& j, const char* key,
                                    std::vector<std::string> fallback) {
    if (!j.contains(key) || !j[key].is_array()) {
        return fallback;
    }
    std::vector<std::string> out;
    for (const auto& item : j[key]) {
        if (item.is_string()) {
            out.push_back(item.get<std::string>());
        }
    }
    return out;
}

}  // namespace

json HarnessConfig::toJson() const {
    return {{"limits",
             {{"timeLimitSec", timeLimitSec},
              {"cpuLimitSec", cpuLimitSec},
              {"memLimitMb", memLimitMb},
              {"interpreterOverheadMb", interpreterOverheadMb},
              {"maxFileSizeMb", maxFileSizeMb},
              {"maxOpenFiles", maxOpenFiles},
              {"deadlineSlackMs", deadlineSlackMs}}},
            {"fsAllowlist", fsAllowlist},
            {"runtimeReadOnly", runtimeReadOnly},
            {"interpreter", interpreter},
            {"interpreterArgs", interpreterArgs},
            {"guardScript", guardScript},
            {"userCode", userCode},
            {"requireKernelIsolation", requireKernelIsolation},
            {"logLevel", logLevel}};
}

HarnessConfig HarnessConfig::fromJson(const json& j) {
    HarnessConfig cfg;
    if (j.contains("limits") && j["limits"].is_object()) {
        const auto& limits = j["limits"];
        cfg.timeLimitSec = limits.value("timeLimitSec", cfg.timeLimitSec);
        cfg.cpuLimitSec = limits.value("cpuLimitSec", cfg.cpuLimitSec);
        cfg.memLimitMb = limits.value("memLimitMb", cfg.memLimitMb);
        cfg.interpreterOverheadMb =
            limits.value("interpreterOverheadMb", cfg.interpreterOverheadMb);
        cfg.maxFileSizeMb = limits.value("maxFileSizeMb", cfg.maxFileSizeMb);
        cfg.maxOpenFiles = limits.value("maxOpenFiles", cfg.maxOpenFiles);
        cfg.deadlineSlackMs =
            limits.value("deadlineSlackMs", cfg.deadlineSlackMs);
    }
    cfg.fsAllowlist = stringList(j, "fsAllowlist", cfg.fsAllowlist);
    cfg.runtimeReadOnly = stringList(j, "runtimeReadOnly", cfg.runtimeReadOnly);
    cfg.interpreter = j.value("interpreter", cfg.interpreter);
    cfg.interpreterArgs = stringList(j, "interpreterArgs", cfg.interpreterArgs);
    cfg.guardScript = j.value("guardScript", cfg.guardScript);
    cfg.userCode = j.value("userCode", cfg.userCode);
    cfg.requireKernelIsolation =
        j.value("requireKernelIsolation", cfg.requireKernelIsolation);
    cfg.logLevel = j.value("logLevel", cfg.logLevel);
    return cfg;
}

std::expected<void, std::string> HarnessConfig::save(
    const std::filesystem::path& path) const {
    return writePrivateFile(path, toJson().dump(2));
}

std::expected<HarnessConfig, std::string> HarnessConfig::load(
    const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return std::unexpected("cannot open " + path.string());
    }
    try {
        json j = json::parse(file);
        if (!j.is_object()) {
            return std::unexpected(path.string() + " is not a JSON object");
        }
        return fromJson(j);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("malformed harness config: ") +
                               e.what());
    }
}

std::expected<void, std::string> writePrivateFile(
    const std::filesystem::path& path, std::string_view content) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                    0600);
    if (fd < 0) {
        return std::unexpected("cannot create " + path.string() + ": " +
                               std::strerror(errno));
    }

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string error = std::strerror(errno);
            ::close(fd);
            return std::unexpected("cannot write " + path.string() + ": " +
                                   error);
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (::close(fd) != 0) {
        return std::unexpected("cannot close " + path.string() + ": " +
                               std::strerror(errno));
    }
    return {};
}

}  // namespace lockbox::sandbox
