/*
 * resource_limits.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "guards.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <sys/resource.h>

namespace lockbox::sandbox::guards {

namespace {

GuardResult setLimit(int resource, const char* name, rlim_t soft, rlim_t hard) {
    struct rlimit current {};
    if (getrlimit(resource, &current) == 0 && current.rlim_max != RLIM_INFINITY) {
        // An unprivileged process cannot raise its hard limit
        hard = std::min(hard, current.rlim_max);
        soft = std::min(soft, hard);
    }

    struct rlimit limit {};
    limit.rlim_cur = soft;
    limit.rlim_max = hard;
    if (setrlimit(resource, &limit) != 0) {
        int err = errno;
        return std::unexpected(GuardError{
            "rlimits",
            std::string("setrlimit(") + name + ") failed: " + std::strerror(err),
            err});
    }
    spdlog::debug("{} = {}/{}", name, static_cast<unsigned long long>(soft),
                  static_cast<unsigned long long>(hard));
    return {};
}

}  // namespace

GuardResult applyResourceLimits(const HarnessConfig& config) {
    constexpr rlim_t MB = 1024 * 1024;

    const auto cpu = static_cast<rlim_t>(config.cpuLimitSec);
    if (auto r = setLimit(RLIMIT_CPU, "RLIMIT_CPU", cpu, cpu + 1); !r) {
        return r;
    }

    const auto as = static_cast<rlim_t>(config.addressSpaceBytes());
    if (auto r = setLimit(RLIMIT_AS, "RLIMIT_AS", as, as); !r) {
        return r;
    }

    if (auto r = setLimit(RLIMIT_CORE, "RLIMIT_CORE", 0, 0); !r) {
        return r;
    }

    const auto fsize = static_cast<rlim_t>(config.maxFileSizeMb) * MB;
    if (auto r = setLimit(RLIMIT_FSIZE, "RLIMIT_FSIZE", fsize, fsize); !r) {
        return r;
    }

    const auto nofile = static_cast<rlim_t>(config.maxOpenFiles);
    return setLimit(RLIMIT_NOFILE, "RLIMIT_NOFILE", nofile, nofile);
}

}  // namespace lockbox::sandbox::guards
