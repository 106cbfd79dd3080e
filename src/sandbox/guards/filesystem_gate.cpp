/*
 * filesystem_gate.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "guards.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#ifdef __linux__
#include <linux/landlock.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif
#ifndef LANDLOCK_ACCESS_FS_REFER
#define LANDLOCK_ACCESS_FS_REFER (1ULL << 13)
#endif
#ifndef LANDLOCK_ACCESS_FS_TRUNCATE
#define LANDLOCK_ACCESS_FS_TRUNCATE (1ULL << 14)
#endif
#endif  // __linux__

namespace lockbox::sandbox::guards {

#ifdef __linux__

namespace {

constexpr int MAX_SUPPORTED_ABI = 3;

constexpr __u64 ACCESS_FS_V1 =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE |
    LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR |
    LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
    LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR |
    LANDLOCK_ACCESS_FS_MAKE_REG | LANDLOCK_ACCESS_FS_MAKE_SOCK |
    LANDLOCK_ACCESS_FS_MAKE_FIFO | LANDLOCK_ACCESS_FS_MAKE_BLOCK |
    LANDLOCK_ACCESS_FS_MAKE_SYM;

// Rights that make sense on a regular file rather than a directory
constexpr __u64 ACCESS_FILE = LANDLOCK_ACCESS_FS_EXECUTE |
                              LANDLOCK_ACCESS_FS_WRITE_FILE |
                              LANDLOCK_ACCESS_FS_READ_FILE |
                              LANDLOCK_ACCESS_FS_TRUNCATE;

constexpr __u64 ACCESS_READ_ONLY = LANDLOCK_ACCESS_FS_EXECUTE |
                                   LANDLOCK_ACCESS_FS_READ_FILE |
                                   LANDLOCK_ACCESS_FS_READ_DIR;

__u64 handledAccess(int abi) {
    __u64 access = ACCESS_FS_V1;
    if (abi >= 2) {
        access |= LANDLOCK_ACCESS_FS_REFER;
    }
    if (abi >= 3) {
        access |= LANDLOCK_ACCESS_FS_TRUNCATE;
    }
    return access;
}

int createRuleset(const landlock_ruleset_attr* attr, size_t size,
                  __u32 flags) {
    return static_cast<int>(
        syscall(__NR_landlock_create_ruleset, attr, size, flags));
}

int addRule(int rulesetFd, const landlock_path_beneath_attr* attr) {
    return static_cast<int>(syscall(__NR_landlock_add_rule, rulesetFd,
                                    LANDLOCK_RULE_PATH_BENEATH, attr, 0));
}

int restrictSelf(int rulesetFd) {
    return static_cast<int>(syscall(__NR_landlock_restrict_self, rulesetFd, 0));
}

/**
 * @brief Add a path-beneath rule
 * @return false only on an unexpected kernel error; missing paths are skipped
 */
bool addPathRule(int rulesetFd, const std::string& path, __u64 access,
                 __u64 handled, GuardError& error) {
    int fd = ::open(path.c_str(), O_PATH | O_CLOEXEC);
    if (fd < 0) {
        spdlog::debug("Landlock: skipping '{}': {}", path, std::strerror(errno));
        return true;
    }

    struct stat st {};
    if (fstat(fd, &st) == 0 && !S_ISDIR(st.st_mode)) {
        access &= ACCESS_FILE;
    }

    landlock_path_beneath_attr attr{};
    attr.allowed_access = access & handled;
    attr.parent_fd = fd;
    int ret = addRule(rulesetFd, &attr);
    int err = errno;
    ::close(fd);

    if (ret != 0) {
        error = GuardError{"filesystem",
                           "landlock_add_rule('" + path +
                               "') failed: " + std::strerror(err),
                           err};
        return false;
    }
    return true;
}

}  // namespace

int landlockAbiVersion() noexcept {
    int abi = createRuleset(nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    return abi < 0 ? 0 : abi;
}

std::expected<int, GuardError> installFilesystemGate(
    const std::vector<std::string>& readWrite,
    const std::vector<std::string>& readOnly) {
    int abi = landlockAbiVersion();
    if (abi <= 0) {
        return std::unexpected(GuardError{
            "filesystem", "Landlock is not supported or disabled by the kernel",
            ENOSYS});
    }
    abi = std::min(abi, MAX_SUPPORTED_ABI);
    const __u64 handled = handledAccess(abi);

    landlock_ruleset_attr rulesetAttr{};
    rulesetAttr.handled_access_fs = handled;
    int rulesetFd = createRuleset(&rulesetAttr, sizeof(rulesetAttr), 0);
    if (rulesetFd < 0) {
        int err = errno;
        return std::unexpected(GuardError{
            "filesystem",
            std::string("landlock_create_ruleset failed: ") + std::strerror(err),
            err});
    }

    GuardError error;
    for (const auto& path : readWrite) {
        if (!addPathRule(rulesetFd, path, handled, handled, error)) {
            ::close(rulesetFd);
            return std::unexpected(error);
        }
    }
    for (const auto& path : readOnly) {
        if (!addPathRule(rulesetFd, path, ACCESS_READ_ONLY, handled, error)) {
            ::close(rulesetFd);
            return std::unexpected(error);
        }
    }

    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        int err = errno;
        ::close(rulesetFd);
        return std::unexpected(GuardError{
            "filesystem",
            std::string("PR_SET_NO_NEW_PRIVS failed: ") + std::strerror(err),
            err});
    }
    if (restrictSelf(rulesetFd) != 0) {
        int err = errno;
        ::close(rulesetFd);
        return std::unexpected(GuardError{
            "filesystem",
            std::string("landlock_restrict_self failed: ") + std::strerror(err),
            err});
    }
    ::close(rulesetFd);

    spdlog::debug("Filesystem gate installed (Landlock ABI {}, {} rw, {} ro)",
                  abi, readWrite.size(), readOnly.size());
    return abi;
}

#else  // __linux__

int landlockAbiVersion() noexcept { return 0; }

std::expected<int, GuardError> installFilesystemGate(
    const std::vector<std::string>&, const std::vector<std::string>&) {
    return std::unexpected(
        GuardError{"filesystem", "Landlock requires Linux", ENOSYS});
}

#endif  // __linux__

}  // namespace lockbox::sandbox::guards
