/*
 * network_gate.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "guards.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <new>

#ifdef __linux__
#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
#endif

namespace lockbox::sandbox::guards {

#ifdef __linux__

namespace {

#if defined(__x86_64__)
constexpr uint32_t NATIVE_ARCH = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
constexpr uint32_t NATIVE_ARCH = AUDIT_ARCH_AARCH64;
#elif defined(__i386__)
constexpr uint32_t NATIVE_ARCH = AUDIT_ARCH_I386;
#elif defined(__riscv) && __riscv_xlen == 64
constexpr uint32_t NATIVE_ARCH = AUDIT_ARCH_RISCV64;
#else
#define LOCKBOX_NO_SECCOMP_ARCH
#endif

#ifndef LOCKBOX_NO_SECCOMP_ARCH

void denySyscall(std::vector<sock_filter>& program, uint32_t nr, int error) {
    program.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, nr, 0, 1));
    program.push_back(BPF_STMT(
        BPF_RET | BPF_K,
        SECCOMP_RET_ERRNO | (static_cast<uint32_t>(error) & SECCOMP_RET_DATA)));
}

void checkArchitecture(std::vector<sock_filter>& program) {

    program.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS,
                               offsetof(struct seccomp_data, arch)));
    program.push_back(BPF_JUMP(BPF_JMP | BPF_JEQ | BPF_K, NATIVE_ARCH, 1, 0));
    program.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));

    program.push_back(BPF_STMT(BPF_LD | BPF_W | BPF_ABS,
                               offsetof(struct seccomp_data, nr)));
#if defined(__x86_64__)
    // x32 syscalls share the x86_64 audit arch
    program.push_back(BPF_JUMP(BPF_JMP | BPF_JGE | BPF_K, 0x40000000, 0, 1));
    program.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
#endif
}

std::vector<sock_filter> buildNetworkProgram() {
    std::vector<sock_filter> program;
    checkArchitecture(program);
    denySyscall(program, __NR_socket, EACCES);
#ifdef __NR_socketcall
    denySyscall(program, __NR_socketcall, EACCES);
#endif
#ifdef __NR_io_uring_setup
    denySyscall(program, __NR_io_uring_setup, EACCES);
#endif
    program.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    return program;
}

std::vector<sock_filter> buildGroupLockProgram() {
    std::vector<sock_filter> program;
    checkArchitecture(program);
    denySyscall(program, __NR_setsid, EPERM);
    denySyscall(program, __NR_setpgid, EPERM);
    program.push_back(BPF_STMT(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    return program;
}

int loadProgram(std::vector<sock_filter>& program) {
    struct sock_fprog prog {};
    prog.len = static_cast<unsigned short>(program.size());
    prog.filter = program.data();
    return prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0);
}

#endif  // LOCKBOX_NO_SECCOMP_ARCH

}  // namespace

GuardResult installNetworkGate() {
#ifdef LOCKBOX_NO_SECCOMP_ARCH
    return std::unexpected(GuardError{
        "network", "seccomp filter not available for this architecture",
        ENOSYS});
#else
    if (prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        int err = errno;
        return std::unexpected(GuardError{
            "network",
            std::string("PR_SET_NO_NEW_PRIVS failed: ") + std::strerror(err),
            err});
    }

    auto program = buildNetworkProgram();
    if (loadProgram(program) != 0) {
        int err = errno;
        return std::unexpected(GuardError{
            "network",
            std::string("seccomp filter rejected: ") + std::strerror(err),
            err});
    }

    spdlog::debug("Network gate installed ({} instructions)", program.size());
    return {};
#endif
}

int lockProcessGroup() noexcept {
#ifdef LOCKBOX_NO_SECCOMP_ARCH
    return ENOSYS;
#else
    // Relies on PR_SET_NO_NEW_PRIVS from installNetworkGate()
    try {
        auto program = buildGroupLockProgram();
        return loadProgram(program) == 0 ? 0 : errno;
    } catch (const std::bad_alloc&) {
        return ENOMEM;
    }
#endif
}

#else  // __linux__

GuardResult installNetworkGate() {
    return std::unexpected(
        GuardError{"network", "seccomp requires Linux", ENOSYS});
}

int lockProcessGroup() noexcept { return ENOSYS; }

#endif  // __linux__

}  // namespace lockbox::sandbox::guards
