/*
 * deadline_timer.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "guards.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <sys/time.h>
#include <sys/wait.h>

namespace lockbox::sandbox::guards {

DeadlineTimer::~DeadlineTimer() { disarm(); }

GuardResult DeadlineTimer::arm(std::chrono::milliseconds timeout) {
    if (armed_) {
        disarm();
    }

    sigemptyset(&waitSet_);
    sigaddset(&waitSet_, SIGALRM);
    sigaddset(&waitSet_, SIGCHLD);
    if (sigprocmask(SIG_BLOCK, &waitSet_, &originalMask_) != 0) {
        int err = errno;
        return std::unexpected(GuardError{
            "deadline",
            std::string("sigprocmask failed: ") + std::strerror(err), err});
    }

    struct itimerval timer {};
    const auto ms = timeout.count() > 0 ? timeout.count() : 1;
    timer.it_value.tv_sec = static_cast<time_t>(ms / 1000);
    timer.it_value.tv_usec = static_cast<suseconds_t>((ms % 1000) * 1000);
    if (setitimer(ITIMER_REAL, &timer, nullptr) != 0) {
        int err = errno;
        sigprocmask(SIG_SETMASK, &originalMask_, nullptr);
        return std::unexpected(GuardError{
            "deadline", std::string("setitimer failed: ") + std::strerror(err),
            err});
    }

    armed_ = true;
    spdlog::debug("Deadline armed at {} ms", ms);
    return {};
}

void DeadlineTimer::disarm() noexcept {
    if (!armed_) {
        return;
    }
    struct itimerval off {};
    setitimer(ITIMER_REAL, &off, nullptr);

    // Drop a SIGALRM that fired but was never consumed
    struct timespec zero {};
    sigset_t alarmOnly;
    sigemptyset(&alarmOnly);
    sigaddset(&alarmOnly, SIGALRM);
    while (sigtimedwait(&alarmOnly, nullptr, &zero) == SIGALRM) {
    }

    sigprocmask(SIG_SETMASK, &originalMask_, nullptr);
    armed_ = false;
}

int DeadlineTimer::waitForChild(pid_t pid) {
    // A lost SIGCHLD only delays the next poll of waitpid
    constexpr long POLL_NS = 100L * 1000 * 1000;

    for (;;) {
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return status;
        }
        if (r < 0 && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }

        struct timespec timeout {};
        timeout.tv_nsec = POLL_NS;
        siginfo_t info;
        int sig = sigtimedwait(&waitSet_, &info, &timeout);
        if (sig == SIGALRM) {
            throw DeadlineExceeded();
        }
        if (sig < 0 && errno != EAGAIN && errno != EINTR) {
            throw std::system_error(errno, std::generic_category(),
                                    "sigtimedwait");
        }
    }
}

}  // namespace lockbox::sandbox::guards
