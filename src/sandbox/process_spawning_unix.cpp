/*
 * process_spawning_unix.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lockbox::sandbox {

namespace {

// Child-side descriptors are parked above this before being moved to 0..3
constexpr int PARK_FD = 10;

struct PipePair {
    int read{-1};
    int write{-1};
};

bool makePipe(PipePair& pipe) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    pipe.read = fds[0];
    pipe.write = fds[1];
    return true;
}

void closePipe(PipePair& pipe) {
    ProcessSpawner::closeFd(pipe.read);
    ProcessSpawner::closeFd(pipe.write);
}

[[noreturn]] void childFail(int errorFd) {
    int err = errno;
    ssize_t ignored = ::write(errorFd, &err, sizeof(err));
    (void)ignored;
    _exit(ExitCodes::CANNOT_EXECUTE);
}

}  // namespace

Result<SpawnedProcess> ProcessSpawner::spawn(const SpawnRequest& request) {
    // Everything the child touches is prepared before fork
    std::vector<std::string> args;
    args.push_back(request.executable.string());
    args.insert(args.end(), request.arguments.begin(), request.arguments.end());
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env = request.environment;
    std::vector<char*> envp;
    for (auto& entry : env) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    const std::string workingDir = request.workingDirectory.string();
    long openMax = sysconf(_SC_OPEN_MAX);
    const int maxFd =
        static_cast<int>(std::clamp<long>(openMax, 256, 65536));

    PipePair out, err, report, exec;
    if (!makePipe(out) || !makePipe(err) || !makePipe(report) ||
        !makePipe(exec)) {
        spdlog::error("Failed to create pipes: {}", std::strerror(errno));
        closePipe(out);
        closePipe(err);
        closePipe(report);
        closePipe(exec);
        return std::unexpected(SandboxError::PipeCreationFailed);
    }

    int devNull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devNull < 0) {
        spdlog::error("Failed to open /dev/null: {}", std::strerror(errno));
        closePipe(out);
        closePipe(err);
        closePipe(report);
        closePipe(exec);
        return std::unexpected(SandboxError::PipeCreationFailed);
    }

    pid_t pid = fork();
    if (pid < 0) {
        spdlog::error("Fork failed: {}", std::strerror(errno));
        closeFd(devNull);
        closePipe(out);
        closePipe(err);
        closePipe(report);
        closePipe(exec);
        return std::unexpected(SandboxError::ProcessSpawnFailed);
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int errorFd = fcntl(exec.write, F_DUPFD_CLOEXEC, PARK_FD);
        int inFd = fcntl(devNull, F_DUPFD_CLOEXEC, PARK_FD);
        int outFd = fcntl(out.write, F_DUPFD_CLOEXEC, PARK_FD);
        int errFd = fcntl(err.write, F_DUPFD_CLOEXEC, PARK_FD);
        int repFd = fcntl(report.write, F_DUPFD_CLOEXEC, PARK_FD);
        if (errorFd < 0 || inFd < 0 || outFd < 0 || errFd < 0 || repFd < 0) {
            childFail(errorFd < 0 ? exec.write : errorFd);
        }

        if (dup2(inFd, STDIN_FILENO) < 0 || dup2(outFd, STDOUT_FILENO) < 0 ||
            dup2(errFd, STDERR_FILENO) < 0 || dup2(repFd, REPORT_FD) < 0) {
            childFail(errorFd);
        }

        for (int fd = REPORT_FD + 1; fd < maxFd; ++fd) {
            if (fd != errorFd) {
                ::close(fd);
            }
        }

        if (chdir(workingDir.c_str()) != 0) {
            childFail(errorFd);
        }

        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        execve(argv[0], argv.data(), envp.data());
        childFail(errorFd);
    }

    // Parent process
    setpgid(pid, pid);
    closeFd(devNull);
    closeFd(out.write);
    closeFd(err.write);
    closeFd(report.write);
    closeFd(exec.write);

    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(exec.read, &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(exec.read);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        spdlog::error("Cannot execute {}: {}", request.executable.string(),
                      std::strerror(childErrno));
        int status = 0;
        waitpid(pid, &status, 0);
        closeFd(out.read);
        closeFd(err.read);
        closeFd(report.read);
        return std::unexpected(SandboxError::ProcessSpawnFailed);
    }

    spdlog::debug("Spawned {} with PID {}", request.executable.string(), pid);
    return SpawnedProcess{pid, out.read, err.read, report.read};
}

void ProcessSpawner::killGroup(pid_t pgid) noexcept {
    if (pgid <= 0) {
        return;
    }
    ::kill(-pgid, SIGKILL);
    ::kill(pgid, SIGKILL);
}

Result<ReapedProcess> ProcessSpawner::reap(pid_t pid,
                                           std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool killed = false;

    for (;;) {
        int status = 0;
        struct rusage usage {};
        pid_t result = wait4(pid, &status, WNOHANG, &usage);
        if (result == pid) {
            ReapedProcess reaped;
            reaped.status = status;
            auto cpuUs =
                (usage.ru_utime.tv_sec + usage.ru_stime.tv_sec) * 1000000L +
                usage.ru_utime.tv_usec + usage.ru_stime.tv_usec;
            reaped.cpuTime = std::chrono::milliseconds(cpuUs / 1000);
            reaped.peakRssKb = static_cast<size_t>(usage.ru_maxrss);
            return reaped;
        }
        if (result < 0 && errno != EINTR) {
            spdlog::error("wait4({}) failed: {}", pid, std::strerror(errno));
            return std::unexpected(SandboxError::ProcessWaitFailed);
        }

        if (!killed && std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("Process {} did not exit in time, killing it", pid);
            killGroup(pid);
            killed = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ProcessSpawner::closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

}  // namespace lockbox::sandbox
