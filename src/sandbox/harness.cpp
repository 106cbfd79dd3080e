/*
 * harness.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "harness.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace lockbox::sandbox {

Harness::Harness(HarnessConfig config, std::filesystem::path configPath,
                 int reportFd)
    : config_(std::move(config)),
      configPath_(std::move(configPath)),
      reportFd_(reportFd) {}

int Harness::run() {
    GuardReport installed;
    if (!installGuards(installed)) {
        return ExitCodes::SETUP_FAILED;
    }
    report(ipc::ReportType::GuardsInstalled, ipc::guardReportToJson(installed));

    int errorPipe[2];
    if (pipe2(errorPipe, O_CLOEXEC) != 0) {
        return setupFailed("spawn", "pipe2 failed", errno);
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        ::close(errorPipe[0]);
        ::close(errorPipe[1]);
        return setupFailed("spawn", "fork failed", err);
    }
    if (pid == 0) {
        ::close(errorPipe[0]);
        execChild(errorPipe[1]);
    }

    // Keep the interpreter out of the harness group as soon as possible
    setpgid(pid, pid);
    ::close(errorPipe[1]);

    int execError = 0;
    ssize_t n;
    do {
        n = ::read(errorPipe[0], &execError, sizeof(execError));
    } while (n < 0 && errno == EINTR);
    ::close(errorPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(execError))) {
        int status = 0;
        waitpid(pid, &status, 0);
        deadline_.disarm();
        if (execError < 0) {
            return setupFailed("process-group",
                               std::string("cannot lock process group: ") +
                                   std::strerror(-execError),
                               -execError);
        }
        int code = execError == ENOENT ? ExitCodes::NOT_FOUND
                                       : ExitCodes::CANNOT_EXECUTE;
        return setupFailed("exec",
                           "cannot execute " + config_.interpreter + ": " +
                               std::strerror(execError),
                           execError, code);
    }

    report(ipc::ReportType::ChildSpawned, {{"pid", pid}});
    spdlog::debug("Interpreter started with pid {}", pid);
    return superviseChild(pid);
}

int Harness::mapChildStatus(int status) noexcept {
    if (WIFSIGNALED(status)) {
        return WTERMSIG(status) == SIGXCPU ? ExitCodes::TIMEOUT
                                           : ExitCodes::FAILURE;
    }
    if (!WIFEXITED(status)) {
        return ExitCodes::FAILURE;
    }
    int code = WEXITSTATUS(status);
    if (code > ExitCodes::TIMEOUT && code <= ExitCodes::NOT_FOUND) {
        return ExitCodes::FAILURE;
    }
    return code;
}

int Harness::setupFailed(const std::string& stage, const std::string& message,
                         int error, int exitCode) {
    spdlog::error("Sandbox setup failed at {}: {}", stage, message);
    report(ipc::ReportType::SetupFailed,
           {{"stage", stage}, {"message", message}, {"errno", error}});
    return exitCode;
}

bool Harness::installGuards(GuardReport& installed) {
    installed.degraded = false;

    if (auto r = guards::applyResourceLimits(config_); !r) {
        setupFailed(r.error().stage, r.error().message, r.error().error);
        return false;
    }
    installed.rlimits = true;
    installed.addressSpaceMb = config_.addressSpaceBytes() / (1024 * 1024);

    if (auto r = deadline_.arm(std::chrono::milliseconds(config_.deadlineMs()));
        !r) {
        setupFailed(r.error().stage, r.error().message, r.error().error);
        return false;
    }
    installed.deadline = true;

    if (auto r = guards::installNetworkGate(); r) {
        installed.network = "seccomp";
        lockGroup_ = true;
    } else if (config_.requireKernelIsolation) {
        setupFailed(r.error().stage, r.error().message, r.error().error);
        return false;
    } else {
        spdlog::warn("Network gate unavailable, continuing degraded: {}",
                     r.error().message);
        installed.network = "unavailable";
        installed.degraded = true;
    }

    if (auto abi = guards::installFilesystemGate(config_.fsAllowlist,
                                                 config_.runtimeReadOnly);
        abi) {
        installed.filesystem = "landlock";
        installed.landlockAbi = *abi;
    } else if (config_.requireKernelIsolation) {
        setupFailed(abi.error().stage, abi.error().message, abi.error().error);
        return false;
    } else {
        spdlog::warn("Filesystem gate unavailable, continuing degraded: {}",
                     abi.error().message);
        installed.filesystem = "unavailable";
        installed.degraded = true;
    }

    installed.received = true;
    return true;
}

std::vector<std::string> Harness::buildArgv() const {
    std::vector<std::string> argv;
    argv.push_back(config_.interpreter);
    argv.insert(argv.end(), config_.interpreterArgs.begin(),
                config_.interpreterArgs.end());
    argv.push_back(config_.guardScript);
    argv.push_back(configPath_.string());
    return argv;
}

void Harness::execChild(int errorFd) {
    // Only async-signal-safe calls from here on, apart from building argv
    auto args = buildArgv();
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

#ifdef __linux__
    prctl(PR_SET_PDEATHSIG, SIGKILL, 0, 0, 0);
#endif
    setpgid(0, 0);
    if (lockGroup_) {
        if (int err = guards::lockProcessGroup(); err != 0) {
            // Negative marks a setup failure rather than an exec failure
            int marker = -err;
            ssize_t ignored = ::write(errorFd, &marker, sizeof(marker));
            (void)ignored;
            _exit(ExitCodes::SETUP_FAILED);
        }
    }
    sigprocmask(SIG_SETMASK, &deadline_.originalMask(), nullptr);

    struct rlimit nofile {};
    int maxFd = 1024;
    if (getrlimit(RLIMIT_NOFILE, &nofile) == 0 &&
        nofile.rlim_cur != RLIM_INFINITY) {
        maxFd = static_cast<int>(nofile.rlim_cur);
    }
    for (int fd = 3; fd < maxFd; ++fd) {
        if (fd != errorFd) {
            ::close(fd);
        }
    }

    execv(argv[0], argv.data());

    int err = errno;
    ssize_t ignored = ::write(errorFd, &err, sizeof(err));
    (void)ignored;
    _exit(err == ENOENT ? ExitCodes::NOT_FOUND : ExitCodes::CANNOT_EXECUTE);
}

int Harness::superviseChild(pid_t pid) {
    int status = 0;
    try {
        status = deadline_.waitForChild(pid);
    } catch (const guards::DeadlineExceeded&) {
        spdlog::debug("Deadline reached, killing interpreter {}", pid);
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        deadline_.disarm();
        report(ipc::ReportType::ChildExited,
               {{"exitCode", ExitCodes::TIMEOUT},
                {"signal", SIGKILL},
                {"deadline", true}});
        return ExitCodes::TIMEOUT;
    } catch (const std::system_error& e) {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
        waitpid(pid, &status, 0);
        deadline_.disarm();
        return setupFailed("wait", e.what(), e.code().value());
    }
    deadline_.disarm();

    // Anything left in the interpreter's group dies with it
    kill(-pid, SIGKILL);

    int code = mapChildStatus(status);
    ipc::json payload = {{"exitCode", code}, {"deadline", false}};
    if (WIFSIGNALED(status)) {
        payload["signal"] = WTERMSIG(status);
    }
    report(ipc::ReportType::ChildExited, payload);
    return code;
}

void Harness::report(ipc::ReportType type, const ipc::json& payload) {
    if (reportFd_ < 0) {
        return;
    }
    if (!ipc::writeReport(reportFd_, type, payload, sequence_++)) {
        spdlog::warn("Cannot write {} report: {}", ipc::reportTypeToString(type),
                     std::strerror(errno));
    }
}

}  // namespace lockbox::sandbox
