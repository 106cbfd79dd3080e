/*
 * supervisor.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include "supervisor.hpp"
#include "ipc/report_message.hpp"
#include "process_spawning.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <map>
#include <span>

#include <poll.h>
#include <signal.h>
#include <sys/eventfd.h>
#include <sys/wait.h>
#include <unistd.h>

namespace lockbox::sandbox {

namespace {

constexpr size_t READ_CHUNK = 64 * 1024;
constexpr std::chrono::milliseconds DRAIN_AFTER_KILL{500};
constexpr std::chrono::milliseconds REAP_TIMEOUT{2000};
constexpr std::chrono::milliseconds CANCEL_POLL_SLICE{100};

class RunningFlag {
public:
    explicit RunningFlag(std::atomic<bool>& flag) : flag_(flag) {
        flag_.store(true, std::memory_order_release);
    }
    ~RunningFlag() { flag_.store(false, std::memory_order_release); }

    RunningFlag(const RunningFlag&) = delete;
    RunningFlag& operator=(const RunningFlag&) = delete;

private:
    std::atomic<bool>& flag_;
};

/**
 * @brief Bounded capture of one output stream
 */
struct CapturedStream {
    int fd{-1};
    std::string* sink{nullptr};
    bool truncated{false};

    void append(const char* data, size_t size, size_t limit) {
        if (sink->size() >= limit) {
            truncated = truncated || size > 0;
            return;
        }
        size_t room = limit - sink->size();
        if (size > room) {
            sink->append(data, room);
            truncated = true;
        } else {
            sink->append(data, size);
        }
    }
};

int millisUntil(std::chrono::steady_clock::time_point when) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        when - std::chrono::steady_clock::now());
    return static_cast<int>(std::max<int64_t>(left.count(), 0) + 1);
}

}  // namespace

ProcessSupervisor::ProcessSupervisor(const config::SandboxConfig& config)
    : config_(config) {
    wakeFd_ = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wakeFd_ < 0) {
        spdlog::warn("eventfd unavailable ({}), cancellation will be polled",
                     std::strerror(errno));
    }
}

ProcessSupervisor::~ProcessSupervisor() { ProcessSpawner::closeFd(wakeFd_); }

std::chrono::milliseconds ProcessSupervisor::externalDeadline(
    const ExecutionPolicy& policy) const noexcept {
    return std::chrono::milliseconds(
        static_cast<int64_t>(policy.timeLimitSec) * 1000 + config_.graceMarginMs);
}

RawOutcome ProcessSupervisor::run(SandboxSession& session) {
    RawOutcome outcome;
    RunningFlag running(running_);
    const auto start = std::chrono::steady_clock::now();

    if (auto r = session.transition(SessionState::Running); !r) {
        outcome.supervisorFailure = "session " + session.id() + " is not ready";
        return outcome;
    }

    auto finish = [&](SessionState state) {
        outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (auto r = session.transition(state); !r) {
            spdlog::warn("Session {}: cannot record final state {}",
                         session.id(), sessionStateToString(state));
        }
        return outcome;
    };

    if (cancelRequested_.load()) {
        outcome.cancelled = true;
        return finish(SessionState::Failed);
    }

    const auto& files = session.files();
    SpawnRequest request;
    request.executable = files.harnessEntry;
    request.arguments = {"--config", files.configPath.string(), "--report-fd",
                         std::to_string(ProcessSpawner::REPORT_FD)};
    request.workingDirectory = session.workingDir();
    request.environment = buildEnvironment(config_, session.workingDir());

    auto spawned = ProcessSpawner::spawn(request);
    if (!spawned) {
        outcome.supervisorFailure =
            std::string(sandboxErrorToString(spawned.error())) + ": " +
            files.harnessEntry.string();
        return finish(SessionState::Failed);
    }
    outcome.spawned = true;

    const auto deadline = start + externalDeadline(session.policy());
    superviseOutput(spawned->stdoutFd, spawned->stderrFd, spawned->reportFd,
                    spawned->pid, deadline, outcome);

    auto reaped = ProcessSpawner::reap(spawned->pid, REAP_TIMEOUT);
    if (outcome.childPid) {
        // Nothing from the interpreter group may outlive the session
        ::kill(-*outcome.childPid, SIGKILL);
    }

    if (!reaped) {
        outcome.supervisorFailure =
            std::string(sandboxErrorToString(reaped.error()));
        return finish(SessionState::Failed);
    }

    if (WIFEXITED(reaped->status)) {
        outcome.exitCode = WEXITSTATUS(reaped->status);
    } else if (WIFSIGNALED(reaped->status)) {
        outcome.termSignal = WTERMSIG(reaped->status);
    }
    outcome.cpuTime = reaped->cpuTime;
    outcome.peakRssKb = reaped->peakRssKb;

    spdlog::debug("Session {}: harness exit={} signal={} timedOut={} "
                  "cancelled={} cpu={}ms rss={}KiB",
                  session.id(), outcome.exitCode.value_or(-1),
                  outcome.termSignal.value_or(0), outcome.timedOut,
                  outcome.cancelled, outcome.cpuTime.count(), outcome.peakRssKb);

    if (outcome.cancelled) {
        return finish(SessionState::Failed);
    }
    if (outcome.timedOut || outcome.harnessDeadline ||
        outcome.exitCode == ExitCodes::TIMEOUT ||
        outcome.termSignal == SIGXCPU) {
        return finish(SessionState::TimedOut);
    }
    return finish(SessionState::Completed);
}

void ProcessSupervisor::superviseOutput(
    int stdoutFd, int stderrFd, int reportFd, pid_t harnessPid,
    std::chrono::steady_clock::time_point deadline, RawOutcome& outcome) {
    CapturedStream out{stdoutFd, &outcome.stdoutData};
    CapturedStream err{stderrFd, &outcome.stderrData};
    ipc::ReportDecoder decoder;
    std::array<char, READ_CHUNK> buffer{};

    bool killed = false;
    auto drainDeadline = deadline;

    auto stop = [&](bool timedOut) {
        if (timedOut) {
            outcome.timedOut = true;
        } else {
            outcome.cancelled = true;
        }
        killAll(harnessPid, outcome);
        killed = true;
        drainDeadline = std::chrono::steady_clock::now() + DRAIN_AFTER_KILL;
    };

    while (out.fd >= 0 || err.fd >= 0 || reportFd >= 0) {
        if (!killed) {
            if (cancelRequested_.load()) {
                stop(false);
            } else if (std::chrono::steady_clock::now() >= deadline) {
                spdlog::info("External deadline reached, killing harness {}",
                             harnessPid);
                stop(true);
            }
        } else if (std::chrono::steady_clock::now() >= drainDeadline) {
            break;
        }

        int timeout = millisUntil(killed ? drainDeadline : deadline);
        if (wakeFd_ < 0 && !killed) {
            timeout = std::min<int>(
                timeout, static_cast<int>(CANCEL_POLL_SLICE.count()));
        }

        std::array<pollfd, 4> fds{};
        nfds_t count = 0;
        for (int fd : {out.fd, err.fd, reportFd}) {
            if (fd >= 0) {
                fds[count++] = pollfd{fd, POLLIN, 0};
            }
        }
        if (wakeFd_ >= 0 && !killed) {
            fds[count++] = pollfd{wakeFd_, POLLIN, 0};
        }

        int ready = poll(fds.data(), count, timeout);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed: {}", std::strerror(errno));
            outcome.supervisorFailure = "poll failed";
            killAll(harnessPid, outcome);
            break;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) {
                continue;
            }
            int fd = fds[i].fd;
            if (fd == wakeFd_) {
                uint64_t value = 0;
                if (::read(wakeFd_, &value, sizeof(value)) < 0 &&
                    errno != EAGAIN) {
                    spdlog::debug("Wake-up read failed: {}",
                                  std::strerror(errno));
                }
                continue;
            }

            ssize_t n = ::read(fd, buffer.data(), buffer.size());
            if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
                continue;
            }
            if (n <= 0) {
                if (fd == out.fd) {
                    ProcessSpawner::closeFd(out.fd);
                } else if (fd == err.fd) {
                    ProcessSpawner::closeFd(err.fd);
                } else {
                    ProcessSpawner::closeFd(reportFd);
                }
                continue;
            }

            if (fd == out.fd) {
                out.append(buffer.data(), static_cast<size_t>(n),
                           config_.maxOutputBytes);
            } else if (fd == err.fd) {
                err.append(buffer.data(), static_cast<size_t>(n),
                           config_.maxOutputBytes);
            } else if (!decoder.failed()) {
                auto messages = decoder.feed(std::span<const uint8_t>(
                    reinterpret_cast<const uint8_t*>(buffer.data()),
                    static_cast<size_t>(n)));
                if (!messages) {
                    spdlog::warn("Discarding corrupt report stream from {}",
                                 harnessPid);
                    continue;
                }
                for (const auto& message : *messages) {
                    spdlog::trace("Report {} from harness {}",
                                  ipc::reportTypeToString(message.header.type),
                                  harnessPid);
                    ipc::applyReport(message, outcome);
                }
            }
        }
    }

    ProcessSpawner::closeFd(out.fd);
    ProcessSpawner::closeFd(err.fd);
    ProcessSpawner::closeFd(reportFd);

    if (out.truncated) {
        outcome.stdoutData += TRUNCATION_MARKER;
    }
    if (err.truncated) {
        outcome.stderrData += TRUNCATION_MARKER;
    }
}

void ProcessSupervisor::killAll(pid_t harnessPid,
                                const RawOutcome& outcome) noexcept {
    ProcessSpawner::killGroup(harnessPid);
    if (outcome.childPid) {
        ProcessSpawner::killGroup(*outcome.childPid);
    }
}

void ProcessSupervisor::cancel() noexcept {
    cancelRequested_.store(true);
    if (wakeFd_ >= 0) {
        uint64_t one = 1;
        if (::write(wakeFd_, &one, sizeof(one)) < 0) {
            spdlog::debug("Cancel wake-up not delivered: {}",
                          std::strerror(errno));
        }
    }
}

void ProcessSupervisor::reset() noexcept {
    cancelRequested_.store(false);
    if (wakeFd_ >= 0) {
        uint64_t value = 0;
        while (::read(wakeFd_, &value, sizeof(value)) > 0) {
        }
    }
}

std::vector<std::string> ProcessSupervisor::buildEnvironment(
    const config::SandboxConfig& config,
    const std::filesystem::path& workingDir) {
    std::map<std::string, std::string> env = {
        {"PATH", "/usr/local/bin:/usr/bin:/bin"},
        {"HOME", workingDir.string()},
        {"TMPDIR", workingDir.string()},
        {"LANG", "C.UTF-8"},
        {"PYTHONUNBUFFERED", "1"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONSAFEPATH", "1"},
        {"PYTHONNOUSERSITE", "1"},
        {"PYTHONWARNINGS", "ignore"},
        {"PYTHONIOENCODING", "utf-8"},
        {"NO_PROXY", "*"},
        {"no_proxy", "*"},
        {"http_proxy", ""},
        {"https_proxy", ""},
        {"HTTP_PROXY", ""},
        {"HTTPS_PROXY", ""},
        {"ALL_PROXY", ""},
    };
    for (const auto& [key, value] : config.extraEnvironment) {
        if (!key.empty() && key.find('=') == std::string::npos) {
            env[key] = value;
        }
    }

    std::vector<std::string> result;
    result.reserve(env.size());
    for (const auto& [key, value] : env) {
        result.push_back(key + "=" + value);
    }
    return result;
}

}  // namespace lockbox::sandbox
