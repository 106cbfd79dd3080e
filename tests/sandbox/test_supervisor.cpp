/*
 * test_supervisor.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

#include <gtest/gtest.h>
#include "sandbox/process_spawning.hpp"
#include "sandbox/supervisor.hpp"

#include <algorithm>
#include <cstdlib>

#include <sys/wait.h>
#include <unistd.h>

using namespace lockbox::sandbox;

namespace {

bool hasEntry(const std::vector<std::string>& env, const std::string& entry) {
    return std::find(env.begin(), env.end(), entry) != env.end();
}

bool hasKey(const std::vector<std::string>& env, const std::string& key) {
    return std::any_of(env.begin(), env.end(), [&](const std::string& e) {
        return e.rfind(key + "=", 0) == 0;
    });
}

}  // namespace

// =============================================================================
// Environment
// =============================================================================

TEST(SupervisorEnvironmentTest, BuiltFromScratch) {
    setenv("LOCKBOX_TEST_SECRET", "hunter2", 1);
    lockbox::config::SandboxConfig config;
    auto env = ProcessSupervisor::buildEnvironment(config, "/tmp/session");
    unsetenv("LOCKBOX_TEST_SECRET");

    EXPECT_FALSE(hasKey(env, "LOCKBOX_TEST_SECRET"));
    EXPECT_TRUE(hasEntry(env, "HOME=/tmp/session"));
    EXPECT_TRUE(hasEntry(env, "LANG=C.UTF-8"));
    EXPECT_TRUE(hasEntry(env, "PYTHONUNBUFFERED=1"));
    EXPECT_TRUE(hasEntry(env, "PYTHONDONTWRITEBYTECODE=1"));
    EXPECT_TRUE(hasEntry(env, "PYTHONSAFEPATH=1"));
    EXPECT_TRUE(hasEntry(env, "PYTHONNOUSERSITE=1"));
    EXPECT_TRUE(hasEntry(env, "PYTHONWARNINGS=ignore"));
    EXPECT_TRUE(hasEntry(env, "NO_PROXY=*"));
    EXPECT_TRUE(hasEntry(env, "no_proxy=*"));
    EXPECT_TRUE(hasEntry(env, "http_proxy="));
    EXPECT_TRUE(hasEntry(env, "HTTPS_PROXY="));
    EXPECT_TRUE(hasKey(env, "PATH"));
}

TEST(SupervisorEnvironmentTest, ExtraEnvironmentAppended) {
    lockbox::config::SandboxConfig config;
    config.extraEnvironment = {{"MPLBACKEND", "Agg"}, {"BAD=KEY", "x"}};
    auto env = ProcessSupervisor::buildEnvironment(config, "/tmp/session");
    EXPECT_TRUE(hasEntry(env, "MPLBACKEND=Agg"));
    EXPECT_FALSE(hasKey(env, "BAD"));
}

TEST(SupervisorDeadlineTest, GraceMarginAddedToTimeLimit) {
    lockbox::config::SandboxConfig config;
    config.graceMarginMs = 1000;
    ProcessSupervisor supervisor(config);
    ExecutionPolicy policy;
    policy.timeLimitSec = 3;
    EXPECT_EQ(supervisor.externalDeadline(policy).count(), 4000);
    EXPECT_FALSE(supervisor.isRunning());
}

// =============================================================================
// Spawner
// =============================================================================

TEST(ProcessSpawnerTest, CapturesOutputAndReaps) {
    SpawnRequest request;
    request.executable = "/bin/sh";
    request.arguments = {"-c", "printf out; printf err >&2; exit 7"};
    request.workingDirectory = "/";
    request.environment = {"PATH=/usr/bin:/bin"};

    auto spawned = ProcessSpawner::spawn(request);
    ASSERT_TRUE(spawned.has_value());

    auto readAll = [](int fd) {
        std::string data;
        char buffer[256];
        ssize_t n;
        while ((n = ::read(fd, buffer, sizeof(buffer))) > 0) {
            data.append(buffer, static_cast<size_t>(n));
        }
        return data;
    };
    EXPECT_EQ(readAll(spawned->stdoutFd), "out");
    EXPECT_EQ(readAll(spawned->stderrFd), "err");

    auto reaped = ProcessSpawner::reap(spawned->pid, std::chrono::seconds(5));
    ASSERT_TRUE(reaped.has_value());
    EXPECT_TRUE(WIFEXITED(reaped->status));
    EXPECT_EQ(WEXITSTATUS(reaped->status), 7);

    ProcessSpawner::closeFd(spawned->stdoutFd);
    ProcessSpawner::closeFd(spawned->stderrFd);
    ProcessSpawner::closeFd(spawned->reportFd);
    EXPECT_EQ(spawned->stdoutFd, -1);
}

TEST(ProcessSpawnerTest, MissingExecutableFails) {
    SpawnRequest request;
    request.executable = "/nonexistent/lockbox-harness";
    request.workingDirectory = "/";
    auto spawned = ProcessSpawner::spawn(request);
    ASSERT_FALSE(spawned.has_value());
    EXPECT_EQ(spawned.error(), SandboxError::ProcessSpawnFailed);
}

TEST(ProcessSpawnerTest, ReapKillsOverdueProcess) {
    SpawnRequest request;
    request.executable = "/bin/sh";
    request.arguments = {"-c", "sleep 30"};
    request.workingDirectory = "/";
    request.environment = {"PATH=/usr/bin:/bin"};

    auto spawned = ProcessSpawner::spawn(request);
    ASSERT_TRUE(spawned.has_value());
    auto reaped =
        ProcessSpawner::reap(spawned->pid, std::chrono::milliseconds(100));
    ASSERT_TRUE(reaped.has_value());
    EXPECT_TRUE(WIFSIGNALED(reaped->status));

    ProcessSpawner::closeFd(spawned->stdoutFd);
    ProcessSpawner::closeFd(spawned->stderrFd);
    ProcessSpawner::closeFd(spawned->reportFd);
}
