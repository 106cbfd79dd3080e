/*
 * test_runner.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

/**
 * @file test_runner.cpp
 * @brief End-to-end tests running real Python code through lockbox-harness
 */

#include <gtest/gtest.h>
#include "sandbox/config_discovery.hpp"
#include "sandbox/result_reporter.hpp"
#include "sandbox/runner.hpp"
#include "sandbox/supervisor.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace lockbox::sandbox;
namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

// Per test and process, so parallel ctest runs never share a directory
std::string uniqueName(const std::string& prefix) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    return prefix + "_" + info->name() + "_" + std::to_string(::getpid());
}

// Zombies count as gone; nobody may reap them inside a container
bool processAlive(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!std::getline(stat, line)) {
        return false;
    }
    auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size()) {
        return false;
    }
    char state = line[close + 2];
    return state != 'Z' && state != 'X';
}

}  // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class SandboxRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!ConfigDiscovery::findInterpreter("")) {
            GTEST_SKIP() << "No Python interpreter available";
        }
        if (!ConfigDiscovery::findHarness("") ||
            !ConfigDiscovery::findGuardScript("")) {
            GTEST_SKIP() << "lockbox-harness or guard prelude not built";
        }

        testDir_ =
            fs::temp_directory_path() / uniqueName("lockbox_runner_test");
        fs::remove_all(testDir_);
        fs::create_directories(testDir_ / "sessions");
        fs::create_directories(testDir_ / "shared");
        testDir_ = fs::canonical(testDir_);

        config_.tempRoot = (testDir_ / "sessions").string();
        runner_ = std::make_unique<SandboxRunner>(config_);
    }

    void TearDown() override {
        runner_.reset();
        if (!testDir_.empty()) {
            fs::remove_all(testDir_);
        }
    }

    ExecutionResult run(const std::string& code, RunOptions options = {}) {
        return runner_->runCode(code, options);
    }

    static RunOptions withTime(int64_t seconds) {
        RunOptions options;
        options.timeLimitSec = seconds;
        return options;
    }

    lockbox::config::SandboxConfig config_;
    std::unique_ptr<SandboxRunner> runner_;
    fs::path testDir_;
};

// =============================================================================
// Basic scenarios
// =============================================================================

TEST_F(SandboxRunnerTest, PrintSucceeds) {
    auto result = run("print('hello')\n");
    EXPECT_TRUE(result.succeeded()) << result.diagnostic << "\n" << result.stderrData;
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_NE(result.stdoutData.find("hello"), std::string::npos);
    EXPECT_FALSE(result.errorReason.has_value());
    EXPECT_TRUE(result.enforcement.received);
    EXPECT_TRUE(result.enforcement.rlimits);
    EXPECT_TRUE(result.enforcement.deadline);
}

TEST_F(SandboxRunnerTest, InfiniteLoopTimesOut) {
    auto result = run("while True:\n    pass\n", withTime(1));
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.errorReason, ErrorReason::Timeout);
    EXPECT_GE(result.elapsed.count(), 1000);
    EXPECT_LE(result.elapsed.count(), 2000);
}

TEST_F(SandboxRunnerTest, DeadlineHoldsWhenAlarmIsBlocked) {
    auto result = run(
        "import signal\n"
        "signal.pthread_sigmask(signal.SIG_BLOCK, [signal.SIGALRM])\n"
        "while True:\n"
        "    pass\n",
        withTime(1));
    EXPECT_EQ(result.errorReason, ErrorReason::Timeout);
    EXPECT_LE(result.elapsed.count(), 1000 + config_.graceMarginMs + 500);
}

TEST_F(SandboxRunnerTest, SleepingCodeTimesOut) {
    auto result = run("import time\ntime.sleep(30)\n", withTime(1));
    EXPECT_EQ(result.errorReason, ErrorReason::Timeout);
    EXPECT_LE(result.elapsed.count(), 1000 + config_.graceMarginMs + 500);
}

TEST_F(SandboxRunnerTest, ReadingOutsideAllowlistDenied) {
    auto result = run("print(open('/etc/passwd').read())\n");
    EXPECT_FALSE(result.succeeded());
    EXPECT_NE(result.exitCode, 0);
    EXPECT_EQ(result.errorReason, ErrorReason::Violation);
    EXPECT_TRUE(ResultReporter::looksLikeViolation(result.stderrData))
        << result.stderrData;
    EXPECT_EQ(result.stdoutData.find("root:"), std::string::npos);
}

TEST_F(SandboxRunnerTest, WritingOutsideAllowlistCreatesNothing) {
    auto target = testDir_ / "escape.txt";
    auto result = run("with open('" + target.string() +
                      "', 'w') as f:\n    f.write('x')\n");
    EXPECT_FALSE(result.succeeded());
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(SandboxRunnerTest, KernelGateBlocksRawFileAccess) {
    auto target = testDir_ / "raw_escape.txt";
    auto result = run("import _io\n_io.FileIO('" + target.string() +
                      "', 'w').write(b'x')\n");
    if (result.enforcement.filesystem != "landlock") {
        GTEST_SKIP() << "Landlock unavailable on this kernel";
    }
    EXPECT_FALSE(result.succeeded());
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(SandboxRunnerTest, AllowlistedDirectoryIsWritable) {
    auto shared = testDir_ / "shared";
    RunOptions options;
    options.fsAllowlist = std::vector<std::string>{shared.string()};
    auto result = run("with open('" + (shared / "out.txt").string() +
                          "', 'w') as f:\n    f.write('data')\n",
                      options);
    EXPECT_TRUE(result.succeeded()) << result.stderrData;
    EXPECT_TRUE(fs::exists(shared / "out.txt"));
}

TEST_F(SandboxRunnerTest, WorkingDirectoryIsWritableAndRemoved) {
    auto result = run(
        "with open('scratch.txt', 'w') as f:\n"
        "    f.write('tmp')\n"
        "print(open('scratch.txt').read())\n");
    EXPECT_TRUE(result.succeeded()) << result.stderrData;
    EXPECT_NE(result.stdoutData.find("tmp"), std::string::npos);
    EXPECT_TRUE(fs::is_empty(testDir_ / "sessions"));
}

TEST_F(SandboxRunnerTest, SocketCreationDenied) {
    auto result = run("import socket\ns = socket.socket()\n");
    EXPECT_FALSE(result.succeeded());
    EXPECT_NE(result.stderrData.find("Network access is disabled in sandbox"),
              std::string::npos)
        << result.stderrData;
}

TEST_F(SandboxRunnerTest, NetworkSentinelSeesNoConnection) {
    int listener = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
    ASSERT_GE(listener, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ASSERT_EQ(::bind(listener, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
    ASSERT_EQ(::listen(listener, 4), 0);
    socklen_t len = sizeof(addr);
    ASSERT_EQ(::getsockname(listener, reinterpret_cast<sockaddr*>(&addr), &len), 0);
    int port = ntohs(addr.sin_port);

    auto result = run(
        "import socket\n"
        "s = socket.create_connection(('127.0.0.1', " + std::to_string(port) +
        "), timeout=1)\n"
        "s.sendall(b'leak')\n");
    EXPECT_FALSE(result.succeeded());

    int accepted = ::accept(listener, nullptr, nullptr);
    EXPECT_LT(accepted, 0);
    if (accepted >= 0) {
        ::close(accepted);
    }
    ::close(listener);
}

TEST_F(SandboxRunnerTest, KernelGateBlocksRawSocket) {
    auto result = run("import _socket\n_socket.socket()\n");
    if (result.enforcement.network != "seccomp") {
        GTEST_SKIP() << "seccomp unavailable";
    }
    EXPECT_FALSE(result.succeeded());
    EXPECT_EQ(result.errorReason, ErrorReason::Violation);
}

TEST_F(SandboxRunnerTest, DescendantsCannotLeaveProcessGroup) {
    auto result = run(
        "import os, time\n"
        "pid = os.fork()\n"
        "if pid == 0:\n"
        "    for leave in (os.setsid, lambda: os.setpgid(0, 0)):\n"
        "        try:\n"
        "            leave()\n"
        "            print('escaped', flush=True)\n"
        "        except OSError:\n"
        "            print('denied', flush=True)\n"
        "    time.sleep(30)\n"
        "    os._exit(0)\n"
        "print('descendant', pid, flush=True)\n"
        "time.sleep(0.5)\n",
        withTime(5));
    if (result.enforcement.network != "seccomp") {
        GTEST_SKIP() << "seccomp unavailable";
    }
    EXPECT_EQ(result.stdoutData.find("escaped"), std::string::npos)
        << result.stdoutData;
    EXPECT_NE(result.stdoutData.find("denied"), std::string::npos)
        << result.stdoutData << result.stderrData;
    EXPECT_LT(result.elapsed.count(), 5000);

    auto marker = result.stdoutData.find("descendant ");
    ASSERT_NE(marker, std::string::npos) << result.stdoutData;
    pid_t descendant = std::stoi(result.stdoutData.substr(marker + 11));

    auto waitUntil = std::chrono::steady_clock::now() + 3s;
    while (processAlive(descendant) &&
           std::chrono::steady_clock::now() < waitUntil) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_FALSE(processAlive(descendant));
}

TEST_F(SandboxRunnerTest, HugeAllocationFails) {
    RunOptions options;
    options.memLimitMb = 16;
    auto result = run("x = bytearray(1024 * 1024 * 1024)\nprint(len(x))\n",
                      options);
    EXPECT_FALSE(result.succeeded());
    EXPECT_NE(result.exitCode, 0);
}

TEST_F(SandboxRunnerTest, UncaughtExceptionIsUnhandled) {
    auto result = run("raise ValueError('boom')\n");
    EXPECT_EQ(result.errorReason, ErrorReason::Unhandled);
    EXPECT_EQ(result.exitCode, 1);
    EXPECT_NE(result.stderrData.find("ValueError: boom"), std::string::npos);
}

TEST_F(SandboxRunnerTest, UserCannotForgeTimeoutExitCode) {
    for (const char* code :
         {"import sys\nsys.exit(124)\n", "import sys\nsys.exit(380)\n",
          "import sys\nsys.exit(-132)\n", "import sys\nsys.exit(127)\n",
          "import os\nos._exit(380)\n"}) {
        auto result = run(code);
        EXPECT_EQ(result.exitCode, 1) << code;
        EXPECT_EQ(result.errorReason, ErrorReason::Unhandled) << code;
    }
}

TEST_F(SandboxRunnerTest, UserExitCodePreserved) {
    auto result = run("import sys\nsys.exit(3)\n");
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_FALSE(result.succeeded());
}

TEST_F(SandboxRunnerTest, StdinIsEmpty) {
    auto result = run("import sys\nprint(repr(sys.stdin.read()))\n");
    EXPECT_TRUE(result.succeeded()) << result.stderrData;
    EXPECT_NE(result.stdoutData.find("''"), std::string::npos);
}

TEST_F(SandboxRunnerTest, RunsAsMainModule) {
    auto result = run("if __name__ == '__main__':\n    print('main')\n");
    EXPECT_NE(result.stdoutData.find("main"), std::string::npos);
}

TEST_F(SandboxRunnerTest, OutputIsCapped) {
    config_.maxOutputBytes = 1024;
    runner_->setConfig(config_);
    auto result = run("print('x' * 100000)\n");
    EXPECT_LE(result.stdoutData.size(),
              1024 + std::string(ProcessSupervisor::TRUNCATION_MARKER).size());
    EXPECT_NE(result.stdoutData.find("[output truncated]"), std::string::npos);
}

TEST_F(SandboxRunnerTest, PolicySnapshotEmbedded) {
    RunOptions options;
    options.timeLimitSec = 2;
    options.cpuLimitSec = 9;
    auto result = run("pass\n", options);
    EXPECT_EQ(result.policySnapshot.timeLimitSec, 2u);
    EXPECT_EQ(result.policySnapshot.cpuLimitSec, 2u);
    ASSERT_FALSE(result.policySnapshot.fsAllowlist.empty());

    auto j = ResultReporter::toJson(result);
    EXPECT_EQ(j["policy"]["network"], "denied");
    EXPECT_EQ(j["policy"]["limits"]["time_sec"], 2);
}

TEST_F(SandboxRunnerTest, EnforcementReportsAddressSpaceCeiling) {
    RunOptions options;
    options.memLimitMb = 16;
    auto result = run("pass\n", options);
    EXPECT_EQ(result.policySnapshot.memLimitMb, 16u);
    EXPECT_EQ(result.enforcement.addressSpaceMb,
              16u + config_.interpreterOverheadMb);

    auto j = ResultReporter::toJson(result);
    EXPECT_EQ(j["policy"]["limits"]["mem_mb"], 16);
    EXPECT_EQ(j["policy"]["enforcement"]["address_space_mb"],
              16 + config_.interpreterOverheadMb);
}

// =============================================================================
// Determinism and control
// =============================================================================

TEST_F(SandboxRunnerTest, IdenticalRunsGiveIdenticalResults) {
    const std::string code = "print(sum(range(1000)))\n";
    auto first = run(code);
    auto second = run(code);
    EXPECT_EQ(first.exitCode, second.exitCode);
    EXPECT_EQ(first.stdoutData, second.stdoutData);
    EXPECT_EQ(first.errorReason, second.errorReason);
}

TEST_F(SandboxRunnerTest, CancelStopsRunningSession) {
    auto future = runner_->runCodeAsync("while True:\n    pass\n", withTime(30));

    auto waitUntil = std::chrono::steady_clock::now() + 10s;
    while (!runner_->isRunning() && std::chrono::steady_clock::now() < waitUntil) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_TRUE(runner_->isRunning());
    std::this_thread::sleep_for(200ms);

    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(runner_->cancel());
    auto result = future.get();
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.errorReason, ErrorReason::Cancelled);
    EXPECT_LT(waited, 5s);
    EXPECT_FALSE(runner_->isRunning());
}

TEST_F(SandboxRunnerTest, CancelRightAfterAsyncStartIsHonoured) {
    auto start = std::chrono::steady_clock::now();
    auto future = runner_->runCodeAsync(
        "import time\ntime.sleep(2)\nprint('ran')\n", withTime(10));
    EXPECT_TRUE(runner_->cancel());
    auto result = future.get();
    auto waited = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.errorReason, ErrorReason::Cancelled);
    EXPECT_EQ(result.stdoutData.find("ran"), std::string::npos);
    EXPECT_LT(waited, 2s);
    EXPECT_FALSE(runner_->isRunning());
}

TEST_F(SandboxRunnerTest, DestroyingRunnerCancelsAsyncSession) {
    std::future<ExecutionResult> future;
    {
        SandboxRunner local(config_);
        future = local.runCodeAsync("import time\ntime.sleep(1)\n", withTime(10));
        std::this_thread::sleep_for(300ms);
    }
    auto result = future.get();
    EXPECT_EQ(result.errorReason, ErrorReason::Cancelled);
    EXPECT_TRUE(fs::is_empty(testDir_ / "sessions"));
}

TEST_F(SandboxRunnerTest, AsyncSessionSurvivesRunnerMove) {
    auto future = runner_->runCodeAsync(
        "import time\ntime.sleep(0.3)\nprint('moved')\n");
    SandboxRunner moved(std::move(*runner_));
    auto result = future.get();
    EXPECT_TRUE(result.succeeded()) << result.stderrData;
    EXPECT_NE(result.stdoutData.find("moved"), std::string::npos);
    EXPECT_FALSE(moved.isRunning());
}

TEST_F(SandboxRunnerTest, CancelWithoutRunIsNoop) {
    EXPECT_FALSE(runner_->cancel());
    auto result = run("print('still fine')\n");
    EXPECT_TRUE(result.succeeded()) << result.stderrData;
}

TEST_F(SandboxRunnerTest, IndependentRunnersRunConcurrently) {
    SandboxRunner other(config_);
    auto a = runner_->runCodeAsync("import time\ntime.sleep(0.5)\nprint('a')\n");
    auto b = other.runCodeAsync("import time\ntime.sleep(0.5)\nprint('b')\n");
    auto ra = a.get();
    auto rb = b.get();
    EXPECT_TRUE(ra.succeeded()) << ra.stderrData;
    EXPECT_TRUE(rb.succeeded()) << rb.stderrData;
    EXPECT_NE(ra.stdoutData.find('a'), std::string::npos);
    EXPECT_NE(rb.stdoutData.find('b'), std::string::npos);
}

// =============================================================================
// Failure paths
// =============================================================================

TEST_F(SandboxRunnerTest, MissingHarnessIsSupervisorFailure) {
    config_.harnessExecutable = (testDir_ / "no-harness").string();
    runner_->setConfig(config_);
    auto result = run("print('never')\n");
    EXPECT_EQ(result.errorReason, ErrorReason::SupervisorFailure);
    EXPECT_EQ(result.exitCode, -1);
    EXPECT_TRUE(fs::is_empty(testDir_ / "sessions"));
}

TEST_F(SandboxRunnerTest, UnusableTempRootIsSupervisorFailure) {
    config_.tempRoot = (testDir_ / "missing" / "root").string();
    auto result = runCode("print('never')\n", {}, config_);
    EXPECT_EQ(result.errorReason, ErrorReason::SupervisorFailure);
    EXPECT_EQ(result.policySnapshot.timeLimitSec, 3u);
}

TEST_F(SandboxRunnerTest, ValidateConfigFindsEverything) {
    EXPECT_TRUE(runner_->validateConfig().has_value());
}
