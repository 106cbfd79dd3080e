/*
 * test_policy_resolver.cpp
 *
 * Copyright (C) 2024 The Lockbox Authors
 */

/**
 * @file test_policy_resolver.cpp
 * @brief Tests for limit clamping and allowlist canonicalization
 */

#include <gtest/gtest.h>
#include "sandbox/policy_resolver.hpp"

#include <filesystem>
#include <fstream>
#include <limits>
#include <string>

#include <unistd.h>

using namespace lockbox::sandbox;
namespace fs = std::filesystem;

namespace {

// Per test and process, so parallel ctest runs never share a directory
std::string uniqueName(const std::string& prefix) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    return prefix + "_" + info->name() + "_" + std::to_string(::getpid());
}

}  // namespace

// =============================================================================
// Test Fixture
// =============================================================================

class PolicyResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        testDir_ =
            fs::temp_directory_path() / uniqueName("lockbox_policy_resolver_test");
        fs::remove_all(testDir_);
        fs::create_directories(testDir_ / "work");
        fs::create_directories(testDir_ / "data");
        testDir_ = fs::canonical(testDir_);
        workDir_ = testDir_ / "work";
    }

    void TearDown() override {
        if (fs::exists(testDir_)) {
            fs::remove_all(testDir_);
        }
    }

    ExecutionPolicy resolve(const RunOptions& options) {
        return PolicyResolver(config_).resolve(options, workDir_);
    }

    lockbox::config::SandboxConfig config_;
    fs::path testDir_;
    fs::path workDir_;
};

// =============================================================================
// Limits
// =============================================================================

TEST_F(PolicyResolverTest, DefaultsWhenNothingRequested) {
    auto policy = resolve({});
    EXPECT_EQ(policy.timeLimitSec, 3u);
    EXPECT_EQ(policy.cpuLimitSec, 3u);
    EXPECT_EQ(policy.memLimitMb, 256u);
}

TEST_F(PolicyResolverTest, DefaultCpuFollowsShorterTimeLimit) {
    RunOptions options;
    options.timeLimitSec = 1;
    auto policy = resolve(options);
    EXPECT_EQ(policy.timeLimitSec, 1u);
    EXPECT_EQ(policy.cpuLimitSec, 1u);
}

TEST_F(PolicyResolverTest, CpuClampedToTimeLimit) {
    RunOptions options;
    options.timeLimitSec = 2;
    options.cpuLimitSec = 50;
    auto policy = resolve(options);
    EXPECT_EQ(policy.cpuLimitSec, 2u);
}

TEST_F(PolicyResolverTest, NegativeAndZeroValuesClampedUp) {
    RunOptions options;
    options.timeLimitSec = -5;
    options.cpuLimitSec = 0;
    options.memLimitMb = -100;
    auto policy = resolve(options);
    EXPECT_EQ(policy.timeLimitSec, PolicyResolver::MIN_TIME_LIMIT_SEC);
    EXPECT_EQ(policy.cpuLimitSec, 1u);
    EXPECT_EQ(policy.memLimitMb, PolicyResolver::MIN_MEM_LIMIT_MB);
}

TEST_F(PolicyResolverTest, HugeValuesClampedToMaxima) {
    RunOptions options;
    options.timeLimitSec = std::numeric_limits<int64_t>::max();
    options.memLimitMb = std::numeric_limits<int64_t>::max();
    auto policy = resolve(options);
    EXPECT_EQ(policy.timeLimitSec, config_.maxTimeLimitSec);
    EXPECT_EQ(policy.memLimitMb, config_.maxMemLimitMb);
}

TEST_F(PolicyResolverTest, MemoryFloorIsSixteen) {
    RunOptions options;
    options.memLimitMb = 1;
    EXPECT_EQ(resolve(options).memLimitMb, 16u);
}

TEST_F(PolicyResolverTest, CpuNeverExceedsTime) {
    for (int64_t time : {-1, 0, 1, 2, 5, 1000}) {
        for (int64_t cpu : {-3, 0, 1, 3, 7, 100000}) {
            RunOptions options;
            options.timeLimitSec = time;
            options.cpuLimitSec = cpu;
            auto policy = resolve(options);
            EXPECT_LE(policy.cpuLimitSec, policy.timeLimitSec);
            EXPECT_GE(policy.cpuLimitSec, 1u);
        }
    }
}

// =============================================================================
// Allowlist
// =============================================================================

TEST_F(PolicyResolverTest, WorkingDirAlwaysLast) {
    RunOptions options;
    options.fsAllowlist = std::vector<std::string>{(testDir_ / "data").string()};
    auto policy = resolve(options);
    ASSERT_EQ(policy.fsAllowlist.size(), 2u);
    EXPECT_EQ(policy.fsAllowlist.front(), testDir_ / "data");
    EXPECT_EQ(policy.fsAllowlist.back(), workDir_);
}

TEST_F(PolicyResolverTest, DefaultAllowlistIsEmpty) {
    auto policy = resolve({});
    ASSERT_EQ(policy.fsAllowlist.size(), 1u);
    EXPECT_EQ(policy.fsAllowlist.front(), workDir_);
}

TEST_F(PolicyResolverTest, ConfiguredDefaultAllowlistUsedWhenAbsent) {
    config_.defaultFsAllowlist = {(testDir_ / "data").string()};
    auto policy = resolve({});
    ASSERT_EQ(policy.fsAllowlist.size(), 2u);
    EXPECT_EQ(policy.fsAllowlist.front(), testDir_ / "data");
}

TEST_F(PolicyResolverTest, ExplicitEmptyAllowlistOverridesDefault) {
    config_.defaultFsAllowlist = {(testDir_ / "data").string()};
    RunOptions options;
    options.fsAllowlist = std::vector<std::string>{};
    auto policy = resolve(options);
    ASSERT_EQ(policy.fsAllowlist.size(), 1u);
    EXPECT_EQ(policy.fsAllowlist.front(), workDir_);
}

TEST_F(PolicyResolverTest, DuplicatesAndEmptyEntriesRemoved) {
    auto data = (testDir_ / "data").string();
    RunOptions options;
    options.fsAllowlist =
        std::vector<std::string>{data, "", data + "/", data + "/./"};
    auto policy = resolve(options);
    ASSERT_EQ(policy.fsAllowlist.size(), 2u);
    EXPECT_EQ(policy.fsAllowlist.front(), testDir_ / "data");
}

TEST_F(PolicyResolverTest, WorkingDirNotDuplicatedWhenRequested) {
    RunOptions options;
    options.fsAllowlist = std::vector<std::string>{workDir_.string(),
                                                   (testDir_ / "data").string()};
    auto policy = resolve(options);
    ASSERT_EQ(policy.fsAllowlist.size(), 2u);
    EXPECT_EQ(policy.fsAllowlist.front(), testDir_ / "data");
    EXPECT_EQ(policy.fsAllowlist.back(), workDir_);
}

TEST_F(PolicyResolverTest, DotDotSegmentsRemoved) {
    RunOptions options;
    options.fsAllowlist = std::vector<std::string>{
        (testDir_ / "work" / ".." / "data").string()};
    auto policy = resolve(options);
    EXPECT_EQ(policy.fsAllowlist.front(), testDir_ / "data");
}

TEST_F(PolicyResolverTest, SymlinksResolved) {
    fs::create_directory_symlink(testDir_ / "data", testDir_ / "link");
    RunOptions options;
    options.fsAllowlist =
        std::vector<std::string>{(testDir_ / "link").string()};
    auto policy = resolve(options);
    EXPECT_EQ(policy.fsAllowlist.front(), testDir_ / "data");
}

TEST_F(PolicyResolverTest, NonexistentPathKeptCanonical) {
    RunOptions options;
    options.fsAllowlist = std::vector<std::string>{
        (testDir_ / "data" / "later" / ".." / "new").string()};
    auto policy = resolve(options);
    EXPECT_EQ(policy.fsAllowlist.front(), testDir_ / "data" / "new");
}

TEST_F(PolicyResolverTest, RelativePathMadeAbsolute) {
    auto previous = fs::current_path();
    fs::current_path(testDir_);
    RunOptions options;
    options.fsAllowlist = std::vector<std::string>{"data"};
    auto policy = resolve(options);
    fs::current_path(previous);
    EXPECT_EQ(policy.fsAllowlist.front(), testDir_ / "data");
}

TEST_F(PolicyResolverTest, ResolveIsDeterministic) {
    RunOptions options;
    options.timeLimitSec = 7;
    options.fsAllowlist = std::vector<std::string>{(testDir_ / "data").string()};
    EXPECT_EQ(resolve(options), resolve(options));
}

// =============================================================================
// Helpers
// =============================================================================

TEST(PolicyResolverHelpers, CanonicalizeRejectsEmpty) {
    EXPECT_FALSE(PolicyResolver::canonicalize("").has_value());
}

TEST(PolicyResolverHelpers, CanonicalizeStripsTrailingSeparator) {
    auto path = PolicyResolver::canonicalize("/tmp/");
    ASSERT_TRUE(path.has_value());
    EXPECT_NE(path->string().back(), '/');
}

TEST(PolicyResolverHelpers, IsWithinComparesComponents) {
    std::vector<fs::path> roots{"/tmp/a"};
    EXPECT_TRUE(PolicyResolver::isWithin("/tmp/a", roots));
    EXPECT_TRUE(PolicyResolver::isWithin("/tmp/a/b/c", roots));
    EXPECT_FALSE(PolicyResolver::isWithin("/tmp/ab", roots));
    EXPECT_FALSE(PolicyResolver::isWithin("/tmp", roots));
}
