/**
 * @file retention_test.cpp
 * @brief Tests for the retention enforcer.
 */
#include "retention.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

class RetentionEnforcerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.projectName = "web01";
        config_.backupToolPath = "/usr/bin/restic";
        config_.repository = "sftp:backup@host:/srv/restic";
        config_.repositoryPassword = "repo-pass";
    }

    TempDir dir_;
    BackupConfig config_;
    FakeProcessRunner runner_;
};

TEST_F(RetentionEnforcerTest, NoPolicyRunsNothingAndLogsNothing) {
    RunLogger logger((dir_.path() / "run").string(), config_.projectName, std::chrono::system_clock::now());
    ResticCommandRunner commands(runner_, config_, logger);
    RetentionEnforcer retention(commands, logger);

    EXPECT_FALSE(retention.enforce(config_.repository, std::nullopt));
    EXPECT_TRUE(runner_.calls.empty());
    EXPECT_FALSE(fs::exists(logger.filePath()));
}

TEST_F(RetentionEnforcerTest, PolicyDelegatesToForget) {
    RunLogger logger((dir_.path() / "run").string(), config_.projectName, std::chrono::system_clock::now());
    ResticCommandRunner commands(runner_, config_, logger);
    RetentionEnforcer retention(commands, logger);

    RetentionPolicy policy;
    policy.keepMonthly = 6;
    auto result = retention.enforce(config_.repository, policy);

    ASSERT_TRUE(result);
    EXPECT_TRUE(result->succeeded());
    ASSERT_EQ(runner_.calls.size(), 1u);
    std::vector<std::string> expected{"/usr/bin/restic", "-r", config_.repository, "forget", "--prune",
                                      "--keep-monthly", "6"};
    EXPECT_EQ(runner_.calls[0].argv, expected);
}

TEST_F(RetentionEnforcerTest, ForgetFailureIsReturnedNotThrown) {
    runner_.results["forget"] = CommandResult{1, "Fatal: unable to create lock", false};
    RunLogger logger((dir_.path() / "run").string(), config_.projectName, std::chrono::system_clock::now());
    ResticCommandRunner commands(runner_, config_, logger);
    RetentionEnforcer retention(commands, logger);

    RetentionPolicy policy;
    policy.keepLast = 3;
    auto result = retention.enforce(config_.repository, policy);

    ASSERT_TRUE(result);
    EXPECT_EQ(result->exitCode, 1);
    EXPECT_NE(ReadFile(logger.filePath()).find("[ERROR] web01: Retention failed with exit code 1"), std::string::npos);
}
