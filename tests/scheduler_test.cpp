/**
 * @file scheduler_test.cpp
 * @brief Tests for daily task registration through systemd timers.
 */
#include "backup.hpp"
#include "scheduler.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        task_.name = "snapvault-daily";
        task_.command = "/usr/local/bin/snapvault backup --config /etc/snapvault/web01.json";
        task_.dailyTime = "02:30";
        task_.runAsUser = "backup";
        task_.workingDirectory = "/var/lib/snapvault";
        task_.description = "SnapVault daily backup (web01.json)";
    }

    TempDir dir_;
    FakeProcessRunner runner_;
    ScheduledTask task_;
};

TEST(DailyTimeTest, Normalizes) {
    EXPECT_EQ(normalizeDailyTime("02:30"), "02:30:00");
    EXPECT_EQ(normalizeDailyTime("7:05"), "07:05:00");
    EXPECT_EQ(normalizeDailyTime("23:59:59"), "23:59:59");
}

TEST(DailyTimeTest, RejectsInvalid) {
    for (const char* bad : {"", "24:00", "12:60", "noon", "12", "12:30pm", "12:30:61"}) {
        EXPECT_FALSE(normalizeDailyTime(bad)) << bad;
    }
}

TEST(ExecStartQuotingTest, EscapesSpecifiersAndBackslashes) {
    EXPECT_EQ(quoteExecStartWord("/usr/local/bin/snapvault"), "/usr/local/bin/snapvault");
    EXPECT_EQ(quoteExecStartWord("/etc/snapvault/100%.json"), "/etc/snapvault/100%%.json");
    EXPECT_EQ(quoteExecStartWord(R"(/srv/a\b.json)"), R"(/srv/a\\b.json)");
    EXPECT_EQ(quoteExecStartWord("/srv/my backups/web01.json"), "\"/srv/my backups/web01.json\"");
    EXPECT_EQ(quoteExecStartWord(R"(/srv/say "hi".json)"), R"("/srv/say \"hi\".json")");
}

TEST_F(SchedulerTest, WritesUnitsAndEnablesTimer) {
    SystemdTimerScheduler scheduler(runner_, dir_.path().string(), "/usr/bin/systemctl");
    auto result = scheduler.registerDaily(task_);
    ASSERT_TRUE(result) << result.error();

    std::string service = ReadFile(dir_.path() / "snapvault-daily.service");
    EXPECT_NE(service.find("User=backup\n"), std::string::npos);
    EXPECT_NE(service.find("WorkingDirectory=/var/lib/snapvault\n"), std::string::npos);
    EXPECT_NE(service.find("ExecStart=" + task_.command + "\n"), std::string::npos);
    EXPECT_NE(service.find("Description=SnapVault daily backup (web01.json)\n"), std::string::npos);

    std::string timer = ReadFile(dir_.path() / "snapvault-daily.timer");
    EXPECT_NE(timer.find("OnCalendar=*-*-* 02:30:00\n"), std::string::npos);
    EXPECT_NE(timer.find("Persistent=true\n"), std::string::npos);
    EXPECT_NE(timer.find("Unit=snapvault-daily.service\n"), std::string::npos);
    EXPECT_NE(timer.find("WantedBy=timers.target\n"), std::string::npos);

    ASSERT_EQ(runner_.calls.size(), 2u);
    EXPECT_EQ(runner_.calls[0].argv, (std::vector<std::string>{"/usr/bin/systemctl", "daemon-reload"}));
    EXPECT_EQ(runner_.calls[1].argv,
              (std::vector<std::string>{"/usr/bin/systemctl", "enable", "--now", "snapvault-daily.timer"}));
}

TEST_F(SchedulerTest, InvalidTimeWritesNothing) {
    task_.dailyTime = "25:00";
    SystemdTimerScheduler scheduler(runner_, dir_.path().string());
    EXPECT_FALSE(scheduler.registerDaily(task_));
    EXPECT_FALSE(fs::exists(dir_.path() / "snapvault-daily.service"));
    EXPECT_TRUE(runner_.calls.empty());
}

TEST_F(SchedulerTest, SystemctlFailureIsReported) {
    runner_.results["daemon-reload"] = CommandResult{1, "Failed to connect to bus", false};
    SystemdTimerScheduler scheduler(runner_, dir_.path().string());
    auto result = scheduler.registerDaily(task_);
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("Failed to connect to bus"), std::string::npos);
    EXPECT_EQ(runner_.calls.size(), 1u);
}

TEST_F(SchedulerTest, OrchestratorDelegatesToScheduler) {
    FakeProcessRunner resticRunner;
    Backup backup(resticRunner);
    SystemdTimerScheduler scheduler(runner_, dir_.path().string());
    EXPECT_TRUE(backup.scheduleDailyRun(scheduler, task_));
    EXPECT_TRUE(fs::exists(dir_.path() / "snapvault-daily.timer"));
    EXPECT_TRUE(resticRunner.calls.empty());
}
