/**
 * @file notification_test.cpp
 * @brief Tests for report composition and best-effort delivery.
 */
#include "notification.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <ctime>
#include <stdexcept>

class NotifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (const char* tz = std::getenv("TZ")) {
            savedTz_ = tz;
        }
        setenv("TZ", "UTC", 1);
        tzset();

        settings_.smtpServer = "smtp.example.com";
        settings_.smtpPort = 587;
        settings_.smtpUser = "mailer";
        settings_.smtpPassword = "mail-pass";
        settings_.from = "backup@example.com";
        settings_.to = "ops@example.com";
        settings_.subject = "Nightly backup";

        report_.status = RunStatus::Success;
        report_.totalSize = "1.234 GiB";
        report_.duration = std::chrono::seconds(3725);
        report_.logFilePath = "/var/log/snapvault/web01-20261017020000.log";
        // 2026-10-17 02:00:00 UTC
        report_.startedAt = std::chrono::system_clock::from_time_t(1792202400);
    }

    void TearDown() override {
        if (savedTz_) {
            setenv("TZ", savedTz_->c_str(), 1);
        } else {
            unsetenv("TZ");
        }
        tzset();
    }

    TempDir dir_;
    std::optional<std::string> savedTz_;
    EmailSettings settings_;
    RunResult report_;
};

TEST_F(NotifierTest, BodyIsDeterministic) {
    std::string expected =
        "Project: web01\n"
        "Status: Success\n"
        "Started: 2026-10-17 02:00:00\n"
        "Duration: 01:02:05\n"
        "Total size: 1.234 GiB\n"
        "Log file: /var/log/snapvault/web01-20261017020000.log\n";
    EXPECT_EQ(Notifier::composeBody("web01", report_), expected);
    EXPECT_EQ(Notifier::composeBody("web01", report_), Notifier::composeBody("web01", report_));
}

TEST_F(NotifierTest, BodyListsErrorsAndUnknownSize) {
    report_.totalSize.reset();
    report_.recordFailure("Backup failed with exit code 3");
    std::string body = Notifier::composeBody("web01", report_);
    EXPECT_NE(body.find("Status: Failure\n"), std::string::npos);
    EXPECT_NE(body.find("Total size: unknown\n"), std::string::npos);
    EXPECT_NE(body.find("\nErrors:\n- Backup failed with exit code 3\n"), std::string::npos);
}

TEST_F(NotifierTest, SubjectCarriesStatus) {
    EXPECT_EQ(Notifier::composeSubject(settings_, "web01", report_), "Nightly backup - web01 - Success");
    settings_.subject.clear();
    report_.status = RunStatus::Failure;
    EXPECT_EQ(Notifier::composeSubject(settings_, "web01", report_), "Backup report - web01 - Failure");
}

TEST_F(NotifierTest, NoSettingsSendsNothing) {
    auto log = std::make_shared<NotificationLog>();
    RunLogger logger((dir_.path() / "run").string(), "web01", std::chrono::system_clock::now());
    Notifier notifier(logger, MakeFakeFactory(log));

    EXPECT_FALSE(notifier.notify(std::nullopt, "web01", report_));
    EXPECT_EQ(log->attempts, 0);
}

TEST_F(NotifierTest, DeliversComposedMessage) {
    auto log = std::make_shared<NotificationLog>();
    RunLogger logger((dir_.path() / "run").string(), "web01", std::chrono::system_clock::now());
    Notifier notifier(logger, MakeFakeFactory(log));

    EXPECT_TRUE(notifier.notify(settings_, "web01", report_));
    EXPECT_EQ(log->attempts, 1);
    EXPECT_EQ(log->lastSubject, "Nightly backup - web01 - Success");
    EXPECT_EQ(log->lastBody, Notifier::composeBody("web01", report_));
}

TEST_F(NotifierTest, DeliveryFailureIsLoggedNotThrown) {
    auto log = std::make_shared<NotificationLog>();
    log->failWith = "535 authentication failed for mail-pass";
    RunLogger logger((dir_.path() / "run").string(), "web01", std::chrono::system_clock::now());
    Notifier notifier(logger, MakeFakeFactory(log));

    bool sent = true;
    EXPECT_NO_THROW(sent = notifier.notify(settings_, "web01", report_));
    EXPECT_FALSE(sent);
    EXPECT_EQ(report_.status, RunStatus::Success);

    std::string content = ReadFile(logger.filePath());
    EXPECT_NE(content.find("[ERROR] web01: Notification failed: 535 authentication failed"), std::string::npos);
    EXPECT_EQ(content.find("mail-pass"), std::string::npos);
}

TEST_F(NotifierTest, ThrowingStrategyIsContained) {
    RunLogger logger((dir_.path() / "run").string(), "web01", std::chrono::system_clock::now());
    Notifier notifier(logger, [](const EmailSettings&) -> std::unique_ptr<NotificationStrategy> {
        throw std::runtime_error("no route to host");
    });

    EXPECT_NO_THROW(EXPECT_FALSE(notifier.notify(settings_, "web01", report_)));
    EXPECT_NE(ReadFile(logger.filePath()).find("no route to host"), std::string::npos);
}

TEST(EmailNotificationStrategyTest, UrlSchemeFollowsPort) {
    EmailSettings settings;
    settings.smtpServer = "smtp.example.com";
    settings.smtpPort = 465;
    EXPECT_EQ(EmailNotificationStrategy(settings).smtpUrl(), "smtps://smtp.example.com:465");
    settings.smtpPort = 587;
    EXPECT_EQ(EmailNotificationStrategy(settings).smtpUrl(), "smtp://smtp.example.com:587");
}

TEST(EmailNotificationStrategyTest, IncompleteSettingsFailWithoutNetwork) {
    EmailSettings settings;
    settings.smtpServer = "smtp.example.com";
    EmailNotificationStrategy strategy(settings);
    auto result = strategy.notify("subject", "body");
    ASSERT_FALSE(result);
    EXPECT_NE(result.error().find("from and to"), std::string::npos);
}
