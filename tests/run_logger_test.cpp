/**
 * @file run_logger_test.cpp
 * @brief Tests for the per-run log file.
 */
#include "run_logger.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <regex>
#include <sstream>

TEST(RunLoggerTest, FileNameEmbedsRunStart) {
    TempDir dir;
    auto start = std::chrono::system_clock::now();
    RunLogger logger((dir.path() / "logs" / "web01").string(), "web01", start);

    std::string expected = (dir.path() / "logs" / ("web01-" + formatLocalTime(start, "%Y%m%d%H%M%S") + ".log")).string();
    EXPECT_EQ(logger.filePath(), expected);
    EXPECT_TRUE(fs::is_directory(dir.path() / "logs"));
}

TEST(RunLoggerTest, LinesHaveTimestampLevelAndProject) {
    TempDir dir;
    RunLogger logger((dir.path() / "run").string(), "web01", std::chrono::system_clock::now());
    logger.info("first");
    logger.warning("second");
    logger.error("third");

    std::string content = ReadFile(logger.filePath());
    std::regex line(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} \[(INFO|WARNING|ERROR)\] web01: \w+)");
    std::istringstream lines(content);
    std::string entry;
    int count = 0;
    while (std::getline(lines, entry)) {
        EXPECT_TRUE(std::regex_match(entry, line)) << entry;
        ++count;
    }
    EXPECT_EQ(count, 3);
    EXPECT_NE(content.find("[WARNING] web01: second"), std::string::npos);
}

TEST(RunLoggerTest, AppendsToExistingFile) {
    TempDir dir;
    auto start = std::chrono::system_clock::now();
    {
        RunLogger logger((dir.path() / "run").string(), "web01", start);
        logger.info("before");
    }
    RunLogger logger((dir.path() / "run").string(), "web01", start);
    logger.info("after");

    std::string content = ReadFile(logger.filePath());
    EXPECT_NE(content.find("before"), std::string::npos);
    EXPECT_NE(content.find("after"), std::string::npos);
}

TEST(RunLoggerTest, MasksSecrets) {
    TempDir dir;
    RunLogger logger((dir.path() / "run").string(), "web01", std::chrono::system_clock::now());
    logger.addSecret("hunter2");
    logger.addSecret("");
    logger.error("login with hunter2 failed, hunter2 rejected");

    std::string content = ReadFile(logger.filePath());
    EXPECT_EQ(content.find("hunter2"), std::string::npos);
    EXPECT_NE(content.find("login with *** failed, *** rejected"), std::string::npos);
}

TEST(RunLoggerTest, ShortSecretIsNotMaskedAndWarns) {
    TempDir dir;
    RunLogger logger((dir.path() / "run").string(), "web01", std::chrono::system_clock::now());
    logger.addSecret("p");
    logger.info("backup /srv opened repository");

    std::string content = ReadFile(logger.filePath());
    EXPECT_NE(content.find("[WARNING] web01: A configured secret is shorter than 4 characters"), std::string::npos);
    EXPECT_NE(content.find("backup /srv opened repository"), std::string::npos);
    EXPECT_EQ(content.find("***"), std::string::npos);
}

TEST(RunLoggerTest, OverlappingSecretsMaskedLongestFirst) {
    TempDir dir;
    RunLogger logger((dir.path() / "run").string(), "web01", std::chrono::system_clock::now());
    logger.addSecret("pass");
    logger.addSecret("repo-password");
    logger.info("using repo-password now");

    std::string content = ReadFile(logger.filePath());
    EXPECT_NE(content.find("using *** now"), std::string::npos);
    EXPECT_EQ(content.find("word"), std::string::npos);
}
