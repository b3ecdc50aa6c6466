#include "run_logger.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <filesystem>
#include <ctime>
#include <utility>

namespace fs = std::filesystem;

const char* logLevelName(LogLevel level) {
    switch (level) {
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

std::string formatLocalTime(std::chrono::system_clock::time_point time, const char* pattern) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm tmLocal{};
    localtime_r(&timeT, &tmLocal);
    char timeBuf[64];
    std::size_t length = std::strftime(timeBuf, sizeof(timeBuf), pattern, &tmLocal);
    return std::string(timeBuf, length);
}

RunLogger::RunLogger(const std::string& logPrefix, std::string projectName,
                     std::chrono::system_clock::time_point runStart)
    : projectName_(std::move(projectName)) {
    std::string prefix = logPrefix.empty() ? "snapvault" : logPrefix;
    filePath_ = prefix + "-" + formatLocalTime(runStart, "%Y%m%d%H%M%S") + ".log";

    fs::path parent = fs::path(filePath_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Error: Cannot create log directory " << parent.string() << ": " << ec.message() << std::endl;
        }
    }
}

void RunLogger::info(const std::string& message) const {
    log(LogLevel::Info, message);
}

void RunLogger::warning(const std::string& message) const {
    log(LogLevel::Warning, message);
}

void RunLogger::error(const std::string& message) const {
    log(LogLevel::Error, message);
}

void RunLogger::log(LogLevel level, const std::string& message) const {
    std::string logEntry = formatLocalTime(std::chrono::system_clock::now(), "%Y-%m-%d %H:%M:%S")
        + " [" + logLevelName(level) + "] " + projectName_ + ": " + redact(message);

    if (level == LogLevel::Error) {
        std::cerr << logEntry << std::endl;
    } else {
        std::cout << logEntry << std::endl;
    }

    std::ofstream logFile(filePath_, std::ios::app);
    if (logFile.is_open()) {
        logFile << logEntry << '\n';
        logFile.flush();
    } else {
        std::cerr << "Error: Cannot write to log file: " << filePath_ << std::endl;
    }
}

void RunLogger::addSecret(const std::string& secret) {
    if (secret.empty()) {
        return;
    }
    if (secret.size() < kMinMaskedSecretLength) {
        warning("A configured secret is shorter than " + std::to_string(kMinMaskedSecretLength)
                + " characters and cannot be masked in this log");
        return;
    }
    if (std::find(secrets_.begin(), secrets_.end(), secret) != secrets_.end()) {
        return;
    }
    auto longer = [](const std::string& a, const std::string& b) { return a.size() > b.size(); };
    secrets_.insert(std::upper_bound(secrets_.begin(), secrets_.end(), secret, longer), secret);
}

std::string RunLogger::redact(std::string text) const {
    for (const auto& secret : secrets_) {
        std::string::size_type pos = 0;
        while ((pos = text.find(secret, pos)) != std::string::npos) {
            text.replace(pos, secret.size(), "***");
            pos += 3;
        }
    }
    return text;
}
