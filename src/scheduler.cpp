#include "scheduler.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace {

std::expected<void, std::string> writeUnitFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected("Failed to open unit file for writing: " + path.string());
    }
    out << content;
    if (!out) {
        return std::unexpected("Failed to write unit file: " + path.string());
    }
    return {};
}

} // namespace

std::string quoteExecStartWord(const std::string& word) {
    std::string escaped;
    bool needsQuotes = word.empty();
    for (char c : word) {
        switch (c) {
        case '%':
            escaped += "%%";
            break;
        case '\\':
            escaped += "\\\\";
            break;
        case '"':
            escaped += "\\\"";
            needsQuotes = true;
            break;
        case ' ':
        case '\t':
            escaped += c;
            needsQuotes = true;
            break;
        default:
            escaped += c;
        }
    }
    return needsQuotes ? "\"" + escaped + "\"" : escaped;
}

std::expected<std::string, std::string> normalizeDailyTime(const std::string& dailyTime) {
    int hour = -1;
    int minute = -1;
    int second = 0;
    char colon = 0;
    std::istringstream ss(dailyTime);
    ss >> hour >> colon;
    if (ss.fail() || colon != ':') {
        return std::unexpected("Invalid schedule time format: " + dailyTime);
    }
    ss >> minute;
    if (ss.fail()) {
        return std::unexpected("Invalid schedule time format: " + dailyTime);
    }
    if (ss.peek() == ':') {
        ss >> colon >> second;
        if (ss.fail()) {
            return std::unexpected("Invalid schedule time format: " + dailyTime);
        }
    }
    ss >> std::ws;
    if (!ss.eof() || hour < 0 || hour > 23 || minute < 0 || minute > 59 || second < 0 || second > 59) {
        return std::unexpected("Invalid schedule time format: " + dailyTime);
    }

    std::ostringstream normalized;
    normalized << std::setfill('0') << std::setw(2) << hour << ':' << std::setw(2) << minute << ':'
               << std::setw(2) << second;
    return normalized.str();
}

SystemdTimerScheduler::SystemdTimerScheduler(ProcessRunner& runner, std::string unitDirectory, std::string systemctlPath)
    : runner_(runner), unitDirectory_(std::move(unitDirectory)), systemctlPath_(std::move(systemctlPath)) {}

std::string SystemdTimerScheduler::renderService(const ScheduledTask& task) {
    std::string unit;
    unit += "[Unit]\n";
    unit += "Description=" + task.description + "\n";
    unit += "\n[Service]\n";
    unit += "Type=oneshot\n";
    if (!task.runAsUser.empty()) {
        unit += "User=" + task.runAsUser + "\n";
    }
    if (!task.workingDirectory.empty()) {
        unit += "WorkingDirectory=" + task.workingDirectory + "\n";
    }
    unit += "ExecStart=" + task.command + "\n";
    return unit;
}

std::string SystemdTimerScheduler::renderTimer(const ScheduledTask& task, const std::string& normalizedTime) {
    std::string unit;
    unit += "[Unit]\n";
    unit += "Description=" + task.description + " (daily timer)\n";
    unit += "\n[Timer]\n";
    unit += "OnCalendar=*-*-* " + normalizedTime + "\n";
    unit += "Persistent=true\n";
    unit += "Unit=" + task.name + ".service\n";
    unit += "\n[Install]\n";
    unit += "WantedBy=timers.target\n";
    return unit;
}

std::expected<void, std::string> SystemdTimerScheduler::systemctl(const std::vector<std::string>& args) {
    std::vector<std::string> argv{systemctlPath_};
    argv.insert(argv.end(), args.begin(), args.end());
    auto result = runner_.run(argv, std::chrono::seconds(60));
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->succeeded()) {
        return std::unexpected(describeCommand(argv) + " failed with exit code " + std::to_string(result->exitCode)
                               + ": " + result->output);
    }
    return {};
}

std::expected<void, std::string> SystemdTimerScheduler::registerDaily(const ScheduledTask& task) {
    if (task.name.empty() || task.name.find('/') != std::string::npos) {
        return std::unexpected("Invalid task name: " + task.name);
    }
    if (task.command.empty()) {
        return std::unexpected("Scheduled task needs a command");
    }
    auto time = normalizeDailyTime(task.dailyTime);
    if (!time) {
        return std::unexpected(time.error());
    }

    std::error_code ec;
    fs::create_directories(unitDirectory_, ec);
    if (ec) {
        return std::unexpected("Failed to create unit directory " + unitDirectory_ + ": " + ec.message());
    }

    fs::path base(unitDirectory_);
    if (auto written = writeUnitFile(base / (task.name + ".service"), renderService(task)); !written) {
        return written;
    }
    if (auto written = writeUnitFile(base / (task.name + ".timer"), renderTimer(task, *time)); !written) {
        return written;
    }

    if (auto reloaded = systemctl({"daemon-reload"}); !reloaded) {
        return reloaded;
    }
    return systemctl({"enable", "--now", task.name + ".timer"});
}
