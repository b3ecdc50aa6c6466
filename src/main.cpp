#include "backup.hpp"
#include <filesystem>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitFatal = 2;

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " backup [--config <path>]\n"
              << "       " << program << " snapshots [--config <path>]\n"
              << "       " << program << " init [--config <path>]\n"
              << "       " << program << " schedule --time HH:MM --user <user> --workdir <dir>"
              << " [--name <name>] [--unit-dir <dir>] [--config <path>]" << std::endl;
}

int reportFatal(const RunError& error) {
    std::cerr << "Error (" << runErrorKindName(error.kind) << "): " << error.message << std::endl;
    return kExitFatal;
}

std::string selfExecutable(const char* argv0) {
    std::error_code ec;
    fs::path self = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        self = fs::absolute(argv0, ec);
    }
    return self.string();
}

} // namespace

int main(int argc, char* argv[]) {
    std::string command;
    std::string configFile = "backup_config.json";
    std::string scheduleTime;
    std::string scheduleUser;
    std::string scheduleWorkdir;
    std::string taskName = "snapvault-daily";
    std::string unitDir = "/etc/systemd/system";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--time" && i + 1 < argc) {
            scheduleTime = argv[++i];
        } else if (arg == "--user" && i + 1 < argc) {
            scheduleUser = argv[++i];
        } else if (arg == "--workdir" && i + 1 < argc) {
            scheduleWorkdir = argv[++i];
        } else if (arg == "--name" && i + 1 < argc) {
            taskName = argv[++i];
        } else if (arg == "--unit-dir" && i + 1 < argc) {
            unitDir = argv[++i];
        } else if (command.empty() && !arg.starts_with("--")) {
            command = arg;
        } else {
            printUsage(argv[0]);
            return kExitFatal;
        }
    }

    PosixProcessRunner runner;
    Backup backup(runner);

    if (command == "backup") {
        auto result = backup.runBackup(configFile);
        if (!result) {
            return reportFatal(result.error());
        }
        return result->status == RunStatus::Success ? kExitOk : kExitFailure;
    }

    if (command == "snapshots") {
        auto result = backup.listSnapshots(configFile);
        if (!result) {
            return reportFatal(result.error());
        }
        return result->succeeded() ? kExitOk : kExitFailure;
    }

    if (command == "init") {
        auto result = backup.initRepository(configFile);
        if (!result) {
            return reportFatal(result.error());
        }
        return *result ? kExitOk : kExitFailure;
    }

    if (command == "schedule") {
        if (scheduleTime.empty() || scheduleUser.empty() || scheduleWorkdir.empty()) {
            printUsage(argv[0]);
            return kExitFatal;
        }
        std::error_code ec;
        fs::path configPath = fs::absolute(configFile, ec);
        if (ec) {
            std::cerr << "Error: Cannot resolve config path " << configFile << ": " << ec.message() << std::endl;
            return kExitFatal;
        }

        ScheduledTask task;
        task.name = taskName;
        task.command = quoteExecStartWord(selfExecutable(argv[0])) + " backup --config " + quoteExecStartWord(configPath.string());
        task.dailyTime = scheduleTime;
        task.runAsUser = scheduleUser;
        task.workingDirectory = scheduleWorkdir;
        task.description = "SnapVault daily backup (" + configPath.filename().string() + ")";

        SystemdTimerScheduler scheduler(runner, unitDir);
        auto result = backup.scheduleDailyRun(scheduler, task);
        if (!result) {
            std::cerr << "Error: " << result.error() << std::endl;
            return kExitFailure;
        }
        std::cout << "Scheduled " << task.name << " daily at " << scheduleTime << std::endl;
        return kExitOk;
    }

    printUsage(argv[0]);
    return kExitFatal;
}
