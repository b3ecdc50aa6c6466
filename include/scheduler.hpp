/**
 * @file scheduler.hpp
 * @brief Registration of the daily backup run with the OS scheduler.
 *
 * The scheduler itself is an external service. SnapVault only describes the recurring task
 * and hands it over; on Linux this means a systemd service/timer unit pair.
 */

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <string>
#include <expected>
#include "process_runner.hpp"

/**
 * @brief A recurring daily invocation of the backup command.
 */
struct ScheduledTask {
    std::string name;             ///< Unit name without suffix (e.g., "snapvault-daily").
    std::string command;          ///< Full command line to run.
    std::string dailyTime;        ///< Local time of day, "HH:MM" or "HH:MM:SS".
    std::string runAsUser;        ///< Account the command runs under.
    std::string workingDirectory; ///< Working directory for the command.
    std::string description;      ///< Human-readable description.
};

/**
 * @brief Interface for OS task schedulers.
 */
class TaskScheduler {
public:
    virtual ~TaskScheduler() = default;

    /**
     * @brief Registers (or replaces) a daily task.
     *
     * @param task Task to register.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> registerDaily(const ScheduledTask& task) = 0;
};

/**
 * @brief Quotes one word for a systemd ExecStart= line.
 *
 * '%' becomes "%%", and backslashes and double quotes are backslash-escaped.
 * The word is double-quoted when it contains whitespace or a quote.
 */
std::string quoteExecStartWord(const std::string& word);

/**
 * @brief Parses "HH:MM[:SS]" and returns it normalized to "HH:MM:SS".
 *
 * @return std::expected<std::string, std::string> Normalized time or an error message.
 */
std::expected<std::string, std::string> normalizeDailyTime(const std::string& dailyTime);

/**
 * @brief systemd timer implementation of TaskScheduler.
 *
 * Writes `<name>.service` and `<name>.timer` into the unit directory, then reloads systemd
 * and enables the timer.
 */
class SystemdTimerScheduler : public TaskScheduler {
public:
    /**
     * @param runner Runs systemctl.
     * @param unitDirectory Where unit files are written.
     * @param systemctlPath Path to the systemctl binary.
     */
    SystemdTimerScheduler(ProcessRunner& runner,
                          std::string unitDirectory = "/etc/systemd/system",
                          std::string systemctlPath = "/usr/bin/systemctl");

    std::expected<void, std::string> registerDaily(const ScheduledTask& task) override;

    static std::string renderService(const ScheduledTask& task);
    static std::string renderTimer(const ScheduledTask& task, const std::string& normalizedTime);

private:
    std::expected<void, std::string> systemctl(const std::vector<std::string>& args);

    ProcessRunner& runner_;
    std::string unitDirectory_;
    std::string systemctlPath_;
};

#endif // SCHEDULER_HPP
