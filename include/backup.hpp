/**
 * @file backup.hpp
 * @brief Backup orchestration for SnapVault.
 *
 * Ties together configuration loading, repository bootstrap, the restic backup itself,
 * size statistics, retention and the status report. Only configuration and tool-path
 * problems abort a run; every later failure is recorded in the RunResult and the run
 * continues so that the report is always attempted.
 *
 * @note Credentials reach restic only through the environment of each child process
 * (see SecretScope) and are masked in the run log.
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include <string>
#include <expected>
#include <optional>
#include "backup_config.hpp"
#include "notification.hpp"
#include "process_runner.hpp"
#include "run_logger.hpp"
#include "run_result.hpp"
#include "scheduler.hpp"

/**
 * @brief Fatal error categories. All of them stop a run before any secret is exported.
 */
enum class RunErrorKind {
    ConfigNotFound,
    ConfigMalformed,
    MissingField,
    ToolNotFound
};

const char* runErrorKindName(RunErrorKind kind);

/**
 * @brief Fatal error returned by the orchestrator's entry points.
 */
struct RunError {
    RunErrorKind kind;   ///< Failure category.
    std::string message; ///< Descriptive message, also written to the run log when one exists.
};

/**
 * @brief Main backup orchestration class.
 *
 * Stateless between calls: every entry point reads its configuration file fresh.
 */
class Backup {
public:
    /**
     * @brief Constructs the orchestrator.
     *
     * @param runner Process runner used for every restic invocation.
     * @param notificationFactory Creates the delivery strategy for the status report.
     */
    explicit Backup(ProcessRunner& runner, NotificationFactory notificationFactory = makeEmailNotification);

    /**
     * @brief Runs a complete backup for the target described by a configuration file.
     *
     * Checks the repository (initializing it if absent), runs the backup, collects the
     * repository size, applies retention and sends the report.
     *
     * @param configFile Path to the target's JSON configuration.
     * @return std::expected<RunResult, RunError> The run report (Success or Failure), or a
     *         fatal error if the configuration or tool path is unusable.
     */
    std::expected<RunResult, RunError> runBackup(const std::string& configFile);

    /**
     * @brief Lists the repository's snapshots.
     *
     * @param configFile Path to the target's JSON configuration.
     * @return std::expected<CommandResult, RunError> restic's result, or a fatal error.
     */
    std::expected<CommandResult, RunError> listSnapshots(const std::string& configFile);

    /**
     * @brief Initializes the repository.
     *
     * An already-initialized repository is logged and treated as success.
     *
     * @param configFile Path to the target's JSON configuration.
     * @return std::expected<bool, RunError> True if the repository is usable afterwards.
     */
    std::expected<bool, RunError> initRepository(const std::string& configFile);

    /**
     * @brief Registers a daily run with the OS scheduler.
     *
     * @param scheduler Scheduler to register with.
     * @param task Task description (command, time, user, working directory).
     * @return std::expected<void, std::string> Success or an error message.
     */
    std::expected<void, std::string> scheduleDailyRun(TaskScheduler& scheduler, const ScheduledTask& task);

private:
    /**
     * @brief Checks the tool path and required fields, logging an ERROR for the first problem.
     */
    std::optional<RunError> validate(const BackupConfig& config, RunLogger& logger) const;

    ProcessRunner& runner_;                   ///< Runs restic.
    NotificationFactory notificationFactory_; ///< Creates the report delivery strategy.
};

#endif // BACKUP_HPP
