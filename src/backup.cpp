#include "backup.hpp"
#include "restic_command.hpp"
#include "retention.hpp"
#include "run_logger.hpp"
#include <chrono>
#include <filesystem>
#include <utility>

namespace fs = std::filesystem;

namespace {

RunError fromConfigError(const ConfigError& error) {
    RunErrorKind kind = error.kind == ConfigErrorKind::NotFound ? RunErrorKind::ConfigNotFound
                                                                : RunErrorKind::ConfigMalformed;
    return RunError{kind, error.message};
}

} // namespace

const char* runErrorKindName(RunErrorKind kind) {
    switch (kind) {
    case RunErrorKind::ConfigNotFound:
        return "ConfigNotFound";
    case RunErrorKind::ConfigMalformed:
        return "ConfigMalformed";
    case RunErrorKind::MissingField:
        return "MissingField";
    case RunErrorKind::ToolNotFound:
        return "ToolNotFound";
    }
    return "Unknown";
}

Backup::Backup(ProcessRunner& runner, NotificationFactory notificationFactory)
    : runner_(runner), notificationFactory_(std::move(notificationFactory)) {}

std::optional<RunError> Backup::validate(const BackupConfig& config, RunLogger& logger) const {
    std::error_code ec;
    if (config.backupToolPath.empty() || !fs::is_regular_file(config.backupToolPath, ec)) {
        RunError error{RunErrorKind::ToolNotFound, "Backup tool not found: '" + config.backupToolPath + "'"};
        logger.error(error.message);
        return error;
    }
    if (auto missing = config.missingRequiredField()) {
        RunError error{RunErrorKind::MissingField, "Required configuration field '" + *missing + "' is missing"};
        logger.error(error.message);
        return error;
    }
    return std::nullopt;
}

std::expected<RunResult, RunError> Backup::runBackup(const std::string& configFile) {
    const auto started = std::chrono::system_clock::now();

    auto config = loadConfig(configFile);
    if (!config) {
        return std::unexpected(fromConfigError(config.error()));
    }

    RunLogger logger(config->logPath, config->projectName, started);
    if (auto invalid = validate(*config, logger)) {
        return std::unexpected(*invalid);
    }

    RunResult report;
    report.startedAt = started;
    report.logFilePath = logger.filePath();
    logger.info("Starting backup of " + config->backupSource + " to " + config->repository);

    ResticCommandRunner commands(runner_, *config, logger);

    switch (commands.checkRepository(config->repository)) {
    case RepositoryState::Present:
        break;
    case RepositoryState::Absent: {
        logger.info("Repository not found, initializing");
        CommandResult init = commands.initRepository(config->repository);
        if (init.succeeded()) {
            logger.info("Repository initialized");
        } else if (ResticCommandRunner::isAlreadyInitialized(init.output)) {
            logger.warning("Repository is already initialized, continuing");
        } else {
            std::string message = "Repository initialization failed with exit code " + std::to_string(init.exitCode);
            logger.error(message);
            report.recordFailure(message);
        }
        break;
    }
    case RepositoryState::Unreachable: {
        std::string message = "Repository check failed; not attempting initialization";
        logger.error(message);
        report.recordFailure(message);
        break;
    }
    }

    CommandResult backup = commands.backup(config->backupSource, config->repository, config->useFilesystemSnapshot);
    if (backup.succeeded()) {
        logger.info("Backup completed");
    } else {
        std::string message = backup.timedOut ? std::string("Backup timed out")
                                              : "Backup failed with exit code " + std::to_string(backup.exitCode);
        logger.error(message);
        report.recordFailure(message);
    }

    report.totalSize = commands.stats(config->repository);
    if (report.totalSize) {
        logger.info("Repository total size: " + *report.totalSize);
    }

    RetentionEnforcer retention(commands, logger);
    if (auto pruned = retention.enforce(config->repository, config->retentionPolicy); pruned && !pruned->succeeded()) {
        report.recordFailure("Retention failed with exit code " + std::to_string(pruned->exitCode));
    }

    report.duration = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - started);
    logger.log(report.status == RunStatus::Success ? LogLevel::Info : LogLevel::Error,
               std::string("Backup run finished: ") + runStatusName(report.status) + " in " + formatDuration(report.duration));

    Notifier notifier(logger, notificationFactory_);
    notifier.notify(config->emailSettings, config->projectName, report);

    return report;
}

std::expected<CommandResult, RunError> Backup::listSnapshots(const std::string& configFile) {
    auto config = loadConfig(configFile);
    if (!config) {
        return std::unexpected(fromConfigError(config.error()));
    }

    RunLogger logger(config->logPath, config->projectName, std::chrono::system_clock::now());
    if (auto invalid = validate(*config, logger)) {
        return std::unexpected(*invalid);
    }

    ResticCommandRunner commands(runner_, *config, logger);
    CommandResult result = commands.listSnapshots(config->repository);
    if (!result.succeeded()) {
        logger.error("Listing snapshots failed with exit code " + std::to_string(result.exitCode));
    }
    return result;
}

std::expected<bool, RunError> Backup::initRepository(const std::string& configFile) {
    auto config = loadConfig(configFile);
    if (!config) {
        return std::unexpected(fromConfigError(config.error()));
    }

    RunLogger logger(config->logPath, config->projectName, std::chrono::system_clock::now());
    if (auto invalid = validate(*config, logger)) {
        return std::unexpected(*invalid);
    }

    ResticCommandRunner commands(runner_, *config, logger);
    CommandResult result = commands.initRepository(config->repository);
    if (result.succeeded()) {
        logger.info("Repository initialized: " + config->repository);
        return true;
    }
    if (ResticCommandRunner::isAlreadyInitialized(result.output)) {
        logger.warning("Repository is already initialized: " + config->repository);
        return true;
    }
    logger.error("Repository initialization failed with exit code " + std::to_string(result.exitCode));
    return false;
}

std::expected<void, std::string> Backup::scheduleDailyRun(TaskScheduler& scheduler, const ScheduledTask& task) {
    return scheduler.registerDaily(task);
}
