/**
 * @file restic_command.hpp
 * @brief Builds and runs restic invocations.
 *
 * Every call runs `<tool> -r <repository> <subcommand...>` through a ProcessRunner with the
 * repository password (and S3 keys, when configured) exported only for the lifetime of
 * that single subprocess. Results are classified by exit code; nothing is retried.
 */

#ifndef RESTIC_COMMAND_HPP
#define RESTIC_COMMAND_HPP

#include <string>
#include <vector>
#include <map>
#include <optional>
#include "backup_config.hpp"
#include "process_runner.hpp"
#include "run_logger.hpp"

/// Environment variable names restic reads its credentials from.
inline constexpr const char* kResticPasswordEnv = "RESTIC_PASSWORD";
inline constexpr const char* kAwsAccessKeyEnv = "AWS_ACCESS_KEY_ID";
inline constexpr const char* kAwsSecretKeyEnv = "AWS_SECRET_ACCESS_KEY";

/**
 * @brief Result of probing a repository with `snapshots`.
 */
enum class RepositoryState {
    Present,    ///< The listing succeeded.
    Absent,     ///< restic reported that no repository exists at the location.
    Unreachable ///< Any other failure (authentication, network, wrong password, timeout).
};

const char* repositoryStateName(RepositoryState state);

/**
 * @brief restic command builder and executor for one configured target.
 */
class ResticCommandRunner {
public:
    /**
     * @brief Constructs a runner bound to a configuration and a run log.
     *
     * Registers the configured secrets with the logger so they are masked in captured output.
     *
     * @param runner Process runner used for every invocation.
     * @param config Target configuration (tool path, credentials, timeout).
     * @param logger Log for this run.
     */
    ResticCommandRunner(ProcessRunner& runner, const BackupConfig& config, RunLogger& logger);

    /**
     * @brief Checks whether the repository exists.
     *
     * @param repo Repository URI.
     * @return RepositoryState Present, Absent (needs init), or Unreachable.
     */
    RepositoryState checkRepository(const std::string& repo);

    /**
     * @brief Runs `init`.
     *
     * @param repo Repository URI.
     * @return CommandResult Raw result; use isAlreadyInitialized() on its output to tell a
     *         repeated init from a real failure.
     */
    CommandResult initRepository(const std::string& repo);

    /**
     * @brief Runs `backup <source> [--use-fs-snapshot]`.
     */
    CommandResult backup(const std::string& source, const std::string& repo, bool useSnapshot);

    /**
     * @brief Runs `stats` and extracts the total size.
     *
     * @return std::optional<std::string> The "Total Size" value (e.g., "1.234 GiB"), or nullopt
     *         if the command failed or its output did not contain the expected line.
     */
    std::optional<std::string> stats(const std::string& repo);

    /**
     * @brief Runs `forget --prune` with the flags present in the policy.
     */
    CommandResult forget(const std::string& repo, const RetentionPolicy& policy);

    /**
     * @brief Runs `snapshots`.
     */
    CommandResult listSnapshots(const std::string& repo);

    /**
     * @brief Environment entries exported for each invocation.
     */
    std::map<std::string, std::string> secretEnvironment() const;

    static std::vector<std::string> buildBackupArgs(const std::string& source, bool useSnapshot);
    static std::vector<std::string> buildForgetArgs(const RetentionPolicy& policy);

    /**
     * @brief Extracts the value of the "Total Size:" line from `stats` output.
     */
    static std::optional<std::string> parseTotalSize(const std::string& output);

    static bool isAlreadyInitialized(const std::string& output);
    static RepositoryState classifyRepositoryCheck(const CommandResult& result);

private:
    /**
     * @brief Runs restic with `-r <repo>` followed by the given arguments.
     *
     * Never throws; a process that cannot be started is reported as exit code -1 with the
     * error message as output.
     */
    CommandResult execute(const std::string& repo, const std::vector<std::string>& args);

    ProcessRunner& runner_;
    const BackupConfig& config_;
    RunLogger& logger_;
};

#endif // RESTIC_COMMAND_HPP
