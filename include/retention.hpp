/**
 * @file retention.hpp
 * @brief Applies the configured retention policy after a backup.
 */

#ifndef RETENTION_HPP
#define RETENTION_HPP

#include <optional>
#include <string>
#include "backup_config.hpp"
#include "restic_command.hpp"

/**
 * @brief Decides whether pruning runs and delegates it to restic.
 */
class RetentionEnforcer {
public:
    RetentionEnforcer(ResticCommandRunner& commands, RunLogger& logger);

    /**
     * @brief Runs `forget --prune` when a policy is configured.
     *
     * Without a policy nothing is run and nothing is logged.
     *
     * @param repo Repository URI.
     * @param policy Retention policy, if any.
     * @return std::optional<CommandResult> The forget result, or nullopt when no policy is set.
     */
    std::optional<CommandResult> enforce(const std::string& repo, const std::optional<RetentionPolicy>& policy);

private:
    ResticCommandRunner& commands_;
    RunLogger& logger_;
};

#endif // RETENTION_HPP
