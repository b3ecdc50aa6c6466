#include "retention.hpp"

RetentionEnforcer::RetentionEnforcer(ResticCommandRunner& commands, RunLogger& logger)
    : commands_(commands), logger_(logger) {}

std::optional<CommandResult> RetentionEnforcer::enforce(const std::string& repo,
                                                        const std::optional<RetentionPolicy>& policy) {
    if (!policy) {
        return std::nullopt;
    }

    logger_.info("Applying retention policy");
    CommandResult result = commands_.forget(repo, *policy);
    if (result.succeeded()) {
        logger_.info("Retention policy applied");
    } else {
        logger_.error("Retention failed with exit code " + std::to_string(result.exitCode));
    }
    return result;
}
