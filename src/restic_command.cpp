#include "restic_command.hpp"
#include "secret_scope.hpp"
#include <sstream>
#include <stdexcept>

namespace {

/// restic exit code for "repository does not exist" (restic 0.17 and later).
constexpr int kResticRepositoryMissing = 10;

void appendKeep(std::vector<std::string>& args, const char* flag, const std::optional<int>& count) {
    if (count) {
        args.emplace_back(flag);
        args.push_back(std::to_string(*count));
    }
}

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto first = text.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return {};
    }
    auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

} // namespace

const char* repositoryStateName(RepositoryState state) {
    switch (state) {
    case RepositoryState::Present:
        return "present";
    case RepositoryState::Absent:
        return "absent";
    case RepositoryState::Unreachable:
        return "unreachable";
    }
    return "unreachable";
}

ResticCommandRunner::ResticCommandRunner(ProcessRunner& runner, const BackupConfig& config, RunLogger& logger)
    : runner_(runner), config_(config), logger_(logger) {
    logger_.addSecret(config_.repositoryPassword);
    if (config_.cloudCredentials) {
        logger_.addSecret(config_.cloudCredentials->accessKeyId);
        logger_.addSecret(config_.cloudCredentials->secretAccessKey);
    }
}

std::map<std::string, std::string> ResticCommandRunner::secretEnvironment() const {
    std::map<std::string, std::string> secrets{{kResticPasswordEnv, config_.repositoryPassword}};
    if (config_.cloudCredentials) {
        secrets[kAwsAccessKeyEnv] = config_.cloudCredentials->accessKeyId;
        secrets[kAwsSecretKeyEnv] = config_.cloudCredentials->secretAccessKey;
    }
    return secrets;
}

CommandResult ResticCommandRunner::execute(const std::string& repo, const std::vector<std::string>& args) {
    std::vector<std::string> argv{config_.backupToolPath, "-r", repo};
    argv.insert(argv.end(), args.begin(), args.end());
    logger_.info("Running: " + describeCommand(argv));

    std::chrono::seconds timeout(config_.effectiveTimeoutSeconds());
    CommandResult result;
    try {
        auto outcome = withSecrets(secretEnvironment(), [&] { return runner_.run(argv, timeout); });
        if (outcome) {
            result = std::move(*outcome);
        } else {
            result.output = outcome.error();
        }
    } catch (const std::runtime_error& e) {
        result.output = e.what();
    }

    std::istringstream lines(result.output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            logger_.info(line);
        }
    }
    if (result.timedOut) {
        logger_.error("Command timed out after " + std::to_string(timeout.count()) + " seconds: " + describeCommand(argv));
    }
    return result;
}

RepositoryState ResticCommandRunner::classifyRepositoryCheck(const CommandResult& result) {
    if (result.succeeded()) {
        return RepositoryState::Present;
    }
    if (result.timedOut) {
        return RepositoryState::Unreachable;
    }
    if (result.exitCode == kResticRepositoryMissing
        || result.output.find("repository does not exist") != std::string::npos
        || result.output.find("Is there a repository at the following location?") != std::string::npos) {
        return RepositoryState::Absent;
    }
    return RepositoryState::Unreachable;
}

RepositoryState ResticCommandRunner::checkRepository(const std::string& repo) {
    auto state = classifyRepositoryCheck(execute(repo, {"snapshots"}));
    logger_.info(std::string("Repository ") + repo + " is " + repositoryStateName(state));
    return state;
}

bool ResticCommandRunner::isAlreadyInitialized(const std::string& output) {
    return output.find("already initialized") != std::string::npos
        || output.find("config file already exists") != std::string::npos;
}

CommandResult ResticCommandRunner::initRepository(const std::string& repo) {
    return execute(repo, {"init"});
}

std::vector<std::string> ResticCommandRunner::buildBackupArgs(const std::string& source, bool useSnapshot) {
    std::vector<std::string> args{"backup", source};
    if (useSnapshot) {
        args.emplace_back("--use-fs-snapshot");
    }
    return args;
}

CommandResult ResticCommandRunner::backup(const std::string& source, const std::string& repo, bool useSnapshot) {
    return execute(repo, buildBackupArgs(source, useSnapshot));
}

std::optional<std::string> ResticCommandRunner::parseTotalSize(const std::string& output) {
    const std::string label = "Total Size:";
    auto pos = output.find(label);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    auto start = pos + label.size();
    auto end = output.find('\n', start);
    std::string value = trim(output.substr(start, end == std::string::npos ? std::string::npos : end - start));
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::string> ResticCommandRunner::stats(const std::string& repo) {
    CommandResult result = execute(repo, {"stats"});
    if (!result.succeeded()) {
        logger_.warning("stats failed with exit code " + std::to_string(result.exitCode) + ", size unknown");
        return std::nullopt;
    }
    auto size = parseTotalSize(result.output);
    if (!size) {
        logger_.warning("Could not find total size in stats output");
    }
    return size;
}

std::vector<std::string> ResticCommandRunner::buildForgetArgs(const RetentionPolicy& policy) {
    std::vector<std::string> args{"forget", "--prune"};
    appendKeep(args, "--keep-last", policy.keepLast);
    appendKeep(args, "--keep-daily", policy.keepDaily);
    appendKeep(args, "--keep-weekly", policy.keepWeekly);
    appendKeep(args, "--keep-monthly", policy.keepMonthly);
    appendKeep(args, "--keep-yearly", policy.keepYearly);
    return args;
}

CommandResult ResticCommandRunner::forget(const std::string& repo, const RetentionPolicy& policy) {
    return execute(repo, buildForgetArgs(policy));
}

CommandResult ResticCommandRunner::listSnapshots(const std::string& repo) {
    return execute(repo, {"snapshots"});
}
