/**
 * @file process_runner.hpp
 * @brief Subprocess execution for SnapVault.
 *
 * Commands are given as discrete argument vectors and executed without a shell, so no
 * argument is ever re-interpreted. Standard output and standard error are merged into a
 * single captured buffer.
 */

#ifndef PROCESS_RUNNER_HPP
#define PROCESS_RUNNER_HPP

#include <string>
#include <vector>
#include <chrono>
#include <expected>

/**
 * @brief Outcome of one subprocess invocation.
 */
struct CommandResult {
    int exitCode = -1;     ///< Process exit status; -1 if it was killed or did not exit normally.
    std::string output;    ///< Captured stdout and stderr, interleaved.
    bool timedOut = false; ///< True if the process was killed for exceeding its timeout.

    /**
     * @brief Success is decided by exit code alone.
     */
    bool succeeded() const { return exitCode == 0 && !timedOut; }
};

/**
 * @brief Interface for running external commands.
 *
 * The orchestrator depends on this interface rather than on fork/exec directly, so a
 * test can substitute a scripted implementation.
 */
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /**
     * @brief Runs a command to completion.
     *
     * @param argv Program path followed by its arguments. argv[0] must be a path; PATH is not searched.
     * @param timeout Maximum run time. Zero means no limit.
     * @return std::expected<CommandResult, std::string> The result, or an error message if the
     *         process could not be started at all.
     */
    virtual std::expected<CommandResult, std::string> run(const std::vector<std::string>& argv,
                                                          std::chrono::seconds timeout) = 0;
};

/**
 * @brief fork/execv implementation of ProcessRunner.
 *
 * The child inherits the current environment, including any entries exported by an
 * enclosing SecretScope. stdin is redirected from /dev/null.
 *
 * The child runs in its own process group. The call returns when the child exits, even
 * if a descendant keeps the output pipe open; on timeout the whole group is killed.
 */
class PosixProcessRunner : public ProcessRunner {
public:
    std::expected<CommandResult, std::string> run(const std::vector<std::string>& argv,
                                                  std::chrono::seconds timeout) override;
};

/**
 * @brief Joins an argument vector with spaces for log output.
 */
std::string describeCommand(const std::vector<std::string>& argv);

#endif // PROCESS_RUNNER_HPP
