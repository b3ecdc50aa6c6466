/**
 * @file run_result.hpp
 * @brief Outcome of one backup run, consumed by the notifier.
 */

#ifndef RUN_RESULT_HPP
#define RUN_RESULT_HPP

#include <string>
#include <vector>
#include <optional>
#include <chrono>

enum class RunStatus {
    Success,
    Failure
};

const char* runStatusName(RunStatus status);

/**
 * @brief Formats a duration as HH:MM:SS.
 */
std::string formatDuration(std::chrono::seconds duration);

/**
 * @brief Report for a single run.
 *
 * Non-fatal failures are appended to `errors` and flip the status to Failure; the run itself
 * keeps going.
 */
struct RunResult {
    RunStatus status = RunStatus::Success;           ///< Overall outcome.
    std::optional<std::string> totalSize;            ///< Repository size from `stats`, if known.
    std::chrono::seconds duration{0};                ///< Wall time of the run.
    std::string logFilePath;                         ///< This run's log file.
    std::chrono::system_clock::time_point startedAt; ///< Run start, also embedded in the log file name.
    std::vector<std::string> errors;                 ///< One line per recorded failure.

    void recordFailure(const std::string& message) {
        status = RunStatus::Failure;
        errors.push_back(message);
    }
};

#endif // RUN_RESULT_HPP
