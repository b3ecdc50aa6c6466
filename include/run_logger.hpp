/**
 * @file run_logger.hpp
 * @brief Per-run log file for SnapVault.
 *
 * Each run writes to its own file named `<prefix>-<YYYYMMDDHHMMSS>.log`, with lines of the
 * form `<timestamp> [<LEVEL>] <project>: <message>`. The logger is created once per run and
 * passed by reference to every component that reports progress.
 */

#ifndef RUN_LOGGER_HPP
#define RUN_LOGGER_HPP

#include <cstddef>
#include <string>
#include <vector>
#include <chrono>

enum class LogLevel {
    Info,
    Warning,
    Error
};

/**
 * @brief Converts a log level to the tag written in brackets.
 */
const char* logLevelName(LogLevel level);

/**
 * @brief Formats a time point in local time with a strftime pattern.
 *
 * @param time Time point to format.
 * @param pattern strftime pattern (e.g., "%Y%m%d%H%M%S").
 * @return std::string Formatted time.
 */
std::string formatLocalTime(std::chrono::system_clock::time_point time, const char* pattern);

/// Shortest secret the logger will mask.
inline constexpr std::size_t kMinMaskedSecretLength = 4;

/**
 * @brief Append-only log for one backup run.
 *
 * Messages are echoed to the console (errors to stderr) and appended to the run's log file.
 * Registered secret values are masked before anything is written.
 */
class RunLogger {
public:
    /**
     * @brief Creates the logger for a run.
     *
     * Creates the log directory if needed. The file itself is opened in append mode on
     * each write, so an existing file with the same name is never truncated.
     *
     * @param logPrefix Log path prefix from the configuration. Empty means "snapvault" in
     *        the working directory.
     * @param projectName Project name written on every line.
     * @param runStart Start time of the run; embedded in the file name.
     */
    RunLogger(const std::string& logPrefix, std::string projectName,
              std::chrono::system_clock::time_point runStart);

    void info(const std::string& message) const;
    void warning(const std::string& message) const;
    void error(const std::string& message) const;

    /**
     * @brief Writes a single line at the given level.
     */
    void log(LogLevel level, const std::string& message) const;

    /**
     * @brief Registers a secret value to mask in all later log lines.
     *
     * Values shorter than kMinMaskedSecretLength are not masked, since masking every
     * occurrence of a one- or two-character string would reveal it; a WARNING is logged
     * instead. Empty values are ignored silently.
     */
    void addSecret(const std::string& secret);

    /**
     * @brief Replaces every registered secret in the text with "***", longest first.
     */
    std::string redact(std::string text) const;

    const std::string& filePath() const { return filePath_; }
    const std::string& projectName() const { return projectName_; }

private:
    std::string filePath_;             ///< Full path of this run's log file.
    std::string projectName_;          ///< Project name written on every line.
    std::vector<std::string> secrets_; ///< Values masked before writing.
};

#endif // RUN_LOGGER_HPP
