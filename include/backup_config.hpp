/**
 * @file backup_config.hpp
 * @brief Configuration records for the SnapVault backup orchestrator.
 *
 * Defines the per-target configuration (repository, credentials, retention policy,
 * email settings) and the JSON loader that reads it fresh on every run.
 *
 * @note Required fields are never defaulted. A missing required field loads as an empty
 * value and is reported by the orchestrator the first time it is needed.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <string>
#include <optional>
#include <expected>

/**
 * @brief Snapshot retention counts passed to `restic forget`.
 *
 * Each count is optional; an absent count produces no `--keep-*` flag.
 */
struct RetentionPolicy {
    std::optional<int> keepLast;    ///< --keep-last
    std::optional<int> keepDaily;   ///< --keep-daily
    std::optional<int> keepWeekly;  ///< --keep-weekly
    std::optional<int> keepMonthly; ///< --keep-monthly
    std::optional<int> keepYearly;  ///< --keep-yearly

    bool operator==(const RetentionPolicy&) const = default;
};

/**
 * @brief SMTP settings for the status report.
 */
struct EmailSettings {
    std::string smtpServer;   ///< SMTP host (e.g., "smtp.example.com").
    int smtpPort = 587;       ///< SMTP port. 465 selects implicit TLS, anything else STARTTLS.
    std::string smtpUser;     ///< SMTP login.
    std::string smtpPassword; ///< SMTP password (secret).
    std::string from;         ///< Sender address.
    std::string to;           ///< Recipient address.
    std::string subject;      ///< Subject prefix.

    bool operator==(const EmailSettings&) const = default;
};

/**
 * @brief Object-storage access keys, present only for S3 repositories.
 */
struct CloudCredentials {
    std::string accessKeyId;     ///< Exported as AWS_ACCESS_KEY_ID.
    std::string secretAccessKey; ///< Exported as AWS_SECRET_ACCESS_KEY.

    bool operator==(const CloudCredentials&) const = default;
};

/// Default per-subprocess timeout when the configuration does not set one.
inline constexpr int kDefaultCommandTimeoutSeconds = 4 * 60 * 60;

/**
 * @brief Configuration for one backup target.
 *
 * Loaded once per invocation and not modified afterwards.
 */
struct BackupConfig {
    std::string projectName;                         ///< Name used in log lines and reports.
    std::string logPath;                             ///< Log file prefix; a timestamp is appended per run.
    std::string backupSource;                        ///< Directory to back up.
    std::string backupToolPath;                      ///< Path to the restic executable.
    std::string repository;                          ///< Repository URI (sftp:... or s3:...).
    std::string repositoryPassword;                  ///< Repository password (secret).
    bool useFilesystemSnapshot = false;              ///< Pass --use-fs-snapshot to backup.
    std::optional<RetentionPolicy> retentionPolicy;  ///< Retention counts, if pruning is wanted.
    std::optional<EmailSettings> emailSettings;      ///< Report recipient, if any.
    std::optional<CloudCredentials> cloudCredentials; ///< S3 keys, if any.
    std::optional<int> commandTimeoutSeconds;        ///< Per-subprocess timeout override.

    /**
     * @brief Returns the JSON key of the first empty required field.
     *
     * Checks backup_source, repository and repository_password in that order.
     * The tool path is validated separately since it must also exist on disk.
     *
     * @return std::optional<std::string> Key of the missing field, or nullopt.
     */
    std::optional<std::string> missingRequiredField() const;

    /**
     * @brief Effective subprocess timeout in seconds; 0 means unlimited.
     */
    int effectiveTimeoutSeconds() const;

    bool operator==(const BackupConfig&) const = default;
};

enum class ConfigErrorKind {
    NotFound,
    Malformed
};

/**
 * @brief Error produced by the configuration loader.
 */
struct ConfigError {
    ConfigErrorKind kind; ///< Failure category.
    std::string message;  ///< Human-readable detail (file path, offending key).
};

/**
 * @brief Loads a configuration file.
 *
 * @param configFile Path to the JSON configuration file.
 * @return std::expected<BackupConfig, ConfigError> The configuration, or NotFound when the
 *         path is not a readable file, or Malformed when the content is not the expected shape.
 */
std::expected<BackupConfig, ConfigError> loadConfig(const std::string& configFile);

/**
 * @brief Writes a configuration file.
 *
 * Absent optional sections are omitted so that loading the file yields the same record.
 *
 * @param config Configuration to write.
 * @param configFile Destination path.
 * @return std::expected<void, std::string> Success or an error message.
 */
std::expected<void, std::string> saveConfig(const BackupConfig& config, const std::string& configFile);

#endif // BACKUP_CONFIG_HPP
