#include "backup_config.hpp"
#include <fstream>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <json/json.h>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Raised by the field readers when a key holds the wrong JSON type.
 */
class MalformedField : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

std::string readString(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return {};
    }
    if (!value.isString()) {
        throw MalformedField(std::string("Field '") + key + "' must be a string");
    }
    return value.asString();
}

bool readBool(const Json::Value& object, const char* key, bool fallback) {
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return fallback;
    }
    if (!value.isBool()) {
        throw MalformedField(std::string("Field '") + key + "' must be a boolean");
    }
    return value.asBool();
}

std::optional<int> readCount(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return std::nullopt;
    }
    if (!value.isInt() || value.asInt() < 0) {
        throw MalformedField(std::string("Field '") + key + "' must be a non-negative integer");
    }
    return value.asInt();
}

const Json::Value* readSection(const Json::Value& object, const char* key) {
    const Json::Value& value = object[key];
    if (value.isNull()) {
        return nullptr;
    }
    if (!value.isObject()) {
        throw MalformedField(std::string("Section '") + key + "' must be an object");
    }
    return &value;
}

void writeCount(Json::Value& object, const char* key, const std::optional<int>& count) {
    if (count) {
        object[key] = *count;
    }
}

} // namespace

std::optional<std::string> BackupConfig::missingRequiredField() const {
    if (backupSource.empty()) {
        return "backup_source";
    }
    if (repository.empty()) {
        return "repository";
    }
    if (repositoryPassword.empty()) {
        return "repository_password";
    }
    return std::nullopt;
}

int BackupConfig::effectiveTimeoutSeconds() const {
    return commandTimeoutSeconds.value_or(kDefaultCommandTimeoutSeconds);
}

std::expected<BackupConfig, ConfigError> loadConfig(const std::string& configFile) {
    std::error_code ec;
    if (!fs::is_regular_file(configFile, ec)) {
        return std::unexpected(ConfigError{ConfigErrorKind::NotFound, "Config file not found: " + configFile});
    }
    std::ifstream file(configFile);
    if (!file.is_open()) {
        return std::unexpected(ConfigError{ConfigErrorKind::NotFound, "Failed to open config file: " + configFile});
    }

    Json::Value configJson;
    Json::CharReaderBuilder builder;
    std::string parseErrors;
    if (!Json::parseFromStream(builder, file, &configJson, &parseErrors)) {
        return std::unexpected(ConfigError{ConfigErrorKind::Malformed,
                                           "Failed to parse config file: " + configFile + ": " + parseErrors});
    }
    if (!configJson.isObject()) {
        return std::unexpected(ConfigError{ConfigErrorKind::Malformed,
                                           "Config root must be a JSON object: " + configFile});
    }

    BackupConfig config;
    try {
        config.projectName = readString(configJson, "project_name");
        config.logPath = readString(configJson, "log_path");
        config.backupSource = readString(configJson, "backup_source");
        config.backupToolPath = readString(configJson, "backup_tool_path");
        config.repository = readString(configJson, "repository");
        config.repositoryPassword = readString(configJson, "repository_password");
        config.useFilesystemSnapshot = readBool(configJson, "use_filesystem_snapshot", false);
        config.commandTimeoutSeconds = readCount(configJson, "command_timeout_seconds");

        if (const Json::Value* retention = readSection(configJson, "retention_policy")) {
            RetentionPolicy policy;
            policy.keepLast = readCount(*retention, "keep_last");
            policy.keepDaily = readCount(*retention, "keep_daily");
            policy.keepWeekly = readCount(*retention, "keep_weekly");
            policy.keepMonthly = readCount(*retention, "keep_monthly");
            policy.keepYearly = readCount(*retention, "keep_yearly");
            config.retentionPolicy = policy;
        }

        if (const Json::Value* email = readSection(configJson, "email")) {
            EmailSettings settings;
            settings.smtpServer = readString(*email, "smtp_server");
            settings.smtpPort = readCount(*email, "smtp_port").value_or(settings.smtpPort);
            settings.smtpUser = readString(*email, "smtp_user");
            settings.smtpPassword = readString(*email, "smtp_password");
            settings.from = readString(*email, "from");
            settings.to = readString(*email, "to");
            settings.subject = readString(*email, "subject");
            config.emailSettings = settings;
        }

        if (const Json::Value* cloud = readSection(configJson, "cloud_credentials")) {
            CloudCredentials credentials;
            credentials.accessKeyId = readString(*cloud, "access_key_id");
            credentials.secretAccessKey = readString(*cloud, "secret_access_key");
            config.cloudCredentials = credentials;
        }
    } catch (const MalformedField& e) {
        return std::unexpected(ConfigError{ConfigErrorKind::Malformed, configFile + ": " + e.what()});
    }

    return config;
}

std::expected<void, std::string> saveConfig(const BackupConfig& config, const std::string& configFile) {
    Json::Value configJson(Json::objectValue);
    configJson["project_name"] = config.projectName;
    configJson["log_path"] = config.logPath;
    configJson["backup_source"] = config.backupSource;
    configJson["backup_tool_path"] = config.backupToolPath;
    configJson["repository"] = config.repository;
    configJson["repository_password"] = config.repositoryPassword;
    configJson["use_filesystem_snapshot"] = config.useFilesystemSnapshot;
    writeCount(configJson, "command_timeout_seconds", config.commandTimeoutSeconds);

    if (config.retentionPolicy) {
        Json::Value retention(Json::objectValue);
        writeCount(retention, "keep_last", config.retentionPolicy->keepLast);
        writeCount(retention, "keep_daily", config.retentionPolicy->keepDaily);
        writeCount(retention, "keep_weekly", config.retentionPolicy->keepWeekly);
        writeCount(retention, "keep_monthly", config.retentionPolicy->keepMonthly);
        writeCount(retention, "keep_yearly", config.retentionPolicy->keepYearly);
        configJson["retention_policy"] = retention;
    }

    if (config.emailSettings) {
        Json::Value email(Json::objectValue);
        email["smtp_server"] = config.emailSettings->smtpServer;
        email["smtp_port"] = config.emailSettings->smtpPort;
        email["smtp_user"] = config.emailSettings->smtpUser;
        email["smtp_password"] = config.emailSettings->smtpPassword;
        email["from"] = config.emailSettings->from;
        email["to"] = config.emailSettings->to;
        email["subject"] = config.emailSettings->subject;
        configJson["email"] = email;
    }

    if (config.cloudCredentials) {
        Json::Value cloud(Json::objectValue);
        cloud["access_key_id"] = config.cloudCredentials->accessKeyId;
        cloud["secret_access_key"] = config.cloudCredentials->secretAccessKey;
        configJson["cloud_credentials"] = cloud;
    }

    std::ofstream outFile(configFile);
    if (!outFile.is_open()) {
        return std::unexpected("Failed to open config file for writing: " + configFile);
    }
    Json::StreamWriterBuilder builder;
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(configJson, &outFile);
    outFile << '\n';
    if (!outFile) {
        return std::unexpected("Failed to write config file: " + configFile);
    }
    return {};
}
