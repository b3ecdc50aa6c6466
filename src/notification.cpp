#include "notification.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <exception>
#include <utility>

namespace {

/**
 * @brief Feeds the message payload to libcurl's upload.
 */
struct UploadSource {
    std::string data;
    std::size_t offset = 0;
};

size_t readCallback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* source = static_cast<UploadSource*>(userp);
    std::size_t room = size * nitems;
    std::size_t remaining = source->data.size() - source->offset;
    std::size_t count = std::min(room, remaining);
    if (count > 0) {
        std::memcpy(buffer, source->data.data() + source->offset, count);
        source->offset += count;
    }
    return count;
}

std::string angleAddress(const std::string& address) {
    if (!address.empty() && address.front() == '<') {
        return address;
    }
    return "<" + address + ">";
}

std::string buildPayload(const EmailSettings& settings, const std::string& subject, const std::string& body) {
    std::string payload;
    payload += "Date: " + formatLocalTime(std::chrono::system_clock::now(), "%a, %d %b %Y %H:%M:%S %z") + "\r\n";
    payload += "To: " + settings.to + "\r\n";
    payload += "From: " + settings.from + "\r\n";
    payload += "Subject: " + subject + "\r\n";
    payload += "MIME-Version: 1.0\r\n";
    payload += "Content-Type: text/plain; charset=utf-8\r\n";
    payload += "\r\n";
    for (char c : body) {
        if (c == '\n') {
            payload += "\r\n";
        } else {
            payload += c;
        }
    }
    payload += "\r\n";
    return payload;
}

} // namespace

EmailNotificationStrategy::EmailNotificationStrategy(EmailSettings settings)
    : settings_(std::move(settings)) {}

std::string EmailNotificationStrategy::smtpUrl() const {
    const char* scheme = settings_.smtpPort == 465 ? "smtps" : "smtp";
    return std::string(scheme) + "://" + settings_.smtpServer + ":" + std::to_string(settings_.smtpPort);
}

std::expected<void, std::string> EmailNotificationStrategy::notify(const std::string& subject, const std::string& body) {
    if (settings_.smtpServer.empty() || settings_.to.empty() || settings_.from.empty()) {
        return std::unexpected("Email settings require smtp_server, from and to");
    }

    CURL* curl = curl_easy_init();
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    UploadSource source{buildPayload(settings_, subject, body)};
    std::string url = smtpUrl();
    std::string mailFrom = angleAddress(settings_.from);
    curl_slist* recipients = curl_slist_append(nullptr, angleAddress(settings_.to).c_str());

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
    if (!settings_.smtpUser.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERNAME, settings_.smtpUser.c_str());
        curl_easy_setopt(curl, CURLOPT_PASSWORD, settings_.smtpPassword.c_str());
    }
    curl_easy_setopt(curl, CURLOPT_MAIL_FROM, mailFrom.c_str());
    curl_easy_setopt(curl, CURLOPT_MAIL_RCPT, recipients);
    curl_easy_setopt(curl, CURLOPT_READFUNCTION, readCallback);
    curl_easy_setopt(curl, CURLOPT_READDATA, &source);
    curl_easy_setopt(curl, CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 120L);

    CURLcode res = curl_easy_perform(curl);
    curl_slist_free_all(recipients);
    curl_easy_cleanup(curl);
    if (res != CURLE_OK) {
        return std::unexpected(std::string("Failed to send email notification: ") + curl_easy_strerror(res));
    }
    return {};
}

std::unique_ptr<NotificationStrategy> makeEmailNotification(const EmailSettings& settings) {
    return std::make_unique<EmailNotificationStrategy>(settings);
}

Notifier::Notifier(RunLogger& logger, NotificationFactory factory)
    : logger_(logger), factory_(std::move(factory)) {}

std::string Notifier::composeSubject(const EmailSettings& settings, const std::string& projectName,
                                     const RunResult& report) {
    std::string prefix = settings.subject.empty() ? "Backup report" : settings.subject;
    return prefix + " - " + projectName + " - " + runStatusName(report.status);
}

std::string Notifier::composeBody(const std::string& projectName, const RunResult& report) {
    std::string body;
    body += "Project: " + projectName + "\n";
    body += std::string("Status: ") + runStatusName(report.status) + "\n";
    body += "Started: " + formatLocalTime(report.startedAt, "%Y-%m-%d %H:%M:%S") + "\n";
    body += "Duration: " + formatDuration(report.duration) + "\n";
    body += "Total size: " + report.totalSize.value_or("unknown") + "\n";
    body += "Log file: " + report.logFilePath + "\n";
    if (!report.errors.empty()) {
        body += "\nErrors:\n";
        for (const auto& error : report.errors) {
            body += "- " + error + "\n";
        }
    }
    return body;
}

bool Notifier::notify(const std::optional<EmailSettings>& settings, const std::string& projectName,
                      const RunResult& report) {
    if (!settings) {
        return false;
    }
    logger_.addSecret(settings->smtpPassword);

    try {
        auto strategy = factory_(*settings);
        if (!strategy) {
            logger_.error("No notification strategy available for " + settings->smtpServer);
            return false;
        }
        auto result = strategy->notify(composeSubject(*settings, projectName, report), composeBody(projectName, report));
        if (!result) {
            logger_.error("Notification failed: " + result.error());
            return false;
        }
    } catch (const std::exception& e) {
        logger_.error(std::string("Notification failed: ") + e.what());
        return false;
    }

    logger_.info("Notification sent to " + settings->to);
    return true;
}
