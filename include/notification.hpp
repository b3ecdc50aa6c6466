/**
 * @file notification.hpp
 * @brief Defines notification strategies for SnapVault.
 *
 * Provides the interface and SMTP implementation used to deliver the run report, plus the
 * Notifier that composes the report and delivers it on a best-effort basis.
 *
 * @note Requires libcurl built with SMTP and TLS support.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <string>
#include <memory>
#include <optional>
#include <expected>
#include <functional>
#include "backup_config.hpp"
#include "run_logger.hpp"
#include "run_result.hpp"

/**
 * @brief Interface for notification strategies.
 *
 * Defines the contract for sending notifications about backup status.
 */
class NotificationStrategy {
public:
    /**
     * @brief Virtual destructor for safe polymorphism.
     */
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Sends a notification.
     *
     * @param subject Message subject.
     * @param body Plain-text message body.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::string& subject, const std::string& body) = 0;
};

/**
 * @brief Email notification strategy.
 *
 * Sends notifications through SMTP with TLS required: implicit TLS on port 465,
 * STARTTLS on any other port.
 */
class EmailNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs an email notification strategy.
     *
     * @param settings SMTP server, credentials and addresses.
     */
    explicit EmailNotificationStrategy(EmailSettings settings);

    /**
     * @brief Sends a notification via email.
     *
     * @param subject Message subject.
     * @param body Plain-text message body.
     * @return std::expected<void, std::string> Success or an error message from libcurl.
     */
    std::expected<void, std::string> notify(const std::string& subject, const std::string& body) override;

    /**
     * @brief Builds the SMTP URL for the configured server and port.
     */
    std::string smtpUrl() const;

private:
    EmailSettings settings_; ///< SMTP configuration.
};

/// Creates the delivery strategy for a set of email settings.
using NotificationFactory = std::function<std::unique_ptr<NotificationStrategy>(const EmailSettings&)>;

/**
 * @brief Default factory returning an EmailNotificationStrategy.
 */
std::unique_ptr<NotificationStrategy> makeEmailNotification(const EmailSettings& settings);

/**
 * @brief Composes the run report and delivers it.
 *
 * Delivery failures are logged and never propagated: by the time the report is sent, the
 * run's outcome is final.
 */
class Notifier {
public:
    Notifier(RunLogger& logger, NotificationFactory factory = makeEmailNotification);

    /**
     * @brief Sends the report if email settings are configured.
     *
     * @param settings Email settings; nullopt disables notification.
     * @param projectName Project the report is about.
     * @param report Finished run result. Never modified.
     * @return bool True if a message was delivered.
     */
    bool notify(const std::optional<EmailSettings>& settings, const std::string& projectName, const RunResult& report);

    static std::string composeSubject(const EmailSettings& settings, const std::string& projectName,
                                      const RunResult& report);

    /**
     * @brief Builds the plain-text report body.
     *
     * Deterministic for a given project and report (start time is rendered in local time).
     */
    static std::string composeBody(const std::string& projectName, const RunResult& report);

private:
    RunLogger& logger_;
    NotificationFactory factory_;
};

#endif // NOTIFICATION_HPP
