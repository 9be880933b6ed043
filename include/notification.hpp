/**
 * @file notification.hpp
 * @brief Defines notification strategies for backup status events.
 *
 * The scheduler reports each run as a `system_backup_completed` or `system_backup_failed`
 * event. Delivery to administrators happens outside this process; the webhook strategy
 * hands the event to that collaborator over HTTP.
 *
 * @note Requires libcurl for webhook notifications.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <string>
#include <expected>
#include <json/json.h>

/**
 * @brief Interface for notification strategies.
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
     * @param event Event type (e.g. "system_backup_completed").
     * @param message Human-readable summary.
     * @param details JSON object with artifact paths or error text.
     * @return std::expected<void, std::string> Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const std::string& event,
                                                    const std::string& message,
                                                    const Json::Value& details) = 0;
};

/**
 * @brief Webhook notification strategy.
 *
 * POSTs `{"event": ..., "message": ..., "details": {...}}` as JSON to a URL.
 */
class WebhookNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @brief Constructs a webhook notification strategy.
     *
     * @param url Endpoint receiving the events.
     * @param timeoutSeconds Whole-request timeout.
     * @throws std::runtime_error If the URL is empty.
     */
    WebhookNotificationStrategy(std::string url, long timeoutSeconds);

    std::expected<void, std::string> notify(const std::string& event,
                                            const std::string& message,
                                            const Json::Value& details) override;

    /**
     * @brief Builds the JSON request body for an event.
     */
    static std::string buildPayload(const std::string& event, const std::string& message, const Json::Value& details);

private:
    std::string url;     ///< Webhook endpoint.
    long timeoutSeconds; ///< Request timeout.
};

#endif // NOTIFICATION_HPP
