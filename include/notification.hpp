/**
 * @file notification.hpp
 * @brief Notification sinks for job outcomes.
 *
 * Every terminal job is reported once to every configured sink. Delivery is fire and
 * forget: a sink failure is logged and never changes the outcome of the job.
 *
 * @note Requires libcurl for the Gotify and healthcheck sinks.
 */

#ifndef NOTIFICATION_HPP
#define NOTIFICATION_HPP

#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "backup_job.hpp"
#include "logger.hpp"

/**
 * @brief Interface for notification strategies.
 */
class NotificationStrategy {
public:
    virtual ~NotificationStrategy() = default;

    /**
     * @brief Delivers the outcome of a job.
     *
     * @return Success or an error message.
     */
    virtual std::expected<void, std::string> notify(const HistoryEntry& entry) = 0;

    /**
     * @brief Sink name used in log lines.
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Gotify notification strategy.
 *
 * Posts {title, message, priority} to "<url>/message?token=<token>".
 */
class GotifyNotificationStrategy : public NotificationStrategy {
public:
    /**
     * @throws std::runtime_error If url or token is empty.
     */
    GotifyNotificationStrategy(std::string url, std::string token);

    std::expected<void, std::string> notify(const HistoryEntry& entry) override;
    std::string name() const override { return "gotify"; }

    /**
     * @brief Message priority: 5 on success, 8 on failure or partial, 10 on critical.
     */
    static int priority(const HistoryEntry& entry);

private:
    std::string url;   ///< Gotify server base URL.
    std::string token; ///< Application token.
};

/**
 * @brief Heartbeat ping, sent on success only.
 */
class HealthcheckNotificationStrategy : public NotificationStrategy {
public:
    explicit HealthcheckNotificationStrategy(std::string url);

    std::expected<void, std::string> notify(const HistoryEntry& entry) override;
    std::string name() const override { return "healthcheck"; }

private:
    std::string url;
};

/**
 * @brief Fans a job outcome out to every registered sink.
 */
class Notifier {
public:
    explicit Notifier(const Logger& logger);

    void addSink(std::unique_ptr<NotificationStrategy> sink);

    /**
     * @brief Replaces every sink, e.g. after a configuration reload.
     */
    void setSinks(std::vector<std::unique_ptr<NotificationStrategy>> replacement);

    /**
     * @brief Sends the outcome to all sinks; failures are logged.
     *
     * Delivery runs outside the sink lock, so concurrent jobs do not wait on each other's sinks.
     */
    void notify(const HistoryEntry& entry);

    std::size_t sinkCount() const;

private:
    const Logger& logger;
    mutable std::mutex mutex;
    std::vector<std::shared_ptr<NotificationStrategy>> sinks;
};

/**
 * @brief Short title for a job outcome, e.g. "Backup success: db".
 */
std::string notificationTitle(const HistoryEntry& entry);

/**
 * @brief Multi-line description of a job outcome.
 */
std::string notificationMessage(const HistoryEntry& entry);

#endif // NOTIFICATION_HPP
