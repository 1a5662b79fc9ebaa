#include "notification.hpp"
#include "http_client.hpp"
#include <format>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <json/json.h>

namespace {

std::string humanSize(std::uintmax_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < std::size(units)) {
        value /= 1024.0;
        ++unit;
    }
    return unit == 0 ? std::format("{} B", bytes) : std::format("{:.1f} {}", value, units[unit]);
}

} // namespace

std::string notificationTitle(const HistoryEntry& entry) {
    if (entry.error && entry.error->severity() == Severity::Critical) {
        return std::format("CRITICAL backup failure: {}", entry.target);
    }
    return std::format("Backup {}: {}", toString(entry.status), entry.target);
}

std::string notificationMessage(const HistoryEntry& entry) {
    std::string message = std::format("Job {} ({}, {}) finished with status {} in {:.1f}s", entry.jobId,
                                      toString(entry.kind), toString(entry.origin), toString(entry.status),
                                      static_cast<double>(entry.duration().count()) / 1000.0);
    if (!entry.archiveName.empty()) {
        message += std::format("\nArchive: {} ({})", entry.archiveName, humanSize(entry.archiveSize));
        if (entry.archiveRetainedLocally) {
            message += "\nArchive kept on local storage";
        }
    }
    if (!entry.failedWorkloads.empty()) {
        std::string names;
        for (const auto& name : entry.failedWorkloads) {
            names += names.empty() ? name : ", " + name;
        }
        message += std::format("\nFailed workloads: {}", names);
    }
    if (entry.error) {
        message += std::format("\n{}", entry.error->describe());
    }
    return message;
}

GotifyNotificationStrategy::GotifyNotificationStrategy(std::string url, std::string token)
    : url(std::move(url)), token(std::move(token)) {
    if (this->url.empty() || this->token.empty()) {
        throw std::runtime_error("Gotify notification requires gotify.url and gotify.token");
    }
    while (this->url.ends_with('/')) {
        this->url.pop_back();
    }
}

int GotifyNotificationStrategy::priority(const HistoryEntry& entry) {
    if (entry.error && entry.error->severity() == Severity::Critical) {
        return 10;
    }
    return entry.status == JobStatus::Success ? 5 : 8;
}

std::expected<void, std::string> GotifyNotificationStrategy::notify(const HistoryEntry& entry) {
    Json::Value body;
    body["title"] = notificationTitle(entry);
    body["message"] = notificationMessage(entry);
    body["priority"] = priority(entry);

    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";

    HttpRequest request;
    request.method = "POST";
    request.url = std::format("{}/message?token={}", url, urlEscape(token));
    request.headers.push_back("Content-Type: application/json");
    request.body = Json::writeString(writer, body);

    auto response = performHttpRequest(request);
    if (!response) {
        return std::unexpected(std::format("Failed to send Gotify notification: {}", response.error().message));
    }
    if (response->status < 200 || response->status >= 300) {
        return std::unexpected(std::format("Gotify rejected notification with HTTP {}", response->status));
    }
    return {};
}

HealthcheckNotificationStrategy::HealthcheckNotificationStrategy(std::string url) : url(std::move(url)) {}

std::expected<void, std::string> HealthcheckNotificationStrategy::notify(const HistoryEntry& entry) {
    if (entry.status != JobStatus::Success) {
        return {};
    }
    HttpRequest request;
    request.url = url;
    auto response = performHttpRequest(request);
    if (!response) {
        return std::unexpected(std::format("Healthcheck ping failed: {}", response.error().message));
    }
    if (response->status < 200 || response->status >= 300) {
        return std::unexpected(std::format("Healthcheck ping returned HTTP {}", response->status));
    }
    return {};
}

Notifier::Notifier(const Logger& logger) : logger(logger) {}

void Notifier::addSink(std::unique_ptr<NotificationStrategy> sink) {
    std::lock_guard<std::mutex> lock(mutex);
    sinks.push_back(std::move(sink));
}

void Notifier::setSinks(std::vector<std::unique_ptr<NotificationStrategy>> replacement) {
    std::vector<std::shared_ptr<NotificationStrategy>> shared;
    for (auto& sink : replacement) {
        shared.push_back(std::move(sink));
    }
    std::lock_guard<std::mutex> lock(mutex);
    sinks.swap(shared);
}

std::size_t Notifier::sinkCount() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sinks.size();
}

void Notifier::notify(const HistoryEntry& entry) {
    std::vector<std::shared_ptr<NotificationStrategy>> current;
    {
        std::lock_guard<std::mutex> lock(mutex);
        current = sinks;
    }
    for (const auto& sink : current) {
        auto delivered = sink->notify(entry);
        if (!delivered) {
            logger.logWarning(std::format("[{}] Notification via {} failed: {}", entry.jobId, sink->name(),
                                          delivered.error()));
        }
    }
}
