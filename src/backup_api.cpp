#include "backup_api.hpp"
#include <chrono>
#include <ctime>
#include <format>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

std::vector<std::unique_ptr<NotificationStrategy>> makeNotificationSinks(const BackupConfig& config) {
    std::vector<std::unique_ptr<NotificationStrategy>> sinks;
    if (!config.gotifyUrl.empty() && !config.gotifyToken.empty()) {
        sinks.push_back(std::make_unique<GotifyNotificationStrategy>(config.gotifyUrl, config.gotifyToken));
    }
    if (!config.healthcheckUrl.empty()) {
        sinks.push_back(std::make_unique<HealthcheckNotificationStrategy>(config.healthcheckUrl));
    }
    return sinks;
}

BackupAPI::BackupAPI(std::string configFile, ComponentFactory factory)
    : configFile(std::move(configFile)), factory(std::move(factory)) {
    config = BackupConfig(this->configFile);
    std::error_code ec;
    configTime = fs::last_write_time(this->configFile, ec);

    logger = std::make_unique<Logger>(config.logFile(), config.errorLogFile());
    backup = std::make_shared<Backup>(config, this->factory(config), *logger, inFlight);
    historyStore = std::make_unique<HistoryStore>(config.historyFile(), *logger);
    notifier = std::make_unique<Notifier>(*logger);
    notifier->setSinks(makeNotificationSinks(config));
    scheduler = std::make_unique<Scheduler>([this](BackupJob& job) { return runJob(job); }, locks, *historyStore,
                                            *notifier, *logger);
    scheduler->syncSchedules(config);
}

std::shared_ptr<Backup> BackupAPI::currentBackup() const {
    std::lock_guard<std::mutex> lock(backupMutex);
    return backup;
}

HistoryEntry BackupAPI::runJob(BackupJob& job) {
    // A reload during the job does not affect it.
    std::shared_ptr<Backup> engine = currentBackup();
    return engine->execute(job);
}

std::expected<HistoryEntry, BackupError> BackupAPI::startBackup(const std::string& target) {
    return scheduler->runNow(target, JobOrigin::Manual);
}

std::expected<HistoryEntry, BackupError> BackupAPI::runInterruptible(const std::string& target,
                                                                     const volatile std::sig_atomic_t& shutdownFlag) {
    if (shutdownFlag) {
        return std::unexpected(makeError(ErrorKind::Cancelled, std::format("Interrupted before {} started", target)));
    }
    auto jobId = scheduler->trigger(target, JobOrigin::Manual);
    if (!jobId) {
        return std::unexpected(jobId.error());
    }

    bool interrupted = false;
    for (auto current = scheduler->status(target); current && current->jobId == *jobId;
         current = scheduler->status(target)) {
        if (shutdownFlag && !interrupted) {
            interrupted = true;
            if (!scheduler->cancel(target)) {
                logger->logWarning(std::format("[{}] Interrupted, finishing the job so its containers are restarted",
                                               *jobId));
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    scheduler->waitIdle();

    HistoryQuery query;
    query.target = target;
    for (const auto& entry : historyStore->query(query)) {
        if (entry.jobId == *jobId) {
            return entry;
        }
    }
    return std::unexpected(makeError(ErrorKind::Configuration, std::format("No history recorded for job {}", *jobId)));
}

std::expected<std::string, BackupError> BackupAPI::triggerBackup(const std::string& target) {
    return scheduler->trigger(target, JobOrigin::Manual);
}

std::expected<void, BackupError> BackupAPI::cancelBackup(const std::string& target) {
    return scheduler->cancel(target);
}

std::optional<ActiveJobStatus> BackupAPI::jobStatus(const std::string& target) const {
    return scheduler->status(target);
}

std::expected<void, BackupError> BackupAPI::persistSchedule(const std::string& target, const Json::Value& schedule) {
    try {
        Json::Value configJson = readJsonFile(configFile);
        if (target == kFullSystemTarget) {
            configJson["schedule"] = schedule;
        } else if (target == kConfigTarget) {
            configJson["config_schedule"] = schedule;
        } else {
            Json::Value& targets = configJson["targets"];
            if (!targets.isArray()) {
                targets = Json::Value(Json::arrayValue);
            }
            bool found = false;
            for (auto& entry : targets) {
                if (entry.get("name", "").asString() == target) {
                    entry["schedule"] = schedule;
                    found = true;
                    break;
                }
            }
            if (!found) {
                Json::Value entry(Json::objectValue);
                entry["name"] = target;
                entry["enabled"] = true;
                entry["schedule"] = schedule;
                targets.append(entry);
            }
        }
        writeJsonFile(configFile, configJson);
        std::error_code ec;
        configTime = fs::last_write_time(configFile, ec);
    } catch (const std::exception& e) {
        return std::unexpected(makeError(ErrorKind::Configuration,
                                         std::format("Failed to update schedule: {}", e.what())));
    }
    return {};
}

std::expected<void, BackupError> BackupAPI::updateSchedule(const std::string& target, const Json::Value& schedule) {
    if (!schedule.isObject()) {
        return std::unexpected(makeError(ErrorKind::Configuration, "Schedule must be a JSON object"));
    }
    ScheduleDefinition definition = ScheduleDefinition::fromJson(schedule);
    if (!schedule.isMember("enabled")) {
        definition.enabled = true;
    }
    auto valid = Scheduler::nextRun(definition, std::chrono::system_clock::now());
    if (!valid) {
        return std::unexpected(valid.error());
    }

    if (auto persisted = persistSchedule(target, definition.toJson()); !persisted) {
        return persisted;
    }
    logger->logMessage(std::format("Schedule of {} updated: {} at {}", target, definition.type, definition.time));
    return scheduler->setSchedule(target, definition);
}

std::expected<void, BackupError> BackupAPI::removeSchedule(const std::string& target) {
    ScheduleDefinition definition;
    auto current = scheduler->schedules();
    if (auto it = current.find(target); it != current.end()) {
        definition = it->second;
    }
    definition.enabled = false;
    if (auto persisted = persistSchedule(target, definition.toJson()); !persisted) {
        return persisted;
    }
    scheduler->removeSchedule(target);
    logger->logMessage(std::format("Schedule of {} removed", target));
    return {};
}

std::vector<HistoryEntry> BackupAPI::history(const HistoryQuery& query) const {
    return historyStore->query(query);
}

std::size_t BackupAPI::prune() {
    return currentBackup()->cleanupOldBackups(RetentionScope::Both);
}

std::expected<void, BackupError> BackupAPI::restore(const std::string& archivePath, const std::string& destination) {
    return currentBackup()->restore(archivePath, destination);
}

std::expected<std::vector<Workload>, BackupError> BackupAPI::listWorkloads() {
    return currentBackup()->listWorkloads();
}

void BackupAPI::waitIdle() {
    scheduler->waitIdle();
}

void BackupAPI::reloadConfig() {
    std::error_code ec;
    auto modified = fs::last_write_time(configFile, ec);
    if (ec || modified == configTime) {
        return;
    }
    configTime = modified;

    try {
        BackupConfig reloaded(configFile);
        auto engine = std::make_shared<Backup>(reloaded, factory(reloaded), *logger, inFlight);
        {
            std::lock_guard<std::mutex> lock(backupMutex);
            backup = std::move(engine);
        }
        notifier->setSinks(makeNotificationSinks(reloaded));
        scheduler->syncSchedules(reloaded);
        config = std::move(reloaded);
        logger->logMessage(std::format("Configuration reloaded from {}", configFile));
    } catch (const std::exception& e) {
        logger->logError(std::format("Keeping previous configuration, reload of {} failed: {}", configFile, e.what()));
    }
}

void BackupAPI::runDaemon(const volatile std::sig_atomic_t& shutdownFlag) {
    logger->logMessage(std::format("Daemon mode started. Check {} for logs.", config.logFile()));
    for (const auto& [target, definition] : scheduler->schedules()) {
        if (auto next = scheduler->nextFireTime(target)) {
            std::time_t nextT = std::chrono::system_clock::to_time_t(*next);
            std::tm tm{};
            localtime_r(&nextT, &tm);
            char buf[32];
            std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
            logger->logMessage(std::format("Next {} backup of {} scheduled at {}", definition.type, target, buf));
        }
    }

    int secondsSinceReload = 0;
    while (!shutdownFlag) {
        scheduler->tick();
        std::this_thread::sleep_for(std::chrono::seconds(1));
        if (++secondsSinceReload >= 30) {
            secondsSinceReload = 0;
            reloadConfig();
        }
    }
    logger->logMessage("Daemon shutting down, waiting for running jobs");
    scheduler->waitIdle();
    logger->logMessage("Daemon shutting down gracefully");
}
