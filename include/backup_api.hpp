/**
 * @file backup_api.hpp
 * @brief High-level API for interacting with the BackupGuard engine.
 *
 * Owns the engine object graph built from one configuration file and exposes the
 * operations a command line or a dashboard needs: run or trigger jobs, cancel them, query
 * their status and history, edit schedules (persisted to the configuration file), prune,
 * restore, and run the scheduling daemon.
 */

#ifndef BACKUP_API_HPP
#define BACKUP_API_HPP

#include <csignal>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "backup.hpp"
#include "history_store.hpp"
#include "logger.hpp"
#include "notification.hpp"
#include "retention_manager.hpp"
#include "scheduler.hpp"
#include "target_lock_registry.hpp"

/**
 * @brief API for managing backups.
 */
class BackupAPI {
public:
    using ComponentFactory = std::function<BackupComponents(const BackupConfig&)>;

    /**
     * @brief Loads the configuration file and builds the engine.
     *
     * @param configFile Path to the JSON configuration file.
     * @param factory Builds the strategies for a configuration.
     * @throws std::runtime_error If the configuration is invalid.
     */
    explicit BackupAPI(std::string configFile, ComponentFactory factory = makeComponents);

    /**
     * @brief Runs a backup synchronously.
     *
     * @param target Workload name, "all" or "config".
     */
    std::expected<HistoryEntry, BackupError> startBackup(const std::string& target);

    /**
     * @brief Runs a backup on a worker and waits for it while watching a shutdown flag.
     *
     * A raised flag cancels the job if no container has been stopped yet. Otherwise the job
     * runs to completion so every container it stopped is started again. A flag raised
     * before the call starts nothing.
     */
    std::expected<HistoryEntry, BackupError> runInterruptible(const std::string& target,
                                                              const volatile std::sig_atomic_t& shutdownFlag);

    /**
     * @brief Starts a backup in the background and returns its job id.
     */
    std::expected<std::string, BackupError> triggerBackup(const std::string& target);

    std::expected<void, BackupError> cancelBackup(const std::string& target);
    std::optional<ActiveJobStatus> jobStatus(const std::string& target) const;

    /**
     * @brief Adds or replaces the schedule of a target and saves it to the configuration file.
     *
     * @param target Workload name, "all" or "config".
     * @param schedule JSON object with enabled, type, time, day_of_week and day_of_month.
     */
    std::expected<void, BackupError> updateSchedule(const std::string& target, const Json::Value& schedule);

    /**
     * @brief Disables the schedule of a target and saves it to the configuration file.
     */
    std::expected<void, BackupError> removeSchedule(const std::string& target);

    std::vector<HistoryEntry> history(const HistoryQuery& query = {}) const;

    /**
     * @brief Runs a retention sweep over local and remote archives.
     */
    std::size_t prune();

    std::expected<void, BackupError> restore(const std::string& archivePath, const std::string& destination);
    std::expected<std::vector<Workload>, BackupError> listWorkloads();

    /**
     * @brief Fires schedules until the flag is set; reloads the configuration when the file changes.
     */
    void runDaemon(const volatile std::sig_atomic_t& shutdownFlag);

    /**
     * @brief Waits for every background job.
     */
    void waitIdle();

    const BackupConfig& configuration() const { return config; }
    Logger& log() { return *logger; }

private:
    std::shared_ptr<Backup> currentBackup() const;
    HistoryEntry runJob(BackupJob& job);
    void reloadConfig();
    std::expected<void, BackupError> persistSchedule(const std::string& target, const Json::Value& schedule);

    std::string configFile;                              ///< Path of the configuration file.
    ComponentFactory factory;                            ///< Strategy factory used on (re)load.
    BackupConfig config;                                 ///< Active configuration.
    std::filesystem::file_time_type configTime;          ///< Modification time at last load.
    std::unique_ptr<Logger> logger;
    InFlightArchives inFlight;
    mutable std::mutex backupMutex;
    std::shared_ptr<Backup> backup;                      ///< Replaced on reload; running jobs keep their copy.
    TargetLockRegistry locks;
    std::unique_ptr<HistoryStore> historyStore;
    std::unique_ptr<Notifier> notifier;
    std::unique_ptr<Scheduler> scheduler;                ///< Declared last so workers finish first on destruction.
};

/**
 * @brief Builds the notification sinks configured in a configuration.
 */
std::vector<std::unique_ptr<NotificationStrategy>> makeNotificationSinks(const BackupConfig& config);

#endif // BACKUP_API_HPP
