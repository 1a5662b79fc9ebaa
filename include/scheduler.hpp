/**
 * @file scheduler.hpp
 * @brief Recurring and manual job triggers with per-target mutual exclusion.
 *
 * Every job runs on its own worker thread. The sequence for one job is fixed: acquire
 * the target lock, run the job, append the history entry, release the lock, notify.
 */

#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "backup_config.hpp"
#include "backup_error.hpp"
#include "backup_job.hpp"
#include "history_store.hpp"
#include "logger.hpp"
#include "notification.hpp"
#include "target_lock_registry.hpp"

/**
 * @brief Snapshot of an active job.
 */
struct ActiveJobStatus {
    std::string jobId;
    std::string target;
    JobKind kind = JobKind::Project;
    JobOrigin origin = JobOrigin::Manual;
    JobPhase phase = JobPhase::Pending;
    std::chrono::system_clock::time_point startedAt;
};

class Scheduler {
public:
    /// Runs one job to completion and describes its outcome.
    using JobRunner = std::function<HistoryEntry(BackupJob&)>;

    Scheduler(JobRunner runner, TargetLockRegistry& locks, HistoryStore& history, Notifier& notifier,
              const Logger& logger);

    /**
     * @brief Waits for every running job.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Adds or replaces the schedule of a target.
     *
     * @return A Configuration error if the definition is invalid.
     */
    std::expected<void, BackupError> setSchedule(const std::string& target, const ScheduleDefinition& definition);

    /**
     * @brief Removes the schedule of a target.
     *
     * @return false if the target had no schedule.
     */
    bool removeSchedule(const std::string& target);

    std::map<std::string, ScheduleDefinition> schedules() const;

    /**
     * @brief Next fire time of a definition strictly after now, in local time.
     *
     * Monthly schedules on days a month lacks fire on its last day.
     */
    static std::expected<std::chrono::system_clock::time_point, BackupError>
    nextRun(const ScheduleDefinition& definition, std::chrono::system_clock::time_point now);

    /**
     * @brief Time the next scheduled job for a target fires, if it has an enabled schedule.
     */
    std::optional<std::chrono::system_clock::time_point> nextFireTime(const std::string& target) const;

    /**
     * @brief Starts a job on a worker thread.
     *
     * @return The job id, or a JobAlreadyRunning error if the target is held.
     */
    std::expected<std::string, BackupError> trigger(const std::string& target, JobOrigin origin = JobOrigin::Manual);

    /**
     * @brief Runs a job on the calling thread.
     */
    std::expected<HistoryEntry, BackupError> runNow(const std::string& target, JobOrigin origin = JobOrigin::Manual);

    /**
     * @brief Cancels the active job of a target.
     *
     * @return A Configuration error if no job is active or it already stopped a container.
     */
    std::expected<void, BackupError> cancel(const std::string& target);

    std::optional<ActiveJobStatus> status(const std::string& target) const;
    std::vector<ActiveJobStatus> activeJobs() const;

    /**
     * @brief Fires every schedule due at now.
     *
     * A due schedule whose target is busy is skipped with a warning.
     *
     * @return Ids of the jobs started.
     */
    std::vector<std::string> tick(std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    /**
     * @brief Joins every worker thread.
     */
    void waitIdle();

    /**
     * @brief Replaces all schedules with the enabled ones of a configuration.
     *
     * Targets: "all" for the full system, "config" for the configuration export and each
     * workload from the targets list.
     */
    void syncSchedules(const BackupConfig& config);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    struct Prepared {
        std::shared_ptr<BackupJob> job;
        TargetLease lease;
    };

    std::expected<Prepared, BackupError> prepare(const std::string& target, JobOrigin origin);
    HistoryEntry runJob(const std::shared_ptr<BackupJob>& job, TargetLease lease);
    std::string nextJobId();
    void reapFinished();

    JobRunner runner;
    TargetLockRegistry& locks;
    HistoryStore& history;
    Notifier& notifier;
    const Logger& logger;

    mutable std::mutex mutex;
    std::map<std::string, ScheduleDefinition> definitions;
    std::map<std::string, std::chrono::system_clock::time_point> nextFire;
    std::map<std::string, std::shared_ptr<BackupJob>> active;

    std::mutex workersMutex;
    std::list<Worker> workers;

    std::atomic<std::uint64_t> sequence{0};
};

/**
 * @brief Parses "HH:MM" or "HH:MM:SS".
 *
 * @return false if the text is not a valid time of day.
 */
bool parseTimeOfDay(const std::string& text, int& hour, int& minute, int& second);

#endif // SCHEDULER_HPP
