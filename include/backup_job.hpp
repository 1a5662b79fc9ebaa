/**
 * @file backup_job.hpp
 * @brief Job model of the BackupGuard engine.
 *
 * A BackupJob is one execution for a target: a single workload, the full system, or the
 * configuration export. A HistoryEntry is the immutable record written once the job is
 * terminal; the same record is handed to the notification sinks.
 */

#ifndef BACKUP_JOB_HPP
#define BACKUP_JOB_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <json/json.h>
#include "backup_error.hpp"

/// Target name of full-system jobs.
inline constexpr std::string_view kFullSystemTarget = "all";
/// Target name of config-only jobs.
inline constexpr std::string_view kConfigTarget = "config";

enum class JobKind {
    Project,     ///< One workload.
    FullSystem,  ///< Every enabled workload plus the configuration export.
    ConfigOnly   ///< Configuration export only.
};

enum class JobOrigin {
    Scheduled,
    Manual
};

enum class JobPhase {
    Pending,
    Discovering,
    Snapshotting,
    Archiving,
    Uploading,
    Pruning,
    Completed
};

enum class JobStatus {
    Success,
    Partial,
    Failed
};

std::string_view toString(JobKind kind);
std::string_view toString(JobOrigin origin);
std::string_view toString(JobPhase phase);
std::string_view toString(JobStatus status);

/**
 * @brief Derives the job kind from a target name.
 */
JobKind kindForTarget(const std::string& target);

/**
 * @brief Cancellation handshake between a requester and the running job.
 *
 * Cancellation is only possible until the job commits its first container stop.
 */
class CancellationToken {
public:
    /**
     * @brief Requests cancellation.
     *
     * @return false if the job already committed a container stop.
     */
    bool requestCancel();

    /**
     * @brief Commits the job to stopping containers.
     *
     * @return false if cancellation was requested first; the job must not stop anything.
     */
    bool commitStop();

    bool cancelRequested() const;
    bool stopCommitted() const;

private:
    mutable std::mutex mutex;
    bool cancelled = false;
    bool committed = false;
};

/**
 * @brief One backup execution.
 */
struct BackupJob {
    std::string id;                                   ///< Unique job id, also the staging directory name.
    std::string target;                               ///< Workload name, "all" or "config".
    JobKind kind = JobKind::Project;                  ///< Job kind.
    JobOrigin origin = JobOrigin::Manual;             ///< What started the job.
    std::chrono::system_clock::time_point startedAt;  ///< Creation time.
    std::atomic<JobPhase> phase{JobPhase::Pending};   ///< Current phase.
    CancellationToken cancellation;                   ///< Cancellation handshake.
};

/**
 * @brief Immutable record of a terminal job.
 */
struct HistoryEntry {
    std::string jobId;
    std::string target;
    JobKind kind = JobKind::Project;
    JobOrigin origin = JobOrigin::Manual;
    JobStatus status = JobStatus::Failed;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point finishedAt;
    std::string archiveName;            ///< File name of the archive, empty if none was produced.
    std::uintmax_t archiveSize = 0;     ///< Encrypted archive size in bytes.
    std::string checksum;               ///< SHA-256 of the encrypted archive.
    bool archiveRetainedLocally = false;///< Local archive kept (no remote, or unverified upload).
    std::optional<BackupError> error;   ///< Most severe failure, if any.
    std::vector<std::string> failedWorkloads;

    std::chrono::milliseconds duration() const;

    Json::Value toJson() const;
    static std::optional<HistoryEntry> fromJson(const Json::Value& json);
};

/**
 * @brief Formats a time point as UTC ISO 8601 ("2026-01-31T03:00:00Z").
 */
std::string formatIsoTime(std::chrono::system_clock::time_point time);

/**
 * @brief Parses a UTC ISO 8601 timestamp; fractional seconds are ignored.
 */
std::optional<std::chrono::system_clock::time_point> parseIsoTime(const std::string& text);

#endif // BACKUP_JOB_HPP
