/**
 * @file backup.hpp
 * @brief Backup orchestration for BackupGuard.
 *
 * A Backup runs one job through its phases: discovery, snapshot of every workload
 * (stop, copy, restart), one consolidated encrypted archive, upload, and a retention sweep.
 * Whatever happens, the job ends with exactly one HistoryEntry describing the outcome,
 * every container the engine stopped has been started again, and the staging directory
 * has been removed.
 *
 * @note Depends on libcurl (Docker API), libarchive and OpenSSL (archives) and libssh or
 * rclone (remote storage).
 */

#ifndef BACKUP_HPP
#define BACKUP_HPP

#include <expected>
#include <memory>
#include <string>
#include <vector>
#include "archive_pipeline.hpp"
#include "backup_config.hpp"
#include "backup_job.hpp"
#include "config_export.hpp"
#include "container_runtime.hpp"
#include "logger.hpp"
#include "remote_transfer.hpp"
#include "retention_manager.hpp"
#include "workload_discovery.hpp"

/**
 * @brief Strategies a Backup works with.
 */
struct BackupComponents {
    std::unique_ptr<ContainerRuntime> runtime;               ///< Container runtime client.
    std::unique_ptr<ArchiveStrategy> archiver;               ///< Archive and restore strategy.
    std::unique_ptr<RemoteTransferStrategy> transfer;        ///< Remote store; nullptr keeps archives locally.
    std::unique_ptr<ConfigExportStrategy> configExport;      ///< Configuration export; nullptr if not configured.
};

/**
 * @brief Builds the production strategies for a configuration.
 *
 * @throws std::runtime_error If a configured strategy has incomplete settings.
 */
BackupComponents makeComponents(const BackupConfig& config);

/**
 * @brief Main backup orchestration class.
 *
 * Thread-safe for concurrent jobs on distinct targets; mutual exclusion between jobs is
 * the caller's responsibility (see TargetLockRegistry).
 */
class Backup {
public:
    /**
     * @brief Constructs a backup instance.
     *
     * @param config Engine configuration.
     * @param components Strategies; runtime and archiver are required.
     * @param logger Shared logger.
     * @param inFlight Registry of archives retention must not delete.
     * @throws std::invalid_argument If runtime or archiver is missing.
     */
    Backup(BackupConfig config, BackupComponents components, const Logger& logger, InFlightArchives& inFlight);

    /**
     * @brief Runs a job to completion.
     *
     * Never throws; every failure is reflected in the returned entry.
     */
    HistoryEntry execute(BackupJob& job);

    /**
     * @brief Deletes archives older than the configured retention.
     *
     * @return Number of archives deleted.
     */
    std::size_t cleanupOldBackups(RetentionScope scope = RetentionScope::Both);

    /**
     * @brief Discovers eligible workloads, with the enabled flag taken from the configuration.
     */
    std::expected<std::vector<Workload>, BackupError> listWorkloads();

    /**
     * @brief Decrypts and extracts an archive into a directory.
     */
    std::expected<void, BackupError> restore(const std::string& archivePath, const std::string& destination);

    const BackupConfig& configuration() const { return config; }

private:
    struct JobRun;

    void run(BackupJob& job, JobRun& state);
    bool discoverWorkloads(BackupJob& job, JobRun& state);
    void snapshotWorkloads(BackupJob& job, JobRun& state);
    bool exportConfiguration(BackupJob& job, JobRun& state);
    bool buildArchive(BackupJob& job, JobRun& state);
    void uploadArchive(BackupJob& job, JobRun& state);
    void finish(BackupJob& job, JobRun& state);

    std::string archiveLabel(const BackupJob& job) const;

    BackupConfig config;                    ///< Engine configuration.
    BackupComponents components;            ///< Strategies.
    const Logger& logger;                   ///< Shared logger.
    InFlightArchives& inFlight;             ///< Archives in progress.
};

#endif // BACKUP_HPP
