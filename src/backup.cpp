#include "backup.hpp"
#include "snapshot_controller.hpp"
#include "sync_manager.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <optional>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Error kind reported for an exception escaping a phase.
 */
ErrorKind kindForPhase(JobPhase phase) {
    switch (phase) {
        case JobPhase::Discovering:
            return ErrorKind::Discovery;
        case JobPhase::Snapshotting:
            return ErrorKind::Copy;
        case JobPhase::Archiving:
            return ErrorKind::Compression;
        case JobPhase::Uploading:
            return ErrorKind::Upload;
        case JobPhase::Pruning:
            return ErrorKind::PruneEntry;
        case JobPhase::Pending:
        case JobPhase::Completed:
            break;
    }
    return ErrorKind::Configuration;
}

} // namespace

struct Backup::JobRun {
    HistoryEntry entry;
    std::string stagingRoot;
    std::vector<Workload> workloads;
    std::vector<std::string> stagedPaths;
    std::optional<BackupError> firstFailure;    ///< Workload or export failure that still allows an archive.
    std::optional<BackupError> restartFailure;  ///< A workload was left down.
    std::optional<BackupError> fatal;           ///< Ends the job without a usable archive.
    std::optional<Archive> archive;
    std::optional<InFlightGuard> jobGuard;
    std::optional<InFlightGuard> archiveGuard;
};

BackupComponents makeComponents(const BackupConfig& config) {
    BackupComponents components;
    components.runtime = std::make_unique<DockerRuntime>(config.dockerSocket);
    components.archiver = std::make_unique<TarEncryptArchiveStrategy>(
        ArchiveOptions{config.compression.format, config.compression.level, config.kdfIterations});

    if (config.remote.type == "rclone") {
        components.transfer = std::make_unique<RcloneTransferStrategy>(config.remote);
    } else if (config.remote.type == "sftp") {
        components.transfer = std::make_unique<SFTPTransferStrategy>(config.remote);
    } else if (config.remote.type != "none") {
        throw std::runtime_error(std::format("Unsupported remote type: {}", config.remote.type));
    }

    if (!config.portainerUrl.empty() && !config.portainerToken.empty()) {
        components.configExport = std::make_unique<PortainerExportStrategy>(config.portainerUrl, config.portainerToken);
    }
    return components;
}

Backup::Backup(BackupConfig config, BackupComponents components, const Logger& logger, InFlightArchives& inFlight)
    : config(std::move(config)), components(std::move(components)), logger(logger), inFlight(inFlight) {
    if (!this->components.runtime || !this->components.archiver) {
        throw std::invalid_argument("Backup requires a container runtime and an archive strategy");
    }
}

HistoryEntry Backup::execute(BackupJob& job) {
    JobRun state;
    state.entry.jobId = job.id;
    state.entry.target = job.target;
    state.entry.kind = job.kind;
    state.entry.origin = job.origin;
    state.entry.startedAt = job.startedAt;
    state.stagingRoot = (fs::path(config.stagingDir()) / job.id).string();

    logger.logMessage(std::format("[{}] Starting {} backup of {} ({})", job.id, toString(job.kind), job.target,
                                  toString(job.origin)));
    {
        StagingArea staging(state.stagingRoot, logger);
        try {
            run(job, state);
        } catch (const std::exception& e) {
            state.fatal = makeError(kindForPhase(job.phase.load()), std::format("Unexpected failure: {}", e.what()));
        }
    }
    finish(job, state);
    return state.entry;
}

void Backup::run(BackupJob& job, JobRun& state) {
    if (config.password.empty()) {
        state.fatal = makeError(ErrorKind::Configuration,
                                "No archive password configured (set password or BACKUP_PASSWORD)");
        return;
    }

    job.phase = JobPhase::Discovering;
    if (job.kind != JobKind::ConfigOnly && !discoverWorkloads(job, state)) {
        return;
    }
    if (job.cancellation.cancelRequested()) {
        state.fatal = makeError(ErrorKind::Cancelled, "Cancelled before any container was stopped");
        return;
    }

    job.phase = JobPhase::Snapshotting;
    if (job.kind != JobKind::Project && !exportConfiguration(job, state)) {
        return;
    }
    snapshotWorkloads(job, state);
    if (state.fatal) {
        return;
    }
    if (state.stagedPaths.empty()) {
        if (state.restartFailure) {
            state.fatal = state.restartFailure;
        } else if (state.firstFailure) {
            state.fatal = state.firstFailure;
        } else {
            state.fatal = makeError(ErrorKind::Discovery, "Nothing was staged for archiving");
        }
        return;
    }

    job.phase = JobPhase::Archiving;
    if (!buildArchive(job, state)) {
        return;
    }

    job.phase = JobPhase::Uploading;
    uploadArchive(job, state);
    if (state.fatal) {
        return;
    }

    job.phase = JobPhase::Pruning;
    cleanupOldBackups(RetentionScope::Both);
}

bool Backup::discoverWorkloads(BackupJob& job, JobRun& state) {
    WorkloadDiscovery discovery(*components.runtime, DiscoveryOptions{config.projectLabel, config.hostRoot});
    std::optional<std::string> filter;
    if (job.kind == JobKind::Project) {
        filter = job.target;
    }

    auto workloads = discovery.discover(config.label, filter);
    if (!workloads) {
        state.fatal = workloads.error();
        return false;
    }
    for (const auto& name : discovery.rejectedNames()) {
        logger.logError(std::format("[{}] Workload name {} is reserved for a job target, rename its project",
                                    job.id, name));
    }

    for (auto& workload : *workloads) {
        if (const TargetConfig* target = config.findTarget(workload.name)) {
            workload.enabled = target->enabled;
        }
        if (job.kind == JobKind::FullSystem && !workload.enabled) {
            logger.logMessage(std::format("[{}] Skipping disabled workload {}", job.id, workload.name));
            continue;
        }
        state.workloads.push_back(std::move(workload));
    }

    if (job.kind == JobKind::Project && state.workloads.empty()) {
        state.fatal = makeError(ErrorKind::Discovery,
                                std::format("No running workload {} with label {}=true", job.target, config.label));
        return false;
    }
    logger.logMessage(std::format("[{}] Discovered {} workload(s)", job.id, state.workloads.size()));
    return true;
}

bool Backup::exportConfiguration(BackupJob& job, JobRun& state) {
    if (job.kind == JobKind::ConfigOnly && !job.cancellation.commitStop()) {
        state.fatal = makeError(ErrorKind::Cancelled, "Cancelled before the configuration export started");
        return false;
    }
    if (!components.configExport) {
        if (job.kind == JobKind::ConfigOnly) {
            state.fatal = makeError(ErrorKind::ConfigExport, "Configuration export is not configured");
            return false;
        }
        logger.logMessage(std::format("[{}] Configuration export not configured, skipping", job.id));
        return true;
    }

    const std::string exportRoot = (fs::path(state.stagingRoot) / kConfigStagingDir).string();
    auto exported = components.configExport->exportTo(exportRoot);
    if (!exported) {
        if (job.kind == JobKind::ConfigOnly) {
            state.fatal = exported.error();
            return false;
        }
        logger.logError(std::format("[{}] {}", job.id, exported.error().describe()));
        state.firstFailure = exported.error();
        return true;
    }
    logger.logMessage(std::format("[{}] Configuration exported to {}", job.id, *exported));
    state.stagedPaths.push_back(exportRoot);
    return true;
}

void Backup::snapshotWorkloads(BackupJob& job, JobRun& state) {
    SnapshotController controller(*components.runtime, logger, std::chrono::seconds(config.stopTimeoutSeconds));
    for (const auto& workload : state.workloads) {
        auto staged = controller.snapshot(workload, state.stagingRoot, job.cancellation);
        if (staged) {
            state.stagedPaths.push_back(*staged);
            continue;
        }

        const BackupError& error = staged.error();
        if (error.kind == ErrorKind::Cancelled) {
            state.fatal = error;
            return;
        }
        logger.logError(std::format("[{}] Workload {}: {}", job.id, workload.name, error.describe()));
        state.entry.failedWorkloads.push_back(workload.name);
        if (error.kind == ErrorKind::RestartFailed) {
            if (!state.restartFailure) {
                state.restartFailure = error;
            }
        } else if (!state.firstFailure) {
            state.firstFailure = error;
        }
    }
}

bool Backup::buildArchive(BackupJob& job, JobRun& state) {
    const std::string name = archiveFileName(archiveLabel(job), components.archiver->extension(),
                                             std::chrono::system_clock::now());
    const fs::path dir = fs::path(config.archiveDir()) / job.id;
    state.jobGuard.emplace(inFlight, job.id);
    state.archiveGuard.emplace(inFlight, name);

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        state.fatal = makeError(ErrorKind::Compression,
                                std::format("Failed to create archive directory {}: {}", dir.string(), ec.message()));
        return false;
    }

    logger.logMessage(std::format("[{}] Archiving {} staged path(s) into {}", job.id, state.stagedPaths.size(), name));
    auto archive = components.archiver->archive(state.stagedPaths, config.password, (dir / name).string());
    if (!archive) {
        state.fatal = archive.error();
        if (fs::is_empty(dir, ec) && !ec) {
            fs::remove(dir, ec);
        }
        return false;
    }

    archive->jobId = job.id;
    state.entry.archiveName = archive->name();
    state.entry.archiveSize = archive->size;
    state.entry.checksum = archive->checksum;
    logger.logMessage(std::format("[{}] Archive {} created ({} bytes, sha256 {})", job.id, archive->name(),
                                  archive->size, archive->checksum));
    state.archive = std::move(*archive);
    return true;
}

void Backup::uploadArchive(BackupJob& job, JobRun& state) {
    SyncOptions options;
    options.attempts = config.remote.retries;
    options.initialBackoff = std::chrono::seconds(config.remote.backoffSeconds);
    options.timeout = std::chrono::seconds(config.remote.timeoutSeconds);

    SyncManager sync(components.transfer.get(), options, logger);
    auto synced = sync.upload(*state.archive, config.remote.destination);
    if (!synced) {
        logger.logError(std::format("[{}] {}", job.id, synced.error().describe()));
        state.entry.archiveRetainedLocally = true;
        state.fatal = synced.error();
        return;
    }
    state.entry.archiveRetainedLocally = *synced == SyncOutcome::KeptLocally;
}

void Backup::finish(BackupJob& job, JobRun& state) {
    HistoryEntry& entry = state.entry;
    if (state.restartFailure) {
        entry.status = JobStatus::Failed;
        entry.error = state.restartFailure;
    } else if (state.fatal) {
        entry.status = JobStatus::Failed;
        entry.error = state.fatal;
    } else if (state.firstFailure) {
        entry.status = JobStatus::Partial;
        entry.error = state.firstFailure;
    } else {
        entry.status = JobStatus::Success;
    }
    entry.finishedAt = std::chrono::system_clock::now();
    job.phase = JobPhase::Completed;

    std::string summary = std::format("[{}] Backup of {} finished: {}", job.id, job.target, toString(entry.status));
    if (entry.error) {
        summary += std::format(" ({}, {})", entry.error->describe(), toString(entry.error->severity()));
    }
    if (entry.status == JobStatus::Success) {
        logger.logMessage(summary);
    } else if (entry.status == JobStatus::Partial) {
        logger.logWarning(summary);
    } else {
        logger.logError(summary);
    }
}

std::string Backup::archiveLabel(const BackupJob& job) const {
    switch (job.kind) {
        case JobKind::FullSystem:
            return "full_system";
        case JobKind::ConfigOnly:
            return "config";
        case JobKind::Project:
            break;
    }
    std::string label = job.target;
    std::replace_if(label.begin(), label.end(), [](char c) { return c == '/' || c == ' '; }, '_');
    return label;
}

std::size_t Backup::cleanupOldBackups(RetentionScope scope) {
    RetentionManager retention(config.archiveDir(), components.transfer.get(), config.remote.destination, inFlight,
                               logger);
    return retention.prune(scope, config.retentionDays);
}

std::expected<std::vector<Workload>, BackupError> Backup::listWorkloads() {
    WorkloadDiscovery discovery(*components.runtime, DiscoveryOptions{config.projectLabel, config.hostRoot});
    auto workloads = discovery.discover(config.label);
    if (!workloads) {
        return workloads;
    }
    for (auto& workload : *workloads) {
        if (const TargetConfig* target = config.findTarget(workload.name)) {
            workload.enabled = target->enabled;
        }
    }
    return workloads;
}

std::expected<void, BackupError> Backup::restore(const std::string& archivePath, const std::string& destination) {
    if (config.password.empty()) {
        return std::unexpected(makeError(ErrorKind::Configuration, "No archive password configured"));
    }
    logger.logMessage(std::format("Restoring {} into {}", archivePath, destination));
    return components.archiver->restore(archivePath, config.password, destination);
}
