/**
 * @file snapshot_controller.hpp
 * @brief Stop, copy and restart of a workload's persisted data.
 *
 * The controller walks each workload through Running -> Stopping -> Copying -> Restarting
 * -> Restarted (or RestartFailed). Containers stopped by the engine are held by a
 * PausedWorkload guard whose release action starts them again, so a workload stopped here
 * is restarted whatever happens during the copy.
 */

#ifndef SNAPSHOT_CONTROLLER_HPP
#define SNAPSHOT_CONTROLLER_HPP

#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <vector>
#include "backup_error.hpp"
#include "backup_job.hpp"
#include "container_runtime.hpp"
#include "logger.hpp"
#include "workload_discovery.hpp"

enum class SnapshotState {
    Running,
    Stopping,
    Copying,
    Restarting,
    Restarted,
    RestartFailed
};

std::string_view toString(SnapshotState state);

/**
 * @brief Scoped "containers paused" acquisition.
 *
 * Every container recorded with track() is started again by release(), or by the
 * destructor if release() was never called. Containers are restarted in reverse order.
 */
class PausedWorkload {
public:
    PausedWorkload(ContainerRuntime& runtime, const Logger& logger);
    ~PausedWorkload();

    PausedWorkload(const PausedWorkload&) = delete;
    PausedWorkload& operator=(const PausedWorkload&) = delete;

    /**
     * @brief Records a container this engine has stopped.
     */
    void track(const std::string& containerId);

    /**
     * @brief Starts every tracked container.
     *
     * Every container is attempted even if an earlier start fails.
     *
     * @return A RestartFailed error naming the containers left down.
     */
    std::expected<void, BackupError> release();

    bool empty() const { return stopped.empty(); }

private:
    ContainerRuntime& runtime;
    const Logger& logger;
    std::vector<std::string> stopped;
    bool released = false;
};

/**
 * @brief Copies a workload's data into a staging directory around a short stop window.
 */
class SnapshotController {
public:
    using StateObserver = std::function<void(const Workload&, SnapshotState)>;

    /**
     * @brief Constructs a snapshot controller.
     *
     * @param runtime Container runtime used to stop and start containers.
     * @param logger Logger for progress and failures.
     * @param stopTimeout Graceful stop bound before escalating to kill.
     * @param observer Optional callback invoked on every state transition.
     */
    SnapshotController(ContainerRuntime& runtime, const Logger& logger, std::chrono::seconds stopTimeout,
                       StateObserver observer = nullptr);

    /**
     * @brief Snapshots one workload.
     *
     * @param workload Workload to snapshot.
     * @param stagingRoot Per-job staging directory; the workload gets its own subdirectory.
     * @param cancellation Token committed right before the first container is stopped.
     * @return Staging path of the workload, or the error that ended the snapshot. A restart
     *         failure is reported as RestartFailed even when the copy also failed.
     */
    std::expected<std::string, BackupError> snapshot(const Workload& workload, const std::string& stagingRoot,
                                                     CancellationToken& cancellation);

    /**
     * @brief Recursively copies a file or directory, preserving permissions, ownership,
     * timestamps and symlinks.
     *
     * @return A Copy error on failure.
     */
    static std::expected<void, BackupError> copyTree(const std::string& source, const std::string& destination);

private:
    std::expected<void, BackupError> stopContainer(const std::string& id, const std::string& name);
    void transition(const Workload& workload, SnapshotState state);

    ContainerRuntime& runtime;
    const Logger& logger;
    std::chrono::seconds stopTimeout;
    StateObserver observer;
};

/**
 * @brief Per-job staging directory, removed when the job ends.
 */
class StagingArea {
public:
    StagingArea(std::string path, const Logger& logger);
    ~StagingArea();

    StagingArea(const StagingArea&) = delete;
    StagingArea& operator=(const StagingArea&) = delete;

    const std::string& path() const { return dir; }

private:
    std::string dir;
    const Logger& logger;
};

#endif // SNAPSHOT_CONTROLLER_HPP
