#include "snapshot_controller.hpp"
#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <format>
#include <optional>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Copies ownership, permission bits and timestamps from one path to another.
 *
 * Ownership changes that need privileges the engine lacks are skipped.
 *
 * @throws fs::filesystem_error On any other failure.
 */
void copyMetadata(const fs::path& source, const fs::path& destination) {
    struct stat st{};
    if (::lstat(source.c_str(), &st) != 0) {
        throw fs::filesystem_error("lstat", source, std::error_code(errno, std::generic_category()));
    }
    if (::lchown(destination.c_str(), st.st_uid, st.st_gid) != 0 && errno != EPERM) {
        throw fs::filesystem_error("lchown", destination, std::error_code(errno, std::generic_category()));
    }
    if (!S_ISLNK(st.st_mode) && ::chmod(destination.c_str(), st.st_mode & 07777) != 0) {
        throw fs::filesystem_error("chmod", destination, std::error_code(errno, std::generic_category()));
    }
    struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (::utimensat(AT_FDCWD, destination.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
        throw fs::filesystem_error("utimensat", destination, std::error_code(errno, std::generic_category()));
    }
}

std::string stagingName(const std::string& path, std::size_t index) {
    fs::path normalized = fs::path(path).lexically_normal();
    std::string base = normalized.filename().string();
    if (base.empty()) {
        base = normalized.parent_path().filename().string();
    }
    if (base.empty()) {
        base = "root";
    }
    return std::format("{}_{}", index, base);
}

// Names starting with '_' or '.' are reserved for staging entries that are not workloads.
std::string sanitizeName(std::string name) {
    std::replace(name.begin(), name.end(), '/', '_');
    if (name.empty() || name.front() == '_' || name.front() == '.') {
        name.insert(0, "workload");
    }
    return name;
}

} // namespace

std::string_view toString(SnapshotState state) {
    switch (state) {
        case SnapshotState::Running:
            return "running";
        case SnapshotState::Stopping:
            return "stopping";
        case SnapshotState::Copying:
            return "copying";
        case SnapshotState::Restarting:
            return "restarting";
        case SnapshotState::Restarted:
            return "restarted";
        case SnapshotState::RestartFailed:
            return "restart-failed";
    }
    return "running";
}

PausedWorkload::PausedWorkload(ContainerRuntime& runtime, const Logger& logger)
    : runtime(runtime), logger(logger) {}

PausedWorkload::~PausedWorkload() {
    if (!released) {
        auto result = release();
        if (!result) {
            logger.logError(result.error().describe());
        }
    }
}

void PausedWorkload::track(const std::string& containerId) {
    stopped.push_back(containerId);
}

std::expected<void, BackupError> PausedWorkload::release() {
    released = true;
    std::vector<std::string> leftDown;
    std::string lastError;
    for (auto it = stopped.rbegin(); it != stopped.rend(); ++it) {
        auto started = runtime.start(*it);
        if (!started) {
            leftDown.push_back(*it);
            lastError = started.error().message;
            logger.logError(std::format("Failed to restart container {}: {}", *it, lastError));
        }
    }
    stopped.clear();
    if (!leftDown.empty()) {
        std::string ids;
        for (const auto& id : leftDown) {
            ids += ids.empty() ? id : ", " + id;
        }
        return std::unexpected(makeError(ErrorKind::RestartFailed,
                                         std::format("Containers left down: {} ({})", ids, lastError)));
    }
    return {};
}

SnapshotController::SnapshotController(ContainerRuntime& runtime, const Logger& logger,
                                       std::chrono::seconds stopTimeout, StateObserver observer)
    : runtime(runtime), logger(logger), stopTimeout(stopTimeout), observer(std::move(observer)) {}

void SnapshotController::transition(const Workload& workload, SnapshotState state) {
    logger.logMessage(std::format("Workload {}: {}", workload.name, toString(state)));
    if (observer) {
        observer(workload, state);
    }
}

std::expected<void, BackupError> SnapshotController::stopContainer(const std::string& id, const std::string& name) {
    auto stopped = runtime.stop(id, stopTimeout);
    if (stopped) {
        return {};
    }
    logger.logWarning(std::format("{}; forcing stop of {}", stopped.error().describe(), name));
    auto killed = runtime.kill(id);
    if (!killed) {
        return std::unexpected(makeError(ErrorKind::ForceStop,
                                         std::format("Could not stop container {}: {}", name, killed.error().message)));
    }
    return {};
}

std::expected<std::string, BackupError> SnapshotController::snapshot(const Workload& workload,
                                                                     const std::string& stagingRoot,
                                                                     CancellationToken& cancellation) {
    if (workload.paths.empty()) {
        return std::unexpected(makeError(ErrorKind::Copy,
                                         std::format("No volumes found to back up in workload {}", workload.name)));
    }
    if (!cancellation.commitStop()) {
        return std::unexpected(makeError(ErrorKind::Cancelled,
                                         std::format("Cancelled before stopping workload {}", workload.name)));
    }

    fs::path workloadStaging = fs::path(stagingRoot) / sanitizeName(workload.name);
    std::optional<BackupError> failure;

    PausedWorkload paused(runtime, logger);
    transition(workload, SnapshotState::Stopping);
    for (std::size_t i = 0; i < workload.containerIds.size(); ++i) {
        const std::string& id = workload.containerIds[i];
        const std::string& name = i < workload.containerNames.size() ? workload.containerNames[i] : id;
        auto stopped = stopContainer(id, name);
        if (!stopped) {
            failure = stopped.error();
            break;
        }
        paused.track(id);
    }

    if (!failure) {
        transition(workload, SnapshotState::Copying);
        std::error_code ec;
        fs::create_directories(workloadStaging, ec);
        if (ec) {
            failure = makeError(ErrorKind::Copy, std::format("Failed to create staging directory {}: {}",
                                                             workloadStaging.string(), ec.message()));
        }
        for (std::size_t i = 0; !failure && i < workload.paths.size(); ++i) {
            const std::string& path = workload.paths[i];
            if (!fs::exists(fs::symlink_status(path, ec))) {
                logger.logWarning(std::format("Path not found, skipping: {}", path));
                continue;
            }
            logger.logMessage(std::format("Copying {}", path));
            auto copied = copyTree(path, (workloadStaging / stagingName(path, i)).string());
            if (!copied) {
                failure = copied.error();
            }
        }
    }

    if (!paused.empty()) {
        transition(workload, SnapshotState::Restarting);
        auto restarted = paused.release();
        if (!restarted) {
            transition(workload, SnapshotState::RestartFailed);
            std::string message = restarted.error().message;
            if (failure) {
                message += std::format(" after {}", failure->describe());
            }
            return std::unexpected(makeError(ErrorKind::RestartFailed, message));
        }
        transition(workload, SnapshotState::Restarted);
    }

    if (failure) {
        return std::unexpected(*failure);
    }
    return workloadStaging.string();
}

std::expected<void, BackupError> SnapshotController::copyTree(const std::string& source, const std::string& destination) {
    try {
        fs::file_status status = fs::symlink_status(source);
        if (fs::is_symlink(status)) {
            fs::copy_symlink(source, destination);
            copyMetadata(source, destination);
            return {};
        }
        if (!fs::is_directory(status)) {
            fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
            copyMetadata(source, destination);
            return {};
        }

        fs::create_directories(destination);
        std::vector<std::pair<fs::path, fs::path>> directories{{source, destination}};
        for (auto it = fs::recursive_directory_iterator(source); it != fs::recursive_directory_iterator(); ++it) {
            const fs::path target = fs::path(destination) / it->path().lexically_relative(source);
            fs::file_status entryStatus = it->symlink_status();
            if (fs::is_symlink(entryStatus)) {
                fs::copy_symlink(it->path(), target);
                copyMetadata(it->path(), target);
            } else if (fs::is_directory(entryStatus)) {
                fs::create_directory(target);
                directories.emplace_back(it->path(), target);
            } else if (fs::is_regular_file(entryStatus)) {
                fs::copy_file(it->path(), target, fs::copy_options::overwrite_existing);
                copyMetadata(it->path(), target);
            }
            // Sockets, fifos and device nodes are runtime state, not volume data.
        }
        // Directory times last, after their contents stopped changing.
        for (auto it = directories.rbegin(); it != directories.rend(); ++it) {
            copyMetadata(it->first, it->second);
        }
    } catch (const fs::filesystem_error& e) {
        return std::unexpected(makeError(ErrorKind::Copy, std::format("Failed to copy {}: {}", source, e.what())));
    }
    return {};
}

StagingArea::StagingArea(std::string path, const Logger& logger) : dir(std::move(path)), logger(logger) {}

StagingArea::~StagingArea() {
    std::error_code ec;
    fs::remove_all(dir, ec);
    if (ec) {
        logger.logError(std::format("Failed to remove staging directory {}: {}", dir, ec.message()));
    }
}
