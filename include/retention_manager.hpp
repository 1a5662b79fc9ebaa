/**
 * @file retention_manager.hpp
 * @brief Age-based deletion of local and remote archives.
 */

#ifndef RETENTION_MANAGER_HPP
#define RETENTION_MANAGER_HPP

#include <chrono>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include "logger.hpp"
#include "remote_transfer.hpp"

/**
 * @brief Archive file names currently being produced or uploaded.
 *
 * Shared between running jobs and retention sweeps. Archive names embed a timestamp and
 * a label, so the name identifies an archive both locally and on the remote. Running jobs
 * also register their job id so their archive directory is not removed while empty.
 */
class InFlightArchives {
public:
    void add(const std::string& name);
    void remove(const std::string& name);
    bool contains(const std::string& name) const;

private:
    mutable std::mutex mutex;
    std::set<std::string> names;
};

/**
 * @brief Keeps an archive name registered for the lifetime of the guard.
 */
class InFlightGuard {
public:
    InFlightGuard(InFlightArchives& registry, std::string name);
    ~InFlightGuard();

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    InFlightArchives& registry;
    std::string name;
};

enum class RetentionScope {
    Local,
    Remote,
    Both
};

std::string_view toString(RetentionScope scope);

/**
 * @brief Deletes archives older than the configured age.
 *
 * An entry is deleted iff its age is strictly greater than maxAgeDays days. Deletion is
 * best effort: a failed entry is logged as a PruneEntry warning and the sweep continues.
 */
class RetentionManager {
public:
    /**
     * @param localRoot Local archive directory, scanned recursively for "*.enc" files.
     * @param remote Remote store, or nullptr.
     * @param remoteDir Remote archive directory.
     */
    RetentionManager(std::string localRoot, RemoteTransferStrategy* remote, std::string remoteDir,
                     const InFlightArchives& inFlight, const Logger& logger);

    /**
     * @brief Runs one sweep.
     *
     * @return Number of entries deleted.
     */
    std::size_t prune(RetentionScope scope, int maxAgeDays,
                      std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

private:
    std::size_t pruneLocal(std::chrono::system_clock::time_point cutoff);
    std::size_t pruneRemote(std::chrono::system_clock::time_point cutoff);
    void removeEmptyDirectories();

    std::string localRoot;
    RemoteTransferStrategy* remote;
    std::string remoteDir;
    const InFlightArchives& inFlight;
    const Logger& logger;
};

/**
 * @brief True for archive file names ("*.enc").
 */
bool isArchiveName(const std::string& name);

#endif // RETENTION_MANAGER_HPP
