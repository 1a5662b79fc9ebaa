/**
 * @file sync_manager.hpp
 * @brief Upload of finished archives to the remote store.
 */

#ifndef SYNC_MANAGER_HPP
#define SYNC_MANAGER_HPP

#include <chrono>
#include <expected>
#include <functional>
#include <string>
#include "archive_pipeline.hpp"
#include "backup_error.hpp"
#include "logger.hpp"
#include "remote_transfer.hpp"

/**
 * @brief Upload retry settings.
 */
struct SyncOptions {
    int attempts = 3;                                    ///< Copy+verify attempts.
    std::chrono::seconds initialBackoff{5};              ///< Delay before the second attempt, doubled after each failure.
    std::chrono::seconds timeout{3600};                  ///< Bound on one copy.
};

enum class SyncOutcome {
    Uploaded,      ///< Copied, verified, local copy deleted.
    KeptLocally    ///< No remote configured.
};

/**
 * @brief Copies an archive to the remote, verifies it and removes the local copy.
 *
 * The local archive is deleted only after the remote listing shows an entry with the
 * same name and size.
 */
class SyncManager {
public:
    using Sleeper = std::function<void(std::chrono::seconds)>;

    /**
     * @param remote Remote store, or nullptr when none is configured.
     * @param sleeper Waits between attempts; defaults to std::this_thread::sleep_for.
     */
    SyncManager(RemoteTransferStrategy* remote, SyncOptions options, const Logger& logger, Sleeper sleeper = nullptr);

    /**
     * @brief Uploads an archive into a remote directory.
     *
     * @return The outcome, or an Upload error once every attempt failed; the local archive
     *         is kept in that case.
     */
    std::expected<SyncOutcome, BackupError> upload(const Archive& archive, const std::string& remoteDir);

private:
    std::expected<void, BackupError> verify(const Archive& archive, const std::string& remoteDir);
    void removeLocal(const Archive& archive);

    RemoteTransferStrategy* remote;
    SyncOptions options;
    const Logger& logger;
    Sleeper sleeper;
};

#endif // SYNC_MANAGER_HPP
