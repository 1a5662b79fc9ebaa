#include "sync_manager.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <thread>
#include <utility>

namespace fs = std::filesystem;

SyncManager::SyncManager(RemoteTransferStrategy* remote, SyncOptions options, const Logger& logger, Sleeper sleeper)
    : remote(remote), options(options), logger(logger), sleeper(std::move(sleeper)) {
    if (!this->sleeper) {
        this->sleeper = [](std::chrono::seconds delay) { std::this_thread::sleep_for(delay); };
    }
}

std::expected<SyncOutcome, BackupError> SyncManager::upload(const Archive& archive, const std::string& remoteDir) {
    if (!remote) {
        logger.logMessage(std::format("[{}] No remote configured, keeping {} locally", archive.jobId, archive.path));
        return SyncOutcome::KeptLocally;
    }

    const int attempts = std::max(1, options.attempts);
    std::chrono::seconds backoff = options.initialBackoff;
    BackupError lastError = makeError(ErrorKind::Upload, "no attempt made");

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        logger.logMessage(std::format("[{}] Uploading {} to {} (attempt {}/{})", archive.jobId, archive.name(),
                                      remote->describe(remoteDir), attempt, attempts));
        auto copied = remote->copy(archive.path, remoteDir, options.timeout);
        if (copied) {
            auto verified = verify(archive, remoteDir);
            if (verified) {
                logger.logMessage(std::format("[{}] Upload of {} verified", archive.jobId, archive.name()));
                removeLocal(archive);
                return SyncOutcome::Uploaded;
            }
            lastError = verified.error();
        } else {
            lastError = copied.error();
        }
        logger.logWarning(std::format("[{}] {}", archive.jobId, lastError.describe()));
        if (attempt < attempts) {
            sleeper(backoff);
            backoff *= 2;
        }
    }

    return std::unexpected(makeError(ErrorKind::Upload,
                                     std::format("Upload of {} failed after {} attempts, kept at {}: {}", archive.name(),
                                                 attempts, archive.path, lastError.message)));
}

std::expected<void, BackupError> SyncManager::verify(const Archive& archive, const std::string& remoteDir) {
    auto listing = remote->list(remoteDir);
    if (!listing) {
        return std::unexpected(listing.error());
    }
    const std::string name = archive.name();
    auto it = std::find_if(listing->begin(), listing->end(), [&](const RemoteEntry& e) { return e.name == name; });
    if (it == listing->end()) {
        return std::unexpected(makeError(ErrorKind::Upload, std::format("{} not found on remote after copy", name)));
    }
    if (it->size != archive.size) {
        return std::unexpected(makeError(ErrorKind::Upload, std::format("Remote size of {} is {} bytes, expected {}",
                                                                        name, it->size, archive.size)));
    }
    return {};
}

void SyncManager::removeLocal(const Archive& archive) {
    std::error_code ec;
    fs::remove(archive.path, ec);
    if (ec) {
        logger.logWarning(std::format("[{}] Failed to delete local archive {}: {}", archive.jobId, archive.path,
                                      ec.message()));
        return;
    }
    fs::path parent = fs::path(archive.path).parent_path();
    if (!parent.empty() && fs::is_empty(parent, ec) && !ec) {
        fs::remove(parent, ec);
    }
}
