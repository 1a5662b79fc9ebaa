#include "retention_manager.hpp"
#include <filesystem>
#include <format>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

void InFlightArchives::add(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex);
    names.insert(name);
}

void InFlightArchives::remove(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex);
    names.erase(name);
}

bool InFlightArchives::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex);
    return names.contains(name);
}

InFlightGuard::InFlightGuard(InFlightArchives& registry, std::string name)
    : registry(registry), name(std::move(name)) {
    registry.add(this->name);
}

InFlightGuard::~InFlightGuard() {
    registry.remove(name);
}

std::string_view toString(RetentionScope scope) {
    switch (scope) {
        case RetentionScope::Local:
            return "local";
        case RetentionScope::Remote:
            return "remote";
        case RetentionScope::Both:
            return "both";
    }
    return "both";
}

bool isArchiveName(const std::string& name) {
    return name.size() > 4 && name.ends_with(".enc");
}

RetentionManager::RetentionManager(std::string localRoot, RemoteTransferStrategy* remote, std::string remoteDir,
                                   const InFlightArchives& inFlight, const Logger& logger)
    : localRoot(std::move(localRoot)), remote(remote), remoteDir(std::move(remoteDir)), inFlight(inFlight),
      logger(logger) {}

std::size_t RetentionManager::prune(RetentionScope scope, int maxAgeDays, std::chrono::system_clock::time_point now) {
    const auto cutoff = now - std::chrono::hours(24) * maxAgeDays;
    std::size_t deleted = 0;
    if (scope == RetentionScope::Local || scope == RetentionScope::Both) {
        deleted += pruneLocal(cutoff);
    }
    if (scope == RetentionScope::Remote || scope == RetentionScope::Both) {
        deleted += pruneRemote(cutoff);
    }
    logger.logMessage(std::format("Retention sweep ({}, {} days): {} deleted", toString(scope), maxAgeDays, deleted));
    return deleted;
}

std::size_t RetentionManager::pruneLocal(std::chrono::system_clock::time_point cutoff) {
    std::error_code ec;
    if (!fs::exists(localRoot, ec)) {
        return 0;
    }

    std::vector<fs::path> expired;
    for (auto it = fs::recursive_directory_iterator(localRoot, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec)) {
        std::error_code entryError;
        if (!it->is_regular_file(entryError) || !isArchiveName(it->path().filename().string())) {
            continue;
        }
        auto lastWrite = it->last_write_time(entryError);
        if (entryError) {
            logger.logWarning(makeError(ErrorKind::PruneEntry, std::format("Cannot read time of {}: {}",
                                                                           it->path().string(), entryError.message()))
                                  .describe());
            continue;
        }
        auto fileTime = std::chrono::file_clock::to_sys(lastWrite);
        if (fileTime < cutoff) {
            expired.push_back(it->path());
        }
    }
    if (ec) {
        logger.logWarning(makeError(ErrorKind::PruneEntry, std::format("Scan of {} stopped: {}", localRoot,
                                                                       ec.message()))
                              .describe());
    }

    std::size_t deleted = 0;
    for (const auto& path : expired) {
        if (inFlight.contains(path.filename().string())) {
            logger.logMessage(std::format("Skipping in-flight archive {}", path.string()));
            continue;
        }
        std::error_code removeError;
        if (fs::remove(path, removeError)) {
            ++deleted;
            logger.logMessage(std::format("Removed old backup: {}", path.string()));
        } else if (removeError) {
            logger.logWarning(makeError(ErrorKind::PruneEntry, std::format("Failed to remove old backup {}: {}",
                                                                           path.string(), removeError.message()))
                                  .describe());
        }
    }
    removeEmptyDirectories();
    return deleted;
}

void RetentionManager::removeEmptyDirectories() {
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(localRoot, ec)) {
        std::error_code entryError;
        if (inFlight.contains(entry.path().filename().string())) {
            continue;
        }
        if (entry.is_directory(entryError) && fs::is_empty(entry.path(), entryError) && !entryError) {
            fs::remove(entry.path(), entryError);
        }
    }
}

std::size_t RetentionManager::pruneRemote(std::chrono::system_clock::time_point cutoff) {
    if (!remote) {
        return 0;
    }
    auto listing = remote->list(remoteDir);
    if (!listing) {
        logger.logWarning(makeError(ErrorKind::PruneEntry, std::format("Cannot list {}: {}",
                                                                       remote->describe(remoteDir),
                                                                       listing.error().message))
                              .describe());
        return 0;
    }

    std::size_t deleted = 0;
    for (const auto& entry : *listing) {
        if (!isArchiveName(entry.name) || entry.modTime >= cutoff) {
            continue;
        }
        if (inFlight.contains(entry.name)) {
            logger.logMessage(std::format("Skipping in-flight archive {}", entry.name));
            continue;
        }
        auto removed = remote->remove(remoteDir, entry.name);
        if (removed) {
            ++deleted;
            logger.logMessage(std::format("Removed old remote backup: {}", entry.name));
        } else {
            logger.logWarning(makeError(ErrorKind::PruneEntry, removed.error().message).describe());
        }
    }
    return deleted;
}
