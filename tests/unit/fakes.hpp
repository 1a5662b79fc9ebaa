#ifndef BACKUPGUARD_TESTS_FAKES_HPP
#define BACKUPGUARD_TESTS_FAKES_HPP

#include "archive_pipeline.hpp"
#include "backup_config.hpp"
#include "config_export.hpp"
#include "container_runtime.hpp"
#include "logger.hpp"
#include "notification.hpp"
#include "remote_transfer.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace testing_support {

namespace fs = std::filesystem;

/**
 * @brief Temporary directory removed on scope exit.
 */
class TempDir {
public:
    TempDir() {
        std::string pattern = (fs::temp_directory_path() / "backupguard-test-XXXXXX").string();
        if (!::mkdtemp(pattern.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        root = pattern;
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(root, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return root; }
    std::string str(const std::string& relative = "") const {
        return relative.empty() ? root.string() : (root / relative).string();
    }

private:
    fs::path root;
};

inline void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void SetAge(const fs::path& path, std::chrono::hours age) {
    auto when = std::chrono::file_clock::now() - age;
    fs::last_write_time(path, when);
}

inline std::unique_ptr<Logger> QuietLogger(const TempDir& dir) {
    auto logger = std::make_unique<Logger>(dir.str("log/backup.log"), dir.str("log/errors.log"));
    logger->setQuiet(true);
    return logger;
}

/**
 * @brief In-memory container runtime with failure knobs.
 */
class FakeContainerRuntime : public ContainerRuntime {
public:
    void AddContainer(const std::string& id, const std::string& name, std::map<std::string, std::string> labels,
                      std::vector<std::string> bindSources) {
        std::lock_guard<std::mutex> lock(mutex);
        ContainerInfo info;
        info.id = id;
        info.name = name;
        info.labels = std::move(labels);
        for (auto& source : bindSources) {
            info.mounts.push_back(MountInfo{"bind", source, "/data"});
        }
        info.running = true;
        containers.push_back(std::move(info));
    }

    std::expected<std::vector<ContainerInfo>, BackupError> listContainers() override {
        std::lock_guard<std::mutex> lock(mutex);
        ++listCalls;
        if (unreachable) {
            return std::unexpected(makeError(ErrorKind::Discovery, "Docker API unreachable"));
        }
        std::vector<ContainerInfo> result;
        for (const auto& container : containers) {
            if (container.running) {
                result.push_back(container);
            }
        }
        return result;
    }

    std::expected<void, BackupError> stop(const std::string& id, std::chrono::seconds) override {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back("stop:" + id);
        ++stopCalls;
        if (stopFails.contains(id)) {
            return std::unexpected(makeError(ErrorKind::StopTimeout, "stop of " + id + " timed out"));
        }
        setRunning(id, false);
        return {};
    }

    std::expected<void, BackupError> kill(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back("kill:" + id);
        ++killCalls;
        if (killFails.contains(id)) {
            return std::unexpected(makeError(ErrorKind::ForceStop, "kill of " + id + " failed"));
        }
        setRunning(id, false);
        return {};
    }

    std::expected<void, BackupError> start(const std::string& id) override {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back("start:" + id);
        ++startCalls;
        if (startFails.contains(id)) {
            return std::unexpected(makeError(ErrorKind::RestartFailed, "start of " + id + " failed"));
        }
        setRunning(id, true);
        return {};
    }

    bool IsRunning(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& container : containers) {
            if (container.id == id) {
                return container.running;
            }
        }
        return false;
    }

    std::vector<std::string> Events() const {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

    bool unreachable = false;
    std::set<std::string> stopFails;
    std::set<std::string> killFails;
    std::set<std::string> startFails;
    int listCalls = 0;
    int stopCalls = 0;
    int killCalls = 0;
    int startCalls = 0;

private:
    void setRunning(const std::string& id, bool running) {
        for (auto& container : containers) {
            if (container.id == id) {
                container.running = running;
            }
        }
    }

    mutable std::mutex mutex;
    std::vector<ContainerInfo> containers;
    std::vector<std::string> events;
};

/**
 * @brief Remote store backed by a local directory.
 */
class FakeRemote : public RemoteTransferStrategy {
public:
    explicit FakeRemote(fs::path root) : root(std::move(root)) {}

    std::expected<void, BackupError> copy(const std::string& localFile, const std::string& remoteDir,
                                          std::chrono::seconds) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++copyCalls;
        if (failCopies > 0) {
            --failCopies;
            return std::unexpected(makeError(ErrorKind::Upload, "simulated copy failure"));
        }
        fs::path dir = root / remoteDir;
        fs::create_directories(dir);
        fs::copy_file(localFile, dir / fs::path(localFile).filename(), fs::copy_options::overwrite_existing);
        return {};
    }

    std::expected<std::vector<RemoteEntry>, BackupError> list(const std::string& remoteDir) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++listCalls;
        if (listFails) {
            return std::unexpected(makeError(ErrorKind::Upload, "simulated listing failure"));
        }
        std::vector<RemoteEntry> entries;
        fs::path dir = root / remoteDir;
        if (!fs::exists(dir)) {
            return entries;
        }
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            RemoteEntry remote;
            remote.name = entry.path().filename().string();
            remote.size = entry.file_size() + sizeSkew;
            remote.modTime = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                std::chrono::file_clock::to_sys(entry.last_write_time()));
            entries.push_back(remote);
        }
        return entries;
    }

    std::expected<void, BackupError> remove(const std::string& remoteDir, const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++removeCalls;
        if (removeFails.contains(name)) {
            return std::unexpected(makeError(ErrorKind::Upload, "simulated delete failure"));
        }
        fs::remove(root / remoteDir / name);
        return {};
    }

    std::string describe(const std::string& remoteDir) const override {
        return "fake:" + remoteDir;
    }

    fs::path root;
    int failCopies = 0;
    std::uintmax_t sizeSkew = 0;
    bool listFails = false;
    std::set<std::string> removeFails;
    int copyCalls = 0;
    int listCalls = 0;
    int removeCalls = 0;

private:
    std::mutex mutex;
};

/**
 * @brief Archive strategy that always fails.
 */
class FailingArchiver : public ArchiveStrategy {
public:
    std::expected<Archive, BackupError> archive(const std::vector<std::string>&, const std::string&,
                                                const std::string&) override {
        ++calls;
        return std::unexpected(makeError(ErrorKind::Compression, "simulated compression failure"));
    }
    std::expected<void, BackupError> restore(const std::string&, const std::string&, const std::string&) override {
        return std::unexpected(makeError(ErrorKind::Compression, "not supported"));
    }
    std::string extension() const override { return ".tar.gz.enc"; }

    std::atomic<int> calls{0};
};

/**
 * @brief Configuration export writing a fixed document, or failing.
 */
class FakeConfigExport : public ConfigExportStrategy {
public:
    std::expected<std::string, BackupError> exportTo(const std::string& stagingRoot) override {
        ++calls;
        if (fail) {
            return std::unexpected(makeError(ErrorKind::ConfigExport, "Portainer unreachable"));
        }
        fs::path dir = fs::path(stagingRoot) / "portainer";
        WriteFile(dir / "stacks.json", "[]");
        return dir.string();
    }

    bool fail = false;
    std::atomic<int> calls{0};
};

/**
 * @brief Notification sink recording every delivered entry.
 */
class RecordingNotifier : public NotificationStrategy {
public:
    std::expected<void, std::string> notify(const HistoryEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex);
        entries.push_back(entry);
        if (fail) {
            return std::unexpected(std::string("simulated delivery failure"));
        }
        return {};
    }
    std::string name() const override { return "recording"; }

    std::vector<HistoryEntry> Entries() const {
        std::lock_guard<std::mutex> lock(mutex);
        return entries;
    }

    bool fail = false;

private:
    mutable std::mutex mutex;
    std::vector<HistoryEntry> entries;
};

/**
 * @brief Configuration rooted in a temporary directory, no remote, fast retries.
 */
inline BackupConfig TestConfig(const TempDir& dir) {
    BackupConfig config;
    config.backupRoot = dir.str("backups");
    config.password = "correct horse battery staple";
    config.hostRoot = "";
    config.kdfIterations = 1000;
    config.stopTimeoutSeconds = 1;
    config.remote.type = "none";
    config.remote.retries = 3;
    config.remote.backoffSeconds = 0;
    return config;
}

} // namespace testing_support

#endif // BACKUPGUARD_TESTS_FAKES_HPP
