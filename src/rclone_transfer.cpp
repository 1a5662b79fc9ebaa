#include "remote_transfer.hpp"
#include "backup_job.hpp"
#include "process_runner.hpp"
#include <format>
#include <utility>
#include <json/json.h>

namespace {

std::string trimOutput(const ProcessResult& result) {
    std::string text = result.err.empty() ? result.out : result.err;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

BackupError commandError(const std::string& what, const ProcessResult& result) {
    if (result.timedOut) {
        return makeError(ErrorKind::Upload, std::format("{} timed out", what));
    }
    return makeError(ErrorKind::Upload, std::format("{} failed (exit {}): {}", what, result.exitCode, trimOutput(result)));
}

} // namespace

RcloneTransferStrategy::RcloneTransferStrategy(const RemoteConfig& config, std::string binary)
    : remoteName(config.name), configPath(config.configPath), binary(std::move(binary)) {}

std::vector<std::string> RcloneTransferStrategy::command(std::vector<std::string> args) const {
    std::vector<std::string> argv{binary};
    argv.insert(argv.end(), std::make_move_iterator(args.begin()), std::make_move_iterator(args.end()));
    if (!configPath.empty()) {
        argv.push_back("--config");
        argv.push_back(configPath);
    }
    return argv;
}

std::expected<void, BackupError> RcloneTransferStrategy::copy(const std::string& localFile, const std::string& remoteDir,
                                                              std::chrono::seconds timeout) {
    // One rclone attempt per call; retries belong to the caller.
    auto result = runCommand(command({"copy", localFile, std::format("{}:{}", remoteName, remoteDir),
                                      "--retries", "1"}),
                             timeout);
    if (!result.ok()) {
        return std::unexpected(commandError(std::format("rclone copy to {}", describe(remoteDir)), result));
    }
    return {};
}

std::expected<std::vector<RemoteEntry>, BackupError> RcloneTransferStrategy::list(const std::string& remoteDir) {
    auto result = runCommand(command({"lsjson", "--files-only", std::format("{}:{}", remoteName, remoteDir)}),
                             std::chrono::seconds(300));
    if (!result.ok()) {
        return std::unexpected(commandError(std::format("rclone lsjson {}", describe(remoteDir)), result));
    }
    return parseListing(result.out);
}

std::expected<void, BackupError> RcloneTransferStrategy::remove(const std::string& remoteDir, const std::string& name) {
    auto result = runCommand(command({"deletefile", std::format("{}:{}/{}", remoteName, remoteDir, name)}),
                             std::chrono::seconds(300));
    if (!result.ok()) {
        return std::unexpected(commandError(std::format("rclone deletefile {}/{}", describe(remoteDir), name), result));
    }
    return {};
}

std::string RcloneTransferStrategy::describe(const std::string& remoteDir) const {
    return std::format("{}:{}", remoteName, remoteDir);
}

std::expected<std::vector<RemoteEntry>, BackupError> RcloneTransferStrategy::parseListing(const std::string& json) {
    Json::Value root;
    Json::Reader reader;
    if (!reader.parse(json, root) || !root.isArray()) {
        return std::unexpected(makeError(ErrorKind::Upload, "Unparsable rclone listing"));
    }

    std::vector<RemoteEntry> entries;
    for (const auto& item : root) {
        if (item.get("IsDir", false).asBool()) {
            continue;
        }
        RemoteEntry entry;
        entry.name = item.get("Name", item.get("Path", "").asString()).asString();
        const Json::Value& size = item["Size"];
        if (size.isIntegral() && size.asLargestInt() > 0) {
            entry.size = static_cast<std::uintmax_t>(size.asLargestUInt());
        }
        auto modTime = parseIsoTime(item.get("ModTime", "").asString());
        if (!modTime) {
            return std::unexpected(makeError(ErrorKind::Upload,
                                             std::format("Invalid ModTime for remote entry {}", entry.name)));
        }
        entry.modTime = *modTime;
        entries.push_back(std::move(entry));
    }
    return entries;
}
