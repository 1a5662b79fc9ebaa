#include "backup_config.hpp"
#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

const std::vector<std::string> kScheduleTypes = {"daily", "weekly", "monthly"};
const std::vector<std::string> kRemoteTypes = {"rclone", "sftp", "none"};
const std::vector<std::string> kCompressionFormats = {"gzip", "zstd", "xz"};

bool contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

void validateSchedule(const ScheduleDefinition& schedule, const std::string& owner) {
    if (!contains(kScheduleTypes, schedule.type)) {
        throw std::runtime_error(std::format("Invalid schedule type for {}: {}", owner, schedule.type));
    }
    if (schedule.dayOfMonth < 1 || schedule.dayOfMonth > 31) {
        throw std::runtime_error(std::format("Invalid day of month for {}: {}", owner, schedule.dayOfMonth));
    }
}

} // namespace

ScheduleDefinition ScheduleDefinition::fromJson(const Json::Value& json) {
    ScheduleDefinition schedule;
    if (!json.isObject()) {
        return schedule;
    }
    schedule.enabled = json.get("enabled", false).asBool();
    schedule.type = json.get("type", "daily").asString();
    schedule.time = json.get("time", "03:00:00").asString();
    schedule.dayOfWeek = json.get("day_of_week", "monday").asString();
    schedule.dayOfMonth = json.get("day_of_month", 1).asInt();
    return schedule;
}

Json::Value ScheduleDefinition::toJson() const {
    Json::Value json(Json::objectValue);
    json["enabled"] = enabled;
    json["type"] = type;
    json["time"] = time;
    json["day_of_week"] = dayOfWeek;
    json["day_of_month"] = dayOfMonth;
    return json;
}

BackupConfig::BackupConfig(const std::string& configFile) {
    *this = fromJson(readJsonFile(configFile));
}

BackupConfig BackupConfig::fromJson(const Json::Value& configJson) {
    BackupConfig config;

    config.backupRoot = configJson.get("backup_root", "/backups").asString();
    config.password = configJson.get("password", "").asString();
    if (const char* envPassword = std::getenv("BACKUP_PASSWORD"); envPassword && *envPassword) {
        config.password = envPassword;
    }
    config.retentionDays = configJson.get("retention_days", 7).asInt();
    if (config.retentionDays < 1) {
        throw std::runtime_error(std::format("Invalid retention_days: {}", config.retentionDays));
    }
    config.label = configJson.get("label", "backup.enable").asString();
    config.projectLabel = configJson.get("project_label", "com.docker.compose.project").asString();
    config.hostRoot = configJson.get("host_root", "/hostfs").asString();
    config.dockerSocket = configJson.get("docker_socket", "/var/run/docker.sock").asString();
    config.stopTimeoutSeconds = configJson.get("stop_timeout_seconds", 30).asInt();
    if (config.stopTimeoutSeconds < 0) {
        throw std::runtime_error(std::format("Invalid stop_timeout_seconds: {}", config.stopTimeoutSeconds));
    }
    config.kdfIterations = configJson.get("kdf_iterations", 100000).asInt();
    if (config.kdfIterations < 1000) {
        throw std::runtime_error(std::format("Invalid kdf_iterations: {}", config.kdfIterations));
    }

    const Json::Value& compression = configJson["compression"];
    if (compression.isObject()) {
        config.compression.format = compression.get("format", "gzip").asString();
        config.compression.level = compression.get("level", 3).asInt();
    }
    if (!contains(kCompressionFormats, config.compression.format)) {
        throw std::runtime_error(std::format("Unsupported compression format: {}", config.compression.format));
    }

    const Json::Value& remote = configJson["remote"];
    if (remote.isObject()) {
        config.remote.type = remote.get("type", "rclone").asString();
        config.remote.name = remote.get("name", "remote").asString();
        config.remote.destination = remote.get("destination", "backups").asString();
        config.remote.configPath = remote.get("config_path", "/app/rclone.conf").asString();
        config.remote.host = remote.get("host", "").asString();
        config.remote.user = remote.get("user", "").asString();
        config.remote.password = remote.get("password", "").asString();
        config.remote.port = remote.get("port", 22).asInt();
        config.remote.timeoutSeconds = remote.get("timeout_seconds", 3600).asInt();
        config.remote.retries = remote.get("retries", 3).asInt();
        config.remote.backoffSeconds = remote.get("backoff_seconds", 5).asInt();
    }
    if (!contains(kRemoteTypes, config.remote.type)) {
        throw std::runtime_error(std::format("Unsupported remote type: {}", config.remote.type));
    }
    if (config.remote.retries < 1) {
        throw std::runtime_error(std::format("Invalid remote.retries: {}", config.remote.retries));
    }
    if (config.remote.timeoutSeconds < 0 || config.remote.backoffSeconds < 0) {
        throw std::runtime_error("remote.timeout_seconds and remote.backoff_seconds must not be negative");
    }
    if (config.remote.type == "sftp" && config.remote.host.empty()) {
        throw std::runtime_error("SFTP remote requires a host");
    }

    const Json::Value& gotify = configJson["gotify"];
    if (gotify.isObject()) {
        config.gotifyUrl = gotify.get("url", "").asString();
        config.gotifyToken = gotify.get("token", "").asString();
    }
    config.healthcheckUrl = configJson.get("healthcheck_url", "").asString();

    const Json::Value& portainer = configJson["portainer"];
    if (portainer.isObject()) {
        config.portainerUrl = portainer.get("url", "").asString();
        config.portainerToken = portainer.get("token", "").asString();
    }

    config.schedule = ScheduleDefinition::fromJson(configJson["schedule"]);
    validateSchedule(config.schedule, "full system");
    config.configSchedule = ScheduleDefinition::fromJson(configJson["config_schedule"]);
    validateSchedule(config.configSchedule, "config export");

    for (const auto& target : configJson["targets"]) {
        TargetConfig targetConfig;
        targetConfig.name = target.get("name", "").asString();
        if (targetConfig.name.empty()) {
            throw std::runtime_error("Target entry without a name");
        }
        targetConfig.enabled = target.get("enabled", true).asBool();
        targetConfig.schedule = ScheduleDefinition::fromJson(target["schedule"]);
        validateSchedule(targetConfig.schedule, targetConfig.name);
        config.targets.push_back(targetConfig);
    }

    return config;
}

const TargetConfig* BackupConfig::findTarget(const std::string& name) const {
    auto it = std::find_if(targets.begin(), targets.end(),
                           [&name](const TargetConfig& target) { return target.name == name; });
    return it == targets.end() ? nullptr : &*it;
}

std::string BackupConfig::stagingDir() const {
    return (fs::path(backupRoot) / "staging").string();
}

std::string BackupConfig::archiveDir() const {
    return (fs::path(backupRoot) / "archives").string();
}

std::string BackupConfig::historyFile() const {
    return (fs::path(backupRoot) / "history.jsonl").string();
}

std::string BackupConfig::logFile() const {
    return (fs::path(backupRoot) / "backup.log").string();
}

std::string BackupConfig::errorLogFile() const {
    return (fs::path(backupRoot) / "errors.log").string();
}

Json::Value readJsonFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error(std::format("Failed to open config file: {}", path));
    }
    Json::Value json;
    Json::Reader reader;
    if (!reader.parse(file, json)) {
        throw std::runtime_error(std::format("Failed to parse config file: {} ({})", path,
                                             reader.getFormattedErrorMessages()));
    }
    return json;
}

void writeJsonFile(const std::string& path, const Json::Value& json) {
    std::string tmpPath = path + ".tmp";
    {
        std::ofstream outFile(tmpPath);
        if (!outFile.is_open()) {
            throw std::runtime_error(std::format("Failed to open config file for writing: {}", tmpPath));
        }
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
        writer->write(json, &outFile);
        outFile << '\n';
        if (!outFile) {
            throw std::runtime_error(std::format("Failed to write config file: {}", tmpPath));
        }
    }
    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        fs::remove(tmpPath, ec);
        throw std::runtime_error(std::format("Failed to replace config file: {}", path));
    }
}
