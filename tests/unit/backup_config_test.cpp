#include "backup_config.hpp"

#include "fakes.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using testing_support::TempDir;
using testing_support::WriteFile;

Json::Value Parse(const std::string& text) {
    Json::Value json;
    Json::Reader reader;
    bool parsed = reader.parse(text, json);
    assert(parsed);
    return json;
}

bool Rejects(const std::string& text) {
    try {
        BackupConfig::fromJson(Parse(text));
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

void TestDefaults() {
    ::unsetenv("BACKUP_PASSWORD");
    BackupConfig config = BackupConfig::fromJson(Parse("{}"));
    assert(config.backupRoot == "/backups");
    assert(config.password.empty());
    assert(config.retentionDays == 7);
    assert(config.label == "backup.enable");
    assert(config.projectLabel == "com.docker.compose.project");
    assert(config.hostRoot == "/hostfs");
    assert(config.compression.format == "gzip");
    assert(config.remote.type == "rclone");
    assert(config.remote.retries == 3);
    assert(!config.schedule.enabled);
    assert(config.targets.empty());
    assert(config.archiveDir() == "/backups/archives");
    assert(config.historyFile() == "/backups/history.jsonl");
}

void TestFullDocument() {
    ::unsetenv("BACKUP_PASSWORD");
    BackupConfig config = BackupConfig::fromJson(Parse(R"({
    "backup_root": "/data/backups",
    "password": "from-file",
    "retention_days": 14,
    "compression": {"format": "zstd", "level": 9},
    "remote": {"type": "sftp", "host": "nas.local", "user": "backup", "port": 2222, "retries": 5},
    "gotify": {"url": "https://gotify.local", "token": "tok"},
    "portainer": {"url": "https://portainer.local", "token": "key"},
    "schedule": {"enabled": true, "type": "weekly", "time": "02:30", "day_of_week": "sunday"},
    "config_schedule": {"enabled": true, "type": "monthly", "day_of_month": 31},
    "targets": [
      {"name": "nextcloud", "enabled": true, "schedule": {"enabled": true, "time": "01:00"}},
      {"name": "scratch", "enabled": false}
    ]
  })"));
    assert(config.password == "from-file");
    assert(config.retentionDays == 14);
    assert(config.compression.format == "zstd" && config.compression.level == 9);
    assert(config.remote.type == "sftp" && config.remote.port == 2222 && config.remote.retries == 5);
    assert(config.gotifyToken == "tok");
    assert(config.portainerUrl == "https://portainer.local");
    assert(config.schedule.enabled && config.schedule.type == "weekly" && config.schedule.dayOfWeek == "sunday");
    assert(config.configSchedule.dayOfMonth == 31);
    assert(config.targets.size() == 2);
    const TargetConfig* scratch = config.findTarget("scratch");
    assert(scratch != nullptr && !scratch->enabled);
    assert(config.findTarget("nextcloud")->schedule.time == "01:00");
    assert(config.findTarget("missing") == nullptr);
}

void TestEnvironmentPasswordWins() {
    ::setenv("BACKUP_PASSWORD", "from-env", 1);
    BackupConfig config = BackupConfig::fromJson(Parse(R"({"password": "from-file"})"));
    assert(config.password == "from-env");
    ::unsetenv("BACKUP_PASSWORD");
}

void TestInvalidValuesRejected() {
    assert(Rejects(R"({"retention_days": 0})"));
    assert(Rejects(R"({"compression": {"format": "bzip2"}})"));
    assert(Rejects(R"({"remote": {"type": "ftp"}})"));
    assert(Rejects(R"({"remote": {"type": "sftp"}})"));
    assert(Rejects(R"({"remote": {"retries": 0}})"));
    assert(Rejects(R"({"kdf_iterations": 10})"));
    assert(Rejects(R"({"schedule": {"type": "hourly"}})"));
    assert(Rejects(R"({"targets": [{"enabled": true}]})"));
}

void TestNegativeTimeoutsRejected() {
    assert(Rejects(R"({"stop_timeout_seconds": -1})"));
    assert(Rejects(R"({"remote": {"timeout_seconds": -5}})"));
    assert(Rejects(R"({"remote": {"backoff_seconds": -1}})"));
    // Zero asks Docker to kill immediately.
    assert(BackupConfig::fromJson(Parse(R"({"stop_timeout_seconds": 0})")).stopTimeoutSeconds == 0);
}

void TestFileRoundTrip() {
    TempDir dir;
    const std::string path = dir.str("config.json");
    assert(!Rejects("{}"));

    bool threw = false;
    try {
        BackupConfig missing(path);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    WriteFile(path, "{ not json");
    threw = false;
    try {
        BackupConfig broken(path);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    Json::Value json(Json::objectValue);
    json["backup_root"] = dir.str("backups");
    json["schedule"] = ScheduleDefinition{true, "daily", "04:00", "monday", 1}.toJson();
    writeJsonFile(path, json);
    BackupConfig config(path);
    assert(config.backupRoot == dir.str("backups"));
    assert(config.schedule == (ScheduleDefinition{true, "daily", "04:00", "monday", 1}));
}

}  // namespace

int main() {
    TestDefaults();
    TestFullDocument();
    TestEnvironmentPasswordWins();
    TestInvalidValuesRejected();
    TestNegativeTimeoutsRejected();
    TestFileRoundTrip();

    std::cout << "backup_config_test: pass\n";
    return 0;
}
