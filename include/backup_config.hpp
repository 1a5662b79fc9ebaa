/**
 * @file backup_config.hpp
 * @brief Configuration management for the BackupGuard engine.
 *
 * Defines the configuration structures for archive settings, remote storage, notification
 * sinks, configuration export and per-target schedules. Every recognized option is a named
 * field with a documented default; unknown keys in the file are ignored.
 *
 * @note Configuration is loaded from a JSON file. The archive passphrase may be supplied
 * through the BACKUP_PASSWORD environment variable instead of the file.
 */

#ifndef BACKUP_CONFIG_HPP
#define BACKUP_CONFIG_HPP

#include <string>
#include <vector>
#include <optional>
#include <json/json.h>

/**
 * @brief Recurring trigger definition for one target.
 */
struct ScheduleDefinition {
    bool enabled = false;                 ///< Whether the trigger fires at all.
    std::string type = "daily";           ///< "daily", "weekly" or "monthly".
    std::string time = "03:00:00";        ///< Time of day, "HH:MM" or "HH:MM:SS".
    std::string dayOfWeek = "monday";     ///< Day for weekly schedules.
    int dayOfMonth = 1;                   ///< Day for monthly schedules (1-31).

    static ScheduleDefinition fromJson(const Json::Value& json);
    Json::Value toJson() const;

    bool operator==(const ScheduleDefinition&) const = default;
};

/**
 * @brief Per-workload settings.
 */
struct TargetConfig {
    std::string name;              ///< Workload name (project label or container name).
    bool enabled = true;           ///< Disabled workloads are skipped by full-system jobs.
    ScheduleDefinition schedule;   ///< Per-workload trigger.
};

/**
 * @brief Remote storage settings.
 */
struct RemoteConfig {
    std::string type = "rclone";                     ///< "rclone", "sftp" or "none".
    std::string name = "remote";                     ///< rclone remote name.
    std::string destination = "backups";             ///< Destination directory on the remote.
    std::string configPath = "/app/rclone.conf";     ///< rclone configuration file.
    std::string host;                                ///< SFTP host.
    std::string user;                                ///< SFTP user.
    std::string password;                            ///< SFTP password; empty uses public key auth.
    int port = 22;                                   ///< SFTP port.
    int timeoutSeconds = 3600;                       ///< Bound on a single upload attempt.
    int retries = 3;                                 ///< Upload attempts before giving up.
    int backoffSeconds = 5;                          ///< Initial delay between attempts, doubled each time.
};

/**
 * @brief Archive compression settings.
 */
struct CompressionConfig {
    std::string format = "gzip";   ///< "gzip", "zstd" or "xz".
    int level = 3;                 ///< Filter effort level; low values keep CPU and memory usage small.
};

/**
 * @brief Configuration class for the backup engine.
 *
 * Loads and manages settings from a JSON configuration file, applying defaults where needed.
 */
class BackupConfig {
public:
    /**
     * @brief Constructs a configuration with every option at its default.
     */
    BackupConfig() = default;

    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws std::runtime_error If the file is unreadable, unparsable or holds invalid values.
     */
    explicit BackupConfig(const std::string& configFile);

    /**
     * @brief Builds a configuration from an already parsed JSON document.
     *
     * @throws std::runtime_error If a value is invalid.
     */
    static BackupConfig fromJson(const Json::Value& configJson);

    /**
     * @brief Looks up the settings of a workload by name.
     */
    const TargetConfig* findTarget(const std::string& name) const;

    std::string stagingDir() const;   ///< <backup_root>/staging
    std::string archiveDir() const;   ///< <backup_root>/archives
    std::string historyFile() const;  ///< <backup_root>/history.jsonl
    std::string logFile() const;      ///< <backup_root>/backup.log
    std::string errorLogFile() const; ///< <backup_root>/errors.log

    std::string backupRoot = "/backups";                          ///< Root for staging, archives, history and logs.
    std::string password;                                         ///< Archive passphrase.
    int retentionDays = 7;                                        ///< Maximum backup age in days.
    std::string label = "backup.enable";                          ///< Eligibility label.
    std::string projectLabel = "com.docker.compose.project";      ///< Grouping label.
    std::string hostRoot = "/hostfs";                             ///< Mount point of the host filesystem.
    std::string dockerSocket = "/var/run/docker.sock";            ///< Docker Engine API socket.
    int stopTimeoutSeconds = 30;                                  ///< Graceful stop bound.
    int kdfIterations = 100000;                                   ///< PBKDF2 iterations.
    CompressionConfig compression;                                ///< Archive filter.
    RemoteConfig remote;                                          ///< Remote storage.
    std::string gotifyUrl;                                        ///< Gotify server URL.
    std::string gotifyToken;                                      ///< Gotify application token.
    std::string healthcheckUrl;                                   ///< Heartbeat URL pinged on success.
    std::string portainerUrl;                                     ///< Portainer base URL.
    std::string portainerToken;                                   ///< Portainer API key.
    ScheduleDefinition schedule;                                  ///< Full-system trigger.
    ScheduleDefinition configSchedule;                            ///< Config-only trigger.
    std::vector<TargetConfig> targets;                            ///< Per-workload settings.
};

/**
 * @brief Reads and parses a JSON file.
 *
 * @throws std::runtime_error If the file cannot be opened or parsed.
 */
Json::Value readJsonFile(const std::string& path);

/**
 * @brief Writes a JSON document to a file, replacing it atomically.
 *
 * @throws std::runtime_error If the file cannot be written.
 */
void writeJsonFile(const std::string& path, const Json::Value& json);

#endif // BACKUP_CONFIG_HPP
