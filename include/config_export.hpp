/**
 * @file config_export.hpp
 * @brief Export of the container management configuration into a job's staging area.
 */

#ifndef CONFIG_EXPORT_HPP
#define CONFIG_EXPORT_HPP

#include <expected>
#include <string>
#include "backup_error.hpp"

/**
 * @brief Staging subdirectory holding configuration exports.
 *
 * Workload staging directories never start with '_', so this name cannot collide with one.
 */
inline constexpr const char* kConfigStagingDir = "_config";

/**
 * @brief Interface for configuration export strategies.
 */
class ConfigExportStrategy {
public:
    virtual ~ConfigExportStrategy() = default;

    /**
     * @brief Writes the exported configuration below a staging directory.
     *
     * @param stagingRoot Per-job staging directory.
     * @return The directory holding the export, or a ConfigExport error.
     */
    virtual std::expected<std::string, BackupError> exportTo(const std::string& stagingRoot) = 0;
};

/**
 * @brief Saves the Portainer endpoint and stack definitions as JSON.
 *
 * Fetches GET /api/endpoints and GET /api/stacks with the X-API-Key header and writes
 * them to <staging>/portainer/endpoints.json and stacks.json.
 */
class PortainerExportStrategy : public ConfigExportStrategy {
public:
    /**
     * @throws std::runtime_error If url or token is empty.
     */
    PortainerExportStrategy(std::string url, std::string token);

    std::expected<std::string, BackupError> exportTo(const std::string& stagingRoot) override;

private:
    std::expected<std::string, BackupError> fetch(const std::string& path);

    std::string url;
    std::string token;
};

#endif // CONFIG_EXPORT_HPP
