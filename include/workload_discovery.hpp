/**
 * @file workload_discovery.hpp
 * @brief Discovery of backup-eligible workloads.
 *
 * A workload is the set of running containers sharing a project label, or a single
 * container when the label is absent. Only containers whose eligibility label is "true"
 * are considered. Workloads are discovered fresh for every job and never persisted.
 */

#ifndef WORKLOAD_DISCOVERY_HPP
#define WORKLOAD_DISCOVERY_HPP

#include <expected>
#include <optional>
#include <string>
#include <vector>
#include "backup_error.hpp"
#include "container_runtime.hpp"

/**
 * @brief A backup unit.
 */
struct Workload {
    std::string name;                        ///< Project label value or container name.
    std::vector<std::string> containerIds;   ///< Containers in runtime order.
    std::vector<std::string> containerNames; ///< Names matching containerIds.
    std::vector<std::string> paths;          ///< Resolved volume and bind-mount paths, deduplicated.
    bool enabled = true;                     ///< Cleared when the configuration disables the target.
};

/**
 * @brief Options for workload discovery.
 */
struct DiscoveryOptions {
    std::string projectLabel = "com.docker.compose.project"; ///< Grouping label.
    std::string hostRoot = "/hostfs";                        ///< Mount point of the host filesystem; empty uses host paths as-is.
};

/**
 * @brief Enumerates eligible workloads from a container runtime.
 */
class WorkloadDiscovery {
public:
    WorkloadDiscovery(ContainerRuntime& runtime, DiscoveryOptions options);

    /**
     * @brief Discovers eligible workloads.
     *
     * @param label Eligibility label; its value must be exactly "true".
     * @param projectFilter When set, only the workload with this name is returned.
     * @return Workloads ordered by name, or a Discovery error if the runtime is unreachable.
     */
    std::expected<std::vector<Workload>, BackupError> discover(const std::string& label,
                                                               const std::optional<std::string>& projectFilter = std::nullopt);

    /**
     * @brief Maps a host mount source to a path readable by the engine.
     *
     * Named volumes under /var/lib/docker/volumes are used as-is; any other host path is
     * re-rooted under hostRoot.
     */
    static std::string resolveHostPath(const std::string& source, const std::string& hostRoot);

    /**
     * @brief Names of eligible workloads left out of the last discover() call.
     *
     * A workload named "all" or "config" would be indistinguishable from the full-system
     * and config-only targets, so it is rejected.
     */
    const std::vector<std::string>& rejectedNames() const { return rejected; }

private:
    ContainerRuntime& runtime;
    DiscoveryOptions options;
    std::vector<std::string> rejected;
};

#endif // WORKLOAD_DISCOVERY_HPP
