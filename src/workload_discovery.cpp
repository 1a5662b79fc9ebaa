#include "workload_discovery.hpp"
#include "backup_job.hpp"
#include <algorithm>
#include <filesystem>
#include <map>
#include <utility>

namespace fs = std::filesystem;

namespace {

const std::string kDockerVolumeRoot = "/var/lib/docker/volumes";
const std::string kDockerSocket = "/var/run/docker.sock";

} // namespace

WorkloadDiscovery::WorkloadDiscovery(ContainerRuntime& runtime, DiscoveryOptions options)
    : runtime(runtime), options(std::move(options)) {}

std::string WorkloadDiscovery::resolveHostPath(const std::string& source, const std::string& hostRoot) {
    if (source.starts_with(kDockerVolumeRoot) || hostRoot.empty()) {
        return source;
    }
    std::string relative = source;
    relative.erase(0, relative.find_first_not_of('/'));
    return (fs::path(hostRoot) / relative).string();
}

std::expected<std::vector<Workload>, BackupError> WorkloadDiscovery::discover(const std::string& label,
                                                                              const std::optional<std::string>& projectFilter) {
    rejected.clear();
    auto containers = runtime.listContainers();
    if (!containers) {
        return std::unexpected(containers.error());
    }

    std::map<std::string, Workload> grouped;
    for (const auto& container : *containers) {
        if (!container.running) {
            continue;
        }
        auto eligible = container.labels.find(label);
        if (eligible == container.labels.end() || eligible->second != "true") {
            continue;
        }

        std::string name = container.name;
        auto project = container.labels.find(options.projectLabel);
        if (project != container.labels.end() && !project->second.empty()) {
            name = project->second;
        }
        if (projectFilter && *projectFilter != name) {
            continue;
        }
        if (name == kFullSystemTarget || name == kConfigTarget) {
            if (std::find(rejected.begin(), rejected.end(), name) == rejected.end()) {
                rejected.push_back(name);
            }
            continue;
        }

        Workload& workload = grouped[name];
        workload.name = name;
        workload.containerIds.push_back(container.id);
        workload.containerNames.push_back(container.name);
        for (const auto& mount : container.mounts) {
            if (mount.type != "bind" && mount.type != "volume") {
                continue;
            }
            if (mount.source.empty() || mount.source == kDockerSocket) {
                continue;
            }
            std::string path = resolveHostPath(mount.source, options.hostRoot);
            if (std::find(workload.paths.begin(), workload.paths.end(), path) == workload.paths.end()) {
                workload.paths.push_back(path);
            }
        }
    }

    std::vector<Workload> workloads;
    workloads.reserve(grouped.size());
    for (auto& [name, workload] : grouped) {
        workloads.push_back(std::move(workload));
    }
    return workloads;
}
