#include "container_runtime.hpp"
#include "http_client.hpp"
#include <format>
#include <utility>

DockerRuntime::DockerRuntime(std::string socketPath) : socketPath(std::move(socketPath)) {}

std::expected<DockerRuntime::Response, std::string> DockerRuntime::request(const std::string& method,
                                                                            const std::string& path,
                                                                            std::chrono::seconds timeout,
                                                                            bool& timedOut) {
    HttpRequest httpRequest;
    httpRequest.method = method;
    httpRequest.url = "http://localhost" + path;
    httpRequest.unixSocket = socketPath;
    httpRequest.timeout = timeout;

    auto result = performHttpRequest(httpRequest);
    if (!result) {
        timedOut = result.error().timedOut;
        return std::unexpected(result.error().message);
    }
    timedOut = false;
    return Response{result->status, std::move(result->body)};
}

std::vector<ContainerInfo> DockerRuntime::parseContainerList(const Json::Value& json) {
    std::vector<ContainerInfo> containers;
    if (!json.isArray()) {
        return containers;
    }
    for (const auto& item : json) {
        ContainerInfo info;
        info.id = item.get("Id", "").asString();
        const Json::Value& names = item["Names"];
        if (names.isArray() && !names.empty()) {
            info.name = names[0].asString();
            if (!info.name.empty() && info.name.front() == '/') {
                info.name.erase(0, 1);
            }
        }
        if (info.name.empty()) {
            info.name = info.id.substr(0, 12);
        }
        const Json::Value& labels = item["Labels"];
        if (labels.isObject()) {
            for (const auto& key : labels.getMemberNames()) {
                info.labels[key] = labels[key].asString();
            }
        }
        for (const auto& mount : item["Mounts"]) {
            info.mounts.push_back(MountInfo{mount.get("Type", "").asString(),
                                            mount.get("Source", "").asString(),
                                            mount.get("Destination", "").asString()});
        }
        info.running = item.get("State", "").asString() == "running";
        containers.push_back(std::move(info));
    }
    return containers;
}

std::expected<std::vector<ContainerInfo>, BackupError> DockerRuntime::listContainers() {
    bool timedOut = false;
    auto response = request("GET", "/containers/json", std::chrono::seconds(30), timedOut);
    if (!response) {
        return std::unexpected(makeError(ErrorKind::Discovery,
                                         std::format("Docker API unreachable at {}: {}", socketPath, response.error())));
    }
    if (response->status != 200) {
        return std::unexpected(makeError(ErrorKind::Discovery,
                                         std::format("Docker API returned HTTP {} listing containers", response->status)));
    }

    Json::Value json;
    Json::Reader reader;
    if (!reader.parse(response->body, json)) {
        return std::unexpected(makeError(ErrorKind::Discovery, "Failed to parse Docker container list"));
    }
    return parseContainerList(json);
}

std::expected<void, BackupError> DockerRuntime::stop(const std::string& id, std::chrono::seconds timeout) {
    bool timedOut = false;
    // Docker itself waits up to t seconds; give the HTTP call some slack on top.
    auto response = request("POST", std::format("/containers/{}/stop?t={}", id, timeout.count()),
                            timeout + std::chrono::seconds(15), timedOut);
    if (!response) {
        return std::unexpected(makeError(ErrorKind::StopTimeout,
                                         timedOut ? std::format("Stop of {} timed out after {}s", id, timeout.count())
                                                  : std::format("Stop of {} failed: {}", id, response.error())));
    }
    if (response->status == 204 || response->status == 304) {
        return {};
    }
    return std::unexpected(makeError(ErrorKind::StopTimeout,
                                     std::format("Stop of {} returned HTTP {}", id, response->status)));
}

std::expected<void, BackupError> DockerRuntime::kill(const std::string& id) {
    bool timedOut = false;
    auto response = request("POST", std::format("/containers/{}/kill", id), std::chrono::seconds(30), timedOut);
    if (!response) {
        return std::unexpected(makeError(ErrorKind::ForceStop, std::format("Kill of {} failed: {}", id, response.error())));
    }
    // 409 means the container is no longer running, which is what we wanted.
    if (response->status == 204 || response->status == 409) {
        return {};
    }
    return std::unexpected(makeError(ErrorKind::ForceStop,
                                     std::format("Kill of {} returned HTTP {}", id, response->status)));
}

std::expected<void, BackupError> DockerRuntime::start(const std::string& id) {
    bool timedOut = false;
    auto response = request("POST", std::format("/containers/{}/start", id), std::chrono::seconds(60), timedOut);
    if (!response) {
        return std::unexpected(makeError(ErrorKind::RestartFailed,
                                         std::format("Start of {} failed: {}", id, response.error())));
    }
    if (response->status == 204 || response->status == 304) {
        return {};
    }
    return std::unexpected(makeError(ErrorKind::RestartFailed,
                                     std::format("Start of {} returned HTTP {}: {}", id, response->status, response->body)));
}
