/**
 * @file container_runtime.hpp
 * @brief Container runtime interface and its Docker Engine API implementation.
 *
 * The engine only needs to list running containers and stop, kill and start them by id.
 * DockerRuntime talks to the Docker Engine API over its unix socket.
 *
 * @note Requires libcurl built with unix socket support (7.40 or newer).
 */

#ifndef CONTAINER_RUNTIME_HPP
#define CONTAINER_RUNTIME_HPP

#include <chrono>
#include <expected>
#include <map>
#include <string>
#include <vector>
#include <json/json.h>
#include "backup_error.hpp"

/**
 * @brief One mount of a container as reported by the runtime.
 */
struct MountInfo {
    std::string type;        ///< "bind", "volume", "tmpfs", ...
    std::string source;      ///< Host path.
    std::string destination; ///< Path inside the container.
};

/**
 * @brief Snapshot of a container's runtime state.
 */
struct ContainerInfo {
    std::string id;
    std::string name;                          ///< Name without the leading slash.
    std::map<std::string, std::string> labels;
    std::vector<MountInfo> mounts;
    bool running = false;
};

/**
 * @brief Interface for container runtimes.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /**
     * @brief Lists running containers.
     *
     * @return Containers, or a Discovery error if the runtime is unreachable.
     */
    virtual std::expected<std::vector<ContainerInfo>, BackupError> listContainers() = 0;

    /**
     * @brief Gracefully stops a container.
     *
     * @param id Container id.
     * @param timeout Time the container is given to exit.
     * @return A StopTimeout error if the container did not stop cleanly in time; the caller
     *         escalates to kill().
     */
    virtual std::expected<void, BackupError> stop(const std::string& id, std::chrono::seconds timeout) = 0;

    /**
     * @brief Force-stops a container.
     */
    virtual std::expected<void, BackupError> kill(const std::string& id) = 0;

    /**
     * @brief Starts a stopped container.
     */
    virtual std::expected<void, BackupError> start(const std::string& id) = 0;
};

/**
 * @brief Docker Engine API client over a unix socket.
 */
class DockerRuntime : public ContainerRuntime {
public:
    /**
     * @brief Constructs a Docker client.
     *
     * @param socketPath Path of the Docker socket, e.g. "/var/run/docker.sock".
     */
    explicit DockerRuntime(std::string socketPath);

    std::expected<std::vector<ContainerInfo>, BackupError> listContainers() override;
    std::expected<void, BackupError> stop(const std::string& id, std::chrono::seconds timeout) override;
    std::expected<void, BackupError> kill(const std::string& id) override;
    std::expected<void, BackupError> start(const std::string& id) override;

    /**
     * @brief Converts a "GET /containers/json" response body into container records.
     */
    static std::vector<ContainerInfo> parseContainerList(const Json::Value& json);

private:
    struct Response {
        long status = 0;
        std::string body;
    };

    /**
     * @brief Performs one API request.
     *
     * @param timedOut Set when the transfer hit the timeout.
     * @return Response, or a transport error message.
     */
    std::expected<Response, std::string> request(const std::string& method, const std::string& path,
                                                 std::chrono::seconds timeout, bool& timedOut);

    std::string socketPath; ///< Docker socket path.
};

#endif // CONTAINER_RUNTIME_HPP
