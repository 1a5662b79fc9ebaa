#include "config_export.hpp"
#include "backup_config.hpp"
#include "http_client.hpp"
#include <filesystem>
#include <format>
#include <stdexcept>
#include <utility>
#include <json/json.h>

namespace fs = std::filesystem;

PortainerExportStrategy::PortainerExportStrategy(std::string url, std::string token)
    : url(std::move(url)), token(std::move(token)) {
    if (this->url.empty() || this->token.empty()) {
        throw std::runtime_error("Portainer export requires portainer.url and portainer.token");
    }
    while (this->url.ends_with('/')) {
        this->url.pop_back();
    }
}

std::expected<std::string, BackupError> PortainerExportStrategy::fetch(const std::string& path) {
    HttpRequest request;
    request.url = url + path;
    request.headers.push_back("X-API-Key: " + token);
    request.timeout = std::chrono::seconds(30);

    auto response = performHttpRequest(request);
    if (!response) {
        return std::unexpected(makeError(ErrorKind::ConfigExport,
                                         std::format("Portainer request {} failed: {}", path, response.error().message)));
    }
    if (response->status != 200) {
        return std::unexpected(makeError(ErrorKind::ConfigExport,
                                         std::format("Portainer request {} returned HTTP {}", path, response->status)));
    }
    return response->body;
}

std::expected<std::string, BackupError> PortainerExportStrategy::exportTo(const std::string& stagingRoot) {
    fs::path exportDir = fs::path(stagingRoot) / "portainer";
    std::error_code ec;
    fs::create_directories(exportDir, ec);
    if (ec) {
        return std::unexpected(makeError(ErrorKind::ConfigExport, std::format("Failed to create {}: {}",
                                                                              exportDir.string(), ec.message())));
    }

    const std::pair<const char*, const char*> resources[] = {
        {"/api/endpoints", "endpoints.json"},
        {"/api/stacks", "stacks.json"},
    };
    for (const auto& [path, file] : resources) {
        auto body = fetch(path);
        if (!body) {
            return std::unexpected(body.error());
        }
        Json::Value document;
        Json::Reader reader;
        if (!reader.parse(*body, document)) {
            return std::unexpected(makeError(ErrorKind::ConfigExport,
                                             std::format("Portainer returned invalid JSON for {}", path)));
        }
        try {
            writeJsonFile((exportDir / file).string(), document);
        } catch (const std::exception& e) {
            return std::unexpected(makeError(ErrorKind::ConfigExport, e.what()));
        }
    }
    return exportDir.string();
}
