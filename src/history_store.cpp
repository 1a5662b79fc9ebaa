#include "history_store.hpp"
#include <filesystem>
#include <format>
#include <fstream>
#include <utility>
#include <json/json.h>

namespace fs = std::filesystem;

HistoryStore::HistoryStore(std::string path, const Logger& logger) : path(std::move(path)), logger(logger) {}

std::expected<void, std::string> HistoryStore::append(const HistoryEntry& entry) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    std::string line = Json::writeString(writer, entry.toJson());

    std::lock_guard<std::mutex> lock(mutex);
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }
    std::ofstream out(path, std::ios::app);
    if (!out) {
        return std::unexpected(std::format("Failed to open history file {}", path));
    }
    out << line << '\n';
    out.flush();
    if (!out) {
        return std::unexpected(std::format("Failed to write history file {}", path));
    }
    return {};
}

std::vector<HistoryEntry> HistoryStore::query(const HistoryQuery& filter) const {
    std::vector<HistoryEntry> entries;
    std::lock_guard<std::mutex> lock(mutex);
    std::ifstream in(path);
    if (!in) {
        return entries;
    }

    std::string line;
    std::size_t lineNumber = 0;
    Json::Reader reader;
    while (std::getline(in, line)) {
        ++lineNumber;
        if (line.empty()) {
            continue;
        }
        Json::Value json;
        std::optional<HistoryEntry> entry;
        if (reader.parse(line, json)) {
            entry = HistoryEntry::fromJson(json);
        }
        if (!entry) {
            logger.logWarning(std::format("Skipping unreadable history line {} in {}", lineNumber, path));
            continue;
        }
        if (filter.target && entry->target != *filter.target) {
            continue;
        }
        if (filter.from && entry->startedAt < *filter.from) {
            continue;
        }
        if (filter.until && entry->startedAt >= *filter.until) {
            continue;
        }
        entries.push_back(std::move(*entry));
    }
    return entries;
}
