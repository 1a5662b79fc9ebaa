/**
 * @file history_store.hpp
 * @brief Append-only job history, one JSON object per line.
 */

#ifndef HISTORY_STORE_HPP
#define HISTORY_STORE_HPP

#include <chrono>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "backup_job.hpp"
#include "logger.hpp"

/**
 * @brief Filter for history queries. Unset fields match everything.
 */
struct HistoryQuery {
    std::optional<std::string> target;                              ///< Exact target name.
    std::optional<std::chrono::system_clock::time_point> from;      ///< Inclusive lower bound on start time.
    std::optional<std::chrono::system_clock::time_point> until;     ///< Exclusive upper bound on start time.
};

/**
 * @brief JSON-lines history file shared by all jobs.
 */
class HistoryStore {
public:
    HistoryStore(std::string path, const Logger& logger);

    /**
     * @brief Appends one record.
     *
     * @return An error message if the file could not be written.
     */
    std::expected<void, std::string> append(const HistoryEntry& entry);

    /**
     * @brief Returns matching records in file order. Unparsable lines are skipped with a warning.
     */
    std::vector<HistoryEntry> query(const HistoryQuery& filter = {}) const;

    const std::string& file() const { return path; }

private:
    std::string path;
    const Logger& logger;
    mutable std::mutex mutex;
};

#endif // HISTORY_STORE_HPP
