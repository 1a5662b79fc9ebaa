/**
 * @file logger.hpp
 * @brief Timestamped logging for BackupGuard.
 *
 * Messages go to stdout and the main log file; warnings and errors also go to stderr
 * and the error log file. Several jobs log concurrently, so writes are serialized.
 */

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <string>
#include <mutex>

/**
 * @brief File and console logger shared by all engine components.
 */
class Logger {
public:
    /**
     * @brief Constructs a logger.
     *
     * @param logFile Path to the main log file. Empty disables file output.
     * @param errorLogFile Path to the error log file. Empty disables file output.
     * @note Parent directories are created on first write.
     */
    Logger(std::string logFile, std::string errorLogFile);

    /**
     * @brief Logs an informational message.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs a warning to both log files.
     */
    void logWarning(const std::string& message) const;

    /**
     * @brief Logs an error to both log files.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Disables console output, keeping file output.
     */
    void setQuiet(bool quiet);

private:
    void write(const std::string& level, const std::string& message, bool isError) const;

    std::string logFile;        ///< Main log file.
    std::string errorLogFile;   ///< Error log file.
    bool quiet = false;         ///< Suppress console output.
    mutable std::mutex mutex;   ///< Serializes writes.
};

/**
 * @brief Formats the current local time as "YYYY-mm-dd HH:MM:SS".
 */
std::string currentTimestamp();

#endif // LOGGER_HPP
