#include "logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <print>
#include <utility>

namespace fs = std::filesystem;

namespace {

void appendLine(const std::string& file, const std::string& line) {
    if (file.empty()) {
        return;
    }
    std::error_code ec;
    fs::path path(file);
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }
    std::ofstream log(file, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", file);
    }
}

} // namespace

std::string currentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto timeT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&timeT, &tmNow);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmNow);
    return timeBuf;
}

Logger::Logger(std::string logFile, std::string errorLogFile)
    : logFile(std::move(logFile)), errorLogFile(std::move(errorLogFile)) {}

void Logger::logMessage(const std::string& message) const {
    write("", message, false);
}

void Logger::logWarning(const std::string& message) const {
    write("WARNING: ", message, true);
}

void Logger::logError(const std::string& message) const {
    write("ERROR: ", message, true);
}

void Logger::setQuiet(bool value) {
    std::lock_guard<std::mutex> lock(mutex);
    quiet = value;
}

void Logger::write(const std::string& level, const std::string& message, bool isError) const {
    std::string logEntry = std::format("[{}] {}{}", currentTimestamp(), level, message);

    std::lock_guard<std::mutex> lock(mutex);
    if (!quiet) {
        if (isError) {
            std::println(stderr, "{}", logEntry);
        } else {
            std::println("{}", logEntry);
        }
    }
    appendLine(logFile, logEntry);
    if (isError) {
        appendLine(errorLogFile, logEntry);
    }
}
