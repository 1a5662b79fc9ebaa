#include "backup_api.hpp"
#include <csignal>
#include <ctime>
#include <format>
#include <iomanip>
#include <iostream>
#include <optional>
#include <print>
#include <sstream>
#include <string>
#include <vector>
#include <signal.h>

namespace {

volatile std::sig_atomic_t gShutdownFlag = 0;

void signalHandler(int /*sig*/) {
    gShutdownFlag = 1;
}

void installSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = signalHandler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

void printUsage(const char* program) {
    std::println(stderr,
                 "Usage: {} [--config <path>] <command>\n"
                 "Commands:\n"
                 "  run <target>                      run one backup (<workload>, all or config)\n"
                 "  daemon                            run scheduled backups until interrupted\n"
                 "  list                              list discovered workloads\n"
                 "  history [target] [--since YYYY-mm-dd] [--until YYYY-mm-dd]\n"
                 "  prune                             delete archives older than retention_days\n"
                 "  restore <archive> <destination>   decrypt and extract an archive\n"
                 "  schedule <target> <json>          add or update a schedule\n"
                 "  unschedule <target>               disable a schedule",
                 program);
}

std::optional<std::chrono::system_clock::time_point> parseDate(const std::string& text) {
    std::tm tm{};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) {
        return std::nullopt;
    }
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::string localTime(std::chrono::system_clock::time_point time) {
    std::time_t t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

int exitCodeFor(const HistoryEntry& entry) {
    switch (entry.status) {
        case JobStatus::Success:
            return 0;
        case JobStatus::Partial:
            return 2;
        case JobStatus::Failed:
            break;
    }
    return 1;
}

void printEntry(const HistoryEntry& entry) {
    std::string line = std::format("{}  {:<20} {:<8} {:>8.1f}s", localTime(entry.startedAt), entry.target,
                                   toString(entry.status),
                                   static_cast<double>(entry.duration().count()) / 1000.0);
    if (!entry.archiveName.empty()) {
        line += std::format("  {}", entry.archiveName);
    }
    if (entry.error) {
        line += std::format("  [{}] {}", toString(entry.error->severity()), entry.error->describe());
    }
    std::println("{}", line);
}

int dispatch(BackupAPI& api, const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "run" && args.size() == 2) {
        // A signal must not end the process while containers are stopped.
        installSignalHandlers();
        auto result = api.runInterruptible(args[1], gShutdownFlag);
        if (!result) {
            std::println(stderr, "Error: {}", result.error().describe());
            return 1;
        }
        printEntry(*result);
        return exitCodeFor(*result);
    }

    if (command == "daemon" && args.size() == 1) {
        installSignalHandlers();
        api.runDaemon(gShutdownFlag);
        return 0;
    }

    if (command == "list" && args.size() == 1) {
        auto workloads = api.listWorkloads();
        if (!workloads) {
            std::println(stderr, "Error: {}", workloads.error().describe());
            return 1;
        }
        for (const auto& workload : *workloads) {
            std::println("{}{}", workload.name, workload.enabled ? "" : " (disabled)");
            for (std::size_t i = 0; i < workload.containerNames.size(); ++i) {
                std::println("  container {}", workload.containerNames[i]);
            }
            for (const auto& path : workload.paths) {
                std::println("  path {}", path);
            }
        }
        return 0;
    }

    if (command == "history") {
        HistoryQuery query;
        for (std::size_t i = 1; i < args.size(); ++i) {
            if ((args[i] == "--since" || args[i] == "--until") && i + 1 < args.size()) {
                auto date = parseDate(args[i + 1]);
                if (!date) {
                    std::println(stderr, "Error: invalid date {}", args[i + 1]);
                    return 1;
                }
                if (args[i] == "--since") {
                    query.from = *date;
                } else {
                    // The until day itself is included.
                    query.until = *date + std::chrono::hours(24);
                }
                ++i;
            } else if (!query.target) {
                query.target = args[i];
            } else {
                printUsage("backupguard");
                return 1;
            }
        }
        for (const auto& entry : api.history(query)) {
            printEntry(entry);
        }
        return 0;
    }

    if (command == "prune" && args.size() == 1) {
        std::println("Deleted {} archive(s)", api.prune());
        return 0;
    }

    if (command == "restore" && args.size() == 3) {
        auto restored = api.restore(args[1], args[2]);
        if (!restored) {
            std::println(stderr, "Error: {}", restored.error().describe());
            return 1;
        }
        std::println("Restored {} into {}", args[1], args[2]);
        return 0;
    }

    if (command == "schedule" && args.size() == 3) {
        Json::Value schedule;
        Json::Reader reader;
        if (!reader.parse(args[2], schedule)) {
            std::println(stderr, "Error: schedule is not valid JSON");
            return 1;
        }
        auto updated = api.updateSchedule(args[1], schedule);
        if (!updated) {
            std::println(stderr, "Error: {}", updated.error().describe());
            return 1;
        }
        return 0;
    }

    if (command == "unschedule" && args.size() == 2) {
        auto removed = api.removeSchedule(args[1]);
        if (!removed) {
            std::println(stderr, "Error: {}", removed.error().describe());
            return 1;
        }
        return 0;
    }

    printUsage("backupguard");
    return 1;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string configFile = "backupguard.json";
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    try {
        BackupAPI api(configFile);
        return dispatch(api, args);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
