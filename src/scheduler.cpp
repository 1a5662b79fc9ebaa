#include "scheduler.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <format>
#include <sstream>
#include <utility>

namespace {

std::chrono::system_clock::time_point makeLocal(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year;
    tm.tm_mon = month;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

int daysInMonth(int year, int month) {
    std::tm tm{};
    tm.tm_year = year;
    tm.tm_mon = month + 1;
    tm.tm_mday = 0;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    std::mktime(&tm);
    return tm.tm_mday;
}

} // namespace

bool parseTimeOfDay(const std::string& text, int& hour, int& minute, int& second) {
    std::istringstream ss(text);
    char colon = 0;
    second = 0;
    ss >> hour >> colon >> minute;
    if (ss.fail() || colon != ':') {
        return false;
    }
    if (ss.peek() == ':') {
        ss >> colon >> second;
        if (ss.fail()) {
            return false;
        }
    }
    ss >> std::ws;
    if (!ss.eof()) {
        return false;
    }
    return hour >= 0 && hour <= 23 && minute >= 0 && minute <= 59 && second >= 0 && second <= 59;
}

Scheduler::Scheduler(JobRunner runner, TargetLockRegistry& locks, HistoryStore& history, Notifier& notifier,
                     const Logger& logger)
    : runner(std::move(runner)), locks(locks), history(history), notifier(notifier), logger(logger) {}

Scheduler::~Scheduler() {
    waitIdle();
}

std::expected<std::chrono::system_clock::time_point, BackupError>
Scheduler::nextRun(const ScheduleDefinition& definition, std::chrono::system_clock::time_point now) {
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (!parseTimeOfDay(definition.time, hour, minute, second)) {
        return std::unexpected(makeError(ErrorKind::Configuration,
                                         std::format("Invalid schedule time format: {}", definition.time)));
    }

    std::time_t nowT = std::chrono::system_clock::to_time_t(now);
    std::tm tmNow{};
    localtime_r(&nowT, &tmNow);

    if (definition.type == "daily") {
        auto next = makeLocal(tmNow.tm_year, tmNow.tm_mon, tmNow.tm_mday, hour, minute, second);
        for (int days = 1; next <= now && days <= 2; ++days) {
            next = makeLocal(tmNow.tm_year, tmNow.tm_mon, tmNow.tm_mday + days, hour, minute, second);
        }
        return next;
    }

    if (definition.type == "weekly") {
        static const std::map<std::string, int> dayMap = {
            {"monday", 1}, {"tuesday", 2}, {"wednesday", 3}, {"thursday", 4},
            {"friday", 5}, {"saturday", 6}, {"sunday", 0}
        };
        std::string day = definition.dayOfWeek;
        std::transform(day.begin(), day.end(), day.begin(), [](unsigned char c) { return std::tolower(c); });
        auto it = dayMap.find(day);
        if (it == dayMap.end()) {
            return std::unexpected(makeError(ErrorKind::Configuration,
                                             std::format("Invalid day of week: {}", definition.dayOfWeek)));
        }
        int daysToAdd = (it->second - tmNow.tm_wday + 7) % 7;
        auto next = makeLocal(tmNow.tm_year, tmNow.tm_mon, tmNow.tm_mday + daysToAdd, hour, minute, second);
        if (next <= now) {
            next = makeLocal(tmNow.tm_year, tmNow.tm_mon, tmNow.tm_mday + daysToAdd + 7, hour, minute, second);
        }
        return next;
    }

    if (definition.type == "monthly") {
        if (definition.dayOfMonth < 1 || definition.dayOfMonth > 31) {
            return std::unexpected(makeError(ErrorKind::Configuration,
                                             std::format("Invalid day of month: {}", definition.dayOfMonth)));
        }
        for (int offset = 0; offset <= 12; ++offset) {
            int year = tmNow.tm_year + (tmNow.tm_mon + offset) / 12;
            int month = (tmNow.tm_mon + offset) % 12;
            int day = std::min(definition.dayOfMonth, daysInMonth(year, month));
            auto next = makeLocal(year, month, day, hour, minute, second);
            if (next > now) {
                return next;
            }
        }
    }

    return std::unexpected(makeError(ErrorKind::Configuration,
                                     std::format("Invalid schedule type: {}", definition.type)));
}

std::expected<void, BackupError> Scheduler::setSchedule(const std::string& target,
                                                        const ScheduleDefinition& definition) {
    if (target.empty()) {
        return std::unexpected(makeError(ErrorKind::Configuration, "Schedule target must not be empty"));
    }
    auto next = nextRun(definition, std::chrono::system_clock::now());
    if (!next) {
        return std::unexpected(next.error());
    }

    std::lock_guard<std::mutex> lock(mutex);
    definitions[target] = definition;
    if (definition.enabled) {
        nextFire[target] = *next;
    } else {
        nextFire.erase(target);
    }
    return {};
}

bool Scheduler::removeSchedule(const std::string& target) {
    std::lock_guard<std::mutex> lock(mutex);
    nextFire.erase(target);
    return definitions.erase(target) > 0;
}

std::map<std::string, ScheduleDefinition> Scheduler::schedules() const {
    std::lock_guard<std::mutex> lock(mutex);
    return definitions;
}

std::optional<std::chrono::system_clock::time_point> Scheduler::nextFireTime(const std::string& target) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = nextFire.find(target);
    if (it == nextFire.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Scheduler::syncSchedules(const BackupConfig& config) {
    std::map<std::string, ScheduleDefinition> wanted;
    if (config.schedule.enabled) {
        wanted[std::string(kFullSystemTarget)] = config.schedule;
    }
    if (config.configSchedule.enabled) {
        wanted[std::string(kConfigTarget)] = config.configSchedule;
    }
    for (const auto& target : config.targets) {
        if (target.enabled && target.schedule.enabled) {
            wanted[target.name] = target.schedule;
        }
    }

    const auto now = std::chrono::system_clock::now();
    std::lock_guard<std::mutex> lock(mutex);
    std::map<std::string, std::chrono::system_clock::time_point> fires;
    for (auto it = wanted.begin(); it != wanted.end();) {
        auto previous = definitions.find(it->first);
        auto fire = nextFire.find(it->first);
        if (previous != definitions.end() && previous->second == it->second && fire != nextFire.end()) {
            fires[it->first] = fire->second;
            ++it;
            continue;
        }
        auto next = nextRun(it->second, now);
        if (!next) {
            logger.logWarning(std::format("Ignoring schedule of {}: {}", it->first, next.error().message));
            it = wanted.erase(it);
            continue;
        }
        fires[it->first] = *next;
        ++it;
    }
    definitions = std::move(wanted);
    nextFire = std::move(fires);
}

std::string Scheduler::nextJobId() {
    std::time_t nowT = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&nowT, &tm);
    char timestampBuf[32];
    std::strftime(timestampBuf, sizeof(timestampBuf), "%Y%m%d-%H%M%S", &tm);
    return std::format("{}-{:04d}", timestampBuf, ++sequence);
}

std::expected<Scheduler::Prepared, BackupError> Scheduler::prepare(const std::string& target, JobOrigin origin) {
    if (target.empty()) {
        return std::unexpected(makeError(ErrorKind::Configuration, "Job target must not be empty"));
    }
    const JobKind kind = kindForTarget(target);
    auto lease = locks.tryAcquire(target, kind);
    if (!lease) {
        return std::unexpected(lease.error());
    }

    auto job = std::make_shared<BackupJob>();
    job->id = nextJobId();
    job->target = target;
    job->kind = kind;
    job->origin = origin;
    job->startedAt = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(mutex);
        active[target] = job;
    }
    return Prepared{job, std::move(*lease)};
}

HistoryEntry Scheduler::runJob(const std::shared_ptr<BackupJob>& job, TargetLease lease) {
    HistoryEntry entry;
    try {
        entry = runner(*job);
    } catch (const std::exception& e) {
        entry.status = JobStatus::Failed;
        entry.error = makeError(ErrorKind::Configuration, std::format("Job aborted: {}", e.what()));
        logger.logError(std::format("[{}] {}", job->id, entry.error->describe()));
    }
    entry.jobId = job->id;
    entry.target = job->target;
    entry.kind = job->kind;
    entry.origin = job->origin;
    entry.startedAt = job->startedAt;
    if (entry.finishedAt < entry.startedAt) {
        entry.finishedAt = std::chrono::system_clock::now();
    }
    job->phase = JobPhase::Completed;

    auto appended = history.append(entry);
    if (!appended) {
        logger.logError(std::format("[{}] {}", job->id, appended.error()));
    }

    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = active.find(job->target);
        if (it != active.end() && it->second == job) {
            active.erase(it);
        }
    }
    lease.release();

    notifier.notify(entry);
    return entry;
}

std::expected<std::string, BackupError> Scheduler::trigger(const std::string& target, JobOrigin origin) {
    reapFinished();
    auto prepared = prepare(target, origin);
    if (!prepared) {
        return std::unexpected(prepared.error());
    }

    std::shared_ptr<BackupJob> job = prepared->job;
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(workersMutex);
    workers.push_back(Worker{
        std::thread([this, job, done, lease = std::move(prepared->lease)]() mutable {
            runJob(job, std::move(lease));
            done->store(true);
        }),
        done});
    logger.logMessage(std::format("[{}] Job for {} started ({})", job->id, target, toString(origin)));
    return job->id;
}

std::expected<HistoryEntry, BackupError> Scheduler::runNow(const std::string& target, JobOrigin origin) {
    auto prepared = prepare(target, origin);
    if (!prepared) {
        return std::unexpected(prepared.error());
    }
    return runJob(prepared->job, std::move(prepared->lease));
}

std::expected<void, BackupError> Scheduler::cancel(const std::string& target) {
    std::shared_ptr<BackupJob> job;
    {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = active.find(target);
        if (it != active.end()) {
            job = it->second;
        }
    }
    if (!job) {
        return std::unexpected(makeError(ErrorKind::Configuration, std::format("No running job for {}", target)));
    }
    if (!job->cancellation.requestCancel()) {
        return std::unexpected(makeError(ErrorKind::Configuration,
                                         std::format("Job {} already stopped containers and cannot be cancelled",
                                                     job->id)));
    }
    logger.logMessage(std::format("[{}] Cancellation requested", job->id));
    return {};
}

std::optional<ActiveJobStatus> Scheduler::status(const std::string& target) const {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = active.find(target);
    if (it == active.end()) {
        return std::nullopt;
    }
    const BackupJob& job = *it->second;
    return ActiveJobStatus{job.id, job.target, job.kind, job.origin, job.phase.load(), job.startedAt};
}

std::vector<ActiveJobStatus> Scheduler::activeJobs() const {
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<ActiveJobStatus> jobs;
    for (const auto& [target, job] : active) {
        jobs.push_back(ActiveJobStatus{job->id, job->target, job->kind, job->origin, job->phase.load(), job->startedAt});
    }
    return jobs;
}

std::vector<std::string> Scheduler::tick(std::chrono::system_clock::time_point now) {
    reapFinished();
    std::vector<std::string> due;
    {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& [target, definition] : definitions) {
            if (!definition.enabled) {
                continue;
            }
            auto it = nextFire.find(target);
            if (it == nextFire.end()) {
                if (auto next = nextRun(definition, now)) {
                    nextFire[target] = *next;
                }
                continue;
            }
            if (it->second > now) {
                continue;
            }
            due.push_back(target);
            if (auto next = nextRun(definition, now)) {
                it->second = *next;
            } else {
                nextFire.erase(it);
            }
        }
    }

    std::vector<std::string> started;
    for (const auto& target : due) {
        auto id = trigger(target, JobOrigin::Scheduled);
        if (id) {
            started.push_back(*id);
        } else {
            logger.logWarning(std::format("Skipping scheduled backup of {}: {}", target, id.error().message));
        }
    }
    return started;
}

void Scheduler::reapFinished() {
    std::lock_guard<std::mutex> lock(workersMutex);
    for (auto it = workers.begin(); it != workers.end();) {
        if (it->done->load()) {
            it->thread.join();
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
}

void Scheduler::waitIdle() {
    while (true) {
        std::list<Worker> pending;
        {
            std::lock_guard<std::mutex> lock(workersMutex);
            pending.swap(workers);
        }
        if (pending.empty()) {
            return;
        }
        for (auto& worker : pending) {
            worker.thread.join();
        }
    }
}
