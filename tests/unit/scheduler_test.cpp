#include "scheduler.hpp"

#include "fakes.hpp"

#include <atomic>
#include <cassert>
#include <condition_variable>
#include <ctime>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using testing_support::QuietLogger;
using testing_support::RecordingNotifier;
using testing_support::TempDir;

// Holds every job until Open() is called.
class Gate {
public:
    void Wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        ++waiting_;
        changed_.notify_all();
        changed_.wait(lock, [this] { return open_; });
    }

    void WaitForWaiters(int count) {
        std::unique_lock<std::mutex> lock(mutex_);
        changed_.wait(lock, [&] { return waiting_ >= count; });
    }

    void Open() {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        changed_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable changed_;
    int waiting_ = 0;
    bool open_ = false;
};

struct Harness {
    explicit Harness(Scheduler::JobRunner runner)
        : logger(QuietLogger(dir)),
          history(dir.str("history.jsonl"), *logger),
          notifier(*logger),
          scheduler(std::move(runner), locks, history, notifier, *logger) {
        auto sink = std::make_unique<RecordingNotifier>();
        recording = sink.get();
        notifier.addSink(std::move(sink));
    }

    TempDir dir;
    std::unique_ptr<Logger> logger;
    TargetLockRegistry locks;
    HistoryStore history;
    Notifier notifier;
    RecordingNotifier* recording = nullptr;
    Scheduler scheduler;
};

HistoryEntry SuccessEntry() {
    HistoryEntry entry;
    entry.status = JobStatus::Success;
    entry.finishedAt = std::chrono::system_clock::now();
    return entry;
}

std::chrono::system_clock::time_point Local(int year, int month, int day, int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

void TestConcurrentTriggersOnOneTargetStartOneJob() {
    Gate gate;
    std::atomic<int> runs{0};
    Harness harness([&](BackupJob&) {
        ++runs;
        gate.Wait();
        return SuccessEntry();
    });

    constexpr int kCallers = 8;
    std::atomic<int> accepted{0};
    std::atomic<int> rejected{0};
    std::vector<std::thread> callers;
    for (int i = 0; i < kCallers; ++i) {
        callers.emplace_back([&] {
            auto id = harness.scheduler.trigger("db");
            if (id) {
                ++accepted;
            } else {
                assert(id.error().kind == ErrorKind::JobAlreadyRunning);
                ++rejected;
            }
        });
    }
    for (auto& caller : callers) {
        caller.join();
    }

    assert(accepted.load() == 1);
    assert(rejected.load() == kCallers - 1);

    gate.WaitForWaiters(1);
    auto status = harness.scheduler.status("db");
    assert(status.has_value());
    assert(status->target == "db");
    assert(status->kind == JobKind::Project);

    gate.Open();
    harness.scheduler.waitIdle();
    assert(runs.load() == 1);
    assert(!harness.scheduler.status("db").has_value());
    assert(!harness.locks.isHeld("db"));
}

void TestRunNowRecordsAndNotifies() {
    Harness harness([](BackupJob&) { return SuccessEntry(); });

    auto entry = harness.scheduler.runNow("web", JobOrigin::Manual);
    assert(entry.has_value());
    assert(entry->status == JobStatus::Success);
    assert(entry->target == "web");
    assert(!entry->jobId.empty());

    auto recorded = harness.history.query();
    assert(recorded.size() == 1);
    assert(recorded[0].jobId == entry->jobId);

    auto notified = harness.recording->Entries();
    assert(notified.size() == 1);
    assert(notified[0].jobId == entry->jobId);
    assert(!harness.locks.isHeld("web"));
}

void TestRunnerExceptionBecomesFailedEntry() {
    Harness harness([](BackupJob&) -> HistoryEntry { throw std::runtime_error("boom"); });

    auto entry = harness.scheduler.runNow("db");
    assert(entry.has_value());
    assert(entry->status == JobStatus::Failed);
    assert(entry->error.has_value());
    assert(entry->error->message.find("boom") != std::string::npos);
    assert(!harness.locks.isHeld("db"));
    assert(harness.history.query().size() == 1);
}

void TestCancelBeforeStopIsHonoured() {
    Gate gate;
    std::atomic<bool> sawCancel{false};
    Harness harness([&](BackupJob& job) {
        gate.Wait();
        if (!job.cancellation.commitStop()) {
            sawCancel = true;
            HistoryEntry entry;
            entry.status = JobStatus::Failed;
            entry.error = makeError(ErrorKind::Cancelled, "cancelled");
            return entry;
        }
        return SuccessEntry();
    });

    assert(!harness.scheduler.cancel("db").has_value());

    auto id = harness.scheduler.trigger("db");
    assert(id.has_value());
    gate.WaitForWaiters(1);
    assert(harness.scheduler.cancel("db").has_value());
    gate.Open();
    harness.scheduler.waitIdle();

    assert(sawCancel.load());
    auto entries = harness.history.query();
    assert(entries.size() == 1);
    assert(entries[0].error.has_value());
    assert(entries[0].error->kind == ErrorKind::Cancelled);
}

void TestCancelAfterCommitIsRejected() {
    Gate gate;
    Harness harness([&](BackupJob& job) {
        bool committed = job.cancellation.commitStop();
        assert(committed);
        gate.Wait();
        return SuccessEntry();
    });

    assert(harness.scheduler.trigger("db").has_value());
    gate.WaitForWaiters(1);
    auto cancelled = harness.scheduler.cancel("db");
    assert(!cancelled.has_value());
    assert(cancelled.error().kind == ErrorKind::Configuration);
    gate.Open();
    harness.scheduler.waitIdle();
    assert(harness.history.query()[0].status == JobStatus::Success);
}

void TestNextRunDaily() {
    ScheduleDefinition daily;
    daily.enabled = true;
    daily.type = "daily";
    daily.time = "03:00";

    auto before = Scheduler::nextRun(daily, Local(2026, 3, 10, 2, 0, 0));
    assert(before.has_value());
    assert(*before == Local(2026, 3, 10, 3, 0, 0));

    // Exactly at the fire time moves to the next day.
    auto at = Scheduler::nextRun(daily, Local(2026, 3, 10, 3, 0, 0));
    assert(at.has_value());
    assert(*at == Local(2026, 3, 11, 3, 0, 0));
}

void TestNextRunWeeklyAndMonthly() {
    ScheduleDefinition weekly;
    weekly.type = "weekly";
    weekly.time = "04:30:00";
    weekly.dayOfWeek = "Sunday";
    // 2026-03-10 is a Tuesday.
    auto sunday = Scheduler::nextRun(weekly, Local(2026, 3, 10, 12, 0, 0));
    assert(sunday.has_value());
    assert(*sunday == Local(2026, 3, 15, 4, 30, 0));

    ScheduleDefinition monthly;
    monthly.type = "monthly";
    monthly.time = "01:00";
    monthly.dayOfMonth = 31;
    auto endOfFebruary = Scheduler::nextRun(monthly, Local(2026, 2, 1, 0, 0, 0));
    assert(endOfFebruary.has_value());
    assert(*endOfFebruary == Local(2026, 2, 28, 1, 0, 0));

    auto nextMonth = Scheduler::nextRun(monthly, Local(2026, 2, 28, 2, 0, 0));
    assert(nextMonth.has_value());
    assert(*nextMonth == Local(2026, 3, 31, 1, 0, 0));
}

void TestNextRunRejectsInvalidDefinitions() {
    const auto now = Local(2026, 3, 10, 12, 0, 0);
    ScheduleDefinition bad;
    bad.time = "25:00";
    assert(!Scheduler::nextRun(bad, now).has_value());

    bad = ScheduleDefinition{};
    bad.type = "hourly";
    auto type = Scheduler::nextRun(bad, now);
    assert(!type.has_value());
    assert(type.error().kind == ErrorKind::Configuration);

    bad = ScheduleDefinition{};
    bad.type = "weekly";
    bad.dayOfWeek = "someday";
    assert(!Scheduler::nextRun(bad, now).has_value());

    bad = ScheduleDefinition{};
    bad.type = "monthly";
    bad.dayOfMonth = 0;
    assert(!Scheduler::nextRun(bad, now).has_value());

    int hour = 0;
    int minute = 0;
    int second = 0;
    assert(parseTimeOfDay("23:59:59", hour, minute, second));
    assert(hour == 23 && minute == 59 && second == 59);
    assert(parseTimeOfDay("7:05", hour, minute, second));
    assert(second == 0);
    assert(!parseTimeOfDay("07:05pm", hour, minute, second));
}

void TestTickFiresDueSchedulesOnce() {
    std::atomic<int> runs{0};
    Harness harness([&](BackupJob& job) {
        assert(job.origin == JobOrigin::Scheduled);
        ++runs;
        return SuccessEntry();
    });

    ScheduleDefinition daily;
    daily.enabled = true;
    daily.time = "03:00";
    assert(harness.scheduler.setSchedule("db", daily).has_value());
    auto fire = harness.scheduler.nextFireTime("db");
    assert(fire.has_value());

    assert(harness.scheduler.tick(*fire - std::chrono::seconds(1)).empty());
    auto started = harness.scheduler.tick(*fire);
    assert(started.size() == 1);
    harness.scheduler.waitIdle();
    assert(runs.load() == 1);

    auto following = harness.scheduler.nextFireTime("db");
    assert(following.has_value());
    assert(*following > *fire);
    assert(harness.scheduler.tick(*fire).empty());
}

void TestTickSkipsBusyTarget() {
    Gate gate;
    Harness harness([&](BackupJob&) {
        gate.Wait();
        return SuccessEntry();
    });

    ScheduleDefinition daily;
    daily.enabled = true;
    daily.time = "03:00";
    assert(harness.scheduler.setSchedule("all", daily).has_value());
    assert(harness.scheduler.trigger("db").has_value());
    gate.WaitForWaiters(1);

    auto fire = harness.scheduler.nextFireTime("all");
    assert(fire.has_value());
    assert(harness.scheduler.tick(*fire).empty());

    gate.Open();
    harness.scheduler.waitIdle();
    assert(harness.history.query().size() == 1);
}

void TestSyncSchedulesFollowsConfiguration() {
    Harness harness([](BackupJob&) { return SuccessEntry(); });

    BackupConfig config;
    config.schedule.enabled = true;
    config.configSchedule.enabled = false;
    TargetConfig db;
    db.name = "db";
    db.schedule.enabled = true;
    db.schedule.type = "weekly";
    config.targets.push_back(db);
    TargetConfig off;
    off.name = "cache";
    off.enabled = false;
    off.schedule.enabled = true;
    config.targets.push_back(off);

    harness.scheduler.syncSchedules(config);
    auto schedules = harness.scheduler.schedules();
    assert(schedules.size() == 2);
    assert(schedules.contains("all"));
    assert(schedules.contains("db"));
    auto fire = harness.scheduler.nextFireTime("db");

    harness.scheduler.syncSchedules(config);
    assert(harness.scheduler.nextFireTime("db") == fire);

    assert(harness.scheduler.removeSchedule("db"));
    assert(!harness.scheduler.removeSchedule("db"));
    assert(!harness.scheduler.nextFireTime("db").has_value());
}

}  // namespace

int main() {
    TestConcurrentTriggersOnOneTargetStartOneJob();
    TestRunNowRecordsAndNotifies();
    TestRunnerExceptionBecomesFailedEntry();
    TestCancelBeforeStopIsHonoured();
    TestCancelAfterCommitIsRejected();
    TestNextRunDaily();
    TestNextRunWeeklyAndMonthly();
    TestNextRunRejectsInvalidDefinitions();
    TestTickFiresDueSchedulesOnce();
    TestTickSkipsBusyTarget();
    TestSyncSchedulesFollowsConfiguration();

    std::cout << "scheduler_test: pass\n";
    return 0;
}
