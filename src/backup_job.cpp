#include "backup_job.hpp"
#include <cctype>
#include <cstdio>
#include <ctime>

std::string_view toString(JobKind kind) {
    switch (kind) {
        case JobKind::Project:
            return "project";
        case JobKind::FullSystem:
            return "full-system";
        case JobKind::ConfigOnly:
            return "config-only";
    }
    return "project";
}

std::string_view toString(JobOrigin origin) {
    return origin == JobOrigin::Scheduled ? "scheduled" : "manual";
}

std::string_view toString(JobPhase phase) {
    switch (phase) {
        case JobPhase::Pending:
            return "pending";
        case JobPhase::Discovering:
            return "discovering";
        case JobPhase::Snapshotting:
            return "snapshotting";
        case JobPhase::Archiving:
            return "archiving";
        case JobPhase::Uploading:
            return "uploading";
        case JobPhase::Pruning:
            return "pruning";
        case JobPhase::Completed:
            return "completed";
    }
    return "pending";
}

std::string_view toString(JobStatus status) {
    switch (status) {
        case JobStatus::Success:
            return "success";
        case JobStatus::Partial:
            return "partial";
        case JobStatus::Failed:
            return "failed";
    }
    return "failed";
}

JobKind kindForTarget(const std::string& target) {
    if (target == kFullSystemTarget) {
        return JobKind::FullSystem;
    }
    if (target == kConfigTarget) {
        return JobKind::ConfigOnly;
    }
    return JobKind::Project;
}

bool CancellationToken::requestCancel() {
    std::lock_guard<std::mutex> lock(mutex);
    if (committed) {
        return false;
    }
    cancelled = true;
    return true;
}

bool CancellationToken::commitStop() {
    std::lock_guard<std::mutex> lock(mutex);
    if (cancelled) {
        return false;
    }
    committed = true;
    return true;
}

bool CancellationToken::cancelRequested() const {
    std::lock_guard<std::mutex> lock(mutex);
    return cancelled;
}

bool CancellationToken::stopCommitted() const {
    std::lock_guard<std::mutex> lock(mutex);
    return committed;
}

std::chrono::milliseconds HistoryEntry::duration() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(finishedAt - startedAt);
}

Json::Value HistoryEntry::toJson() const {
    Json::Value json(Json::objectValue);
    json["job_id"] = jobId;
    json["target"] = target;
    json["kind"] = std::string(toString(kind));
    json["origin"] = std::string(toString(origin));
    json["status"] = std::string(toString(status));
    json["started_at"] = formatIsoTime(startedAt);
    json["finished_at"] = formatIsoTime(finishedAt);
    json["duration_ms"] = static_cast<Json::Int64>(duration().count());
    json["archive_name"] = archiveName;
    json["archive_size"] = static_cast<Json::UInt64>(archiveSize);
    json["checksum"] = checksum;
    json["archive_retained_locally"] = archiveRetainedLocally;
    if (error) {
        json["error_kind"] = std::string(toString(error->kind));
        json["error"] = error->message;
        json["severity"] = std::string(toString(error->severity()));
    }
    Json::Value failed(Json::arrayValue);
    for (const auto& name : failedWorkloads) {
        failed.append(name);
    }
    json["failed_workloads"] = failed;
    return json;
}

std::optional<HistoryEntry> HistoryEntry::fromJson(const Json::Value& json) {
    if (!json.isObject() || !json.isMember("job_id")) {
        return std::nullopt;
    }
    HistoryEntry entry;
    entry.jobId = json["job_id"].asString();
    entry.target = json.get("target", "").asString();
    entry.kind = kindForTarget(entry.target);
    entry.origin = json.get("origin", "manual").asString() == "scheduled" ? JobOrigin::Scheduled : JobOrigin::Manual;

    const std::string status = json.get("status", "failed").asString();
    if (status == "success") {
        entry.status = JobStatus::Success;
    } else if (status == "partial") {
        entry.status = JobStatus::Partial;
    } else {
        entry.status = JobStatus::Failed;
    }

    auto started = parseIsoTime(json.get("started_at", "").asString());
    auto finished = parseIsoTime(json.get("finished_at", "").asString());
    if (!started || !finished) {
        return std::nullopt;
    }
    entry.startedAt = *started;
    entry.finishedAt = *finished;
    entry.archiveName = json.get("archive_name", "").asString();
    entry.archiveSize = json.get("archive_size", 0).asUInt64();
    entry.checksum = json.get("checksum", "").asString();
    entry.archiveRetainedLocally = json.get("archive_retained_locally", false).asBool();

    if (json.isMember("error_kind")) {
        ErrorKind kind = ErrorKind::Configuration;
        parseErrorKind(json["error_kind"].asString(), kind);
        entry.error = makeError(kind, json.get("error", "").asString());
    }
    for (const auto& name : json["failed_workloads"]) {
        entry.failedWorkloads.push_back(name.asString());
    }
    return entry;
}

std::string formatIsoTime(std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm tmUtc{};
    gmtime_r(&timeT, &tmUtc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tmUtc);
    return buf;
}

std::optional<std::chrono::system_clock::time_point> parseIsoTime(const std::string& text) {
    std::tm tmUtc{};
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &tmUtc.tm_year, &tmUtc.tm_mon, &tmUtc.tm_mday,
                    &tmUtc.tm_hour, &tmUtc.tm_min, &tmUtc.tm_sec, &consumed) != 6) {
        return std::nullopt;
    }
    tmUtc.tm_year -= 1900;
    tmUtc.tm_mon -= 1;

    std::size_t pos = static_cast<std::size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
    }

    long offsetSeconds = 0;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int hours = 0;
        int minutes = 0;
        if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &hours, &minutes) != 2) {
            return std::nullopt;
        }
        offsetSeconds = (hours * 3600L + minutes * 60L) * (text[pos] == '-' ? -1 : 1);
    } else if (pos < text.size() && text[pos] != 'Z') {
        return std::nullopt;
    }

    std::time_t utc = timegm(&tmUtc);
    if (utc == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return std::chrono::system_clock::from_time_t(utc - offsetSeconds);
}
