/**
 * @file target_lock_registry.hpp
 * @brief Mutual exclusion between jobs on overlapping targets.
 *
 * Rules:
 *  - a project job on a workload excludes other jobs on that workload and full-system jobs;
 *  - a full-system job excludes every other full-system, project and config-only job;
 *  - a config-only job excludes other config-only jobs and full-system jobs.
 */

#ifndef TARGET_LOCK_REGISTRY_HPP
#define TARGET_LOCK_REGISTRY_HPP

#include <expected>
#include <mutex>
#include <set>
#include <string>
#include "backup_error.hpp"
#include "backup_job.hpp"

class TargetLockRegistry;

/**
 * @brief Held target lock, released when destroyed.
 */
class TargetLease {
public:
    TargetLease() = default;
    TargetLease(TargetLease&& other) noexcept;
    TargetLease& operator=(TargetLease&& other) noexcept;
    TargetLease(const TargetLease&) = delete;
    TargetLease& operator=(const TargetLease&) = delete;
    ~TargetLease();

    /**
     * @brief Releases the lock early. Safe to call more than once.
     */
    void release();

    bool held() const { return registry != nullptr; }
    const std::string& target() const { return name; }

private:
    friend class TargetLockRegistry;
    TargetLease(TargetLockRegistry* registry, std::string target, JobKind kind);

    TargetLockRegistry* registry = nullptr;
    std::string name;
    JobKind kind = JobKind::Project;
};

/**
 * @brief Registry of held targets.
 */
class TargetLockRegistry {
public:
    /**
     * @brief Acquires the lock for a target without waiting.
     *
     * @return The lease, or a JobAlreadyRunning error naming the conflicting holder.
     */
    std::expected<TargetLease, BackupError> tryAcquire(const std::string& target, JobKind kind);

    /**
     * @brief True if a job currently holds this exact target.
     */
    bool isHeld(const std::string& target) const;

private:
    friend class TargetLease;
    void release(const std::string& target, JobKind kind);

    mutable std::mutex mutex;
    std::set<std::string> workloads;
    bool fullSystem = false;
    bool config = false;
};

#endif // TARGET_LOCK_REGISTRY_HPP
