#include "target_lock_registry.hpp"
#include <format>
#include <utility>

TargetLease::TargetLease(TargetLockRegistry* registry, std::string target, JobKind kind)
    : registry(registry), name(std::move(target)), kind(kind) {}

TargetLease::TargetLease(TargetLease&& other) noexcept
    : registry(std::exchange(other.registry, nullptr)), name(std::move(other.name)), kind(other.kind) {}

TargetLease& TargetLease::operator=(TargetLease&& other) noexcept {
    if (this != &other) {
        release();
        registry = std::exchange(other.registry, nullptr);
        name = std::move(other.name);
        kind = other.kind;
    }
    return *this;
}

TargetLease::~TargetLease() {
    release();
}

void TargetLease::release() {
    if (registry) {
        registry->release(name, kind);
        registry = nullptr;
    }
}

std::expected<TargetLease, BackupError> TargetLockRegistry::tryAcquire(const std::string& target, JobKind kind) {
    std::lock_guard<std::mutex> lock(mutex);
    auto busy = [&](const std::string& holder) {
        return std::unexpected(makeError(ErrorKind::JobAlreadyRunning,
                                         std::format("Cannot start {}: {} is already running", target, holder)));
    };

    switch (kind) {
        case JobKind::Project:
            if (fullSystem) {
                return busy("full-system backup");
            }
            if (workloads.contains(target)) {
                return busy(std::format("a backup of {}", target));
            }
            workloads.insert(target);
            break;
        case JobKind::FullSystem:
            if (fullSystem) {
                return busy("full-system backup");
            }
            if (config) {
                return busy("configuration export");
            }
            if (!workloads.empty()) {
                return busy(std::format("a backup of {}", *workloads.begin()));
            }
            fullSystem = true;
            break;
        case JobKind::ConfigOnly:
            if (fullSystem) {
                return busy("full-system backup");
            }
            if (config) {
                return busy("configuration export");
            }
            config = true;
            break;
    }
    return TargetLease(this, target, kind);
}

bool TargetLockRegistry::isHeld(const std::string& target) const {
    std::lock_guard<std::mutex> lock(mutex);
    switch (kindForTarget(target)) {
        case JobKind::FullSystem:
            return fullSystem;
        case JobKind::ConfigOnly:
            return config;
        case JobKind::Project:
            return workloads.contains(target);
    }
    return false;
}

void TargetLockRegistry::release(const std::string& target, JobKind kind) {
    std::lock_guard<std::mutex> lock(mutex);
    switch (kind) {
        case JobKind::Project:
            workloads.erase(target);
            break;
        case JobKind::FullSystem:
            fullSystem = false;
            break;
        case JobKind::ConfigOnly:
            config = false;
            break;
    }
}
