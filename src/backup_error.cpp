#include "backup_error.hpp"
#include <array>
#include <format>
#include <utility>

namespace {

constexpr std::array<std::pair<ErrorKind, std::string_view>, 13> kErrorKindNames = {{
    {ErrorKind::Discovery, "DiscoveryError"},
    {ErrorKind::StopTimeout, "StopTimeoutError"},
    {ErrorKind::ForceStop, "ForceStopError"},
    {ErrorKind::Copy, "CopyError"},
    {ErrorKind::RestartFailed, "RestartFailedError"},
    {ErrorKind::Compression, "CompressionError"},
    {ErrorKind::Encryption, "EncryptionError"},
    {ErrorKind::Upload, "UploadError"},
    {ErrorKind::PruneEntry, "PruneEntryError"},
    {ErrorKind::JobAlreadyRunning, "JobAlreadyRunningError"},
    {ErrorKind::ConfigExport, "ConfigExportError"},
    {ErrorKind::Cancelled, "CancelledError"},
    {ErrorKind::Configuration, "ConfigurationError"},
}};

} // namespace

Severity BackupError::severity() const {
    switch (kind) {
        case ErrorKind::RestartFailed:
            return Severity::Critical;
        case ErrorKind::StopTimeout:
        case ErrorKind::PruneEntry:
            return Severity::Warning;
        default:
            return Severity::Error;
    }
}

std::string BackupError::describe() const {
    return std::format("{}: {}", toString(kind), message);
}

BackupError makeError(ErrorKind kind, std::string message) {
    return BackupError{kind, std::move(message)};
}

std::string_view toString(ErrorKind kind) {
    for (const auto& [k, name] : kErrorKindNames) {
        if (k == kind) {
            return name;
        }
    }
    return "UnknownError";
}

std::string_view toString(Severity severity) {
    switch (severity) {
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
        case Severity::Critical:
            return "critical";
    }
    return "error";
}

bool parseErrorKind(std::string_view name, ErrorKind& kind) {
    for (const auto& [k, n] : kErrorKindNames) {
        if (n == name) {
            kind = k;
            return true;
        }
    }
    return false;
}
