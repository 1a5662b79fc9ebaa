/**
 * @file backup_error.hpp
 * @brief Error taxonomy for the BackupGuard engine.
 *
 * Every fallible engine operation returns std::expected<T, BackupError>. The error kind
 * decides how the orchestrator reacts (abort, retry, continue) and the severity tier
 * decides how loudly the outcome is reported.
 */

#ifndef BACKUP_ERROR_HPP
#define BACKUP_ERROR_HPP

#include <string>
#include <string_view>

/**
 * @brief Kinds of failures the engine distinguishes.
 */
enum class ErrorKind {
    Discovery,          ///< Container runtime unreachable or target not found.
    StopTimeout,        ///< Graceful stop did not complete in time.
    ForceStop,          ///< Force-stop failed; the workload could not be stopped.
    Copy,               ///< Copying volume data into staging failed.
    RestartFailed,      ///< A stopped container could not be started again.
    Compression,        ///< Writing the compressed tar stream failed.
    Encryption,         ///< Encrypting or decrypting the archive failed.
    Upload,             ///< Remote copy or remote verification failed.
    PruneEntry,         ///< A single retention deletion failed.
    JobAlreadyRunning,  ///< The target is held by another job.
    ConfigExport,       ///< Configuration export (Portainer) failed.
    Cancelled,          ///< The job was cancelled before any container was stopped.
    Configuration       ///< Invalid configuration or request.
};

/**
 * @brief Reporting tier of an error.
 *
 * Critical is reserved for failures that leave a workload down.
 */
enum class Severity {
    Warning,
    Error,
    Critical
};

/**
 * @brief Error value carried by std::expected returns.
 */
struct BackupError {
    ErrorKind kind;      ///< What failed.
    std::string message; ///< Human readable detail.

    /**
     * @brief Severity derived from the error kind.
     */
    Severity severity() const;

    /**
     * @brief Formats the error as "<KindName>: <message>".
     */
    std::string describe() const;
};

/**
 * @brief Builds an error value.
 */
BackupError makeError(ErrorKind kind, std::string message);

/**
 * @brief Stable name of an error kind, e.g. "CopyError".
 */
std::string_view toString(ErrorKind kind);

std::string_view toString(Severity severity);

/**
 * @brief Parses a name produced by toString(ErrorKind).
 *
 * @return true if the name was recognised.
 */
bool parseErrorKind(std::string_view name, ErrorKind& kind);

#endif // BACKUP_ERROR_HPP
