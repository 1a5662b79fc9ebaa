/**
 * @file remote_transfer.hpp
 * @brief Remote storage strategies for BackupGuard.
 *
 * A remote store supports three operations: copy a local file into a directory, list a
 * directory, and delete one entry. The Sync Manager verifies uploads through list(); the
 * Retention Manager ages entries by their remote modification time.
 *
 * @note SFTP transfers require libssh. The rclone strategy runs the rclone binary.
 */

#ifndef REMOTE_TRANSFER_HPP
#define REMOTE_TRANSFER_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>
#include "backup_config.hpp"
#include "backup_error.hpp"

/**
 * @brief One entry of a remote directory listing.
 */
struct RemoteEntry {
    std::string name;                                  ///< File name, without directory.
    std::uintmax_t size = 0;                           ///< Size in bytes.
    std::chrono::system_clock::time_point modTime;     ///< Remote modification time.
};

/**
 * @brief Interface for remote transfer strategies.
 *
 * All failures are reported as Upload errors.
 */
class RemoteTransferStrategy {
public:
    virtual ~RemoteTransferStrategy() = default;

    /**
     * @brief Copies a local file into a remote directory, keeping its file name.
     *
     * @param localFile Path to the local file.
     * @param remoteDir Remote directory, created if missing.
     * @param timeout Bound on the transfer.
     */
    virtual std::expected<void, BackupError> copy(const std::string& localFile, const std::string& remoteDir,
                                                  std::chrono::seconds timeout) = 0;

    /**
     * @brief Lists the files of a remote directory.
     */
    virtual std::expected<std::vector<RemoteEntry>, BackupError> list(const std::string& remoteDir) = 0;

    /**
     * @brief Deletes one file from a remote directory.
     */
    virtual std::expected<void, BackupError> remove(const std::string& remoteDir, const std::string& name) = 0;

    /**
     * @brief Human readable location, used in log lines.
     */
    virtual std::string describe(const std::string& remoteDir) const = 0;
};

/**
 * @brief SFTP remote transfer strategy.
 *
 * Opens one SSH session per operation. Authenticates with the configured password, or
 * with the user's public keys when no password is set.
 */
class SFTPTransferStrategy : public RemoteTransferStrategy {
public:
    /**
     * @brief Constructs an SFTP transfer strategy.
     *
     * @param config Remote settings (host, user, password, port).
     * @throws std::runtime_error If host or user is missing.
     */
    explicit SFTPTransferStrategy(const RemoteConfig& config);

    std::expected<void, BackupError> copy(const std::string& localFile, const std::string& remoteDir,
                                          std::chrono::seconds timeout) override;
    std::expected<std::vector<RemoteEntry>, BackupError> list(const std::string& remoteDir) override;
    std::expected<void, BackupError> remove(const std::string& remoteDir, const std::string& name) override;
    std::string describe(const std::string& remoteDir) const override;

    /**
     * @brief Whole seconds left before a deadline, rounded up; 0 once it has passed.
     *
     * Used to bound each blocking SSH call of an upload by the time remaining.
     */
    static long secondsLeft(std::chrono::steady_clock::time_point deadline,
                            std::chrono::steady_clock::time_point now);

private:
    std::string host_;     ///< SFTP host address.
    std::string user_;     ///< SFTP username.
    std::string password_; ///< SFTP password.
    int port_;             ///< SFTP port (e.g., 22).
};

/**
 * @brief rclone remote transfer strategy.
 *
 * Uses "rclone copy", "rclone lsjson" and "rclone deletefile" against
 * "<remote name>:<directory>", with the configured rclone.conf.
 */
class RcloneTransferStrategy : public RemoteTransferStrategy {
public:
    /**
     * @param config Remote settings (name, config_path).
     * @param binary rclone executable, looked up in PATH.
     */
    explicit RcloneTransferStrategy(const RemoteConfig& config, std::string binary = "rclone");

    std::expected<void, BackupError> copy(const std::string& localFile, const std::string& remoteDir,
                                          std::chrono::seconds timeout) override;
    std::expected<std::vector<RemoteEntry>, BackupError> list(const std::string& remoteDir) override;
    std::expected<void, BackupError> remove(const std::string& remoteDir, const std::string& name) override;
    std::string describe(const std::string& remoteDir) const override;

    /**
     * @brief Parses the output of "rclone lsjson"; directories are skipped.
     */
    static std::expected<std::vector<RemoteEntry>, BackupError> parseListing(const std::string& json);

private:
    std::vector<std::string> command(std::vector<std::string> args) const;

    std::string remoteName;
    std::string configPath;
    std::string binary;
};

#endif // REMOTE_TRANSFER_HPP
