#include "remote_transfer.hpp"
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <stdexcept>
#include <fcntl.h>

namespace fs = std::filesystem;

namespace {

/**
 * @brief Connected and authenticated SFTP session, torn down on scope exit.
 */
struct SftpConnection {
    ssh_session ssh = nullptr;
    sftp_session sftp = nullptr;

    SftpConnection() = default;
    SftpConnection(const SftpConnection&) = delete;
    SftpConnection& operator=(const SftpConnection&) = delete;

    ~SftpConnection() {
        if (sftp) {
            sftp_free(sftp);
        }
        if (ssh) {
            if (ssh_is_connected(ssh)) {
                ssh_disconnect(ssh);
            }
            ssh_free(ssh);
        }
    }
};

BackupError sftpError(const std::string& what, const SftpConnection& connection) {
    std::string detail = connection.ssh ? ssh_get_error(connection.ssh) : "no session";
    return makeError(ErrorKind::Upload, std::format("{}: {}", what, detail));
}

std::expected<void, BackupError> openConnection(SftpConnection& connection, const std::string& host,
                                                const std::string& user, const std::string& password,
                                                int port, long timeoutSeconds) {
    connection.ssh = ssh_new();
    if (!connection.ssh) {
        return std::unexpected(makeError(ErrorKind::Upload, "Failed to create SSH session"));
    }
    ssh_options_set(connection.ssh, SSH_OPTIONS_HOST, host.c_str());
    ssh_options_set(connection.ssh, SSH_OPTIONS_PORT, &port);
    ssh_options_set(connection.ssh, SSH_OPTIONS_USER, user.c_str());
    if (timeoutSeconds > 0) {
        ssh_options_set(connection.ssh, SSH_OPTIONS_TIMEOUT, &timeoutSeconds);
    }
    if (ssh_connect(connection.ssh) != SSH_OK) {
        return std::unexpected(sftpError(std::format("SSH connection to {}:{} failed", host, port), connection));
    }

    if (password.empty()) {
        if (ssh_userauth_publickey_auto(connection.ssh, nullptr, nullptr) != SSH_AUTH_SUCCESS) {
            return std::unexpected(sftpError("SSH authentication failed", connection));
        }
    } else {
        if (ssh_userauth_password(connection.ssh, nullptr, password.c_str()) != SSH_AUTH_SUCCESS) {
            return std::unexpected(sftpError("SSH password authentication failed", connection));
        }
    }

    connection.sftp = sftp_new(connection.ssh);
    if (!connection.sftp || sftp_init(connection.sftp) != SSH_OK) {
        return std::unexpected(sftpError("SFTP initialization failed", connection));
    }
    return {};
}

std::string joinRemote(const std::string& dir, const std::string& name) {
    if (dir.empty()) {
        return name;
    }
    return dir.back() == '/' ? dir + name : dir + "/" + name;
}

/**
 * @brief Creates every missing component of a remote directory path.
 */
std::expected<void, BackupError> ensureRemoteDir(SftpConnection& connection, const std::string& dir) {
    std::string current;
    for (const auto& part : fs::path(dir)) {
        std::string component = part.string();
        if (component.empty()) {
            continue;
        }
        if (component == "/") {
            current = "/";
            continue;
        }
        current = current.empty() ? component : joinRemote(current, component);
        sftp_attributes attributes = sftp_stat(connection.sftp, current.c_str());
        if (attributes) {
            sftp_attributes_free(attributes);
            continue;
        }
        if (sftp_mkdir(connection.sftp, current.c_str(), 0755) != 0) {
            return std::unexpected(sftpError(std::format("Failed to create remote directory {}", current), connection));
        }
    }
    return {};
}

} // namespace

SFTPTransferStrategy::SFTPTransferStrategy(const RemoteConfig& config)
    : host_(config.host),
      user_(config.user),
      password_(config.password),
      port_(config.port) {
    if (host_.empty() || user_.empty()) {
        throw std::runtime_error("SFTP remote requires remote.host and remote.user");
    }
}

std::expected<void, BackupError> SFTPTransferStrategy::copy(const std::string& localFile, const std::string& remoteDir,
                                                            std::chrono::seconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    SftpConnection connection;
    if (auto opened = openConnection(connection, host_, user_, password_, port_, static_cast<long>(timeout.count()));
        !opened) {
        return opened;
    }
    if (auto created = ensureRemoteDir(connection, remoteDir); !created) {
        return created;
    }

    std::ifstream input(localFile, std::ios::binary);
    if (!input) {
        return std::unexpected(makeError(ErrorKind::Upload, std::format("Failed to open local file {}", localFile)));
    }

    std::string remoteFile = joinRemote(remoteDir, fs::path(localFile).filename().string());
    sftp_file file = sftp_open(connection.sftp, remoteFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (!file) {
        return std::unexpected(sftpError(std::format("Failed to open remote file {}", remoteFile), connection));
    }

    char buf[32768];
    while (input) {
        input.read(buf, sizeof(buf));
        std::streamsize count = input.gcount();
        if (count <= 0) {
            break;
        }
        if (timeout.count() > 0) {
            long left = secondsLeft(deadline, std::chrono::steady_clock::now());
            if (left == 0) {
                sftp_close(file);
                return std::unexpected(makeError(ErrorKind::Upload,
                                                 std::format("Upload of {} exceeded {}s", remoteFile, timeout.count())));
            }
            // A stalled write may only use what is left of the upload budget.
            ssh_options_set(connection.ssh, SSH_OPTIONS_TIMEOUT, &left);
        }
        ssize_t written = sftp_write(file, buf, static_cast<size_t>(count));
        if (written != count) {
            sftp_close(file);
            return std::unexpected(sftpError(std::format("Write to {} failed", remoteFile), connection));
        }
    }
    if (input.bad()) {
        sftp_close(file);
        return std::unexpected(makeError(ErrorKind::Upload, std::format("Failed to read local file {}", localFile)));
    }
    if (sftp_close(file) != SSH_NO_ERROR) {
        return std::unexpected(sftpError(std::format("Failed to close remote file {}", remoteFile), connection));
    }
    return {};
}

long SFTPTransferStrategy::secondsLeft(std::chrono::steady_clock::time_point deadline,
                                       std::chrono::steady_clock::time_point now) {
    if (now >= deadline) {
        return 0;
    }
    auto left = std::chrono::ceil<std::chrono::seconds>(deadline - now);
    return static_cast<long>(left.count());
}

std::expected<std::vector<RemoteEntry>, BackupError> SFTPTransferStrategy::list(const std::string& remoteDir) {
    SftpConnection connection;
    if (auto opened = openConnection(connection, host_, user_, password_, port_, 60); !opened) {
        return std::unexpected(opened.error());
    }

    sftp_dir dir = sftp_opendir(connection.sftp, remoteDir.c_str());
    if (!dir) {
        return std::unexpected(sftpError(std::format("Failed to list remote directory {}", remoteDir), connection));
    }
    std::vector<RemoteEntry> entries;
    while (sftp_attributes attributes = sftp_readdir(connection.sftp, dir)) {
        if (attributes->type == SSH_FILEXFER_TYPE_REGULAR && attributes->name) {
            RemoteEntry entry;
            entry.name = attributes->name;
            entry.size = attributes->size;
            entry.modTime = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(attributes->mtime));
            entries.push_back(std::move(entry));
        }
        sftp_attributes_free(attributes);
    }
    bool complete = sftp_dir_eof(dir) == 1;
    sftp_closedir(dir);
    if (!complete) {
        return std::unexpected(sftpError(std::format("Listing of {} ended early", remoteDir), connection));
    }
    return entries;
}

std::expected<void, BackupError> SFTPTransferStrategy::remove(const std::string& remoteDir, const std::string& name) {
    SftpConnection connection;
    if (auto opened = openConnection(connection, host_, user_, password_, port_, 60); !opened) {
        return opened;
    }
    std::string remoteFile = joinRemote(remoteDir, name);
    if (sftp_unlink(connection.sftp, remoteFile.c_str()) != 0) {
        return std::unexpected(sftpError(std::format("Failed to delete {}", remoteFile), connection));
    }
    return {};
}

std::string SFTPTransferStrategy::describe(const std::string& remoteDir) const {
    return std::format("sftp://{}@{}:{}/{}", user_, host_, port_, remoteDir);
}
