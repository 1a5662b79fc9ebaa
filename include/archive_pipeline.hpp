/**
 * @file archive_pipeline.hpp
 * @brief Compression and encryption of staged snapshots.
 *
 * The staged directory trees are written as one compressed tar stream, which is then
 * encrypted as a whole with AES-256-GCM under a PBKDF2-derived key, so member names are
 * not visible without the passphrase.
 *
 * Encrypted file layout:
 *   magic "BGVAULT1" (8) | iterations, big-endian (4) | salt (16) | nonce (12) | ciphertext | tag (16)
 * The header bytes are authenticated as additional data.
 *
 * @note Requires libarchive and OpenSSL (libcrypto).
 */

#ifndef ARCHIVE_PIPELINE_HPP
#define ARCHIVE_PIPELINE_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>
#include "backup_error.hpp"

/**
 * @brief An encrypted archive produced by one job.
 */
struct Archive {
    std::string path;                                  ///< Local file path.
    std::uintmax_t size = 0;                           ///< Size of the encrypted file.
    std::string checksum;                              ///< Hex SHA-256 of the encrypted file.
    std::chrono::system_clock::time_point createdAt;   ///< Creation time.
    std::string jobId;                                 ///< Originating job.

    /**
     * @brief File name of the archive.
     */
    std::string name() const;
};

/**
 * @brief Archive settings.
 */
struct ArchiveOptions {
    std::string format = "gzip";   ///< Compression filter: "gzip", "zstd" or "xz".
    int level = 3;                 ///< Filter effort level.
    int kdfIterations = 100000;    ///< PBKDF2-HMAC-SHA256 iterations.
};

/**
 * @brief Interface for archive strategies.
 */
class ArchiveStrategy {
public:
    virtual ~ArchiveStrategy() = default;

    /**
     * @brief Produces one encrypted archive from staged directories.
     *
     * @param stagingPaths Directories to include; each becomes a top-level member named after it.
     * @param passphrase Encryption passphrase.
     * @param outputFile Path of the encrypted archive to create.
     * @return The archive, or a Compression/Encryption error. No file is left at outputFile on error.
     */
    virtual std::expected<Archive, BackupError> archive(const std::vector<std::string>& stagingPaths,
                                                        const std::string& passphrase,
                                                        const std::string& outputFile) = 0;

    /**
     * @brief Decrypts an archive and extracts it into a directory.
     *
     * The archive is authenticated before anything is extracted.
     */
    virtual std::expected<void, BackupError> restore(const std::string& archivePath, const std::string& passphrase,
                                                     const std::string& destination) = 0;

    /**
     * @brief File name suffix of produced archives, e.g. ".tar.gz.enc".
     */
    virtual std::string extension() const = 0;
};

/**
 * @brief libarchive tar stream encrypted with OpenSSL.
 */
class TarEncryptArchiveStrategy : public ArchiveStrategy {
public:
    explicit TarEncryptArchiveStrategy(ArchiveOptions options);

    std::expected<Archive, BackupError> archive(const std::vector<std::string>& stagingPaths,
                                                const std::string& passphrase,
                                                const std::string& outputFile) override;

    std::expected<void, BackupError> restore(const std::string& archivePath, const std::string& passphrase,
                                             const std::string& destination) override;

    std::string extension() const override;

private:
    std::expected<void, BackupError> writeTar(const std::vector<std::string>& stagingPaths, const std::string& tarFile);
    std::expected<void, BackupError> extractTar(const std::string& tarFile, const std::string& destination);

    ArchiveOptions options;
};

/**
 * @brief Encrypts a file with AES-256-GCM under a passphrase-derived key.
 */
std::expected<void, BackupError> encryptFile(const std::string& inputFile, const std::string& outputFile,
                                             const std::string& passphrase, int iterations);

/**
 * @brief Decrypts a file written by encryptFile().
 *
 * @return An Encryption error if the passphrase is wrong or the file was altered; the
 *         output file is removed in that case.
 */
std::expected<void, BackupError> decryptFile(const std::string& inputFile, const std::string& outputFile,
                                             const std::string& passphrase);

/**
 * @brief Computes the hex SHA-256 digest of a file.
 */
std::expected<std::string, BackupError> sha256File(const std::string& path);

/**
 * @brief Archive file name for a label and time, e.g. "db_20261018_030000.tar.gz.enc".
 */
std::string archiveFileName(const std::string& label, const std::string& extension,
                            std::chrono::system_clock::time_point time);

#endif // ARCHIVE_PIPELINE_HPP
