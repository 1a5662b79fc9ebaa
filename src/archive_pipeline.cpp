/**
 * @file archive_pipeline.cpp
 * @brief Tar stream creation with libarchive and AES-256-GCM file encryption with OpenSSL.
 */

#include "archive_pipeline.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <utility>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr char kMagic[8] = {'B', 'G', 'V', 'A', 'U', 'L', 'T', '1'};
constexpr std::size_t kSaltSize = 16;
constexpr std::size_t kNonceSize = 12;
constexpr std::size_t kTagSize = 16;
constexpr std::size_t kKeySize = 32;
constexpr std::size_t kHeaderSize = sizeof(kMagic) + 4 + kSaltSize + kNonceSize;
constexpr std::size_t kChunkSize = 64 * 1024;

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const { archive_write_free(a); }
};

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const { archive_read_free(a); }
};

struct ArchiveEntryDeleter {
    void operator()(struct archive_entry* e) const { archive_entry_free(e); }
};

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

struct DigestCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using ArchiveWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;

/**
 * @brief Zeroes key material when leaving scope.
 */
struct KeyBuffer {
    std::array<unsigned char, kKeySize> bytes{};
    ~KeyBuffer() { OPENSSL_cleanse(bytes.data(), bytes.size()); }
};

bool deriveKey(const std::string& passphrase, const unsigned char* salt, int iterations, KeyBuffer& key) {
    return PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()), salt, static_cast<int>(kSaltSize),
                             iterations, EVP_sha256(), static_cast<int>(kKeySize), key.bytes.data()) == 1;
}

BackupError encryptionError(const std::string& message) {
    return makeError(ErrorKind::Encryption, message);
}

std::string archiveError(struct archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown error";
}

int copyData(struct archive* reader, struct archive* writer) {
    const void* buffer = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    for (;;) {
        int r = archive_read_data_block(reader, &buffer, &size, &offset);
        if (r == ARCHIVE_EOF) {
            return ARCHIVE_OK;
        }
        if (r < ARCHIVE_OK) {
            return r;
        }
        if (archive_write_data_block(writer, buffer, size, offset) < ARCHIVE_OK) {
            return ARCHIVE_FAILED;
        }
    }
}

} // namespace

std::string Archive::name() const {
    return fs::path(path).filename().string();
}

TarEncryptArchiveStrategy::TarEncryptArchiveStrategy(ArchiveOptions options) : options(std::move(options)) {}

std::string TarEncryptArchiveStrategy::extension() const {
    if (options.format == "zstd") {
        return ".tar.zst.enc";
    }
    if (options.format == "xz") {
        return ".tar.xz.enc";
    }
    return ".tar.gz.enc";
}

std::expected<void, BackupError> TarEncryptArchiveStrategy::writeTar(const std::vector<std::string>& stagingPaths,
                                                                     const std::string& tarFile) {
    ArchiveWriter writer(archive_write_new());
    int r = ARCHIVE_OK;
    if (options.format == "zstd") {
        r = archive_write_add_filter_zstd(writer.get());
    } else if (options.format == "xz") {
        r = archive_write_add_filter_xz(writer.get());
    } else {
        r = archive_write_add_filter_gzip(writer.get());
    }
    if (r != ARCHIVE_OK) {
        return std::unexpected(makeError(ErrorKind::Compression,
                                         std::format("Compression filter {} unavailable: {}", options.format,
                                                     archiveError(writer.get()))));
    }
    std::string level = std::to_string(options.level);
    if (archive_write_set_filter_option(writer.get(), nullptr, "compression-level", level.c_str()) < ARCHIVE_WARN) {
        return std::unexpected(makeError(ErrorKind::Compression,
                                         std::format("Invalid compression level {}: {}", options.level,
                                                     archiveError(writer.get()))));
    }
    archive_write_set_format_pax_restricted(writer.get());
    if (archive_write_open_filename(writer.get(), tarFile.c_str()) != ARCHIVE_OK) {
        return std::unexpected(makeError(ErrorKind::Compression,
                                         std::format("Failed to open archive file: {} (error: {})", tarFile,
                                                     archiveError(writer.get()))));
    }

    ArchiveReader disk(archive_read_disk_new());
    archive_read_disk_set_standard_lookup(disk.get());
    archive_read_disk_set_symlink_physical(disk.get());

    auto addEntry = [&](const fs::path& sourcePath, const std::string& memberName) -> std::expected<void, BackupError> {
        std::unique_ptr<struct archive_entry, ArchiveEntryDeleter> entry(archive_entry_new());
        archive_entry_copy_sourcepath(entry.get(), sourcePath.c_str());
        archive_entry_copy_pathname(entry.get(), memberName.c_str());
        if (archive_read_disk_entry_from_file(disk.get(), entry.get(), -1, nullptr) < ARCHIVE_WARN) {
            return std::unexpected(makeError(ErrorKind::Compression,
                                             std::format("Failed to read {}: {}", sourcePath.string(),
                                                         archiveError(disk.get()))));
        }
        if (archive_write_header(writer.get(), entry.get()) < ARCHIVE_WARN) {
            return std::unexpected(makeError(ErrorKind::Compression,
                                             std::format("Failed to write header for {}: {}", memberName,
                                                         archiveError(writer.get()))));
        }
        if (archive_entry_filetype(entry.get()) != AE_IFREG) {
            return {};
        }

        std::ifstream file(sourcePath, std::ios::binary);
        if (!file) {
            return std::unexpected(makeError(ErrorKind::Compression,
                                             std::format("Failed to open file: {} (error: {})", sourcePath.string(),
                                                         std::strerror(errno))));
        }
        std::vector<char> buf(kChunkSize);
        while (file) {
            file.read(buf.data(), static_cast<std::streamsize>(buf.size()));
            std::streamsize count = file.gcount();
            if (count > 0 && archive_write_data(writer.get(), buf.data(), static_cast<size_t>(count)) < 0) {
                return std::unexpected(makeError(ErrorKind::Compression,
                                                 std::format("Failed to write data for {}: {}", memberName,
                                                             archiveError(writer.get()))));
            }
        }
        if (file.bad()) {
            return std::unexpected(makeError(ErrorKind::Compression,
                                             std::format("Read error on {}", sourcePath.string())));
        }
        return {};
    };

    try {
        for (const auto& stagingPath : stagingPaths) {
            fs::path root(stagingPath);
            std::string prefix = root.filename().string();
            if (auto added = addEntry(root, prefix); !added) {
                return added;
            }
            for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
                std::string member = (fs::path(prefix) / it->path().lexically_relative(root)).generic_string();
                if (auto added = addEntry(it->path(), member); !added) {
                    return added;
                }
            }
        }
    } catch (const fs::filesystem_error& e) {
        return std::unexpected(makeError(ErrorKind::Compression, std::format("Failed to walk staging area: {}", e.what())));
    }

    if (archive_write_close(writer.get()) != ARCHIVE_OK) {
        return std::unexpected(makeError(ErrorKind::Compression,
                                         std::format("Failed to finish archive {}: {}", tarFile,
                                                     archiveError(writer.get()))));
    }
    return {};
}

std::expected<Archive, BackupError> TarEncryptArchiveStrategy::archive(const std::vector<std::string>& stagingPaths,
                                                                       const std::string& passphrase,
                                                                       const std::string& outputFile) {
    if (passphrase.empty()) {
        return std::unexpected(encryptionError("No backup password configured"));
    }

    std::error_code ec;
    fs::path outputPath(outputFile);
    if (outputPath.has_parent_path()) {
        fs::create_directories(outputPath.parent_path(), ec);
        if (ec) {
            return std::unexpected(makeError(ErrorKind::Compression,
                                             std::format("Failed to create archive directory: {}", ec.message())));
        }
    }

    const std::string tarFile = outputFile + ".part";
    auto written = writeTar(stagingPaths, tarFile);
    if (!written) {
        fs::remove(tarFile, ec);
        return std::unexpected(written.error());
    }

    auto encrypted = encryptFile(tarFile, outputFile, passphrase, options.kdfIterations);
    fs::remove(tarFile, ec);
    if (!encrypted) {
        fs::remove(outputFile, ec);
        return std::unexpected(encrypted.error());
    }

    auto checksum = sha256File(outputFile);
    if (!checksum) {
        fs::remove(outputFile, ec);
        return std::unexpected(checksum.error());
    }

    Archive result;
    result.path = outputFile;
    result.size = fs::file_size(outputFile, ec);
    result.checksum = *checksum;
    result.createdAt = std::chrono::system_clock::now();
    return result;
}

std::expected<void, BackupError> TarEncryptArchiveStrategy::extractTar(const std::string& tarFile,
                                                                       const std::string& destination) {
    ArchiveReader reader(archive_read_new());
    archive_read_support_filter_all(reader.get());
    archive_read_support_format_tar(reader.get());
    if (archive_read_open_filename(reader.get(), tarFile.c_str(), 10240) != ARCHIVE_OK) {
        return std::unexpected(makeError(ErrorKind::Compression,
                                         std::format("Failed to open archive for extraction: {} (error: {})", tarFile,
                                                     archiveError(reader.get()))));
    }

    const fs::path root = fs::absolute(destination).lexically_normal();
    ArchiveWriter disk(archive_write_disk_new());
    int flags = ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM | ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                ARCHIVE_EXTRACT_SECURE_SYMLINKS;
    if (::geteuid() == 0) {
        flags |= ARCHIVE_EXTRACT_OWNER;
    }
    archive_write_disk_set_options(disk.get(), flags);
    archive_write_disk_set_standard_lookup(disk.get());

    struct archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        fs::path member(archive_entry_pathname(entry));
        if (member.is_absolute()) {
            return std::unexpected(makeError(ErrorKind::Compression,
                                             std::format("Refusing absolute member {}", member.string())));
        }
        std::string target = (root / member).string();
        archive_entry_copy_pathname(entry, target.c_str());
        if (archive_write_header(disk.get(), entry) < ARCHIVE_WARN) {
            return std::unexpected(makeError(ErrorKind::Compression,
                                             std::format("Failed to extract {}: {}", target,
                                                         archiveError(disk.get()))));
        }
        if (archive_entry_size(entry) > 0 && copyData(reader.get(), disk.get()) != ARCHIVE_OK) {
            return std::unexpected(makeError(ErrorKind::Compression,
                                             std::format("Failed to extract data of {}: {}", target,
                                                         archiveError(reader.get()))));
        }
        if (archive_write_finish_entry(disk.get()) < ARCHIVE_WARN) {
            return std::unexpected(makeError(ErrorKind::Compression,
                                             std::format("Failed to finish {}: {}", target,
                                                         archiveError(disk.get()))));
        }
    }
    if (r != ARCHIVE_EOF) {
        return std::unexpected(makeError(ErrorKind::Compression,
                                         std::format("Corrupt archive {}: {}", tarFile, archiveError(reader.get()))));
    }
    if (archive_write_close(disk.get()) != ARCHIVE_OK) {
        return std::unexpected(makeError(ErrorKind::Compression,
                                         std::format("Failed to finish extraction: {}", archiveError(disk.get()))));
    }
    return {};
}

std::expected<void, BackupError> TarEncryptArchiveStrategy::restore(const std::string& archivePath,
                                                                    const std::string& passphrase,
                                                                    const std::string& destination) {
    std::error_code ec;
    fs::create_directories(destination, ec);
    if (ec) {
        return std::unexpected(makeError(ErrorKind::Compression,
                                         std::format("Failed to create restore directory {}: {}", destination, ec.message())));
    }

    const std::string tarFile = (fs::path(destination) / (fs::path(archivePath).filename().string() + ".tar")).string();
    auto decrypted = decryptFile(archivePath, tarFile, passphrase);
    if (!decrypted) {
        return decrypted;
    }
    auto extracted = extractTar(tarFile, destination);
    fs::remove(tarFile, ec);
    return extracted;
}

std::expected<void, BackupError> encryptFile(const std::string& inputFile, const std::string& outputFile,
                                             const std::string& passphrase, int iterations) {
    std::ifstream in(inputFile, std::ios::binary);
    if (!in) {
        return std::unexpected(encryptionError(std::format("Failed to open {} for encryption", inputFile)));
    }
    std::ofstream out(outputFile, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(encryptionError(std::format("Failed to create {}", outputFile)));
    }

    std::array<unsigned char, kHeaderSize> header{};
    std::memcpy(header.data(), kMagic, sizeof(kMagic));
    header[8] = static_cast<unsigned char>((iterations >> 24) & 0xff);
    header[9] = static_cast<unsigned char>((iterations >> 16) & 0xff);
    header[10] = static_cast<unsigned char>((iterations >> 8) & 0xff);
    header[11] = static_cast<unsigned char>(iterations & 0xff);
    unsigned char* salt = header.data() + 12;
    unsigned char* nonce = salt + kSaltSize;
    if (RAND_bytes(salt, static_cast<int>(kSaltSize)) != 1 || RAND_bytes(nonce, static_cast<int>(kNonceSize)) != 1) {
        return std::unexpected(encryptionError("Failed to generate salt and nonce"));
    }

    KeyBuffer key;
    if (!deriveKey(passphrase, salt, iterations, key)) {
        return std::unexpected(encryptionError("Key derivation failed"));
    }

    std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx(EVP_CIPHER_CTX_new());
    int outLen = 0;
    if (!ctx ||
        EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.bytes.data(), nonce) != 1 ||
        EVP_EncryptUpdate(ctx.get(), nullptr, &outLen, header.data(), static_cast<int>(header.size())) != 1) {
        return std::unexpected(encryptionError("Cipher initialization failed"));
    }
    out.write(reinterpret_cast<const char*>(header.data()), static_cast<std::streamsize>(header.size()));

    std::vector<unsigned char> plain(kChunkSize);
    std::vector<unsigned char> cipher(kChunkSize + 16);
    while (in) {
        in.read(reinterpret_cast<char*>(plain.data()), static_cast<std::streamsize>(plain.size()));
        std::streamsize count = in.gcount();
        if (count <= 0) {
            break;
        }
        if (EVP_EncryptUpdate(ctx.get(), cipher.data(), &outLen, plain.data(), static_cast<int>(count)) != 1) {
            return std::unexpected(encryptionError("Encryption failed"));
        }
        out.write(reinterpret_cast<const char*>(cipher.data()), outLen);
    }
    if (in.bad()) {
        return std::unexpected(encryptionError(std::format("Read error on {}", inputFile)));
    }

    std::array<unsigned char, kTagSize> tag{};
    if (EVP_EncryptFinal_ex(ctx.get(), cipher.data(), &outLen) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), tag.data()) != 1) {
        return std::unexpected(encryptionError("Encryption finalization failed"));
    }
    out.write(reinterpret_cast<const char*>(cipher.data()), outLen);
    out.write(reinterpret_cast<const char*>(tag.data()), static_cast<std::streamsize>(tag.size()));
    out.flush();
    if (!out) {
        return std::unexpected(encryptionError(std::format("Write error on {}", outputFile)));
    }
    return {};
}

std::expected<void, BackupError> decryptFile(const std::string& inputFile, const std::string& outputFile,
                                             const std::string& passphrase) {
    std::error_code ec;
    std::uintmax_t fileSize = fs::file_size(inputFile, ec);
    if (ec || fileSize < kHeaderSize + kTagSize) {
        return std::unexpected(encryptionError(std::format("{} is not an encrypted archive", inputFile)));
    }

    std::ifstream in(inputFile, std::ios::binary);
    std::array<unsigned char, kHeaderSize> header{};
    in.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    if (!in || std::memcmp(header.data(), kMagic, sizeof(kMagic)) != 0) {
        return std::unexpected(encryptionError(std::format("{} is not an encrypted archive", inputFile)));
    }
    int iterations = (header[8] << 24) | (header[9] << 16) | (header[10] << 8) | header[11];
    if (iterations <= 0) {
        return std::unexpected(encryptionError(std::format("{} has an invalid header", inputFile)));
    }
    const unsigned char* salt = header.data() + 12;
    const unsigned char* nonce = salt + kSaltSize;

    std::array<unsigned char, kTagSize> tag{};
    in.seekg(static_cast<std::streamoff>(fileSize - kTagSize));
    in.read(reinterpret_cast<char*>(tag.data()), static_cast<std::streamsize>(tag.size()));
    in.seekg(static_cast<std::streamoff>(kHeaderSize));
    if (!in) {
        return std::unexpected(encryptionError(std::format("Failed to read {}", inputFile)));
    }

    KeyBuffer key;
    if (!deriveKey(passphrase, salt, iterations, key)) {
        return std::unexpected(encryptionError("Key derivation failed"));
    }

    std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter> ctx(EVP_CIPHER_CTX_new());
    int outLen = 0;
    if (!ctx ||
        EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.bytes.data(), nonce) != 1 ||
        EVP_DecryptUpdate(ctx.get(), nullptr, &outLen, header.data(), static_cast<int>(header.size())) != 1) {
        return std::unexpected(encryptionError("Cipher initialization failed"));
    }

    std::ofstream out(outputFile, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(encryptionError(std::format("Failed to create {}", outputFile)));
    }
    auto fail = [&](const std::string& message) {
        out.close();
        fs::remove(outputFile, ec);
        return std::unexpected(encryptionError(message));
    };

    std::uintmax_t remaining = fileSize - kHeaderSize - kTagSize;
    std::vector<unsigned char> cipher(kChunkSize);
    std::vector<unsigned char> plain(kChunkSize + 16);
    while (remaining > 0) {
        std::size_t want = static_cast<std::size_t>(std::min<std::uintmax_t>(remaining, cipher.size()));
        in.read(reinterpret_cast<char*>(cipher.data()), static_cast<std::streamsize>(want));
        if (in.gcount() != static_cast<std::streamsize>(want)) {
            return fail(std::format("Unexpected end of {}", inputFile));
        }
        if (EVP_DecryptUpdate(ctx.get(), plain.data(), &outLen, cipher.data(), static_cast<int>(want)) != 1) {
            return fail("Decryption failed");
        }
        out.write(reinterpret_cast<const char*>(plain.data()), outLen);
        remaining -= want;
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag.data()) != 1 ||
        EVP_DecryptFinal_ex(ctx.get(), plain.data(), &outLen) != 1) {
        return fail("Wrong password or corrupted archive");
    }
    out.write(reinterpret_cast<const char*>(plain.data()), outLen);
    out.flush();
    if (!out) {
        return fail(std::format("Write error on {}", outputFile));
    }
    return {};
}

std::expected<std::string, BackupError> sha256File(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(encryptionError(std::format("Failed to open {} for checksum", path)));
    }
    std::unique_ptr<EVP_MD_CTX, DigestCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        return std::unexpected(encryptionError("Digest initialization failed"));
    }
    std::vector<char> buf(kChunkSize);
    while (in) {
        in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        if (in.gcount() > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(in.gcount())) != 1) {
            return std::unexpected(encryptionError("Digest update failed"));
        }
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digestLen = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &digestLen) != 1) {
        return std::unexpected(encryptionError("Digest finalization failed"));
    }
    std::string hex;
    hex.reserve(digestLen * 2);
    for (unsigned int i = 0; i < digestLen; ++i) {
        hex += std::format("{:02x}", digest[i]);
    }
    return hex;
}

std::string archiveFileName(const std::string& label, const std::string& extension,
                            std::chrono::system_clock::time_point time) {
    auto timeT = std::chrono::system_clock::to_time_t(time);
    std::tm tmLocal{};
    localtime_r(&timeT, &tmLocal);
    char timestampBuf[32];
    std::strftime(timestampBuf, sizeof(timestampBuf), "%Y%m%d_%H%M%S", &tmLocal);
    return std::format("{}_{}{}", label, timestampBuf, extension);
}
