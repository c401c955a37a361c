/**
 * @file checksum.h
 * @brief Checksum utilities for segment and file integrity verification
 */

#ifndef KCENON_MEDIA_FETCH_CORE_CHECKSUM_H
#define KCENON_MEDIA_FETCH_CORE_CHECKSUM_H

#include <kcenon/media_fetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace kcenon::media_fetch {

/**
 * @brief Checksum utilities for CRC32 and SHA-256 calculations
 *
 * - CRC32 guards each downloaded segment between download and reassembly
 * - SHA-256 is the digest of a reassembled file
 */
class checksum {
public:
    /**
     * @brief Calculate CRC32 checksum of data
     * @param data Input data span
     * @return CRC32 checksum value
     */
    [[nodiscard]] static auto crc32(std::span<const std::byte> data) -> uint32_t;

    /**
     * @brief Continue a running CRC32 with more data
     * @param crc Value returned by a previous call (0 for a fresh checksum)
     * @param data Next block of data
     * @return Updated CRC32
     */
    [[nodiscard]] static auto crc32_update(uint32_t crc, std::span<const std::byte> data)
        -> uint32_t;

    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return SHA-256 hash as lowercase hex string, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return SHA-256 hash as lowercase hex string
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;
};

/**
 * @brief Incremental SHA-256 hasher backed by OpenSSL EVP
 *
 * Lets the transfer engine hash a file on the same pass that writes it.
 */
class sha256_hasher {
public:
    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(sha256_hasher&&) noexcept;
    auto operator=(sha256_hasher&&) noexcept -> sha256_hasher&;

    sha256_hasher(const sha256_hasher&) = delete;
    auto operator=(const sha256_hasher&) -> sha256_hasher& = delete;

    /**
     * @brief Feed more data into the digest
     */
    void update(std::span<const std::byte> data);

    /**
     * @brief Finish the digest
     * @return Lowercase hex digest; the hasher must not be updated afterwards
     */
    [[nodiscard]] auto finalize() -> std::string;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_CORE_CHECKSUM_H
