/**
 * @file checksum.cpp
 * @brief Implementation of checksum utilities
 */

#include <kcenon/media_fetch/core/checksum.h>

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace kcenon::media_fetch {

namespace {

// CRC32 polynomial (IEEE 802.3)
constexpr uint32_t CRC32_POLYNOMIAL = 0xEDB88320;

constexpr auto generate_crc32_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};

    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1) {
                crc = (crc >> 1) ^ CRC32_POLYNOMIAL;
            } else {
                crc >>= 1;
            }
        }
        table[i] = crc;
    }

    return table;
}

constexpr auto CRC32_TABLE = generate_crc32_table();

auto digest_to_hex(const unsigned char* digest, unsigned int length) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

}  // namespace

auto checksum::crc32(std::span<const std::byte> data) -> uint32_t {
    return crc32_update(0, data);
}

auto checksum::crc32_update(uint32_t crc, std::span<const std::byte> data) -> uint32_t {
    crc ^= 0xFFFFFFFF;
    for (std::byte b : data) {
        auto index = static_cast<uint8_t>(crc ^ static_cast<uint8_t>(b));
        crc = CRC32_TABLE[index] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_read_error, "cannot open file: " + path.string()});
    }

    sha256_hasher hasher;
    std::vector<std::byte> buffer(64 * 1024);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        auto bytes_read = static_cast<std::size_t>(file.gcount());
        if (bytes_read > 0) {
            hasher.update(std::span<const std::byte>(buffer.data(), bytes_read));
        }
    }
    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    return hasher.finalize();
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    sha256_hasher hasher;
    hasher.update(data);
    return hasher.finalize();
}

// sha256_hasher

struct sha256_hasher::impl {
    EVP_MD_CTX* ctx = nullptr;

    impl() : ctx(EVP_MD_CTX_new()) {
        if (ctx == nullptr || EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            throw std::runtime_error("EVP SHA-256 initialization failed");
        }
    }

    ~impl() { EVP_MD_CTX_free(ctx); }

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;
};

sha256_hasher::sha256_hasher() : impl_(std::make_unique<impl>()) {}

sha256_hasher::~sha256_hasher() = default;

sha256_hasher::sha256_hasher(sha256_hasher&&) noexcept = default;

auto sha256_hasher::operator=(sha256_hasher&&) noexcept -> sha256_hasher& = default;

void sha256_hasher::update(std::span<const std::byte> data) {
    if (data.empty()) {
        return;
    }
    EVP_DigestUpdate(impl_->ctx, data.data(), data.size());
}

auto sha256_hasher::finalize() -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    EVP_DigestFinal_ex(impl_->ctx, digest.data(), &length);
    return digest_to_hex(digest.data(), length);
}

}  // namespace kcenon::media_fetch
