/**
 * @file test_checksum.cpp
 * @brief Unit tests for checksum utilities
 */

#include <gtest/gtest.h>

#include <kcenon/media_fetch/core/checksum.h>

#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace kcenon::media_fetch::test {

namespace {

auto to_bytes(const std::string& text) -> std::vector<std::byte> {
    std::vector<std::byte> bytes(text.size());
    if (!text.empty()) {
        std::memcpy(bytes.data(), text.data(), text.size());
    }
    return bytes;
}

}  // namespace

class ChecksumTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() / "media_fetch_test_checksum";
        std::filesystem::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, const std::string& content)
        -> std::filesystem::path {
        auto path = test_dir_ / name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    std::filesystem::path test_dir_;
};

// CRC32 Tests

TEST_F(ChecksumTest, CRC32_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::crc32(empty), 0x00000000u);
}

TEST_F(ChecksumTest, CRC32_KnownValue) {
    // "123456789" -> 0xCBF43926
    auto data = to_bytes("123456789");
    EXPECT_EQ(checksum::crc32(data), 0xCBF43926u);
}

TEST_F(ChecksumTest, CRC32_UpdateChainsAcrossBlocks) {
    auto whole = to_bytes("123456789");
    auto first = to_bytes("1234");
    auto second = to_bytes("56789");

    auto crc = checksum::crc32_update(0, first);
    crc = checksum::crc32_update(crc, second);

    EXPECT_EQ(crc, checksum::crc32(whole));
}

// SHA-256 Tests

TEST_F(ChecksumTest, SHA256_EmptyData) {
    std::vector<std::byte> empty;
    EXPECT_EQ(checksum::sha256(empty),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(ChecksumTest, SHA256_KnownValue) {
    auto data = to_bytes("abc");
    EXPECT_EQ(checksum::sha256(data),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, SHA256_StreamingMatchesOneShot) {
    sha256_hasher hasher;
    hasher.update(to_bytes("a"));
    hasher.update(to_bytes("bc"));

    EXPECT_EQ(hasher.finalize(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, SHA256_File) {
    auto path = create_test_file("abc.bin", "abc");

    auto result = checksum::sha256_file(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ChecksumTest, SHA256_FileNotFound) {
    auto result = checksum::sha256_file(test_dir_ / "missing.bin");
    EXPECT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::file_read_error);
}

}  // namespace kcenon::media_fetch::test
