/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_MEDIA_FETCH_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_MEDIA_FETCH_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace kcenon::media_fetch::benchmark {

/**
 * @brief Helper class for generating test data for benchmarks
 */
class test_data_generator {
public:
    /**
     * @brief Generate random binary data
     * @param size Size in bytes
     * @param seed Random seed (0 for random)
     * @return Vector of random bytes
     */
    static auto generate_random_data(std::size_t size, uint32_t seed = 0)
        -> std::vector<std::byte>;

    /**
     * @brief Generate ASS dialogue lines with stutters, line breaks and names
     * @param lines Number of dialogue lines
     * @param seed Random seed (0 for random)
     * @return Subtitle text
     */
    static auto generate_subtitle_text(std::size_t lines, uint32_t seed = 0) -> std::string;
};

/**
 * @brief Helper class for managing temporary benchmark files
 */
class temp_file_manager {
public:
    /**
     * @brief Constructor
     * @param base_dir Base directory for temporary files
     */
    explicit temp_file_manager(const std::filesystem::path& base_dir = {});

    /**
     * @brief Destructor - cleans up temporary files
     */
    ~temp_file_manager();

    // Non-copyable
    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a temporary file with the given content
     * @param name File name
     * @param data File content
     * @return Path to created file
     */
    auto create_file(const std::string& name, const std::vector<std::byte>& data)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path&;

    /**
     * @brief Clean up all temporary files
     */
    void cleanup();

private:
    std::filesystem::path base_dir_;
    std::vector<std::filesystem::path> created_files_;
    bool owns_dir_ = false;
};

/**
 * @brief Size constants for benchmarks
 */
namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 512 * KB;
constexpr std::size_t medium_file = 16 * MB;
constexpr std::size_t large_file = 64 * MB;
}  // namespace sizes

}  // namespace kcenon::media_fetch::benchmark

#endif  // KCENON_MEDIA_FETCH_BENCHMARKS_BENCHMARK_HELPERS_H
