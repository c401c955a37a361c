/**
 * @file segment_assembler.h
 * @brief Reassembly of downloaded segment files into the final file
 */

#ifndef KCENON_MEDIA_FETCH_CORE_SEGMENT_ASSEMBLER_H
#define KCENON_MEDIA_FETCH_CORE_SEGMENT_ASSEMBLER_H

#include <kcenon/media_fetch/core/chunk_plan.h>
#include <kcenon/media_fetch/core/types.h>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_fetch {

/**
 * @brief A finished segment download waiting for reassembly
 */
struct segment_record {
    segment range;                 ///< Planned byte range
    std::filesystem::path file;    ///< Temporary segment file
    uint64_t bytes_written = 0;    ///< Bytes actually stored in the file
    uint32_t crc32 = 0;            ///< CRC32 computed while downloading
};

/**
 * @brief Outcome of a successful reassembly
 */
struct assembly_result {
    std::filesystem::path path;
    uint64_t bytes = 0;
    std::string sha256;
};

/**
 * @brief Concatenates segment files in index order and verifies the result
 *
 * Segments may be registered from any worker thread in any order. On
 * finalize() the assembler:
 * 1. Streams every segment file, in index order, into "<final>.mfstage"
 * 2. Re-checks each segment's byte count and CRC32
 * 3. Compares the total against the expected size (zero is never accepted)
 * 4. Renames the staging file over the final path and deletes the segments
 *
 * A failed finalize leaves no staging file and no final file behind.
 */
class segment_assembler {
public:
    /**
     * @brief Construct assembler for one transfer
     * @param final_path Path the verified file is renamed to
     * @param expected_size Size reported by the remote stat
     * @param total_segments Number of planned segments
     */
    segment_assembler(std::filesystem::path final_path,
                      uint64_t expected_size,
                      uint32_t total_segments);

    ~segment_assembler();

    segment_assembler(const segment_assembler&) = delete;
    auto operator=(const segment_assembler&) -> segment_assembler& = delete;

    /**
     * @brief Register a finished segment
     * @param record Segment description (thread-safe)
     * @return Error when the index is out of range or already registered
     */
    [[nodiscard]] auto add_segment(segment_record record) -> result<void>;

    /**
     * @brief Check whether every planned segment has been registered
     */
    [[nodiscard]] auto is_complete() const -> bool;

    /**
     * @brief Indices of segments that have not been registered yet
     */
    [[nodiscard]] auto missing_segments() const -> std::vector<uint32_t>;

    /**
     * @brief Concatenate, verify and commit the final file
     * @return Final path, byte count and SHA-256, or error
     *         (segment_io_error, size_mismatch, file_write_error)
     */
    [[nodiscard]] auto finalize() -> result<assembly_result>;

    /**
     * @brief Remove every registered segment file and the staging file
     */
    void discard();

    [[nodiscard]] auto staging_path() const -> const std::filesystem::path& {
        return staging_path_;
    }

private:
    void remove_segment_files();

    std::filesystem::path final_path_;
    std::filesystem::path staging_path_;
    uint64_t expected_size_;
    std::vector<std::optional<segment_record>> records_;
    mutable std::mutex mutex_;
    bool finalized_ = false;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_CORE_SEGMENT_ASSEMBLER_H
