/**
 * @file chunk_plan.h
 * @brief Byte-range segment planning for chunked downloads
 */

#ifndef KCENON_MEDIA_FETCH_CORE_CHUNK_PLAN_H
#define KCENON_MEDIA_FETCH_CORE_CHUNK_PLAN_H

#include <kcenon/media_fetch/core/types.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_fetch {

/**
 * @brief One contiguous byte range [start, end) of a remote file
 */
struct segment {
    uint32_t index = 0;
    uint64_t start = 0;
    uint64_t end = 0;

    [[nodiscard]] auto size() const noexcept -> uint64_t { return end - start; }

    auto operator==(const segment&) const -> bool = default;
};

/**
 * @brief Chunking policy for one transfer
 */
struct chunk_policy {
    /// Files at or below this size always use a single stream (1MB)
    static constexpr uint64_t small_file_threshold = 1024 * 1024;

    /// Default number of segments per file
    static constexpr uint32_t default_chunk_count = 3;

    /// Number of segments for a chunked transfer
    uint32_t chunk_count = default_chunk_count;

    /// Chunked transfers enabled
    bool use_chunks = true;

    /**
     * @brief Validate configuration
     * @return Success if valid, error otherwise
     */
    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_count < 1) {
            return unexpected(error{error_code::config_invalid,
                                    "chunk count must be at least 1"});
        }
        return {};
    }

    /**
     * @brief Decide whether a file of the given size is split into segments
     */
    [[nodiscard]] auto should_split(uint64_t file_size) const noexcept -> bool {
        return use_chunks && chunk_count > 1 && file_size > small_file_threshold;
    }
};

/// Suffix of a per-segment temporary file
inline constexpr std::string_view segment_suffix = ".part";

/// Suffix of the reassembly staging file
inline constexpr std::string_view staging_suffix = ".mfstage";

/**
 * @brief Split [0, file_size) into at most chunk_count contiguous segments
 *
 * Every segment is ceil(file_size / chunk_count) bytes wide, the last one
 * clamped to file_size. Empty ranges are never produced, so fewer than
 * chunk_count segments come back when the width rounding exhausts the file
 * early. A zero-byte file yields an empty plan.
 *
 * @param file_size Size reported by a fresh stat
 * @param chunk_count Requested segment count (0 is treated as 1)
 * @return Segments ordered by index, covering every byte exactly once
 */
[[nodiscard]] auto plan_segments(uint64_t file_size, uint32_t chunk_count)
    -> std::vector<segment>;

/**
 * @brief Name of the temporary file holding one segment
 * @return "<name>.part<index>"
 */
[[nodiscard]] auto segment_file_name(std::string_view name, uint32_t index) -> std::string;

/**
 * @brief Name of the staging file used while segments are concatenated
 * @return "<name>.mfstage"
 */
[[nodiscard]] auto staging_file_name(std::string_view name) -> std::string;

/**
 * @brief Check whether a local file name belongs to an in-flight transfer
 *
 * Matches "<anything>.part<digits>" and "<anything>.mfstage".
 */
[[nodiscard]] auto is_in_flight_name(std::string_view name) -> bool;

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_CORE_CHUNK_PLAN_H
