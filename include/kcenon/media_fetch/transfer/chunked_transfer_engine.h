/**
 * @file chunked_transfer_engine.h
 * @brief Segmented download of one remote file with verified commit
 */

#ifndef KCENON_MEDIA_FETCH_TRANSFER_CHUNKED_TRANSFER_ENGINE_H
#define KCENON_MEDIA_FETCH_TRANSFER_CHUNKED_TRANSFER_ENGINE_H

#include <kcenon/media_fetch/core/chunk_plan.h>
#include <kcenon/media_fetch/core/progress.h>
#include <kcenon/media_fetch/core/types.h>
#include <kcenon/media_fetch/remote/remote_store.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::media_fetch {

/**
 * @brief Engine configuration
 */
struct engine_config {
    /// Read buffer size per worker (64KB)
    static constexpr std::size_t default_buffer_size = 64 * 1024;

    /// Remote directory holding the files to transfer
    std::string remote_directory;

    /// Segmenting policy
    chunk_policy chunking;

    /// Bytes requested per remote read
    std::size_t buffer_size = default_buffer_size;

    /// Optional flag polled between reads; true aborts the transfer
    const std::atomic<bool>* cancel_flag = nullptr;

    [[nodiscard]] auto validate() const -> result<void> {
        if (buffer_size == 0) {
            return unexpected(error{error_code::config_invalid, "buffer size must be > 0"});
        }
        return chunking.validate();
    }
};

/**
 * @brief Result of a committed transfer
 */
struct transfer_report {
    std::string name;
    std::filesystem::path local_path;
    uint64_t bytes = 0;
    std::string sha256;
    uint32_t segments = 0;
    std::chrono::milliseconds duration{0};

    /// Remote copy deleted after verification
    bool remote_removed = false;

    /// Set when the local file verified but the remote delete failed
    std::optional<error> remote_delete_error;
};

/**
 * @brief Downloads one remote file, verifies it and deletes the remote copy
 *
 * Transfer sequence:
 * 1. Fresh stat of the remote file
 * 2. Plan: a single stream for files <= 1MB or when chunking is disabled,
 *    otherwise chunk_count byte ranges downloaded in parallel, each over its
 *    own session into "<name>.part<index>"
 * 3. Wait for every segment; any failure fails the job
 * 4. Reassemble in index order, compare the byte count with the stat size
 * 5. Only on a verified match, delete the remote file
 *
 * A failed transfer leaves neither segment files nor a partial local file,
 * and never touches the remote copy.
 *
 * @note transfer() may be called from several threads at once.
 */
class chunked_transfer_engine {
public:
    chunked_transfer_engine(std::shared_ptr<remote_store> store, engine_config config);
    ~chunked_transfer_engine();

    chunked_transfer_engine(const chunked_transfer_engine&) = delete;
    auto operator=(const chunked_transfer_engine&) -> chunked_transfer_engine& = delete;

    chunked_transfer_engine(chunked_transfer_engine&&) noexcept;
    auto operator=(chunked_transfer_engine&&) noexcept -> chunked_transfer_engine&;

    /**
     * @brief Set an observer for per-job byte progress
     */
    void on_progress(progress_observer observer);

    /**
     * @brief Transfer one file into a local directory
     * @param file Listing entry; only the name is used
     * @param destination_dir Directory for the local copy (created if absent)
     * @return Report, or connect_failed / stat_failed / segment_io_error /
     *         size_mismatch / transfer_cancelled / file_write_error
     */
    [[nodiscard]] auto transfer(const remote_file& file,
                                const std::filesystem::path& destination_dir)
        -> result<transfer_report>;

    [[nodiscard]] auto config() const -> const engine_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_TRANSFER_CHUNKED_TRANSFER_ENGINE_H
