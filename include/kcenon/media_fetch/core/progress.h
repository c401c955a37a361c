/**
 * @file progress.h
 * @brief Monotonic per-transfer progress counters
 */

#ifndef KCENON_MEDIA_FETCH_CORE_PROGRESS_H
#define KCENON_MEDIA_FETCH_CORE_PROGRESS_H

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace kcenon::media_fetch {

/**
 * @brief Point-in-time view of one transfer's progress
 */
struct progress_snapshot {
    std::string filename;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;

    [[nodiscard]] auto percent() const -> double {
        if (total_bytes == 0) return 0.0;
        return static_cast<double>(bytes_transferred) * 100.0 /
               static_cast<double>(total_bytes);
    }
};

/// Observer notified after every counter update, possibly from several workers at once
using progress_observer = std::function<void(const progress_snapshot&)>;

/**
 * @brief Lock-free byte counter shared by the segment workers of one job
 *
 * The counter only increases and never exceeds the total passed at
 * construction, even when a remote file grows during the download.
 */
class transfer_progress {
public:
    transfer_progress(std::string filename, uint64_t total_bytes,
                      progress_observer observer = {});

    transfer_progress(const transfer_progress&) = delete;
    auto operator=(const transfer_progress&) -> transfer_progress& = delete;

    /**
     * @brief Record newly written bytes
     * @param bytes Bytes written since the previous call from this worker
     * @return Counter value after the update
     */
    auto add(uint64_t bytes) -> uint64_t;

    [[nodiscard]] auto bytes_transferred() const -> uint64_t {
        return bytes_.load(std::memory_order_acquire);
    }

    [[nodiscard]] auto total_bytes() const -> uint64_t { return total_; }

    [[nodiscard]] auto snapshot() const -> progress_snapshot;

private:
    std::string filename_;
    uint64_t total_;
    std::atomic<uint64_t> bytes_{0};
    progress_observer observer_;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_CORE_PROGRESS_H
