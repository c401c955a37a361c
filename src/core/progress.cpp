/**
 * @file progress.cpp
 * @brief Implementation of transfer progress counters
 */

#include <kcenon/media_fetch/core/progress.h>

#include <algorithm>

namespace kcenon::media_fetch {

transfer_progress::transfer_progress(std::string filename, uint64_t total_bytes,
                                     progress_observer observer)
    : filename_(std::move(filename)), total_(total_bytes), observer_(std::move(observer)) {}

auto transfer_progress::add(uint64_t bytes) -> uint64_t {
    uint64_t current = bytes_.load(std::memory_order_relaxed);
    uint64_t next = 0;
    do {
        next = std::min(total_, current + bytes);
    } while (!bytes_.compare_exchange_weak(current, next, std::memory_order_acq_rel,
                                           std::memory_order_relaxed));

    if (observer_) {
        progress_snapshot snap;
        snap.filename = filename_;
        snap.bytes_transferred = next;
        snap.total_bytes = total_;
        observer_(snap);
    }
    return next;
}

auto transfer_progress::snapshot() const -> progress_snapshot {
    progress_snapshot snap;
    snap.filename = filename_;
    snap.bytes_transferred = bytes_transferred();
    snap.total_bytes = total_;
    return snap;
}

}  // namespace kcenon::media_fetch
