/**
 * @file session_limiter.h
 * @brief Global cap on simultaneously open remote sessions
 */

#ifndef KCENON_MEDIA_FETCH_REMOTE_SESSION_LIMITER_H
#define KCENON_MEDIA_FETCH_REMOTE_SESSION_LIMITER_H

#include <kcenon/media_fetch/remote/remote_store.h>

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>

namespace kcenon::media_fetch {

/**
 * @brief Counting limiter for remote sessions
 *
 * File-level and segment-level workers both open sessions; with N files
 * and C chunks the fan-out is N*C. The limiter bounds the total number of
 * sessions alive at once across every job.
 */
class session_limiter {
public:
    /**
     * @brief Construct limiter
     * @param max_sessions Maximum concurrent sessions (0 = unlimited)
     */
    explicit session_limiter(std::size_t max_sessions);

    session_limiter(const session_limiter&) = delete;
    auto operator=(const session_limiter&) -> session_limiter& = delete;

    /**
     * @brief Block until a session slot is free, then take it
     */
    void acquire();

    /**
     * @brief Take a slot if one is free
     * @return true if a slot was taken
     */
    [[nodiscard]] auto try_acquire() -> bool;

    /**
     * @brief Return a slot taken by acquire() or try_acquire()
     */
    void release();

    [[nodiscard]] auto in_use() const -> std::size_t;

    [[nodiscard]] auto max_sessions() const noexcept -> std::size_t { return max_sessions_; }

    [[nodiscard]] auto is_unlimited() const noexcept -> bool { return max_sessions_ == 0; }

private:
    const std::size_t max_sessions_;
    std::size_t in_use_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

/**
 * @brief RAII holder of one session_limiter slot
 */
class session_permit {
public:
    explicit session_permit(session_limiter& limiter) : limiter_(&limiter) {
        limiter_->acquire();
    }

    ~session_permit() {
        if (limiter_) {
            limiter_->release();
        }
    }

    session_permit(session_permit&& other) noexcept : limiter_(other.limiter_) {
        other.limiter_ = nullptr;
    }

    session_permit(const session_permit&) = delete;
    auto operator=(const session_permit&) -> session_permit& = delete;
    auto operator=(session_permit&&) -> session_permit& = delete;

private:
    session_limiter* limiter_;
};

/**
 * @brief Store decorator whose sessions each hold a limiter slot
 *
 * The slot is taken before the inner session is opened and released when
 * the returned session is destroyed.
 */
class limited_remote_store : public remote_store {
public:
    limited_remote_store(std::shared_ptr<remote_store> inner,
                         std::shared_ptr<session_limiter> limiter);

    [[nodiscard]] auto name() const -> std::string_view override { return inner_->name(); }

    [[nodiscard]] auto open_session() -> result<std::unique_ptr<remote_session>> override;

private:
    std::shared_ptr<remote_store> inner_;
    std::shared_ptr<session_limiter> limiter_;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_REMOTE_SESSION_LIMITER_H
