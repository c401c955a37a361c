/**
 * @file session_limiter.cpp
 * @brief Implementation of the remote session limiter
 */

#include <kcenon/media_fetch/remote/session_limiter.h>

namespace kcenon::media_fetch {

namespace {

class limited_session : public remote_session {
public:
    limited_session(session_permit permit, std::unique_ptr<remote_session> inner)
        : permit_(std::move(permit)), inner_(std::move(inner)) {}

    [[nodiscard]] auto list(const std::string& directory)
        -> result<std::vector<remote_file>> override {
        return inner_->list(directory);
    }

    [[nodiscard]] auto stat(const std::string& path) -> result<uint64_t> override {
        return inner_->stat(path);
    }

    [[nodiscard]] auto open_range(const std::string& path, uint64_t offset)
        -> result<std::unique_ptr<remote_reader>> override {
        return inner_->open_range(path, offset);
    }

    [[nodiscard]] auto remove(const std::string& path) -> result<void> override {
        return inner_->remove(path);
    }

private:
    // Declared first so the slot is released after the inner session closes
    session_permit permit_;
    std::unique_ptr<remote_session> inner_;
};

}  // namespace

session_limiter::session_limiter(std::size_t max_sessions) : max_sessions_(max_sessions) {}

void session_limiter::acquire() {
    std::unique_lock lock(mutex_);
    if (max_sessions_ > 0) {
        cv_.wait(lock, [this] { return in_use_ < max_sessions_; });
    }
    ++in_use_;
}

auto session_limiter::try_acquire() -> bool {
    std::lock_guard lock(mutex_);
    if (max_sessions_ > 0 && in_use_ >= max_sessions_) {
        return false;
    }
    ++in_use_;
    return true;
}

void session_limiter::release() {
    {
        std::lock_guard lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

auto session_limiter::in_use() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return in_use_;
}

limited_remote_store::limited_remote_store(std::shared_ptr<remote_store> inner,
                                           std::shared_ptr<session_limiter> limiter)
    : inner_(std::move(inner)), limiter_(std::move(limiter)) {}

auto limited_remote_store::open_session() -> result<std::unique_ptr<remote_session>> {
    session_permit permit(*limiter_);

    auto session = inner_->open_session();
    if (!session) {
        return unexpected(session.error());
    }

    return std::unique_ptr<remote_session>(
        std::make_unique<limited_session>(std::move(permit), std::move(session.value())));
}

}  // namespace kcenon::media_fetch
