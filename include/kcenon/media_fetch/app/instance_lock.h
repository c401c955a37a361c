/**
 * @file instance_lock.h
 * @brief Single-instance guard backed by a PID file
 */

#ifndef KCENON_MEDIA_FETCH_APP_INSTANCE_LOCK_H
#define KCENON_MEDIA_FETCH_APP_INSTANCE_LOCK_H

#include <kcenon/media_fetch/core/types.h>

#include <filesystem>

namespace kcenon::media_fetch {

/**
 * @brief Exclusive ownership of a lock file holding the owner's PID
 *
 * Ownership is an flock(2) lock held on the open file for the lifetime of
 * the object; the PID inside is informational. A file left behind by a
 * dead process carries no lock and is taken over in place. The file is
 * removed when the owning instance_lock is destroyed.
 */
class instance_lock {
public:
    static constexpr const char* default_lock_name = "media_fetch.lock";

    /**
     * @brief Lock file path in the system temporary directory
     */
    [[nodiscard]] static auto default_path() -> std::filesystem::path;

    /**
     * @brief Acquire the lock
     * @return Lock owner, instance_locked when a live process holds it, or
     *         file_write_error when the file cannot be opened or written
     */
    [[nodiscard]] static auto acquire(const std::filesystem::path& path = default_path())
        -> result<instance_lock>;

    ~instance_lock();

    instance_lock(const instance_lock&) = delete;
    auto operator=(const instance_lock&) -> instance_lock& = delete;

    instance_lock(instance_lock&& other) noexcept;
    auto operator=(instance_lock&& other) noexcept -> instance_lock&;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    [[nodiscard]] auto owns() const noexcept -> bool { return fd_ >= 0; }

    /**
     * @brief Remove the lock file and drop the lock now
     */
    void release();

private:
    instance_lock(std::filesystem::path path, int fd);

    std::filesystem::path path_;
    int fd_ = -1;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_APP_INSTANCE_LOCK_H
