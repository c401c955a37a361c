/**
 * @file instance_lock.cpp
 * @brief Implementation of the PID file lock
 */

#include <kcenon/media_fetch/app/instance_lock.h>

#include <kcenon/media_fetch/core/logging.h>

#include <cerrno>
#include <charconv>
#include <cstring>
#include <optional>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kcenon::media_fetch {

namespace {

// Attempts before giving up on a lock file that keeps being replaced
constexpr int max_attempts = 5;

auto read_owner_pid(int fd) -> std::optional<pid_t> {
    char buffer[32] = {};
    ssize_t n = 0;
    do {
        n = ::pread(fd, buffer, sizeof(buffer) - 1, 0);
    } while (n < 0 && errno == EINTR);
    if (n <= 0) {
        return std::nullopt;
    }

    pid_t pid = 0;
    auto [ptr, ec] = std::from_chars(buffer, buffer + n, pid);
    if (ec != std::errc{} || pid <= 0) {
        return std::nullopt;
    }
    return pid;
}

auto open_lock_file(const std::filesystem::path& path) -> int {
    int fd = -1;
    do {
        fd = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    } while (fd < 0 && errno == EINTR);
    return fd;
}

auto lock_exclusive(int fd) -> int {
    int rc = 0;
    do {
        rc = ::flock(fd, LOCK_EX | LOCK_NB);
    } while (rc != 0 && errno == EINTR);
    return rc;
}

// True while `path` still names the inode behind `fd`
auto same_file(int fd, const std::filesystem::path& path) -> bool {
    struct stat by_fd {};
    struct stat by_path {};
    if (::fstat(fd, &by_fd) != 0 || ::stat(path.c_str(), &by_path) != 0) {
        return false;
    }
    return by_fd.st_dev == by_path.st_dev && by_fd.st_ino == by_path.st_ino;
}

auto write_pid(int fd) -> bool {
    const auto pid = std::to_string(::getpid()) + "\n";
    if (::ftruncate(fd, 0) != 0) {
        return false;
    }
    return ::pwrite(fd, pid.data(), pid.size(), 0) == static_cast<ssize_t>(pid.size());
}

}  // namespace

auto instance_lock::default_path() -> std::filesystem::path {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        dir = "/tmp";
    }
    return dir / default_lock_name;
}

auto instance_lock::acquire(const std::filesystem::path& path) -> result<instance_lock> {
    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        int fd = open_lock_file(path);
        if (fd < 0) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot open lock file " + path.string() + ": " +
                                        std::strerror(errno)});
        }

        if (lock_exclusive(fd) != 0) {
            const int saved_errno = errno;
            auto owner = read_owner_pid(fd);
            ::close(fd);
            if (saved_errno == EWOULDBLOCK) {
                return unexpected(error{
                    error_code::instance_locked,
                    "another instance" +
                        (owner ? " (pid " + std::to_string(*owner) + ")" : std::string{}) +
                        " holds " + path.string()});
            }
            return unexpected(error{error_code::file_write_error,
                                    "cannot lock " + path.string() + ": " +
                                        std::strerror(saved_errno)});
        }

        // The previous holder may have unlinked the file between open and flock
        if (!same_file(fd, path)) {
            ::close(fd);
            continue;
        }

        if (auto previous = read_owner_pid(fd); previous && *previous != ::getpid()) {
            MF_LOG_WARN(log_category::app,
                        "Reclaiming lock file " + path.string() + " left by pid " +
                            std::to_string(*previous));
        }

        if (!write_pid(fd)) {
            const int saved_errno = errno;
            ::unlink(path.c_str());
            ::close(fd);
            return unexpected(error{error_code::file_write_error,
                                    "cannot write lock file " + path.string() + ": " +
                                        std::strerror(saved_errno)});
        }

        MF_LOG_DEBUG(log_category::app, "Acquired instance lock " + path.string());
        return instance_lock(path, fd);
    }

    return unexpected(error{error_code::instance_locked,
                            "lock file " + path.string() + " kept changing while locking"});
}

instance_lock::instance_lock(std::filesystem::path path, int fd)
    : path_(std::move(path)), fd_(fd) {}

instance_lock::~instance_lock() {
    release();
}

instance_lock::instance_lock(instance_lock&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_) {
    other.fd_ = -1;
}

auto instance_lock::operator=(instance_lock&& other) noexcept -> instance_lock& {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void instance_lock::release() {
    if (fd_ < 0) {
        return;
    }

    // Unlink while still holding the lock so no one locks a detached inode
    if (::unlink(path_.c_str()) != 0 && errno != ENOENT) {
        MF_LOG_WARN(log_category::app,
                    "Cannot remove lock file " + path_.string() + ": " + std::strerror(errno));
    }
    ::close(fd_);
    fd_ = -1;
}

}  // namespace kcenon::media_fetch
