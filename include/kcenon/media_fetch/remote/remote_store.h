/**
 * @file remote_store.h
 * @brief Remote file access abstraction
 *
 * The transfer engine never speaks a wire protocol directly. It consumes
 * the capability defined here: list a directory, stat a file, open a file
 * for reading at an offset, and remove a file. Concrete backends are the
 * filesystem-backed local_remote_store and the libssh-backed
 * sftp_remote_store.
 */

#ifndef KCENON_MEDIA_FETCH_REMOTE_REMOTE_STORE_H
#define KCENON_MEDIA_FETCH_REMOTE_REMOTE_STORE_H

#include <kcenon/media_fetch/core/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_fetch {

/**
 * @brief Entry returned by a remote directory listing
 */
struct remote_file {
    /// File name, unique within one listing
    std::string name;

    /// Size reported by the listing; never trusted for verification
    std::optional<uint64_t> listed_size;
};

/**
 * @brief Sequential reader positioned at an offset of a remote file
 */
class remote_reader {
public:
    virtual ~remote_reader() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @param buffer Destination buffer
     * @return Bytes read (0 at end of file), or segment_io_error
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

protected:
    remote_reader() = default;
};

/**
 * @brief One authenticated connection to the remote store
 *
 * Readers opened from a session borrow its connection and must be
 * destroyed before the session.
 */
class remote_session {
public:
    virtual ~remote_session() = default;

    remote_session(const remote_session&) = delete;
    auto operator=(const remote_session&) -> remote_session& = delete;

    /**
     * @brief List regular files in a directory
     * @return Entries in listing order, or list_failed
     */
    [[nodiscard]] virtual auto list(const std::string& directory)
        -> result<std::vector<remote_file>> = 0;

    /**
     * @brief Query the current size of a file
     * @return Size in bytes, or stat_failed
     */
    [[nodiscard]] virtual auto stat(const std::string& path) -> result<uint64_t> = 0;

    /**
     * @brief Open a file for reading starting at offset
     * @return Reader, or segment_io_error
     */
    [[nodiscard]] virtual auto open_range(const std::string& path, uint64_t offset)
        -> result<std::unique_ptr<remote_reader>> = 0;

    /**
     * @brief Delete a file
     * @return Success, or remote_delete_failed
     */
    [[nodiscard]] virtual auto remove(const std::string& path) -> result<void> = 0;

protected:
    remote_session() = default;
};

/**
 * @brief Factory of remote sessions
 *
 * Implementations must allow open_session() from several threads at once;
 * every segment worker opens its own session.
 */
class remote_store {
public:
    virtual ~remote_store() = default;

    remote_store(const remote_store&) = delete;
    auto operator=(const remote_store&) -> remote_store& = delete;

    /**
     * @brief Backend name used in log lines (e.g. "sftp", "local")
     */
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Open a new session
     * @return Session, or connect_failed
     */
    [[nodiscard]] virtual auto open_session() -> result<std::unique_ptr<remote_session>> = 0;

protected:
    remote_store() = default;
};

/**
 * @brief Join a remote directory and a file name with a single '/'
 */
[[nodiscard]] inline auto join_remote_path(std::string_view directory, std::string_view name)
    -> std::string {
    if (directory.empty()) {
        return std::string(name);
    }
    std::string path(directory);
    if (path.back() != '/') {
        path += '/';
    }
    path += name;
    return path;
}

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_REMOTE_REMOTE_STORE_H
