/**
 * @file sftp_remote_store.h
 * @brief Remote store over SFTP (libssh)
 *
 * Only available when built with MEDIA_FETCH_ENABLE_SFTP.
 */

#ifndef KCENON_MEDIA_FETCH_REMOTE_SFTP_REMOTE_STORE_H
#define KCENON_MEDIA_FETCH_REMOTE_SFTP_REMOTE_STORE_H

#include <kcenon/media_fetch/config/feature_flags.h>
#include <kcenon/media_fetch/remote/remote_store.h>

#include <cstdint>
#include <string>

namespace kcenon::media_fetch {

/**
 * @brief Connection parameters for an SFTP server
 */
struct sftp_options {
    std::string host;
    uint16_t port = 22;
    std::string user;
    std::string password;

    /// Reject hosts whose key is absent from known_hosts
    bool strict_host_key = false;

    /// Connect timeout in seconds
    long timeout_seconds = 30;

    [[nodiscard]] auto validate() const -> result<void> {
        if (host.empty()) {
            return unexpected(error{error_code::config_invalid, "SFTP host is empty"});
        }
        if (user.empty()) {
            return unexpected(error{error_code::config_invalid, "SFTP user is empty"});
        }
        if (port == 0) {
            return unexpected(error{error_code::config_invalid, "SFTP port is 0"});
        }
        return {};
    }
};

#if MEDIA_FETCH_HAS_SFTP

/**
 * @brief Remote store that opens one SSH connection per session
 *
 * Every session performs its own handshake and password authentication,
 * so parallel segment workers never share a libssh session.
 */
class sftp_remote_store : public remote_store {
public:
    explicit sftp_remote_store(sftp_options options);

    [[nodiscard]] auto name() const -> std::string_view override { return "sftp"; }

    [[nodiscard]] auto open_session() -> result<std::unique_ptr<remote_session>> override;

    [[nodiscard]] auto options() const -> const sftp_options& { return options_; }

private:
    sftp_options options_;
};

#endif  // MEDIA_FETCH_HAS_SFTP

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_REMOTE_SFTP_REMOTE_STORE_H
