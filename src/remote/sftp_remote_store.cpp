/**
 * @file sftp_remote_store.cpp
 * @brief libssh implementation of the SFTP remote store
 */

#include <kcenon/media_fetch/remote/sftp_remote_store.h>

#if MEDIA_FETCH_HAS_SFTP

#include <kcenon/media_fetch/core/logging.h>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <fcntl.h>

namespace kcenon::media_fetch {

namespace {

struct sftp_attributes_deleter {
    void operator()(sftp_attributes_struct* attrs) const { sftp_attributes_free(attrs); }
};

using attributes_ptr = std::unique_ptr<sftp_attributes_struct, sftp_attributes_deleter>;

class sftp_reader : public remote_reader {
public:
    explicit sftp_reader(sftp_file file) : file_(file) {}

    ~sftp_reader() override {
        if (file_) {
            sftp_close(file_);
        }
    }

    sftp_reader(const sftp_reader&) = delete;
    auto operator=(const sftp_reader&) -> sftp_reader& = delete;

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (buffer.empty()) {
            return std::size_t{0};
        }

        ssize_t n = sftp_read(file_, buffer.data(), buffer.size());
        if (n < 0) {
            return unexpected(error{error_code::segment_io_error, "sftp_read failed"});
        }
        return static_cast<std::size_t>(n);
    }

private:
    sftp_file file_;
};

class sftp_session_impl : public remote_session {
public:
    sftp_session_impl(ssh_session ssh, sftp_session sftp) : ssh_(ssh), sftp_(sftp) {}

    ~sftp_session_impl() override {
        sftp_free(sftp_);
        ssh_disconnect(ssh_);
        ssh_free(ssh_);
    }

    [[nodiscard]] auto list(const std::string& directory)
        -> result<std::vector<remote_file>> override {
        sftp_dir dir = sftp_opendir(sftp_, directory.c_str());
        if (!dir) {
            return unexpected(error{error_code::list_failed,
                                    "cannot open remote directory " + directory + ": " +
                                        ssh_get_error(ssh_)});
        }

        std::vector<remote_file> files;
        while (true) {
            attributes_ptr attrs(sftp_readdir(sftp_, dir));
            if (!attrs) break;

            if (attrs->type != SSH_FILEXFER_TYPE_REGULAR || attrs->name == nullptr) {
                continue;
            }
            remote_file file;
            file.name = attrs->name;
            file.listed_size = attrs->size;
            files.push_back(std::move(file));
        }

        bool complete = sftp_dir_eof(dir) != 0;
        sftp_closedir(dir);
        if (!complete) {
            return unexpected(error{error_code::list_failed,
                                    "listing of " + directory + " ended early: " +
                                        ssh_get_error(ssh_)});
        }
        return files;
    }

    [[nodiscard]] auto stat(const std::string& path) -> result<uint64_t> override {
        attributes_ptr attrs(sftp_stat(sftp_, path.c_str()));
        if (!attrs) {
            return unexpected(error{error_code::stat_failed,
                                    "cannot stat " + path + ": " + ssh_get_error(ssh_)});
        }
        return static_cast<uint64_t>(attrs->size);
    }

    [[nodiscard]] auto open_range(const std::string& path, uint64_t offset)
        -> result<std::unique_ptr<remote_reader>> override {
        sftp_file file = sftp_open(sftp_, path.c_str(), O_RDONLY, 0);
        if (!file) {
            return unexpected(error{error_code::segment_io_error,
                                    "cannot open " + path + ": " + ssh_get_error(ssh_)});
        }

        auto reader = std::make_unique<sftp_reader>(file);
        if (offset > 0 && sftp_seek64(file, offset) != 0) {
            return unexpected(error{error_code::segment_io_error,
                                    "cannot seek " + path + " to " + std::to_string(offset)});
        }
        return std::unique_ptr<remote_reader>(std::move(reader));
    }

    [[nodiscard]] auto remove(const std::string& path) -> result<void> override {
        if (sftp_unlink(sftp_, path.c_str()) != 0) {
            return unexpected(error{error_code::remote_delete_failed,
                                    "cannot remove " + path + ": " + ssh_get_error(ssh_)});
        }
        return {};
    }

private:
    ssh_session ssh_;
    sftp_session sftp_;
};

auto verify_host_key(ssh_session ssh, const sftp_options& options) -> result<void> {
    switch (ssh_session_is_known_server(ssh)) {
        case SSH_KNOWN_HOSTS_OK:
            return {};
        case SSH_KNOWN_HOSTS_UNKNOWN:
        case SSH_KNOWN_HOSTS_NOT_FOUND:
            if (options.strict_host_key) {
                return unexpected(error{error_code::connect_failed,
                                        "host key of " + options.host + " is not known"});
            }
            MF_LOG_WARN(log_category::remote,
                        "Accepting unknown host key of " + options.host);
            return {};
        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            return unexpected(error{error_code::connect_failed,
                                    "host key of " + options.host + " has changed"});
        case SSH_KNOWN_HOSTS_ERROR:
        default:
            return unexpected(error{error_code::connect_failed,
                                    std::string("host key check failed: ") +
                                        ssh_get_error(ssh)});
    }
}

}  // namespace

sftp_remote_store::sftp_remote_store(sftp_options options) : options_(std::move(options)) {}

auto sftp_remote_store::open_session() -> result<std::unique_ptr<remote_session>> {
    ssh_session ssh = ssh_new();
    if (!ssh) {
        return unexpected(error{error_code::connect_failed, "ssh_new failed"});
    }

    auto fail = [&](const std::string& what) -> result<std::unique_ptr<remote_session>> {
        std::string message = what + ": " + ssh_get_error(ssh);
        if (ssh_is_connected(ssh)) {
            ssh_disconnect(ssh);
        }
        ssh_free(ssh);
        return unexpected(error{error_code::connect_failed, message});
    };

    unsigned int port = options_.port;
    long timeout = options_.timeout_seconds;
    ssh_options_set(ssh, SSH_OPTIONS_HOST, options_.host.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_PORT, &port);
    ssh_options_set(ssh, SSH_OPTIONS_USER, options_.user.c_str());
    ssh_options_set(ssh, SSH_OPTIONS_TIMEOUT, &timeout);

    if (ssh_connect(ssh) != SSH_OK) {
        return fail("cannot connect to " + options_.host);
    }

    auto host_key = verify_host_key(ssh, options_);
    if (!host_key) {
        ssh_disconnect(ssh);
        ssh_free(ssh);
        return unexpected(host_key.error());
    }

    if (ssh_userauth_password(ssh, nullptr, options_.password.c_str()) != SSH_AUTH_SUCCESS) {
        return fail("authentication failed for " + options_.user);
    }

    sftp_session sftp = sftp_new(ssh);
    if (!sftp) {
        return fail("cannot allocate SFTP session");
    }
    if (sftp_init(sftp) != SSH_OK) {
        sftp_free(sftp);
        return fail("cannot initialize SFTP session");
    }

    MF_LOG_DEBUG(log_category::remote,
                 "Opened SFTP session to " + options_.host + ":" + std::to_string(port));

    return std::unique_ptr<remote_session>(std::make_unique<sftp_session_impl>(ssh, sftp));
}

}  // namespace kcenon::media_fetch

#endif  // MEDIA_FETCH_HAS_SFTP
