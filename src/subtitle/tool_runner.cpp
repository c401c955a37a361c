/**
 * @file tool_runner.cpp
 * @brief posix_spawn implementation of the tool runner
 */

#include <kcenon/media_fetch/subtitle/tool_runner.h>

#include <kcenon/media_fetch/core/logging.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace kcenon::media_fetch {

namespace {

constexpr int poll_interval_ms = 100;

/**
 * @brief Owns a pipe's file descriptors
 */
class pipe_pair {
public:
    pipe_pair() {
        if (::pipe2(fds_, O_CLOEXEC) != 0) {
            fds_[0] = fds_[1] = -1;
        }
    }

    ~pipe_pair() {
        close_read();
        close_write();
    }

    pipe_pair(const pipe_pair&) = delete;
    auto operator=(const pipe_pair&) -> pipe_pair& = delete;

    [[nodiscard]] auto valid() const -> bool { return fds_[0] >= 0 && fds_[1] >= 0; }
    [[nodiscard]] auto read_end() const -> int { return fds_[0]; }
    [[nodiscard]] auto write_end() const -> int { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) {
            ::close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void close_write() {
        if (fds_[1] >= 0) {
            ::close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

/**
 * @brief RAII wrapper for posix_spawn_file_actions_t
 */
class spawn_actions {
public:
    spawn_actions() { posix_spawn_file_actions_init(&actions_); }
    ~spawn_actions() { posix_spawn_file_actions_destroy(&actions_); }

    spawn_actions(const spawn_actions&) = delete;
    auto operator=(const spawn_actions&) -> spawn_actions& = delete;

    [[nodiscard]] auto get() -> posix_spawn_file_actions_t* { return &actions_; }

private:
    posix_spawn_file_actions_t actions_;
};

auto describe_command(const std::filesystem::path& program,
                      const std::vector<std::string>& args) -> std::string {
    std::ostringstream oss;
    oss << program.string();
    for (const auto& arg : args) {
        oss << " \"" << arg << '"';
    }
    return oss.str();
}

// One read per readiness event; returns false once the descriptor is done
auto drain(int fd, std::string& sink) -> bool {
    char buffer[4096];
    ssize_t n = 0;
    do {
        n = ::read(fd, buffer, sizeof(buffer));
    } while (n < 0 && errno == EINTR);

    if (n > 0) {
        sink.append(buffer, static_cast<std::size_t>(n));
        return true;
    }
    return false;
}

}  // namespace

process_tool_runner::process_tool_runner(const std::atomic<bool>* cancel_flag)
    : cancel_flag_(cancel_flag) {}

auto process_tool_runner::run(const std::filesystem::path& program,
                              const std::vector<std::string>& args) -> result<tool_output> {
    const auto command = describe_command(program, args);
    MF_LOG_DEBUG(log_category::subtitle, "Running " + command);

    pipe_pair out_pipe;
    pipe_pair err_pipe;
    if (!out_pipe.valid() || !err_pipe.valid()) {
        return unexpected(error{error_code::tool_launch_failed,
                                std::string("cannot create pipes: ") + std::strerror(errno)});
    }

    spawn_actions actions;
    posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(actions.get(), out_pipe.write_end(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(actions.get(), err_pipe.write_end(), STDERR_FILENO);

    const std::string program_str = program.string();
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(program_str.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, program_str.c_str(), actions.get(), nullptr, argv.data(),
                          environ);
    if (rc != 0) {
        return unexpected(error{error_code::tool_launch_failed,
                                "cannot start " + program_str + ": " + std::strerror(rc)});
    }

    out_pipe.close_write();
    err_pipe.close_write();

    tool_output output;
    bool out_open = true;
    bool err_open = true;
    bool terminated = false;

    while (out_open || err_open) {
        if (!terminated && cancel_flag_ && cancel_flag_->load(std::memory_order_relaxed)) {
            MF_LOG_WARN(log_category::subtitle, "Cancelling " + program_str);
            ::kill(pid, SIGTERM);
            terminated = true;
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_open) fds[count++] = {out_pipe.read_end(), POLLIN, 0};
        if (err_open) fds[count++] = {err_pipe.read_end(), POLLIN, 0};

        int ready = ::poll(fds, count, poll_interval_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

            if (fds[i].fd == out_pipe.read_end()) {
                out_open = drain(fds[i].fd, output.stdout_text);
            } else {
                err_open = drain(fds[i].fd, output.stderr_text);
            }
        }
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return unexpected(error{error_code::tool_launch_failed,
                                    "waitpid failed for " + program_str + ": " +
                                        std::strerror(errno)});
        }
    }

    if (WIFEXITED(status)) {
        output.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        output.exit_code = 128 + WTERMSIG(status);
    } else {
        output.exit_code = -1;
    }

    MF_LOG_DEBUG(log_category::subtitle,
                 program.filename().string() + " exited with " +
                     std::to_string(output.exit_code));
    return output;
}

auto locate_executable(std::string_view name, const std::filesystem::path& fallback_dir)
    -> std::optional<std::filesystem::path> {
    auto is_executable = [](const std::filesystem::path& candidate) {
        std::error_code ec;
        return std::filesystem::is_regular_file(candidate, ec) &&
               ::access(candidate.c_str(), X_OK) == 0;
    };

    if (name.empty()) {
        return std::nullopt;
    }

    if (name.find('/') != std::string_view::npos) {
        std::filesystem::path direct(name);
        if (is_executable(direct)) return direct;
        return std::nullopt;
    }

    if (const char* path_env = std::getenv("PATH")) {
        std::string_view path_list(path_env);
        while (!path_list.empty()) {
            auto sep = path_list.find(':');
            auto entry = path_list.substr(0, sep);
            if (!entry.empty()) {
                auto candidate = std::filesystem::path(entry) / name;
                if (is_executable(candidate)) return candidate;
            }
            if (sep == std::string_view::npos) break;
            path_list.remove_prefix(sep + 1);
        }
    }

    if (!fallback_dir.empty()) {
        auto candidate = fallback_dir / name;
        if (is_executable(candidate)) return candidate;
    }

    return std::nullopt;
}

}  // namespace kcenon::media_fetch
