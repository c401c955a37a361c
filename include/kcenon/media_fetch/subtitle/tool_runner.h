/**
 * @file tool_runner.h
 * @brief External program invocation
 */

#ifndef KCENON_MEDIA_FETCH_SUBTITLE_TOOL_RUNNER_H
#define KCENON_MEDIA_FETCH_SUBTITLE_TOOL_RUNNER_H

#include <kcenon/media_fetch/core/types.h>

#include <atomic>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_fetch {

/**
 * @brief Captured result of one program run
 */
struct tool_output {
    /// Exit status; 128 + signal number when the program was killed
    int exit_code = 0;
    std::string stdout_text;
    std::string stderr_text;

    [[nodiscard]] auto succeeded() const noexcept -> bool { return exit_code == 0; }
};

/**
 * @brief Capability to run an external program and wait for it
 */
class tool_runner {
public:
    virtual ~tool_runner() = default;

    /**
     * @brief Run a program with arguments, capturing stdout and stderr
     * @param program Program path or bare name looked up on PATH
     * @param args Arguments (argv[1..])
     * @return Output with exit status, or tool_launch_failed when the
     *         program could not be started
     */
    [[nodiscard]] virtual auto run(const std::filesystem::path& program,
                                   const std::vector<std::string>& args)
        -> result<tool_output> = 0;
};

/**
 * @brief tool_runner backed by posix_spawnp and pipes
 *
 * stdin is /dev/null. When the cancel flag becomes true the child receives
 * SIGTERM and the run reports its signal exit status.
 */
class process_tool_runner : public tool_runner {
public:
    explicit process_tool_runner(const std::atomic<bool>* cancel_flag = nullptr);

    [[nodiscard]] auto run(const std::filesystem::path& program,
                           const std::vector<std::string>& args)
        -> result<tool_output> override;

private:
    const std::atomic<bool>* cancel_flag_;
};

/**
 * @brief Find an executable on PATH, then in a fallback directory
 * @param name Program name, or a path containing '/'
 * @param fallback_dir Directory searched when PATH has no match
 * @return Path of the first executable match
 */
[[nodiscard]] auto locate_executable(std::string_view name,
                                     const std::filesystem::path& fallback_dir)
    -> std::optional<std::filesystem::path>;

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_SUBTITLE_TOOL_RUNNER_H
