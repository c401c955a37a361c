/**
 * @file media_pipeline.h
 * @brief One complete fetch / classify / place / patch run
 */

#ifndef KCENON_MEDIA_FETCH_APP_MEDIA_PIPELINE_H
#define KCENON_MEDIA_FETCH_APP_MEDIA_PIPELINE_H

#include <kcenon/media_fetch/app/app_config.h>
#include <kcenon/media_fetch/core/types.h>
#include <kcenon/media_fetch/library/episode_classifier.h>
#include <kcenon/media_fetch/library/library_placer.h>
#include <kcenon/media_fetch/remote/remote_store.h>
#include <kcenon/media_fetch/subtitle/subtitle_patch_pipeline.h>
#include <kcenon/media_fetch/subtitle/tool_runner.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace kcenon::media_fetch {

/**
 * @brief Per-stage tally of one run
 */
struct run_summary {
    std::size_t transferred = 0;
    std::size_t transfer_failed = 0;
    std::size_t placed = 0;
    std::size_t unmatched = 0;
    std::size_t classification_failed = 0;
    std::size_t placement_failed = 0;
    std::size_t patched = 0;
    std::size_t patch_failed = 0;
    std::size_t skipped_empty = 0;

    /// True when no stage reported a failure
    [[nodiscard]] auto clean() const noexcept -> bool {
        return transfer_failed == 0 && classification_failed == 0 && placement_failed == 0 &&
               patch_failed == 0;
    }

    [[nodiscard]] auto to_string() const -> std::string;
};

/**
 * @brief Orchestrates one run over the configured remote and library
 *
 * Run sequence:
 * 1. Ensure the staging directory and purge in-flight leftovers
 * 2. Unless MOVELOCAL=ON, list the remote directory and run the transfer
 *    scheduler (connection and listing failures are fatal)
 * 3. For each regular staging file, in name order: skip empty files,
 *    classify, place into the library, then patch subtitles
 *
 * Per-file failures are logged with their stage and counted; they never
 * abort the run.
 */
class media_pipeline {
public:
    /**
     * @brief Construct a pipeline
     * @param config Validated configuration
     * @param store Remote store (unused when MOVELOCAL=ON)
     * @param runner Runner for the subtitle tools
     * @param cancel_flag Optional flag; true stops the run between files
     */
    media_pipeline(app_config config,
                   std::shared_ptr<remote_store> store,
                   std::shared_ptr<tool_runner> runner,
                   const std::atomic<bool>* cancel_flag = nullptr);

    /**
     * @brief Build the remote store named by the configuration
     *
     * The store is wrapped in a session limiter when MAX_SESSIONS > 0.
     *
     * @return Store, or config_invalid when the backend is unavailable
     */
    [[nodiscard]] static auto create_remote_store(const remote_settings& settings)
        -> result<std::shared_ptr<remote_store>>;

    /**
     * @brief Execute the run
     * @return Tally, or the fatal error that stopped the run
     */
    [[nodiscard]] auto run() -> result<run_summary>;

    /**
     * @brief Delete segment and staging files left in the staging directory
     * @return Number of files removed
     */
    auto purge_in_flight() -> std::size_t;

    /**
     * @brief Classify, place and patch every file in the staging directory
     */
    void process_staging(run_summary& summary);

    [[nodiscard]] auto config() const -> const app_config& { return config_; }

private:
    auto prepare_staging() -> result<void>;
    auto fetch(run_summary& summary) -> result<void>;
    void process_file(const std::filesystem::path& file, run_summary& summary);
    [[nodiscard]] auto cancelled() const -> bool;
    [[nodiscard]] auto remote_directory() const -> std::string;

    app_config config_;
    std::shared_ptr<remote_store> store_;
    const std::atomic<bool>* cancel_flag_;

    episode_classifier classifier_;
    std::unique_ptr<library_placer> placer_;
    subtitle_patch_pipeline patcher_;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_APP_MEDIA_PIPELINE_H
