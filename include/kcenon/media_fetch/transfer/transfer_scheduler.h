/**
 * @file transfer_scheduler.h
 * @brief Selection and bounded concurrent execution of file transfers
 */

#ifndef KCENON_MEDIA_FETCH_TRANSFER_TRANSFER_SCHEDULER_H
#define KCENON_MEDIA_FETCH_TRANSFER_TRANSFER_SCHEDULER_H

#include <kcenon/media_fetch/core/types.h>
#include <kcenon/media_fetch/remote/remote_store.h>
#include <kcenon/media_fetch/transfer/chunked_transfer_engine.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_fetch {

/**
 * @brief Scheduler configuration
 */
struct scheduler_config {
    /// Default number of files transferred at once
    static constexpr std::size_t default_max_concurrent_transfers = 5;

    /// Release-group tags; a file qualifies when it contains "[tag]" or "【tag】"
    std::vector<std::string> groups;

    /// Upper bound on concurrent engine invocations
    std::size_t max_concurrent_transfers = default_max_concurrent_transfers;

    /// Local staging directory receiving downloads
    std::filesystem::path staging_dir;

    [[nodiscard]] auto validate() const -> result<void> {
        if (max_concurrent_transfers == 0) {
            return unexpected(error{error_code::config_invalid,
                                    "max concurrent transfers must be at least 1"});
        }
        if (staging_dir.empty()) {
            return unexpected(error{error_code::config_invalid, "staging directory is empty"});
        }
        return {};
    }
};

/**
 * @brief Failure record of one file in a batch
 */
struct transfer_failure {
    std::string name;
    error err;
};

/**
 * @brief Outcome of a scheduler run
 */
struct transfer_batch_result {
    std::vector<std::string> succeeded;
    std::vector<std::string> failed;
    std::vector<transfer_failure> failures;
    std::vector<transfer_report> reports;
    uint64_t total_bytes = 0;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto all_succeeded() const noexcept -> bool { return failed.empty(); }
};

/**
 * @brief Drives the transfer engine over a remote listing
 *
 * A run performs, in order:
 * 1. Deletes staging files whose names appear in the listing
 * 2. Keeps files tagged with a configured group
 * 3. Collapses duplicate names
 * 4. Transfers up to max_concurrent_transfers files at once; one file's
 *    failure never cancels another
 * 5. Returns the success/failure partition after every job finished
 */
class transfer_scheduler {
public:
    transfer_scheduler(std::shared_ptr<chunked_transfer_engine> engine,
                       scheduler_config config);

    /**
     * @brief Check whether a name carries one of the group tags
     *
     * Case-sensitive containment of "[tag]" or "【tag】".
     */
    [[nodiscard]] static auto matches_group(std::string_view name,
                                            const std::vector<std::string>& groups) -> bool;

    /**
     * @brief Filter a listing by group and collapse duplicate names
     * @return Selected files in listing order
     */
    [[nodiscard]] auto select(const std::vector<remote_file>& listing) const
        -> std::vector<remote_file>;

    /**
     * @brief Delete staging files left over from an earlier run
     * @return Number of files removed
     */
    auto remove_stale_staging(const std::vector<remote_file>& listing) const -> std::size_t;

    /**
     * @brief Run the whole batch
     */
    [[nodiscard]] auto run(const std::vector<remote_file>& listing) -> transfer_batch_result;

    [[nodiscard]] auto config() const -> const scheduler_config& { return config_; }

private:
    std::shared_ptr<chunked_transfer_engine> engine_;
    scheduler_config config_;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_TRANSFER_TRANSFER_SCHEDULER_H
