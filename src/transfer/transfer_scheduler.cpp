/**
 * @file transfer_scheduler.cpp
 * @brief Implementation of the transfer scheduler
 */

#include <kcenon/media_fetch/transfer/transfer_scheduler.h>

#include <kcenon/media_fetch/adapters/thread_pool_adapter.h>
#include <kcenon/media_fetch/core/chunk_plan.h>
#include <kcenon/media_fetch/core/logging.h>

#include <algorithm>
#include <future>
#include <optional>
#include <unordered_set>

namespace kcenon::media_fetch {

namespace {

constexpr const char* file_stage = "file_transfer";

}  // namespace

transfer_scheduler::transfer_scheduler(std::shared_ptr<chunked_transfer_engine> engine,
                                       scheduler_config config)
    : engine_(std::move(engine)), config_(std::move(config)) {}

auto transfer_scheduler::matches_group(std::string_view name,
                                       const std::vector<std::string>& groups) -> bool {
    for (const auto& group : groups) {
        if (group.empty()) continue;

        std::string ascii = "[" + group + "]";
        std::string fullwidth = "\xE3\x80\x90" + group + "\xE3\x80\x91";  // 【group】
        if (name.find(ascii) != std::string_view::npos ||
            name.find(fullwidth) != std::string_view::npos) {
            return true;
        }
    }
    return false;
}

auto transfer_scheduler::select(const std::vector<remote_file>& listing) const
    -> std::vector<remote_file> {
    std::vector<remote_file> selected;
    std::unordered_set<std::string> seen;

    for (const auto& file : listing) {
        if (!matches_group(file.name, config_.groups)) {
            continue;
        }
        if (!seen.insert(file.name).second) {
            MF_LOG_DEBUG(log_category::scheduler, "Skipping duplicate entry " + file.name);
            continue;
        }
        selected.push_back(file);
    }
    return selected;
}

auto transfer_scheduler::remove_stale_staging(const std::vector<remote_file>& listing) const
    -> std::size_t {
    std::unordered_set<std::string> names;
    for (const auto& file : listing) {
        names.insert(file.name);
    }

    std::error_code ec;
    std::filesystem::directory_iterator it(config_.staging_dir, ec);
    if (ec) {
        return 0;
    }

    std::size_t removed = 0;
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;

        auto local = entry.path().filename().string();
        bool stale = names.count(local) > 0;
        if (!stale && is_in_flight_name(local)) {
            // "<listed name>.partN" or "<listed name>.mfstage"
            auto base = local.substr(0, local.rfind('.'));
            stale = names.count(base) > 0;
        }
        if (!stale) continue;

        if (std::filesystem::remove(entry.path(), entry_ec)) {
            ++removed;
            MF_LOG_INFO(log_category::scheduler, "Removed stale staging file " + local);
        } else if (entry_ec) {
            MF_LOG_WARN(log_category::scheduler,
                        "Cannot remove stale staging file " + local + ": " + entry_ec.message());
        }
    }
    return removed;
}

auto transfer_scheduler::run(const std::vector<remote_file>& listing) -> transfer_batch_result {
    const auto start_time = std::chrono::steady_clock::now();
    transfer_batch_result batch;

    remove_stale_staging(listing);

    if (config_.groups.empty()) {
        MF_LOG_WARN(log_category::scheduler, "No release groups configured; nothing selected");
    }

    auto selected = select(listing);
    MF_LOG_INFO(log_category::scheduler,
                "Selected " + std::to_string(selected.size()) + " of " +
                    std::to_string(listing.size()) + " remote file(s)");

    if (selected.empty()) {
        return batch;
    }

    std::vector<std::optional<result<transfer_report>>> outcomes(selected.size());
    {
        auto workers = std::min(config_.max_concurrent_transfers, selected.size());
        auto pool = adapters::transfer_pool_factory::create(workers, "transfers");

        std::vector<std::future<void>> futures;
        futures.reserve(selected.size());
        for (std::size_t i = 0; i < selected.size(); ++i) {
            futures.push_back(pool->submit_to_stage(
                [this, &selected, &outcomes, i] {
                    outcomes[i] = engine_->transfer(selected[i], config_.staging_dir);
                },
                file_stage));
        }

        for (std::size_t i = 0; i < futures.size(); ++i) {
            try {
                futures[i].get();
            } catch (const std::exception& e) {
                outcomes[i] = result<transfer_report>(unexpected(
                    error{error_code::internal_error,
                          std::string("transfer worker threw: ") + e.what()}));
            }
        }
    }

    for (std::size_t i = 0; i < selected.size(); ++i) {
        const auto& name = selected[i].name;
        auto& outcome = outcomes[i];

        if (outcome && outcome->has_value()) {
            batch.succeeded.push_back(name);
            batch.total_bytes += outcome->value().bytes;
            batch.reports.push_back(std::move(outcome->value()));
        } else {
            batch.failed.push_back(name);
            batch.failures.push_back(
                {name, outcome ? outcome->error()
                               : error{error_code::internal_error, "transfer did not run"}});
        }
    }

    batch.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    MF_LOG_INFO(log_category::scheduler,
                "Transfer batch finished: " + std::to_string(batch.succeeded.size()) +
                    " succeeded, " + std::to_string(batch.failed.size()) + " failed");

    return batch;
}

}  // namespace kcenon::media_fetch
