/**
 * @file media_pipeline.cpp
 * @brief Implementation of the run orchestration
 */

#include <kcenon/media_fetch/app/media_pipeline.h>

#include <kcenon/media_fetch/config/feature_flags.h>
#include <kcenon/media_fetch/core/chunk_plan.h>
#include <kcenon/media_fetch/core/logging.h>
#include <kcenon/media_fetch/remote/local_remote_store.h>
#include <kcenon/media_fetch/remote/session_limiter.h>
#include <kcenon/media_fetch/remote/sftp_remote_store.h>
#include <kcenon/media_fetch/transfer/chunked_transfer_engine.h>
#include <kcenon/media_fetch/transfer/transfer_scheduler.h>

#include <algorithm>
#include <set>
#include <sstream>
#include <system_error>
#include <vector>

namespace kcenon::media_fetch {

auto run_summary::to_string() const -> std::string {
    std::ostringstream oss;
    oss << "transferred=" << transferred << " transfer_failed=" << transfer_failed
        << " placed=" << placed << " unmatched=" << unmatched
        << " classification_failed=" << classification_failed
        << " placement_failed=" << placement_failed << " patched=" << patched
        << " patch_failed=" << patch_failed << " skipped_empty=" << skipped_empty;
    return oss.str();
}

media_pipeline::media_pipeline(app_config config,
                               std::shared_ptr<remote_store> store,
                               std::shared_ptr<tool_runner> runner,
                               const std::atomic<bool>* cancel_flag)
    : config_(std::move(config)),
      store_(std::move(store)),
      cancel_flag_(cancel_flag),
      classifier_(config_.library.series, config_.library.rename),
      placer_(std::make_unique<library_placer>(placer_config{
          config_.library.library_root, config_.library.save_ledger})),
      patcher_(std::move(runner), config_.subtitle.patch) {}

auto media_pipeline::create_remote_store(const remote_settings& settings)
    -> result<std::shared_ptr<remote_store>> {
    std::shared_ptr<remote_store> store;

    if (settings.backend == "local") {
        store = std::make_shared<local_remote_store>(settings.remote_directory);
    } else if (settings.backend == "sftp") {
#if MEDIA_FETCH_HAS_SFTP
        sftp_options options;
        options.host = settings.host;
        options.port = settings.port;
        options.user = settings.user;
        options.password = settings.password;
        if (auto ok = options.validate(); !ok) {
            return unexpected(ok.error());
        }
        store = std::make_shared<sftp_remote_store>(std::move(options));
#else
        return unexpected(error{error_code::config_invalid,
                                "this build has no SFTP support; use REMOTE_BACKEND=local"});
#endif
    } else {
        return unexpected(error{error_code::config_invalid,
                                "unknown remote backend '" + settings.backend + "'"});
    }

    if (settings.max_sessions > 0) {
        MF_LOG_DEBUG(log_category::remote,
                     "Limiting remote sessions to " + std::to_string(settings.max_sessions));
        store = std::make_shared<limited_remote_store>(
            std::move(store), std::make_shared<session_limiter>(settings.max_sessions));
    }
    return store;
}

auto media_pipeline::run() -> result<run_summary> {
    run_summary summary;
    MF_LOG_INFO(log_category::app, "Starting media_fetch run");

    if (auto ok = prepare_staging(); !ok) {
        MF_LOG_ERROR(log_category::app, ok.error().message);
        return unexpected(ok.error());
    }

    if (!config_.remote.move_local) {
        if (auto ok = fetch(summary); !ok) {
            MF_LOG_ERROR(log_category::app, ok.error().message);
            return unexpected(ok.error());
        }
    } else {
        MF_LOG_INFO(log_category::app, "MOVELOCAL=ON, skipping remote transfer");
    }

    process_staging(summary);

    MF_LOG_INFO(log_category::app, "Run finished: " + summary.to_string());
    return summary;
}

auto media_pipeline::prepare_staging() -> result<void> {
    const auto& staging = config_.transfer.staging_dir;
    std::error_code ec;

    if (config_.remote.move_local) {
        if (!std::filesystem::is_directory(staging, ec)) {
            return unexpected(error{error_code::config_invalid,
                                    "local temp directory not found: " + staging.string()});
        }
    } else {
        std::filesystem::create_directories(staging, ec);
        if (ec) {
            return unexpected(error{error_code::config_invalid,
                                    "cannot create staging directory " + staging.string() +
                                        ": " + ec.message()});
        }
    }

    auto purged = purge_in_flight();
    if (purged > 0) {
        MF_LOG_INFO(log_category::app,
                    "Purged " + std::to_string(purged) + " in-flight file(s) from staging");
    }
    return {};
}

auto media_pipeline::purge_in_flight() -> std::size_t {
    std::size_t removed = 0;
    std::error_code ec;
    std::filesystem::directory_iterator it(config_.transfer.staging_dir, ec);
    if (ec) {
        return 0;
    }

    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) continue;
        if (!is_in_flight_name(entry.path().filename().string())) continue;

        if (std::filesystem::remove(entry.path(), entry_ec)) {
            ++removed;
        } else if (entry_ec) {
            MF_LOG_WARN(log_category::app,
                        "Cannot remove " + entry.path().string() + ": " + entry_ec.message());
        }
    }
    return removed;
}

auto media_pipeline::remote_directory() const -> std::string {
    // The local backend is rooted at REMOTEPATCH already
    return config_.remote.backend == "local" ? std::string{} : config_.remote.remote_directory;
}

auto media_pipeline::fetch(run_summary& summary) -> result<void> {
    if (!store_) {
        return unexpected(error{error_code::internal_error, "no remote store configured"});
    }

    std::vector<remote_file> listing;
    {
        auto session = store_->open_session();
        if (!session) {
            return unexpected(session.error());
        }

        auto listed = session.value()->list(remote_directory());
        if (!listed) {
            return unexpected(listed.error());
        }
        listing = std::move(listed.value());
    }

    MF_LOG_INFO(log_category::remote,
                "Listed " + std::to_string(listing.size()) + " remote file(s) via " +
                    std::string(store_->name()));

    engine_config engine_cfg;
    engine_cfg.remote_directory = remote_directory();
    engine_cfg.chunking = config_.transfer.chunking;
    engine_cfg.cancel_flag = cancel_flag_;

    scheduler_config scheduler_cfg;
    scheduler_cfg.groups = config_.groups;
    scheduler_cfg.max_concurrent_transfers = config_.transfer.max_concurrent_transfers;
    scheduler_cfg.staging_dir = config_.transfer.staging_dir;

    auto engine = std::make_shared<chunked_transfer_engine>(store_, std::move(engine_cfg));
    transfer_scheduler scheduler(std::move(engine), std::move(scheduler_cfg));

    auto batch = scheduler.run(listing);
    summary.transferred += batch.succeeded.size();
    summary.transfer_failed += batch.failed.size();
    return {};
}

auto media_pipeline::cancelled() const -> bool {
    return cancel_flag_ != nullptr && cancel_flag_->load(std::memory_order_relaxed);
}

void media_pipeline::process_staging(run_summary& summary) {
    std::vector<std::filesystem::path> files;

    std::error_code ec;
    std::filesystem::directory_iterator it(config_.transfer.staging_dir, ec);
    if (ec) {
        MF_LOG_ERROR(log_category::app,
                     "Cannot read staging directory " +
                         config_.transfer.staging_dir.string() + ": " + ec.message());
        return;
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (entry.is_regular_file(entry_ec)) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    std::set<std::string> attempted;
    for (const auto& file : files) {
        if (cancelled()) {
            MF_LOG_WARN(log_category::app, "Cancelled, leaving remaining files in staging");
            break;
        }

        auto name = file.filename().string();
        if (is_in_flight_name(name) || !attempted.insert(name).second) {
            continue;
        }
        process_file(file, summary);
    }
}

void media_pipeline::process_file(const std::filesystem::path& file, run_summary& summary) {
    const auto name = file.filename().string();

    std::error_code ec;
    const auto size = std::filesystem::file_size(file, ec);
    if (ec || size == 0) {
        MF_LOG_WARN(log_category::app, "Skipping empty file: " + name);
        ++summary.skipped_empty;
        return;
    }

    auto outcome = classifier_.classify(name);
    if (!outcome.is_placeable()) {
        transfer_log_context log_ctx;
        log_ctx.filename = name;
        log_ctx.stage = "classify";
        log_ctx.error_message = outcome.err ? outcome.err->message : "not placeable";

        if (!outcome.matched) {
            MF_LOG_INFO_CTX(log_category::classify, "No series rule matches", log_ctx);
            ++summary.unmatched;
        } else {
            MF_LOG_ERROR_CTX(log_category::classify, "Classification failed", log_ctx);
            ++summary.classification_failed;
        }
        return;
    }

    auto placed = placer_->place(file, outcome);
    if (!placed) {
        ++summary.placement_failed;
        return;
    }
    ++summary.placed;

    auto patched = patcher_.patch(placed.value().parent_path(), placed.value(),
                                  outcome.ruleset_source);
    if (!patched) {
        ++summary.patch_failed;
    } else if (patched.value() == patch_status::patched) {
        ++summary.patched;
    }
}

}  // namespace kcenon::media_fetch
