/**
 * @file chunked_transfer_engine.cpp
 * @brief Implementation of the segmented transfer engine
 */

#include <kcenon/media_fetch/transfer/chunked_transfer_engine.h>

#include <kcenon/media_fetch/adapters/thread_pool_adapter.h>
#include <kcenon/media_fetch/core/checksum.h>
#include <kcenon/media_fetch/core/logging.h>
#include <kcenon/media_fetch/core/segment_assembler.h>

#include <algorithm>
#include <fstream>
#include <future>
#include <mutex>
#include <vector>

namespace kcenon::media_fetch {

namespace {

constexpr const char* segment_stage = "segment_download";

struct segment_job {
    segment range;
    bool bounded = true;  // false: single stream, read to end of file
    std::filesystem::path file;
};

}  // namespace

struct chunked_transfer_engine::impl {
    std::shared_ptr<remote_store> store;
    engine_config config;

    std::mutex observer_mutex;
    progress_observer observer;

    impl(std::shared_ptr<remote_store> s, engine_config c)
        : store(std::move(s)), config(std::move(c)) {}

    [[nodiscard]] auto cancelled() const -> bool {
        return config.cancel_flag != nullptr &&
               config.cancel_flag->load(std::memory_order_relaxed);
    }

    [[nodiscard]] auto current_observer() -> progress_observer {
        std::lock_guard lock(observer_mutex);
        return observer;
    }

    auto stat_remote(const std::string& path) -> result<uint64_t> {
        auto session = store->open_session();
        if (!session) {
            return unexpected(session.error());
        }
        return session.value()->stat(path);
    }

    auto download_segment(const std::string& remote_path,
                          const segment_job& job,
                          transfer_progress& progress) -> result<segment_record> {
        if (cancelled()) {
            return unexpected(error{error_code::transfer_cancelled,
                                    "cancelled before segment " +
                                        std::to_string(job.range.index)});
        }

        auto session = store->open_session();
        if (!session) {
            return unexpected(session.error());
        }

        auto reader = session.value()->open_range(remote_path, job.range.start);
        if (!reader) {
            return unexpected(reader.error());
        }

        std::ofstream out(job.file, std::ios::binary | std::ios::trunc);
        if (!out) {
            return unexpected(error{error_code::segment_io_error,
                                    "cannot create segment file: " + job.file.string()});
        }

        std::vector<std::byte> buffer(config.buffer_size);
        uint64_t written = 0;
        uint32_t crc = 0;

        while (true) {
            if (cancelled()) {
                return unexpected(error{error_code::transfer_cancelled,
                                        "cancelled during segment " +
                                            std::to_string(job.range.index)});
            }

            std::size_t want = buffer.size();
            if (job.bounded) {
                uint64_t remaining = job.range.size() - written;
                if (remaining == 0) break;
                want = static_cast<std::size_t>(std::min<uint64_t>(want, remaining));
            }

            auto n = reader.value()->read(std::span<std::byte>(buffer.data(), want));
            if (!n) {
                return unexpected(error{error_code::segment_io_error,
                                        "segment " + std::to_string(job.range.index) +
                                            ": " + n.error().message});
            }
            if (n.value() == 0) {
                // End of file before the planned range end; verification decides
                break;
            }

            auto block = std::span<const std::byte>(buffer.data(), n.value());
            out.write(reinterpret_cast<const char*>(block.data()),
                      static_cast<std::streamsize>(block.size()));
            if (!out) {
                return unexpected(error{error_code::segment_io_error,
                                        "write failed: " + job.file.string()});
            }

            crc = checksum::crc32_update(crc, block);
            written += block.size();
            progress.add(block.size());
        }

        out.flush();
        if (!out) {
            return unexpected(error{error_code::segment_io_error,
                                    "flush failed: " + job.file.string()});
        }

        segment_record record;
        record.range = job.range;
        record.file = job.file;
        record.bytes_written = written;
        record.crc32 = crc;
        return record;
    }
};

chunked_transfer_engine::chunked_transfer_engine(std::shared_ptr<remote_store> store,
                                                 engine_config config)
    : impl_(std::make_unique<impl>(std::move(store), std::move(config))) {}

chunked_transfer_engine::~chunked_transfer_engine() = default;

chunked_transfer_engine::chunked_transfer_engine(chunked_transfer_engine&&) noexcept = default;

auto chunked_transfer_engine::operator=(chunked_transfer_engine&&) noexcept
    -> chunked_transfer_engine& = default;

void chunked_transfer_engine::on_progress(progress_observer observer) {
    std::lock_guard lock(impl_->observer_mutex);
    impl_->observer = std::move(observer);
}

auto chunked_transfer_engine::config() const -> const engine_config& {
    return impl_->config;
}

auto chunked_transfer_engine::transfer(const remote_file& file,
                                       const std::filesystem::path& destination_dir)
    -> result<transfer_report> {
    const auto start_time = std::chrono::steady_clock::now();
    const auto remote_path = join_remote_path(impl_->config.remote_directory, file.name);

    transfer_log_context log_ctx;
    log_ctx.filename = file.name;
    log_ctx.stage = "transfer";

    auto fail = [&](const error& err, const char* what) -> result<transfer_report> {
        log_ctx.error_message = err.message;
        MF_LOG_ERROR_CTX(log_category::transfer, what, log_ctx);
        return unexpected(err);
    };

    std::error_code ec;
    std::filesystem::create_directories(destination_dir, ec);
    if (ec) {
        return fail(error{error_code::file_write_error,
                          "cannot create directory " + destination_dir.string() + ": " +
                              ec.message()},
                    "Transfer failed: staging directory unavailable");
    }

    // Fresh stat immediately before planning; the listed size is ignored
    auto stat = impl_->stat_remote(remote_path);
    if (!stat) {
        return fail(stat.error(), "Transfer failed: remote stat error");
    }
    const uint64_t size = stat.value();
    log_ctx.file_size = size;

    std::vector<segment_job> jobs;
    if (impl_->config.chunking.should_split(size)) {
        for (const auto& seg : plan_segments(size, impl_->config.chunking.chunk_count)) {
            jobs.push_back({seg, true, destination_dir / segment_file_name(file.name, seg.index)});
        }
    } else {
        jobs.push_back({segment{0, 0, size}, false,
                        destination_dir / segment_file_name(file.name, 0)});
    }
    log_ctx.total_chunks = static_cast<uint32_t>(jobs.size());

    MF_LOG_INFO_CTX(log_category::transfer, "Starting transfer", log_ctx);

    transfer_progress progress(file.name, size, impl_->current_observer());
    segment_assembler assembler(destination_dir / file.name, size,
                                static_cast<uint32_t>(jobs.size()));

    std::vector<result<segment_record>> outcomes(jobs.size());

    if (jobs.size() == 1) {
        outcomes[0] = impl_->download_segment(remote_path, jobs[0], progress);
    } else {
        auto pool = adapters::transfer_pool_factory::create(jobs.size(),
                                                            "segments:" + file.name);
        std::vector<std::future<void>> futures;
        futures.reserve(jobs.size());

        for (std::size_t i = 0; i < jobs.size(); ++i) {
            futures.push_back(pool->submit_to_stage(
                [this, &remote_path, &jobs, &outcomes, &progress, i] {
                    outcomes[i] = impl_->download_segment(remote_path, jobs[i], progress);
                },
                segment_stage));
        }

        // Wait for every segment, even after a failure
        for (std::size_t i = 0; i < futures.size(); ++i) {
            try {
                futures[i].get();
            } catch (const std::exception& e) {
                outcomes[i] = unexpected(error{error_code::segment_io_error,
                                               std::string("segment worker threw: ") +
                                                   e.what()});
            }
        }
    }

    std::optional<error> first_error;
    for (std::size_t i = 0; i < outcomes.size(); ++i) {
        auto& outcome = outcomes[i];
        if (outcome) {
            auto added = assembler.add_segment(std::move(outcome.value()));
            if (!added && !first_error) {
                first_error = added.error();
            }
            continue;
        }

        transfer_log_context seg_ctx = log_ctx;
        seg_ctx.chunk_index = jobs[i].range.index;
        seg_ctx.error_message = outcome.error().message;
        MF_LOG_WARN_CTX(log_category::chunk, "Segment failed", seg_ctx);

        if (!first_error || outcome.error().code == error_code::transfer_cancelled) {
            first_error = outcome.error();
        }
    }

    if (first_error) {
        assembler.discard();
        for (const auto& job : jobs) {
            std::filesystem::remove(job.file, ec);
        }
        return fail(*first_error, "Transfer failed");
    }

    auto assembled = assembler.finalize();
    if (!assembled) {
        return fail(assembled.error(), "Transfer failed: verification error");
    }

    transfer_report report;
    report.name = file.name;
    report.local_path = assembled.value().path;
    report.bytes = assembled.value().bytes;
    report.sha256 = assembled.value().sha256;
    report.segments = static_cast<uint32_t>(jobs.size());

    // Commit: the local copy is verified, the remote copy may go
    auto session = impl_->store->open_session();
    auto removed = session ? session.value()->remove(remote_path)
                           : result<void>(unexpected(session.error()));
    if (removed) {
        report.remote_removed = true;
    } else {
        report.remote_delete_error = error{error_code::remote_delete_failed,
                                           removed.error().message};
        transfer_log_context warn_ctx = log_ctx;
        warn_ctx.error_message = removed.error().message;
        MF_LOG_WARN_CTX(log_category::transfer,
                        "Remote delete failed; local copy kept", warn_ctx);
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    log_ctx.bytes_transferred = report.bytes;
    log_ctx.duration_ms = static_cast<uint64_t>(report.duration.count());
    MF_LOG_INFO_CTX(log_category::transfer,
                    "Transfer completed (sha256 " + report.sha256 + ")", log_ctx);

    return report;
}

}  // namespace kcenon::media_fetch
