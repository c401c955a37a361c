/**
 * @file library_placer.cpp
 * @brief Implementation of the library placer
 */

#include <kcenon/media_fetch/library/library_placer.h>

#include <kcenon/media_fetch/core/logging.h>

#include <cerrno>
#include <fstream>
#include <system_error>

namespace kcenon::media_fetch {

namespace {

constexpr std::string_view placing_suffix = ".mfplace";

auto unwritable(const std::string& message) -> unexpected {
    return unexpected(error{error_code::destination_unwritable, message});
}

}  // namespace

library_placer::library_placer(placer_config config) : config_(std::move(config)) {}

auto library_placer::destination_directory(const placement_outcome& outcome) const
    -> std::filesystem::path {
    return config_.library_root / outcome.folder / ("Season " + std::to_string(outcome.season));
}

auto library_placer::place(const std::filesystem::path& local_file,
                           const placement_outcome& outcome) -> result<std::filesystem::path> {
    transfer_log_context log_ctx;
    log_ctx.filename = outcome.source_name;
    log_ctx.stage = "place";

    auto fail = [&](const error& err) -> result<std::filesystem::path> {
        log_ctx.error_message = err.message;
        MF_LOG_ERROR_CTX(log_category::placement, "Placement failed", log_ctx);
        return unexpected(err);
    };

    if (!outcome.is_placeable()) {
        return fail(error{error_code::internal_error,
                          "outcome of " + outcome.source_name + " is not placeable"});
    }

    const auto directory = destination_directory(outcome);
    const auto destination = directory / outcome.target_name;

    std::error_code ec;
    std::filesystem::create_directories(directory, ec);
    if (ec) {
        return fail(error{error_code::destination_unwritable,
                          "cannot create " + directory.string() + ": " + ec.message()});
    }

    if (std::filesystem::exists(destination, ec)) {
        std::filesystem::remove(destination, ec);
        if (ec) {
            return fail(error{error_code::destination_unwritable,
                              "cannot replace " + destination.string() + ": " + ec.message()});
        }
        MF_LOG_INFO(log_category::placement, "Replacing existing " + destination.string());
    }

    auto moved = move_file(local_file, destination);
    if (!moved) {
        return fail(moved.error());
    }

    MF_LOG_INFO(log_category::placement,
                "Moved " + outcome.source_name + " to " + destination.string());

    if (config_.save_ledger) {
        auto ledger = append_ledger(directory, outcome);
        if (!ledger) {
            // The file is already placed; a ledger failure is reported only
            MF_LOG_WARN(log_category::placement, ledger.error().message);
        }
    }

    return destination;
}

auto library_placer::move_file(const std::filesystem::path& from,
                               const std::filesystem::path& to) -> result<void> {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return {};
    }
    if (ec != std::errc::cross_device_link) {
        return unwritable("cannot move " + from.string() + " to " + to.string() + ": " +
                          ec.message());
    }

    // Different filesystem: copy beside the target, then rename into place
    auto temp = to;
    temp += placing_suffix;

    std::filesystem::copy_file(from, temp, std::filesystem::copy_options::overwrite_existing,
                               ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temp, cleanup);
        return unwritable("cannot copy " + from.string() + " to " + temp.string() + ": " +
                          ec.message());
    }

    std::filesystem::rename(temp, to, ec);
    if (ec) {
        std::error_code cleanup;
        std::filesystem::remove(temp, cleanup);
        return unwritable("cannot rename " + temp.string() + ": " + ec.message());
    }

    std::filesystem::remove(from, ec);
    if (ec) {
        MF_LOG_WARN(log_category::placement,
                    "Placed copy but cannot remove source " + from.string() + ": " +
                        ec.message());
    }
    return {};
}

auto library_placer::append_ledger(const std::filesystem::path& directory,
                                   const placement_outcome& outcome) -> result<void> {
    std::lock_guard lock(ledger_mutex_);

    const auto path = directory / std::string(placer_config::ledger_filename);
    std::ofstream ledger(path, std::ios::binary | std::ios::app);
    if (!ledger) {
        return unexpected(error{error_code::file_write_error,
                                "cannot open ledger " + path.string()});
    }

    ledger << outcome.source_name << " (" << outcome.target_name << ")\n";
    ledger.flush();
    if (!ledger) {
        return unexpected(error{error_code::file_write_error,
                                "cannot append to ledger " + path.string()});
    }
    return {};
}

}  // namespace kcenon::media_fetch
