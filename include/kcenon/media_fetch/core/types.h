/**
 * @file types.h
 * @brief Core type definitions for media_fetch
 */

#ifndef KCENON_MEDIA_FETCH_CORE_TYPES_H
#define KCENON_MEDIA_FETCH_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::media_fetch {

/**
 * @brief Error codes for media_fetch operations
 *
 * Error code ranges:
 * - -100 to -119: Configuration and process errors (fatal to the run)
 * - -120 to -139: Transfer errors (per file)
 * - -140 to -149: Classification errors (per file)
 * - -150 to -159: Placement errors (per file)
 * - -160 to -179: Subtitle patch errors (per file)
 * - -200 to -219: Generic I/O and internal errors
 */
enum class error_code {
    success = 0,

    // Configuration and process errors
    config_not_found = -100,
    config_decode_error = -101,
    config_invalid = -102,
    instance_locked = -103,

    // Transfer errors
    connect_failed = -120,
    stat_failed = -121,
    segment_io_error = -122,
    size_mismatch = -123,
    remote_delete_failed = -124,
    transfer_cancelled = -125,
    list_failed = -126,

    // Classification errors
    no_rule_match = -140,
    no_episode_number = -141,

    // Placement errors
    destination_unwritable = -150,

    // Subtitle patch errors
    invalid_ruleset = -160,
    extract_failed = -161,
    remux_failed = -162,
    patch_commit_failed = -163,
    tool_launch_failed = -164,

    // Generic errors
    file_read_error = -200,
    file_write_error = -201,
    decode_error = -202,
    internal_error = -210,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::config_not_found:
            return "configuration file not found";
        case error_code::config_decode_error:
            return "configuration file could not be decoded";
        case error_code::config_invalid:
            return "invalid configuration";
        case error_code::instance_locked:
            return "another instance is running";
        case error_code::connect_failed:
            return "connection failed";
        case error_code::stat_failed:
            return "remote stat failed";
        case error_code::segment_io_error:
            return "segment I/O error";
        case error_code::size_mismatch:
            return "size mismatch";
        case error_code::remote_delete_failed:
            return "remote delete failed";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::list_failed:
            return "remote listing failed";
        case error_code::no_rule_match:
            return "no series rule matched";
        case error_code::no_episode_number:
            return "no episode number found";
        case error_code::destination_unwritable:
            return "destination unwritable";
        case error_code::invalid_ruleset:
            return "invalid ruleset";
        case error_code::extract_failed:
            return "subtitle extraction failed";
        case error_code::remux_failed:
            return "remux failed";
        case error_code::patch_commit_failed:
            return "patch commit failed";
        case error_code::tool_launch_failed:
            return "external tool could not be launched";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::decode_error:
            return "text decode error";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check whether an error aborts the whole run
 */
[[nodiscard]] constexpr auto is_fatal(error_code code) -> bool {
    switch (code) {
        case error_code::config_not_found:
        case error_code::config_decode_error:
        case error_code::config_invalid:
        case error_code::instance_locked:
        case error_code::list_failed:
            return true;
        default:
            return false;
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_CORE_TYPES_H
