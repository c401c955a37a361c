/**
 * @file app_config.h
 * @brief Typed application configuration loaded from the config directory
 */

#ifndef KCENON_MEDIA_FETCH_APP_APP_CONFIG_H
#define KCENON_MEDIA_FETCH_APP_APP_CONFIG_H

#include <kcenon/media_fetch/core/chunk_plan.h>
#include <kcenon/media_fetch/core/logging.h>
#include <kcenon/media_fetch/core/types.h>
#include <kcenon/media_fetch/library/library_types.h>
#include <kcenon/media_fetch/subtitle/subtitle_patch_pipeline.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::media_fetch {

/**
 * @brief Remote server settings
 */
struct remote_settings {
    /// "sftp" or "local"
    std::string backend = "sftp";

    std::string host;
    uint16_t port = 22;
    std::string user;
    std::string password;

    /// Remote source directory (REMOTEPATCH)
    std::string remote_directory;

    /// Simultaneous remote sessions, 0 for unlimited
    std::size_t max_sessions = 0;

    /// Skip the transfer phase and process the staging directory only
    bool move_local = false;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Download settings
 */
struct transfer_settings {
    chunk_policy chunking;
    std::size_t max_concurrent_transfers = 5;

    /// Staging directory (LOCALTEMP)
    std::filesystem::path staging_dir;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Library layout settings
 */
struct library_settings {
    /// Library root (LOCALPATCH)
    std::filesystem::path library_root;
    bool rename = true;
    bool save_ledger = false;
    series_table series;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Subtitle patch settings
 */
struct subtitle_settings {
    patch_config patch;

    [[nodiscard]] auto validate() const -> result<void> { return patch.validate(); }
};

/**
 * @brief Logging settings
 */
struct logging_settings {
    log_level level = log_level::info;
    log_output_format format = log_output_format::text;
    bool mask_sensitive = false;
};

/**
 * @brief Complete configuration of one run
 *
 * Loaded from three files in the config directory:
 * - media_fetch.conf: KEY=VALUE settings
 * - groups.list: one release-group tag per line
 * - series.list: "match|folder|season[|ruleset]" rows
 */
struct app_config {
    static constexpr std::string_view config_filename = "media_fetch.conf";
    static constexpr std::string_view groups_filename = "groups.list";
    static constexpr std::string_view series_filename = "series.list";

    std::filesystem::path config_dir;
    remote_settings remote;
    transfer_settings transfer;
    library_settings library;
    subtitle_settings subtitle;
    logging_settings logging;
    std::vector<std::string> groups;

    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Load and validate the configuration in a directory
     * @return Configuration, or config_not_found / config_decode_error /
     *         config_invalid
     */
    [[nodiscard]] static auto load(const std::filesystem::path& dir) -> result<app_config>;
};

/**
 * @brief Parse KEY=VALUE lines
 *
 * Keys and values are trimmed, the value may contain '='. Blank lines,
 * lines starting with '#' and lines without '=' are ignored. A later
 * duplicate key overrides an earlier one.
 */
[[nodiscard]] auto parse_key_values(std::string_view text) -> std::map<std::string, std::string>;

/**
 * @brief Parse an ON/OFF switch, case-insensitive
 */
[[nodiscard]] auto parse_switch(std::string_view value) -> std::optional<bool>;

/**
 * @brief Parse the groups list: every non-blank trimmed line is a tag
 */
[[nodiscard]] auto parse_groups(std::string_view text) -> std::vector<std::string>;

/**
 * @brief Parse the series table
 *
 * Lines without '|' are ignored. A line with '|' must have three or four
 * fields with a positive integer season. A relative ruleset path is taken
 * relative to base_dir.
 *
 * @return Rows in file order, or config_invalid naming the line
 */
[[nodiscard]] auto parse_series_table(std::string_view text,
                                      const std::filesystem::path& base_dir)
    -> result<series_table>;

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_APP_APP_CONFIG_H
