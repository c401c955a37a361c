/**
 * @file library_types.h
 * @brief Series rules and placement outcomes
 */

#ifndef KCENON_MEDIA_FETCH_LIBRARY_LIBRARY_TYPES_H
#define KCENON_MEDIA_FETCH_LIBRARY_LIBRARY_TYPES_H

#include <kcenon/media_fetch/core/types.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::media_fetch {

/**
 * @brief One row of the series table
 */
struct series_rule {
    /// Substring that must occur in the file name
    std::string match;

    /// Destination folder under the library root
    std::string folder;

    /// Season number (positive)
    int season = 1;

    /// Ruleset file used instead of "<destination>/replace.txt"
    std::optional<std::filesystem::path> ruleset_source;

    [[nodiscard]] auto validate() const -> result<void> {
        if (match.empty()) {
            return unexpected(error{error_code::config_invalid, "series match is empty"});
        }
        if (folder.empty()) {
            return unexpected(error{error_code::config_invalid,
                                    "series folder is empty for '" + match + "'"});
        }
        if (season < 1) {
            return unexpected(error{error_code::config_invalid,
                                    "season must be positive for '" + match + "'"});
        }
        return {};
    }
};

/// Ordered series table; the first matching rule wins
using series_table = std::vector<series_rule>;

/**
 * @brief Result of classifying one file name
 */
struct placement_outcome {
    /// A series rule matched the name
    bool matched = false;

    /// Two-digit episode number as it appears in the name
    std::optional<std::string> episode;

    /// "<folder>/Season <n>/<target_name>", relative to the library root
    std::optional<std::filesystem::path> destination_path;

    /// no_rule_match or no_episode_number
    std::optional<error> err;

    std::string source_name;
    std::string folder;
    int season = 0;
    std::string extension;
    std::string target_name;
    std::optional<std::filesystem::path> ruleset_source;

    [[nodiscard]] auto is_placeable() const noexcept -> bool {
        return matched && !err && destination_path.has_value();
    }
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_LIBRARY_LIBRARY_TYPES_H
