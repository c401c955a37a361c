/**
 * @file ruleset.h
 * @brief Subtitle text replacement rules
 */

#ifndef KCENON_MEDIA_FETCH_SUBTITLE_RULESET_H
#define KCENON_MEDIA_FETCH_SUBTITLE_RULESET_H

#include <kcenon/media_fetch/core/types.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::media_fetch {

/**
 * @brief One ordered (old, new) substitution
 */
struct replacement_rule {
    std::string old_text;
    std::string new_text;

    auto operator==(const replacement_rule&) const -> bool = default;
};

/// Ordered list of substitutions scoped to one destination directory
using ruleset = std::vector<replacement_rule>;

/**
 * @brief Parse and validate ruleset text
 *
 * Each non-blank line (surrounding whitespace ignored) must contain exactly
 * one '|' with non-empty text on both sides.
 *
 * @return Rules in file order, or invalid_ruleset naming the first bad line
 */
[[nodiscard]] auto parse_ruleset(std::string_view text) -> result<ruleset>;

/**
 * @brief Load a ruleset file with decode-with-fallback
 */
[[nodiscard]] auto load_ruleset(const std::filesystem::path& path) -> result<ruleset>;

/**
 * @brief Built-in stutter and line-break normalizations, in application order
 */
[[nodiscard]] auto standard_replacements()
    -> const std::vector<std::pair<std::string, std::string>>&;

/**
 * @brief Apply the built-in normalizations as plain substring replacement
 */
[[nodiscard]] auto apply_standard_replacements(std::string text) -> std::string;

/**
 * @brief Apply ruleset pairs in order, matching whole tokens only
 *
 * A word boundary is required on each side of old_text whose edge
 * character is a word character. A possessive "'s" or "’s" directly after
 * the match is kept after new_text.
 */
[[nodiscard]] auto apply_ruleset(std::string text, const ruleset& rules) -> std::string;

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_SUBTITLE_RULESET_H
