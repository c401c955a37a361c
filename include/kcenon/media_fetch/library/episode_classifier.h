/**
 * @file episode_classifier.h
 * @brief Series matching and episode-number extraction
 */

#ifndef KCENON_MEDIA_FETCH_LIBRARY_EPISODE_CLASSIFIER_H
#define KCENON_MEDIA_FETCH_LIBRARY_EPISODE_CLASSIFIER_H

#include <kcenon/media_fetch/library/library_types.h>

#include <optional>
#include <string>
#include <string_view>

namespace kcenon::media_fetch {

/**
 * @brief Episode number and extension found in a file name
 */
struct episode_match {
    std::string episode;
    std::string extension;
};

/**
 * @brief Maps file names to series, season and episode
 *
 * Classification is a pure function of the name and the table: the same
 * name always produces the same outcome.
 *
 * Recognized forms (first occurrence wins):
 * - "<...> 01 (annotation)<...>.ext" or "<...> 01 [annotation]<...>.ext"
 * - "<...> 01.ext"
 */
class episode_classifier {
public:
    /**
     * @brief Construct classifier over a series table
     * @param rules Table in priority order
     * @param rename_enabled Produce "SxxEyy.ext" names instead of keeping the original
     */
    episode_classifier(series_table rules, bool rename_enabled);

    /**
     * @brief Classify one file name
     */
    [[nodiscard]] auto classify(std::string_view file_name) const -> placement_outcome;

    /**
     * @brief Classify one file name against a table
     */
    [[nodiscard]] static auto classify(std::string_view file_name,
                                       const series_table& rules,
                                       bool rename_enabled) -> placement_outcome;

    /**
     * @brief Extract the episode number and extension
     * @return nullopt when neither recognized form is present
     */
    [[nodiscard]] static auto extract_episode(std::string_view file_name)
        -> std::optional<episode_match>;

    /**
     * @brief Build the renamed file name
     * @return "S<season, 2 digits>E<episode><extension>"
     */
    [[nodiscard]] static auto format_target_name(int season,
                                                 std::string_view episode,
                                                 std::string_view extension) -> std::string;

    [[nodiscard]] auto rules() const -> const series_table& { return rules_; }

private:
    series_table rules_;
    bool rename_enabled_;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_LIBRARY_EPISODE_CLASSIFIER_H
