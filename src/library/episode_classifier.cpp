/**
 * @file episode_classifier.cpp
 * @brief Implementation of the episode classifier
 */

#include <kcenon/media_fetch/library/episode_classifier.h>

#include <kcenon/media_fetch/core/logging.h>

#include <iomanip>
#include <regex>
#include <sstream>

namespace kcenon::media_fetch {

namespace {

// Group 1: episode, group 2: extension (from the final dot)
const std::regex& episode_pattern() {
    static const std::regex pattern(
        R"(\s(\d{2})(?:\s(?:\(.*?\)|\[.*?\]).*)?(\.[^.]*)$)");
    return pattern;
}

}  // namespace

episode_classifier::episode_classifier(series_table rules, bool rename_enabled)
    : rules_(std::move(rules)), rename_enabled_(rename_enabled) {}

auto episode_classifier::classify(std::string_view file_name) const -> placement_outcome {
    return classify(file_name, rules_, rename_enabled_);
}

auto episode_classifier::classify(std::string_view file_name,
                                  const series_table& rules,
                                  bool rename_enabled) -> placement_outcome {
    placement_outcome outcome;
    outcome.source_name = std::string(file_name);

    const series_rule* rule = nullptr;
    for (const auto& candidate : rules) {
        if (!candidate.match.empty() && file_name.find(candidate.match) != std::string_view::npos) {
            rule = &candidate;
            break;
        }
    }

    if (!rule) {
        outcome.err = error{error_code::no_rule_match,
                            "no series rule matches " + outcome.source_name};
        return outcome;
    }

    outcome.matched = true;
    outcome.folder = rule->folder;
    outcome.season = rule->season;
    outcome.ruleset_source = rule->ruleset_source;

    auto found = extract_episode(file_name);
    if (!found) {
        outcome.err = error{error_code::no_episode_number,
                            "no episode number in " + outcome.source_name};
        return outcome;
    }

    outcome.episode = found->episode;
    outcome.extension = found->extension;
    outcome.target_name = rename_enabled
        ? format_target_name(rule->season, found->episode, found->extension)
        : outcome.source_name;
    outcome.destination_path = std::filesystem::path(rule->folder) /
                               ("Season " + std::to_string(rule->season)) /
                               outcome.target_name;

    MF_LOG_DEBUG(log_category::classify,
                 outcome.source_name + " -> " + outcome.destination_path->string());
    return outcome;
}

auto episode_classifier::extract_episode(std::string_view file_name)
    -> std::optional<episode_match> {
    const std::string name(file_name);
    std::smatch match;
    if (!std::regex_search(name, match, episode_pattern())) {
        return std::nullopt;
    }

    episode_match result;
    result.episode = match[1].str();
    result.extension = match[2].str();
    return result;
}

auto episode_classifier::format_target_name(int season,
                                            std::string_view episode,
                                            std::string_view extension) -> std::string {
    std::ostringstream oss;
    oss << 'S' << std::setw(2) << std::setfill('0') << season << 'E' << episode << extension;
    return oss.str();
}

}  // namespace kcenon::media_fetch
