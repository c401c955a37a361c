/**
 * @file ruleset.cpp
 * @brief Implementation of subtitle replacement rules
 */

#include <kcenon/media_fetch/subtitle/ruleset.h>

#include <kcenon/media_fetch/core/text_decoder.h>

#include <algorithm>
#include <cctype>
#include <regex>

namespace kcenon::media_fetch {

namespace {

auto trim(std::string_view s) -> std::string_view {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

auto is_word_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

auto escape_regex(std::string_view literal) -> std::string {
    static constexpr std::string_view special = R"(\^$.|?*+()[]{})";
    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char c : literal) {
        if (special.find(c) != std::string_view::npos) {
            escaped += '\\';
        }
        escaped += c;
    }
    return escaped;
}

auto replace_all(std::string text, std::string_view from, std::string_view to) -> std::string {
    if (from.empty()) return text;

    std::string out;
    out.reserve(text.size());
    std::size_t pos = 0;
    while (true) {
        auto hit = text.find(from, pos);
        if (hit == std::string::npos) break;
        out.append(text, pos, hit - pos);
        out.append(to);
        pos = hit + from.size();
    }
    out.append(text, pos, std::string::npos);
    return out;
}

auto token_pattern(const replacement_rule& rule) -> std::regex {
    std::string pattern;
    if (is_word_char(rule.old_text.front())) pattern += R"(\b)";
    pattern += escape_regex(rule.old_text);
    if (is_word_char(rule.old_text.back())) pattern += R"(\b)";
    // Possessive marker: ASCII apostrophe or U+2019
    pattern += "('s|\xE2\x80\x99s)?";
    return std::regex(pattern);
}

}  // namespace

auto parse_ruleset(std::string_view text) -> result<ruleset> {
    ruleset rules;
    std::size_t line_number = 0;

    while (!text.empty() || line_number == 0) {
        ++line_number;
        auto eol = text.find('\n');
        auto line = trim(text.substr(0, eol));
        text = (eol == std::string_view::npos) ? std::string_view{} : text.substr(eol + 1);

        if (line.empty()) {
            if (text.empty()) break;
            continue;
        }

        auto sep = line.find('|');
        if (sep == std::string_view::npos || line.find('|', sep + 1) != std::string_view::npos) {
            return unexpected(error{error_code::invalid_ruleset,
                                    "line " + std::to_string(line_number) +
                                        ": expected exactly one '|' separator"});
        }

        auto old_text = line.substr(0, sep);
        auto new_text = line.substr(sep + 1);
        if (old_text.empty() || new_text.empty()) {
            return unexpected(error{error_code::invalid_ruleset,
                                    "line " + std::to_string(line_number) +
                                        ": empty field"});
        }

        rules.push_back({std::string(old_text), std::string(new_text)});
    }

    return rules;
}

auto load_ruleset(const std::filesystem::path& path) -> result<ruleset> {
    auto text = read_text_file(path);
    if (!text) {
        return unexpected(text.error());
    }

    auto parsed = parse_ruleset(text.value().text);
    if (!parsed) {
        return unexpected(error{error_code::invalid_ruleset,
                                path.filename().string() + " " + parsed.error().message});
    }
    return parsed;
}

auto standard_replacements() -> const std::vector<std::pair<std::string, std::string>>& {
    static const std::vector<std::pair<std::string, std::string>> replacements = [] {
        std::vector<std::pair<std::string, std::string>> list = {
            {"Wh-wh", "W-Wh"}, {"Wh-Wh", "W-Wh"}, {"Th-th", "T-Th"}, {"Th-Th", "T-Th"}};

        // Single-letter stutters: "A-a" -> "A-A" (no V or X)
        for (char c = 'A'; c <= 'Z'; ++c) {
            if (c == 'V' || c == 'X') continue;
            std::string from{c, '-', static_cast<char>(std::tolower(c))};
            std::string to{c, '-', c};
            list.emplace_back(std::move(from), std::move(to));
        }

        list.emplace_back(R"(\N)", R"(\N )");
        list.emplace_back(R"(\h)", R"(\h )");
        return list;
    }();
    return replacements;
}

auto apply_standard_replacements(std::string text) -> std::string {
    for (const auto& [from, to] : standard_replacements()) {
        text = replace_all(std::move(text), from, to);
    }
    return text;
}

auto apply_ruleset(std::string text, const ruleset& rules) -> std::string {
    for (const auto& rule : rules) {
        if (rule.old_text.empty()) continue;

        const auto pattern = token_pattern(rule);

        std::string out;
        out.reserve(text.size());
        auto last = text.cbegin();
        for (std::sregex_iterator it(text.cbegin(), text.cend(), pattern), end; it != end; ++it) {
            const auto& match = *it;
            out.append(last, match[0].first);
            out += rule.new_text;
            if (match[1].matched) {
                out.append(match[1].first, match[1].second);
            }
            last = match[0].second;
        }
        out.append(last, text.cend());
        text = std::move(out);
    }
    return text;
}

}  // namespace kcenon::media_fetch
