/**
 * @file app_config.cpp
 * @brief Implementation of configuration loading
 */

#include <kcenon/media_fetch/app/app_config.h>

#include <kcenon/media_fetch/core/text_decoder.h>
#include <kcenon/media_fetch/subtitle/tool_runner.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace kcenon::media_fetch {

namespace {

auto trim(std::string_view s) -> std::string_view {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

auto to_lower(std::string_view s) -> std::string {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template <typename Fn>
void for_each_line(std::string_view text, Fn&& fn) {
    std::size_t line_number = 0;
    while (!text.empty()) {
        ++line_number;
        auto eol = text.find('\n');
        fn(line_number, trim(text.substr(0, eol)));
        if (eol == std::string_view::npos) break;
        text.remove_prefix(eol + 1);
    }
}

auto split(std::string_view line, char separator) -> std::vector<std::string_view> {
    std::vector<std::string_view> fields;
    while (true) {
        auto pos = line.find(separator);
        fields.push_back(line.substr(0, pos));
        if (pos == std::string_view::npos) break;
        line.remove_prefix(pos + 1);
    }
    return fields;
}

auto invalid(const std::string& message) -> unexpected {
    return unexpected(error{error_code::config_invalid, message});
}

template <typename T>
auto parse_number(std::string_view value, T& out) -> bool {
    value = trim(value);
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    return ec == std::errc{} && ptr == value.data() + value.size();
}

/**
 * @brief Typed accessors over the parsed key/value map
 */
class settings_reader {
public:
    explicit settings_reader(std::map<std::string, std::string> values)
        : values_(std::move(values)) {}

    [[nodiscard]] auto get(const std::string& key) const -> std::optional<std::string> {
        auto it = values_.find(key);
        if (it == values_.end()) return std::nullopt;
        return it->second;
    }

    [[nodiscard]] auto get_or(const std::string& key, std::string fallback) const
        -> std::string {
        auto value = get(key);
        return value && !value->empty() ? *value : std::move(fallback);
    }

    [[nodiscard]] auto get_switch(const std::string& key, bool fallback) const -> result<bool> {
        auto value = get(key);
        if (!value || value->empty()) return fallback;
        auto parsed = parse_switch(*value);
        if (!parsed) {
            return invalid(key + " must be ON or OFF, got '" + *value + "'");
        }
        return *parsed;
    }

    template <typename T>
    [[nodiscard]] auto get_number(const std::string& key, T fallback) const -> result<T> {
        auto value = get(key);
        if (!value || value->empty()) return fallback;
        T parsed{};
        if (!parse_number(*value, parsed)) {
            return invalid(key + " is not a valid number: '" + *value + "'");
        }
        return parsed;
    }

private:
    std::map<std::string, std::string> values_;
};

auto read_config_file(const std::filesystem::path& path) -> result<std::string> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(error{error_code::config_not_found,
                                "file not found: " + path.string()});
    }

    auto decoded = read_text_file(path);
    if (!decoded) {
        return unexpected(error{error_code::config_decode_error,
                                path.filename().string() + ": " + decoded.error().message});
    }

    MF_LOG_DEBUG(log_category::config,
                 "Read " + path.filename().string() + " as " + decoded.value().encoding);
    return std::move(decoded.value().text);
}

auto resolve_tool(const settings_reader& reader,
                  const std::string& key,
                  std::string_view default_name,
                  const std::filesystem::path& config_dir) -> std::filesystem::path {
    auto configured = reader.get(key);
    const std::string name = configured && !configured->empty() ? *configured
                                                                : std::string(default_name);

    if (auto found = locate_executable(name, config_dir)) {
        return *found;
    }

    MF_LOG_WARN(log_category::config,
                "Cannot find " + name + " on PATH or in " + config_dir.string());
    return std::filesystem::path(name);
}

auto apply_remote(const settings_reader& reader, remote_settings& remote) -> result<void> {
    remote.backend = to_lower(reader.get_or("REMOTE_BACKEND", remote.backend));
    remote.host = reader.get_or("HOST", "");
    remote.user = reader.get_or("USER", "");
    remote.password = reader.get_or("PASSWORD", "");
    remote.remote_directory = reader.get_or("REMOTEPATCH", "");

    auto port = reader.get_number<uint16_t>("PORT", remote.port);
    if (!port) return unexpected(port.error());
    remote.port = port.value();

    auto sessions = reader.get_number<std::size_t>("MAX_SESSIONS", remote.max_sessions);
    if (!sessions) return unexpected(sessions.error());
    remote.max_sessions = sessions.value();

    auto move_local = reader.get_switch("MOVELOCAL", remote.move_local);
    if (!move_local) return unexpected(move_local.error());
    remote.move_local = move_local.value();
    return {};
}

auto apply_transfer(const settings_reader& reader,
                    const std::filesystem::path& dir,
                    transfer_settings& transfer) -> result<void> {
    auto chunks = reader.get_number<uint32_t>("CHUNKS", transfer.chunking.chunk_count);
    if (!chunks) return unexpected(chunks.error());
    transfer.chunking.chunk_count = chunks.value();

    auto use_chunks = reader.get_switch("USE_CHUNKS", transfer.chunking.use_chunks);
    if (!use_chunks) return unexpected(use_chunks.error());
    transfer.chunking.use_chunks = use_chunks.value();

    auto max_transfers =
        reader.get_number<std::size_t>("MAX_TRANSFERS", transfer.max_concurrent_transfers);
    if (!max_transfers) return unexpected(max_transfers.error());
    transfer.max_concurrent_transfers = max_transfers.value();

    transfer.staging_dir = reader.get_or("LOCALTEMP", (dir / "temp").string());
    return {};
}

auto apply_library(const settings_reader& reader, library_settings& library) -> result<void> {
    library.library_root = reader.get_or("LOCALPATCH", "");

    auto rename = reader.get_switch("RENAME", library.rename);
    if (!rename) return unexpected(rename.error());
    library.rename = rename.value();

    auto ledger = reader.get_switch("SAVEINFO", library.save_ledger);
    if (!ledger) return unexpected(ledger.error());
    library.save_ledger = ledger.value();
    return {};
}

auto apply_subtitle(const settings_reader& reader,
                    const std::filesystem::path& dir,
                    subtitle_settings& subtitle) -> result<void> {
    auto& patch = subtitle.patch;
    patch.extractor = resolve_tool(reader, "MKVEXTRACT", "mkvextract", dir);
    patch.remuxer = resolve_tool(reader, "MKVMERGE", "mkvmerge", dir);
    patch.track_name = reader.get_or("SUBTITLE_TRACK_NAME", patch.track_name);
    patch.language = reader.get_or("SUBTITLE_LANGUAGE", patch.language);

    auto track = reader.get_number<int>("SUBTITLE_TRACK", patch.track_index);
    if (!track) return unexpected(track.error());
    patch.track_index = track.value();

    auto warnings = reader.get_switch("ACCEPT_REMUX_WARNINGS", patch.accept_remux_warnings);
    if (!warnings) return unexpected(warnings.error());
    patch.accept_remux_warnings = warnings.value();
    return {};
}

auto apply_logging(const settings_reader& reader, logging_settings& logging) -> result<void> {
    if (auto level = reader.get("LOG_LEVEL"); level && !level->empty()) {
        auto parsed = log_level_from_string(*level);
        if (!parsed) {
            return invalid("LOG_LEVEL is not a log level: '" + *level + "'");
        }
        logging.level = *parsed;
    }

    const auto format = to_lower(reader.get_or("LOG_FORMAT", "text"));
    if (format == "text") {
        logging.format = log_output_format::text;
    } else if (format == "json") {
        logging.format = log_output_format::json;
    } else {
        return invalid("LOG_FORMAT must be text or json, got '" + format + "'");
    }

    auto mask = reader.get_switch("MASK_LOGS", logging.mask_sensitive);
    if (!mask) return unexpected(mask.error());
    logging.mask_sensitive = mask.value();
    return {};
}

}  // namespace

auto remote_settings::validate() const -> result<void> {
    if (move_local) {
        return {};
    }
    if (backend != "sftp" && backend != "local") {
        return invalid("REMOTE_BACKEND must be sftp or local, got '" + backend + "'");
    }
    if (remote_directory.empty()) {
        return invalid("REMOTEPATCH is required unless MOVELOCAL=ON");
    }
    if (backend == "sftp") {
        if (host.empty() || user.empty()) {
            return invalid("HOST and USER are required for the sftp backend");
        }
        if (port == 0) {
            return invalid("PORT must not be 0");
        }
    }
    return {};
}

auto transfer_settings::validate() const -> result<void> {
    if (auto ok = chunking.validate(); !ok) {
        return ok;
    }
    if (max_concurrent_transfers == 0) {
        return invalid("MAX_TRANSFERS must be at least 1");
    }
    if (staging_dir.empty()) {
        return invalid("LOCALTEMP is empty");
    }
    return {};
}

auto library_settings::validate() const -> result<void> {
    if (library_root.empty()) {
        return invalid("LOCALPATCH is required");
    }
    for (const auto& rule : series) {
        if (auto ok = rule.validate(); !ok) {
            return ok;
        }
    }
    return {};
}

auto app_config::validate() const -> result<void> {
    if (auto ok = remote.validate(); !ok) return ok;
    if (auto ok = transfer.validate(); !ok) return ok;
    if (auto ok = library.validate(); !ok) return ok;
    if (auto ok = subtitle.validate(); !ok) return ok;
    return {};
}

auto app_config::load(const std::filesystem::path& dir) -> result<app_config> {
    auto fail = [](const error& err) -> result<app_config> {
        MF_LOG_ERROR(log_category::config, err.message);
        return unexpected(err);
    };

    auto config_text = read_config_file(dir / std::string(config_filename));
    if (!config_text) return fail(config_text.error());

    auto groups_text = read_config_file(dir / std::string(groups_filename));
    if (!groups_text) return fail(groups_text.error());

    auto series_text = read_config_file(dir / std::string(series_filename));
    if (!series_text) return fail(series_text.error());

    app_config config;
    config.config_dir = dir;

    const settings_reader reader(parse_key_values(config_text.value()));

    if (auto ok = apply_remote(reader, config.remote); !ok) return fail(ok.error());
    if (auto ok = apply_transfer(reader, dir, config.transfer); !ok) return fail(ok.error());
    if (auto ok = apply_library(reader, config.library); !ok) return fail(ok.error());
    if (auto ok = apply_subtitle(reader, dir, config.subtitle); !ok) return fail(ok.error());
    if (auto ok = apply_logging(reader, config.logging); !ok) return fail(ok.error());

    config.groups = parse_groups(groups_text.value());

    auto series = parse_series_table(series_text.value(), dir);
    if (!series) {
        return fail(error{error_code::config_invalid,
                          std::string(series_filename) + " " + series.error().message});
    }
    config.library.series = std::move(series.value());

    if (auto ok = config.validate(); !ok) return fail(ok.error());

    MF_LOG_INFO(log_category::config,
                "Loaded configuration: " + std::to_string(config.groups.size()) +
                    " group(s), " + std::to_string(config.library.series.size()) +
                    " series rule(s)");
    return config;
}

auto parse_key_values(std::string_view text) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> values;
    for_each_line(text, [&](std::size_t, std::string_view line) {
        if (line.empty() || line.front() == '#') return;

        auto eq = line.find('=');
        if (eq == std::string_view::npos) return;

        auto key = trim(line.substr(0, eq));
        if (key.empty()) return;
        values[std::string(key)] = std::string(trim(line.substr(eq + 1)));
    });
    return values;
}

auto parse_switch(std::string_view value) -> std::optional<bool> {
    const auto lowered = to_lower(trim(value));
    if (lowered == "on") return true;
    if (lowered == "off") return false;
    return std::nullopt;
}

auto parse_groups(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> groups;
    for_each_line(text, [&](std::size_t, std::string_view line) {
        if (!line.empty()) {
            groups.emplace_back(line);
        }
    });
    return groups;
}

auto parse_series_table(std::string_view text, const std::filesystem::path& base_dir)
    -> result<series_table> {
    series_table table;
    std::optional<error> failure;

    for_each_line(text, [&](std::size_t line_number, std::string_view line) {
        if (failure || line.find('|') == std::string_view::npos) return;

        const auto where = "line " + std::to_string(line_number) + ": ";
        const auto fields = split(line, '|');
        if (fields.size() < 3 || fields.size() > 4) {
            failure = error{error_code::config_invalid,
                            where + "expected match|folder|season[|ruleset]"};
            return;
        }

        series_rule rule;
        rule.match = std::string(fields[0]);
        rule.folder = std::string(trim(fields[1]));
        if (!parse_number(fields[2], rule.season) || rule.season < 1) {
            failure = error{error_code::config_invalid,
                            where + "season must be a positive integer"};
            return;
        }
        if (fields.size() == 4) {
            auto source = trim(fields[3]);
            if (!source.empty()) {
                std::filesystem::path path(source);
                rule.ruleset_source = path.is_relative() ? base_dir / path : path;
            }
        }

        if (auto ok = rule.validate(); !ok) {
            failure = error{error_code::config_invalid, where + ok.error().message};
            return;
        }
        table.push_back(std::move(rule));
    });

    if (failure) {
        return unexpected(*failure);
    }
    return table;
}

}  // namespace kcenon::media_fetch
