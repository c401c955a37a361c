/**
 * @file subtitle_patch_pipeline.cpp
 * @brief Implementation of the subtitle patch pipeline
 */

#include <kcenon/media_fetch/subtitle/subtitle_patch_pipeline.h>

#include <kcenon/media_fetch/core/logging.h>
#include <kcenon/media_fetch/core/text_decoder.h>

#include <string_view>
#include <system_error>

namespace kcenon::media_fetch {

namespace {

constexpr int remux_warning_exit = 1;

// Suffix of the extracted subtitle; never collides with a placed ".ass"
constexpr std::string_view sidecar_suffix = ".mfsub.ass";

// Tool diagnostics: stderr when present, stdout otherwise
auto tool_diagnostics(const tool_output& output) -> std::string {
    const auto& text = output.stderr_text.empty() ? output.stdout_text : output.stderr_text;
    auto end = text.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? std::string{} : text.substr(0, end + 1);
}

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        MF_LOG_WARN(log_category::subtitle,
                    "Cannot remove " + path.string() + ": " + ec.message());
    }
}

}  // namespace

subtitle_patch_pipeline::subtitle_patch_pipeline(std::shared_ptr<tool_runner> runner,
                                                 patch_config config)
    : runner_(std::move(runner)), config_(std::move(config)) {}

auto subtitle_patch_pipeline::sidecar_path(const std::filesystem::path& file)
    -> std::filesystem::path {
    return file.parent_path() / (file.stem().string() + std::string(sidecar_suffix));
}

auto subtitle_patch_pipeline::remux_output_path(const std::filesystem::path& file)
    -> std::filesystem::path {
    return file.parent_path() /
           (file.stem().string() + "_remuxed" + file.extension().string());
}

auto subtitle_patch_pipeline::patch(const std::filesystem::path& destination_dir,
                                    const std::filesystem::path& file,
                                    const std::optional<std::filesystem::path>& ruleset_source)
    -> result<patch_status> {
    transfer_log_context log_ctx;
    log_ctx.filename = file.filename().string();
    log_ctx.stage = "patch";

    auto fail = [&](const error& err) -> result<patch_status> {
        log_ctx.error_message = err.message;
        MF_LOG_ERROR_CTX(log_category::subtitle, "Subtitle patch failed", log_ctx);
        return unexpected(err);
    };

    const auto ruleset_path =
        ruleset_source.value_or(destination_dir / std::string(patch_config::ruleset_filename));

    std::error_code ec;
    if (!std::filesystem::is_regular_file(ruleset_path, ec)) {
        MF_LOG_DEBUG(log_category::subtitle,
                     "No ruleset for " + destination_dir.string() + ", skipping patch");
        return patch_status::skipped;
    }

    auto rules = load_ruleset(ruleset_path);
    if (!rules) {
        return fail(rules.error());
    }

    const auto sidecar = sidecar_path(file);
    const auto output = remux_output_path(file);

    // Work files are deleted on failure, so they must not already exist
    for (const auto& work : {sidecar, output}) {
        if (work == file || std::filesystem::exists(work, ec)) {
            return fail(error{error_code::extract_failed,
                              work.filename().string() + " already exists, not overwriting it"});
        }
    }

    MF_LOG_INFO_CTX(log_category::subtitle,
                    "Patching subtitles with " + std::to_string(rules.value().size()) +
                        " rule(s) from " + ruleset_path.filename().string(),
                    log_ctx);

    if (auto extracted = extract(file, sidecar); !extracted) {
        return fail(extracted.error());
    }

    if (auto transformed = transform(sidecar, rules.value()); !transformed) {
        remove_quietly(sidecar);
        return fail(transformed.error());
    }

    if (auto remuxed = remux(file, sidecar, output); !remuxed) {
        return fail(remuxed.error());
    }

    if (auto committed = commit(file, sidecar, output); !committed) {
        return fail(committed.error());
    }

    MF_LOG_INFO_CTX(log_category::subtitle, "Processed subtitles", log_ctx);
    return patch_status::patched;
}

auto subtitle_patch_pipeline::extract(const std::filesystem::path& file,
                                      const std::filesystem::path& sidecar) -> result<void> {
    const std::vector<std::string> args = {
        file.string(), "tracks", std::to_string(config_.track_index) + ":" + sidecar.string()};

    auto run = runner_->run(config_.extractor, args);
    if (!run) {
        return unexpected(error{error_code::extract_failed, run.error().message});
    }

    if (!run.value().succeeded()) {
        remove_quietly(sidecar);
        return unexpected(error{error_code::extract_failed,
                                "exit " + std::to_string(run.value().exit_code) + ": " +
                                    tool_diagnostics(run.value())});
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(sidecar, ec)) {
        return unexpected(error{error_code::extract_failed,
                                "extractor produced no " + sidecar.filename().string()});
    }
    return {};
}

auto subtitle_patch_pipeline::transform(const std::filesystem::path& sidecar,
                                        const ruleset& rules) -> result<void> {
    auto decoded = read_text_file(sidecar);
    if (!decoded) {
        return unexpected(decoded.error());
    }

    MF_LOG_DEBUG(log_category::subtitle,
                 sidecar.filename().string() + " decoded as " + decoded.value().encoding);

    auto text = apply_standard_replacements(std::move(decoded.value().text));
    text = apply_ruleset(std::move(text), rules);

    return write_text_file(sidecar, text);
}

auto subtitle_patch_pipeline::remux(const std::filesystem::path& file,
                                    const std::filesystem::path& sidecar,
                                    const std::filesystem::path& output) -> result<void> {
    const std::vector<std::string> args = {"-o",
                                           output.string(),
                                           "--no-subtitles",
                                           file.string(),
                                           "--language",
                                           "0:" + config_.language,
                                           "--track-name",
                                           "0:" + config_.track_name,
                                           sidecar.string()};

    auto run = runner_->run(config_.remuxer, args);
    if (!run) {
        remove_quietly(output);
        return unexpected(error{error_code::remux_failed, run.error().message});
    }

    const int exit_code = run.value().exit_code;
    if (exit_code == 0) {
        return {};
    }
    if (exit_code == remux_warning_exit && config_.accept_remux_warnings) {
        MF_LOG_WARN(log_category::subtitle,
                    "Remux finished with warnings: " + tool_diagnostics(run.value()));
        return {};
    }

    remove_quietly(output);
    return unexpected(error{error_code::remux_failed,
                            "exit " + std::to_string(exit_code) + ": " +
                                tool_diagnostics(run.value())});
}

auto subtitle_patch_pipeline::commit(const std::filesystem::path& file,
                                     const std::filesystem::path& sidecar,
                                     const std::filesystem::path& output) -> result<void> {
    std::error_code ec;
    const auto size = std::filesystem::file_size(output, ec);
    if (ec || size == 0) {
        remove_quietly(output);
        return unexpected(error{error_code::patch_commit_failed,
                                "remux output " + output.filename().string() +
                                    " is missing or empty"});
    }

    // rename(2) replaces the original atomically
    std::filesystem::rename(output, file, ec);
    if (ec) {
        remove_quietly(output);
        return unexpected(error{error_code::patch_commit_failed,
                                "cannot replace " + file.filename().string() + ": " +
                                    ec.message()});
    }

    remove_quietly(sidecar);
    return {};
}

}  // namespace kcenon::media_fetch
