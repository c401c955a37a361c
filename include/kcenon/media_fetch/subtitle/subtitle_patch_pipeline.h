/**
 * @file subtitle_patch_pipeline.h
 * @brief Extract, rewrite and remux the subtitle track of a placed container
 */

#ifndef KCENON_MEDIA_FETCH_SUBTITLE_SUBTITLE_PATCH_PIPELINE_H
#define KCENON_MEDIA_FETCH_SUBTITLE_SUBTITLE_PATCH_PIPELINE_H

#include <kcenon/media_fetch/subtitle/ruleset.h>
#include <kcenon/media_fetch/subtitle/tool_runner.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::media_fetch {

/**
 * @brief Subtitle patch configuration
 */
struct patch_config {
    /// Ruleset file looked up in the destination directory
    static constexpr std::string_view ruleset_filename = "replace.txt";

    /// Track extraction program (mkvextract)
    std::filesystem::path extractor = "mkvextract";

    /// Remux program (mkvmerge)
    std::filesystem::path remuxer = "mkvmerge";

    /// Track id passed to the extractor
    int track_index = 2;

    /// Name given to the patched subtitle track
    std::string track_name = "MediaFetchFixed";

    /// Language tag of the patched subtitle track
    std::string language = "eng";

    /// Treat remuxer exit status 1 (warnings only) as success
    bool accept_remux_warnings = false;

    [[nodiscard]] auto validate() const -> result<void> {
        if (extractor.empty() || remuxer.empty()) {
            return unexpected(error{error_code::config_invalid, "subtitle tool path is empty"});
        }
        if (track_index < 0) {
            return unexpected(error{error_code::config_invalid,
                                    "subtitle track must not be negative"});
        }
        if (track_name.empty() || language.empty()) {
            return unexpected(error{error_code::config_invalid,
                                    "subtitle track name and language are required"});
        }
        return {};
    }
};

/**
 * @brief Outcome of a successful patch call
 */
enum class patch_status {
    skipped,  ///< No ruleset for the destination directory
    patched   ///< Container replaced by the remuxed file
};

[[nodiscard]] constexpr auto to_string(patch_status status) -> const char* {
    switch (status) {
        case patch_status::skipped:
            return "skipped";
        case patch_status::patched:
            return "patched";
        default:
            return "unknown";
    }
}

/**
 * @brief Linear extract / transform / remux / commit pipeline
 *
 * Steps run strictly in order and each one starts only after the previous
 * one succeeded:
 * -# Validate the ruleset (invalid_ruleset, file untouched)
 * -# Refuse to run if a work file already exists (extract_failed)
 * -# Extract the subtitle track to "<stem>.mfsub.ass" (extract_failed)
 * -# Rewrite the sidecar with the built-in normalizations, then the ruleset
 * -# Remux into "<stem>_remuxed<ext>" (remux_failed, partial output removed)
 * -# Rename the remuxed file over the original and delete the sidecar
 *    (patch_commit_failed, original kept)
 *
 * The original container is replaced only by a rename, so a playable file
 * exists at every point of the sequence.
 */
class subtitle_patch_pipeline {
public:
    subtitle_patch_pipeline(std::shared_ptr<tool_runner> runner, patch_config config);

    /**
     * @brief Patch a placed container when its directory carries a ruleset
     * @param destination_dir Directory holding the container
     * @param file Container path
     * @param ruleset_source Ruleset used instead of "<destination_dir>/replace.txt"
     * @return skipped when no ruleset exists, patched on commit
     */
    [[nodiscard]] auto patch(const std::filesystem::path& destination_dir,
                             const std::filesystem::path& file,
                             const std::optional<std::filesystem::path>& ruleset_source =
                                 std::nullopt) -> result<patch_status>;

    /**
     * @brief Extracted subtitle path for a container ("<stem>.mfsub.ass")
     */
    [[nodiscard]] static auto sidecar_path(const std::filesystem::path& file)
        -> std::filesystem::path;

    /**
     * @brief Remux output path for a container ("<stem>_remuxed<ext>")
     */
    [[nodiscard]] static auto remux_output_path(const std::filesystem::path& file)
        -> std::filesystem::path;

    [[nodiscard]] auto config() const -> const patch_config& { return config_; }

private:
    auto extract(const std::filesystem::path& file, const std::filesystem::path& sidecar)
        -> result<void>;
    auto transform(const std::filesystem::path& sidecar, const ruleset& rules) -> result<void>;
    auto remux(const std::filesystem::path& file,
               const std::filesystem::path& sidecar,
               const std::filesystem::path& output) -> result<void>;
    auto commit(const std::filesystem::path& file,
                const std::filesystem::path& sidecar,
                const std::filesystem::path& output) -> result<void>;

    std::shared_ptr<tool_runner> runner_;
    patch_config config_;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_SUBTITLE_SUBTITLE_PATCH_PIPELINE_H
