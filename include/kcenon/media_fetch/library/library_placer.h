/**
 * @file library_placer.h
 * @brief Moves classified files into the library layout
 */

#ifndef KCENON_MEDIA_FETCH_LIBRARY_LIBRARY_PLACER_H
#define KCENON_MEDIA_FETCH_LIBRARY_LIBRARY_PLACER_H

#include <kcenon/media_fetch/library/library_types.h>

#include <filesystem>
#include <mutex>
#include <string_view>

namespace kcenon::media_fetch {

/**
 * @brief Library placer configuration
 */
struct placer_config {
    /// Ledger file name inside each destination directory
    static constexpr std::string_view ledger_filename = "info.txt";

    /// Library root (LOCALPATCH)
    std::filesystem::path library_root;

    /// Append "original (renamed)" lines to the ledger
    bool save_ledger = false;

    [[nodiscard]] auto validate() const -> result<void> {
        if (library_root.empty()) {
            return unexpected(error{error_code::config_invalid, "library root is empty"});
        }
        return {};
    }
};

/**
 * @brief Places a staged file at "<root>/<folder>/Season <n>/<name>"
 *
 * - An existing destination file is replaced (last write wins)
 * - Within one filesystem the move is a rename
 * - Across filesystems the file is copied to a temporary name in the
 *   destination directory, renamed into place, then the source is removed
 *
 * A failed placement never leaves a truncated destination file and keeps
 * the source in the staging directory.
 */
class library_placer {
public:
    explicit library_placer(placer_config config);

    /**
     * @brief Move a file into the library
     * @param local_file Staged file
     * @param outcome Successful classification of local_file's name
     * @return Final destination path, or destination_unwritable
     */
    [[nodiscard]] auto place(const std::filesystem::path& local_file,
                             const placement_outcome& outcome) -> result<std::filesystem::path>;

    /**
     * @brief Destination directory for a classification
     */
    [[nodiscard]] auto destination_directory(const placement_outcome& outcome) const
        -> std::filesystem::path;

    [[nodiscard]] auto config() const -> const placer_config& { return config_; }

private:
    auto move_file(const std::filesystem::path& from, const std::filesystem::path& to)
        -> result<void>;
    auto append_ledger(const std::filesystem::path& directory, const placement_outcome& outcome)
        -> result<void>;

    placer_config config_;
    std::mutex ledger_mutex_;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_LIBRARY_LIBRARY_PLACER_H
