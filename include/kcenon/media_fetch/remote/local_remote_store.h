/**
 * @file local_remote_store.h
 * @brief Remote store backed by a local or mounted directory tree
 */

#ifndef KCENON_MEDIA_FETCH_REMOTE_LOCAL_REMOTE_STORE_H
#define KCENON_MEDIA_FETCH_REMOTE_LOCAL_REMOTE_STORE_H

#include <kcenon/media_fetch/remote/remote_store.h>

#include <filesystem>

namespace kcenon::media_fetch {

/**
 * @brief Remote store whose "remote" paths live under a local root
 *
 * Remote paths are resolved against the root; a leading '/' is ignored,
 * so "/incoming/a.mkv" and "incoming/a.mkv" name the same file.
 */
class local_remote_store : public remote_store {
public:
    /**
     * @brief Construct store rooted at a directory
     * @param root Directory that remote paths are resolved against
     */
    explicit local_remote_store(std::filesystem::path root);

    [[nodiscard]] auto name() const -> std::string_view override { return "local"; }

    [[nodiscard]] auto open_session() -> result<std::unique_ptr<remote_session>> override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    std::filesystem::path root_;
};

}  // namespace kcenon::media_fetch

#endif  // KCENON_MEDIA_FETCH_REMOTE_LOCAL_REMOTE_STORE_H
