/**
 * @file local_remote_store.cpp
 * @brief Implementation of the filesystem-backed remote store
 */

#include <kcenon/media_fetch/remote/local_remote_store.h>

#include <fstream>

namespace kcenon::media_fetch {

namespace {

class local_reader : public remote_reader {
public:
    explicit local_reader(std::ifstream stream) : stream_(std::move(stream)) {}

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override {
        if (buffer.empty() || stream_.eof()) {
            return std::size_t{0};
        }

        stream_.read(reinterpret_cast<char*>(buffer.data()),
                     static_cast<std::streamsize>(buffer.size()));
        if (stream_.bad()) {
            return unexpected(error{error_code::segment_io_error, "local read failed"});
        }
        return static_cast<std::size_t>(stream_.gcount());
    }

private:
    std::ifstream stream_;
};

class local_session : public remote_session {
public:
    explicit local_session(const std::filesystem::path& root) : root_(root) {}

    [[nodiscard]] auto list(const std::string& directory)
        -> result<std::vector<remote_file>> override {
        auto dir = resolve(directory);

        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            return unexpected(error{error_code::list_failed,
                                    "cannot list " + dir.string() + ": " + ec.message()});
        }

        std::vector<remote_file> files;
        for (const auto& entry : it) {
            std::error_code entry_ec;
            if (!entry.is_regular_file(entry_ec)) {
                continue;
            }
            remote_file file;
            file.name = entry.path().filename().string();
            auto size = entry.file_size(entry_ec);
            if (!entry_ec) {
                file.listed_size = size;
            }
            files.push_back(std::move(file));
        }
        return files;
    }

    [[nodiscard]] auto stat(const std::string& path) -> result<uint64_t> override {
        std::error_code ec;
        auto size = std::filesystem::file_size(resolve(path), ec);
        if (ec) {
            return unexpected(error{error_code::stat_failed,
                                    "cannot stat " + path + ": " + ec.message()});
        }
        return static_cast<uint64_t>(size);
    }

    [[nodiscard]] auto open_range(const std::string& path, uint64_t offset)
        -> result<std::unique_ptr<remote_reader>> override {
        std::ifstream stream(resolve(path), std::ios::binary);
        if (!stream) {
            return unexpected(error{error_code::segment_io_error, "cannot open " + path});
        }

        stream.seekg(static_cast<std::streamoff>(offset));
        if (!stream) {
            return unexpected(error{error_code::segment_io_error,
                                    "cannot seek " + path + " to " + std::to_string(offset)});
        }
        return std::unique_ptr<remote_reader>(
            std::make_unique<local_reader>(std::move(stream)));
    }

    [[nodiscard]] auto remove(const std::string& path) -> result<void> override {
        std::error_code ec;
        if (!std::filesystem::remove(resolve(path), ec)) {
            return unexpected(error{error_code::remote_delete_failed,
                                    "cannot remove " + path +
                                        (ec ? ": " + ec.message() : ": not found")});
        }
        return {};
    }

private:
    [[nodiscard]] auto resolve(const std::string& path) const -> std::filesystem::path {
        std::filesystem::path p(path);
        return root_ / p.relative_path();
    }

    std::filesystem::path root_;
};

}  // namespace

local_remote_store::local_remote_store(std::filesystem::path root) : root_(std::move(root)) {}

auto local_remote_store::open_session() -> result<std::unique_ptr<remote_session>> {
    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec)) {
        return unexpected(error{error_code::connect_failed,
                                "store root is not a directory: " + root_.string()});
    }
    return std::unique_ptr<remote_session>(std::make_unique<local_session>(root_));
}

}  // namespace kcenon::media_fetch
