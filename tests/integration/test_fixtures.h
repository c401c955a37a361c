/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_MEDIA_FETCH_TEST_FIXTURES_H
#define KCENON_MEDIA_FETCH_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/media_fetch/media_fetch.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace kcenon::media_fetch::test {

/**
 * @brief Test fixture for temporary directory management
 *
 * Layout under a unique temporary directory:
 * - remote/   stands in for the seedbox directory (local backend)
 * - staging/  LOCALTEMP
 * - library/  LOCALPATCH
 * - config/   configuration directory
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("media_fetch_test_" + std::to_string(std::random_device{}()));
        remote_dir_ = test_dir_ / "remote";
        staging_dir_ = test_dir_ / "staging";
        library_dir_ = test_dir_ / "library";
        config_dir_ = test_dir_ / "config";
        for (const auto& dir : {remote_dir_, staging_dir_, library_dir_, config_dir_}) {
            std::filesystem::create_directories(dir);
        }
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_remote_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = remote_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(42);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    static auto write_file(const std::filesystem::path& path, const std::string& content)
        -> std::filesystem::path {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream file(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(file),
                           std::istreambuf_iterator<char>());
    }

    static auto files_in(const std::filesystem::path& dir) -> std::vector<std::string> {
        std::vector<std::string> names;
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            names.push_back(entry.path().filename().string());
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    std::filesystem::path test_dir_;
    std::filesystem::path remote_dir_;
    std::filesystem::path staging_dir_;
    std::filesystem::path library_dir_;
    std::filesystem::path config_dir_;
};

/**
 * @brief Fixture running the whole pipeline against the local backend
 *
 * mkvextract and mkvmerge are replaced by shell scripts in the config
 * directory:
 * - mkvextract writes a fixed subtitle to the "<track>:<path>" target
 * - mkvmerge concatenates the source container and the sidecar into -o
 */
class PipelineFixture : public TempDirectoryFixture {
protected:
    static constexpr const char* show_name = "[GroupA] Show 01 (WEB).mkv";

    void SetUp() override {
        TempDirectoryFixture::SetUp();

        install_tool("mkvextract",
                     "#!/bin/sh\n"
                     "target=\"${3#*:}\"\n"
                     "printf 'Dialogue: Kirito\\\\Nsays hi\\n' > \"$target\"\n");
        install_tool("mkvmerge",
                     "#!/bin/sh\n"
                     "out=\"$2\"\n"
                     "for arg; do last=\"$arg\"; done\n"
                     "cat \"$4\" \"$last\" > \"$out\"\n");
    }

    void install_tool(const std::string& name, const std::string& script) {
        auto path = write_file(config_dir_ / name, script);
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    }

    // Replaces a fake tool with one that exits with the given status
    void break_tool(const std::string& name, int exit_code) {
        install_tool(name, "#!/bin/sh\necho 'Error: simulated failure' >&2\nexit " +
                               std::to_string(exit_code) + "\n");
    }

    auto make_config() -> app_config {
        app_config config;
        config.config_dir = config_dir_;
        config.remote.backend = "local";
        config.remote.remote_directory = remote_dir_.string();
        config.transfer.staging_dir = staging_dir_;
        config.library.library_root = library_dir_;
        config.library.rename = true;
        config.library.save_ledger = true;
        config.library.series = {{"Show", "ShowFolder", 1, std::nullopt}};
        config.subtitle.patch.extractor = config_dir_ / "mkvextract";
        config.subtitle.patch.remuxer = config_dir_ / "mkvmerge";
        config.groups = {"GroupA"};
        return config;
    }

    auto run_pipeline(const app_config& config) -> result<run_summary> {
        auto store = media_pipeline::create_remote_store(config.remote);
        if (!store) {
            return unexpected(store.error());
        }
        media_pipeline pipeline(config, store.value(),
                                std::make_shared<process_tool_runner>(&cancel_), &cancel_);
        return pipeline.run();
    }

    auto season_dir() const -> std::filesystem::path {
        return library_dir_ / "ShowFolder" / "Season 1";
    }

    std::atomic<bool> cancel_{false};
};

}  // namespace kcenon::media_fetch::test

#endif  // KCENON_MEDIA_FETCH_TEST_FIXTURES_H
