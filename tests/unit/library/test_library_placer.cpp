/**
 * @file test_library_placer.cpp
 * @brief Unit tests for library_placer
 */

#include <gtest/gtest.h>

#include <kcenon/media_fetch/library/episode_classifier.h>
#include <kcenon/media_fetch/library/library_placer.h>

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace kcenon::media_fetch::test {

class LibraryPlacerTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_ = std::filesystem::temp_directory_path() / "media_fetch_test_placer";
        std::filesystem::remove_all(base_);
        staging_ = base_ / "staging";
        library_ = base_ / "library";
        std::filesystem::create_directories(staging_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::permissions(library_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(base_, ec);
    }

    auto stage(const std::string& name, const std::string& content) -> std::filesystem::path {
        auto path = staging_ / name;
        std::ofstream(path, std::ios::binary) << content;
        return path;
    }

    static auto read(const std::filesystem::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    auto classify(const std::string& name, bool rename = true) -> placement_outcome {
        return episode_classifier::classify(name, table_, rename);
    }

    std::filesystem::path base_;
    std::filesystem::path staging_;
    std::filesystem::path library_;
    series_table table_{{"Show", "ShowFolder", 1, std::nullopt}};
};

TEST_F(LibraryPlacerTest, MovesIntoSeasonFolder) {
    const std::string name = "[GroupA] Show 01 (WEB).mkv";
    auto source = stage(name, "episode-bytes");

    library_placer placer(placer_config{library_, false});
    auto result = placer.place(source, classify(name));
    ASSERT_TRUE(result.has_value()) << result.error().message;

    const auto expected = library_ / "ShowFolder" / "Season 1" / "S01E01.mkv";
    EXPECT_EQ(result.value(), expected);
    EXPECT_EQ(read(expected), "episode-bytes");
    EXPECT_FALSE(std::filesystem::exists(source));
    EXPECT_FALSE(std::filesystem::exists(expected.parent_path() / "info.txt"));
}

TEST_F(LibraryPlacerTest, LedgerAppendsOriginalAndRenamed) {
    library_placer placer(placer_config{library_, true});

    for (const std::string name : {"[GroupA] Show 01 (WEB).mkv", "[GroupA] Show 02 (WEB).mkv"}) {
        auto source = stage(name, "x");
        ASSERT_TRUE(placer.place(source, classify(name)).has_value());
    }

    auto ledger = read(library_ / "ShowFolder" / "Season 1" / "info.txt");
    EXPECT_EQ(ledger,
              "[GroupA] Show 01 (WEB).mkv (S01E01.mkv)\n"
              "[GroupA] Show 02 (WEB).mkv (S01E02.mkv)\n");
}

TEST_F(LibraryPlacerTest, ReplacesExistingDestination) {
    const auto dest_dir = library_ / "ShowFolder" / "Season 1";
    std::filesystem::create_directories(dest_dir);
    std::ofstream(dest_dir / "S01E01.mkv") << "old-and-longer-content";

    const std::string name = "[GroupA] Show 01 (WEB).mkv";
    library_placer placer(placer_config{library_, false});
    ASSERT_TRUE(placer.place(stage(name, "new"), classify(name)).has_value());

    EXPECT_EQ(read(dest_dir / "S01E01.mkv"), "new");
}

TEST_F(LibraryPlacerTest, RenameDisabledKeepsOriginalName) {
    const std::string name = "[GroupA] Show 01 (WEB).mkv";
    library_placer placer(placer_config{library_, false});
    auto result = placer.place(stage(name, "x"), classify(name, false));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), library_ / "ShowFolder" / "Season 1" / name);
}

TEST_F(LibraryPlacerTest, UnplaceableOutcomeIsRejected) {
    const std::string name = "[GroupA] Unknown 01.mkv";
    auto source = stage(name, "x");

    library_placer placer(placer_config{library_, false});
    auto result = placer.place(source, classify(name));
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(std::filesystem::exists(source));
}

TEST_F(LibraryPlacerTest, UnwritableRootKeepsSource) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }

    std::filesystem::create_directories(library_);
    std::filesystem::permissions(library_, std::filesystem::perms::owner_read |
                                               std::filesystem::perms::owner_exec);

    const std::string name = "[GroupA] Show 01 (WEB).mkv";
    auto source = stage(name, "x");

    library_placer placer(placer_config{library_, false});
    auto result = placer.place(source, classify(name));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::destination_unwritable);
    EXPECT_TRUE(std::filesystem::exists(source));
}

TEST_F(LibraryPlacerTest, DestinationDirectory) {
    library_placer placer(placer_config{library_, false});
    auto outcome = classify("[GroupA] Show 04.mkv");
    EXPECT_EQ(placer.destination_directory(outcome), library_ / "ShowFolder" / "Season 1");
}

}  // namespace kcenon::media_fetch::test
