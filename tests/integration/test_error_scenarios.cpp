/**
 * @file test_error_scenarios.cpp
 * @brief Integration tests for per-file failures and fatal run errors
 */

#include "test_fixtures.h"

#include <unistd.h>

namespace kcenon::media_fetch::test {

class ErrorScenariosTest : public PipelineFixture {};

TEST_F(ErrorScenariosTest, ZeroSizeRemoteFileIsNotTransferred) {
    auto remote = write_file(remote_dir_ / show_name, "");

    auto summary = run_pipeline(make_config());
    ASSERT_TRUE(summary.has_value()) << summary.error().message;
    EXPECT_EQ(summary.value().transferred, 0u);
    EXPECT_EQ(summary.value().transfer_failed, 1u);
    EXPECT_FALSE(summary.value().clean());

    EXPECT_TRUE(std::filesystem::exists(remote));
    EXPECT_TRUE(files_in(staging_dir_).empty());
    EXPECT_FALSE(std::filesystem::exists(library_dir_ / "ShowFolder"));
}

TEST_F(ErrorScenariosTest, FailedTransferDoesNotStopOthers) {
    write_file(remote_dir_ / "[GroupA] Show 01.mkv", "");
    create_remote_file("[GroupA] Show 02.mkv", 2000);

    auto summary = run_pipeline(make_config());
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().transferred, 1u);
    EXPECT_EQ(summary.value().transfer_failed, 1u);
    EXPECT_EQ(summary.value().placed, 1u);
    EXPECT_TRUE(std::filesystem::exists(season_dir() / "S01E02.mkv"));
}

TEST_F(ErrorScenariosTest, RemuxFailureKeepsPlacedOriginal) {
    auto remote = create_remote_file(show_name, 5000);
    const auto original = read_file(remote);
    write_file(season_dir() / "replace.txt", "Kirito|Kazuto\n");
    break_tool("mkvmerge", 2);

    auto summary = run_pipeline(make_config());
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().placed, 1u);
    EXPECT_EQ(summary.value().patch_failed, 1u);
    EXPECT_EQ(summary.value().patched, 0u);

    EXPECT_EQ(read_file(season_dir() / "S01E01.mkv"), original);
    EXPECT_FALSE(std::filesystem::exists(season_dir() / "S01E01_remuxed.mkv"));
}

TEST_F(ErrorScenariosTest, ExtractFailureIsReported) {
    create_remote_file(show_name, 5000);
    write_file(season_dir() / "replace.txt", "Kirito|Kazuto\n");
    break_tool("mkvextract", 2);

    auto summary = run_pipeline(make_config());
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().placed, 1u);
    EXPECT_EQ(summary.value().patch_failed, 1u);
    EXPECT_FALSE(std::filesystem::exists(season_dir() / "S01E01.mfsub.ass"));
}

TEST_F(ErrorScenariosTest, InvalidRulesetIsPatchFailure) {
    create_remote_file(show_name, 5000);
    write_file(season_dir() / "replace.txt", "no separator here\n");

    auto summary = run_pipeline(make_config());
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().placed, 1u);
    EXPECT_EQ(summary.value().patch_failed, 1u);
}

TEST_F(ErrorScenariosTest, MissingEpisodeNumberStaysInStaging) {
    create_remote_file("[GroupA] Show Special.mkv", 1000);

    auto summary = run_pipeline(make_config());
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().transferred, 1u);
    EXPECT_EQ(summary.value().classification_failed, 1u);
    EXPECT_EQ(summary.value().placed, 0u);

    EXPECT_EQ(files_in(staging_dir_), (std::vector<std::string>{"[GroupA] Show Special.mkv"}));
}

TEST_F(ErrorScenariosTest, EmptyStagingFileIsSkipped) {
    write_file(staging_dir_ / "[GroupA] Show 03.mkv", "");

    auto config = make_config();
    config.remote.move_local = true;

    auto summary = run_pipeline(config);
    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().skipped_empty, 1u);
    EXPECT_EQ(summary.value().placed, 0u);
    EXPECT_TRUE(std::filesystem::exists(staging_dir_ / "[GroupA] Show 03.mkv"));
}

TEST_F(ErrorScenariosTest, MissingRemoteDirectoryIsFatal) {
    auto config = make_config();
    config.remote.remote_directory = (test_dir_ / "does_not_exist").string();

    auto summary = run_pipeline(config);
    ASSERT_FALSE(summary.has_value());
    EXPECT_TRUE(summary.error().code == error_code::connect_failed ||
                summary.error().code == error_code::list_failed);
}

TEST_F(ErrorScenariosTest, MoveLocalRequiresStagingDirectory) {
    auto config = make_config();
    config.remote.move_local = true;
    config.transfer.staging_dir = test_dir_ / "no_staging";

    auto summary = run_pipeline(config);
    ASSERT_FALSE(summary.has_value());
    EXPECT_EQ(summary.error().code, error_code::config_invalid);
}

TEST_F(ErrorScenariosTest, UnknownBackendIsRejected) {
    remote_settings settings;
    settings.backend = "ftp";
    auto store = media_pipeline::create_remote_store(settings);
    ASSERT_FALSE(store.has_value());
    EXPECT_EQ(store.error().code, error_code::config_invalid);
}

TEST_F(ErrorScenariosTest, UnwritableLibraryIsPlacementFailure) {
    if (::geteuid() == 0) {
        GTEST_SKIP() << "permission checks do not apply to root";
    }
    create_remote_file(show_name, 1000);
    std::filesystem::permissions(library_dir_, std::filesystem::perms::owner_read |
                                                   std::filesystem::perms::owner_exec);

    auto summary = run_pipeline(make_config());
    std::filesystem::permissions(library_dir_, std::filesystem::perms::owner_all);

    ASSERT_TRUE(summary.has_value());
    EXPECT_EQ(summary.value().placement_failed, 1u);
    EXPECT_EQ(files_in(staging_dir_), (std::vector<std::string>{show_name}));
}

}  // namespace kcenon::media_fetch::test
