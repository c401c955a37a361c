/**
 * @file test_app_config.cpp
 * @brief Unit tests for configuration parsing and loading
 */

#include <gtest/gtest.h>

#include <kcenon/media_fetch/app/app_config.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace kcenon::media_fetch::test {

// =============================================================================
// Parsers
// =============================================================================

class ConfigParserTest : public ::testing::Test {};

TEST_F(ConfigParserTest, KeyValues) {
    auto values = parse_key_values(
        "# media_fetch settings\n"
        "HOST = seedbox.example\n"
        "PASSWORD=a=b\n"
        "\n"
        "not a pair\n"
        "PORT=22\n"
        "PORT=2222\n");

    EXPECT_EQ(values.size(), 3u);
    EXPECT_EQ(values["HOST"], "seedbox.example");
    EXPECT_EQ(values["PASSWORD"], "a=b");
    EXPECT_EQ(values["PORT"], "2222");
}

TEST_F(ConfigParserTest, Switches) {
    EXPECT_EQ(parse_switch("ON"), true);
    EXPECT_EQ(parse_switch("off"), false);
    EXPECT_EQ(parse_switch(" On "), true);
    EXPECT_FALSE(parse_switch("yes").has_value());
    EXPECT_FALSE(parse_switch("").has_value());
}

TEST_F(ConfigParserTest, Groups) {
    EXPECT_EQ(parse_groups("GroupA\n\n  GroupB \r\n"),
              (std::vector<std::string>{"GroupA", "GroupB"}));
    EXPECT_TRUE(parse_groups("").empty());
}

TEST_F(ConfigParserTest, SeriesTable) {
    const std::filesystem::path base("/etc/media_fetch");
    auto table = parse_series_table(
        "Show|ShowFolder|1\n"
        "free text without separator\n"
        "Other| OtherFolder |2|rules/other.txt\n"
        "Third|ThirdFolder|3|/abs/third.txt\n",
        base);
    ASSERT_TRUE(table.has_value()) << table.error().message;
    ASSERT_EQ(table.value().size(), 3u);

    EXPECT_EQ(table.value()[0].match, "Show");
    EXPECT_EQ(table.value()[0].folder, "ShowFolder");
    EXPECT_EQ(table.value()[0].season, 1);
    EXPECT_FALSE(table.value()[0].ruleset_source.has_value());

    EXPECT_EQ(table.value()[1].folder, "OtherFolder");
    EXPECT_EQ(table.value()[1].ruleset_source, base / "rules/other.txt");
    EXPECT_EQ(table.value()[2].ruleset_source, std::filesystem::path("/abs/third.txt"));
}

TEST_F(ConfigParserTest, SeriesTableErrors) {
    auto bad_season = parse_series_table("Show|ShowFolder|0\n", "/");
    ASSERT_FALSE(bad_season.has_value());
    EXPECT_EQ(bad_season.error().code, error_code::config_invalid);
    EXPECT_NE(bad_season.error().message.find("line 1"), std::string::npos);

    EXPECT_FALSE(parse_series_table("Show|ShowFolder|x\n", "/").has_value());
    EXPECT_FALSE(parse_series_table("Show|ShowFolder\n", "/").has_value());
    EXPECT_FALSE(parse_series_table("ok|F|1\nShow|F|1|r|extra\n", "/").has_value());
    EXPECT_FALSE(parse_series_table("|ShowFolder|1\n", "/").has_value());
}

// =============================================================================
// Loading
// =============================================================================

class AppConfigLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() / "media_fetch_test_config";
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        write("groups.list", "GroupA\nGroupB\n");
        write("series.list", "Show|ShowFolder|1\n");
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream(dir_ / name, std::ios::binary) << content;
    }

    std::filesystem::path dir_;
};

TEST_F(AppConfigLoadTest, LoadsFullConfiguration) {
    write("media_fetch.conf",
          "HOST=seedbox.example\n"
          "USER=fetcher\n"
          "PASSWORD=secret\n"
          "PORT=2222\n"
          "REMOTEPATCH=/downloads/complete\n"
          "LOCALPATCH=/srv/library\n"
          "LOCALTEMP=/var/tmp/media_fetch\n"
          "CHUNKS=4\n"
          "USE_CHUNKS=OFF\n"
          "MAX_TRANSFERS=2\n"
          "MAX_SESSIONS=6\n"
          "RENAME=OFF\n"
          "SAVEINFO=ON\n"
          "SUBTITLE_TRACK=3\n"
          "SUBTITLE_TRACK_NAME=Fixed\n"
          "ACCEPT_REMUX_WARNINGS=ON\n"
          "LOG_LEVEL=debug\n"
          "LOG_FORMAT=json\n"
          "MASK_LOGS=ON\n");

    auto loaded = app_config::load(dir_);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    const auto& config = loaded.value();

    EXPECT_EQ(config.config_dir, dir_);
    EXPECT_EQ(config.remote.backend, "sftp");
    EXPECT_EQ(config.remote.host, "seedbox.example");
    EXPECT_EQ(config.remote.user, "fetcher");
    EXPECT_EQ(config.remote.password, "secret");
    EXPECT_EQ(config.remote.port, 2222);
    EXPECT_EQ(config.remote.remote_directory, "/downloads/complete");
    EXPECT_EQ(config.remote.max_sessions, 6u);
    EXPECT_FALSE(config.remote.move_local);

    EXPECT_EQ(config.transfer.chunking.chunk_count, 4u);
    EXPECT_FALSE(config.transfer.chunking.use_chunks);
    EXPECT_EQ(config.transfer.max_concurrent_transfers, 2u);
    EXPECT_EQ(config.transfer.staging_dir, std::filesystem::path("/var/tmp/media_fetch"));

    EXPECT_EQ(config.library.library_root, std::filesystem::path("/srv/library"));
    EXPECT_FALSE(config.library.rename);
    EXPECT_TRUE(config.library.save_ledger);
    ASSERT_EQ(config.library.series.size(), 1u);

    EXPECT_EQ(config.subtitle.patch.track_index, 3);
    EXPECT_EQ(config.subtitle.patch.track_name, "Fixed");
    EXPECT_EQ(config.subtitle.patch.language, "eng");
    EXPECT_TRUE(config.subtitle.patch.accept_remux_warnings);

    EXPECT_EQ(config.logging.level, log_level::debug);
    EXPECT_EQ(config.logging.format, log_output_format::json);
    EXPECT_TRUE(config.logging.mask_sensitive);

    EXPECT_EQ(config.groups, (std::vector<std::string>{"GroupA", "GroupB"}));
}

TEST_F(AppConfigLoadTest, Defaults) {
    write("media_fetch.conf",
          "REMOTE_BACKEND=local\n"
          "REMOTEPATCH=/downloads\n"
          "LOCALPATCH=/srv/library\n");

    auto loaded = app_config::load(dir_);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    const auto& config = loaded.value();

    EXPECT_EQ(config.remote.backend, "local");
    EXPECT_EQ(config.transfer.chunking.chunk_count, 3u);
    EXPECT_TRUE(config.transfer.chunking.use_chunks);
    EXPECT_EQ(config.transfer.max_concurrent_transfers, 5u);
    EXPECT_EQ(config.transfer.staging_dir, dir_ / "temp");
    EXPECT_TRUE(config.library.rename);
    EXPECT_FALSE(config.library.save_ledger);
    EXPECT_EQ(config.subtitle.patch.track_index, 2);
    EXPECT_EQ(config.subtitle.patch.track_name, "MediaFetchFixed");
    EXPECT_FALSE(config.subtitle.patch.accept_remux_warnings);
    EXPECT_EQ(config.logging.level, log_level::info);
}

TEST_F(AppConfigLoadTest, MoveLocalNeedsNoRemote) {
    write("media_fetch.conf", "MOVELOCAL=ON\nLOCALPATCH=/srv/library\n");

    auto loaded = app_config::load(dir_);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_TRUE(loaded.value().remote.move_local);
}

TEST_F(AppConfigLoadTest, ToolFoundInConfigDirectory) {
    const auto tool = dir_ / "media_fetch_test_mkvmerge";
    write("media_fetch_test_mkvmerge", "#!/bin/sh\nexit 0\n");
    std::filesystem::permissions(tool, std::filesystem::perms::owner_all);

    write("media_fetch.conf",
          "MOVELOCAL=ON\nLOCALPATCH=/srv/library\nMKVMERGE=media_fetch_test_mkvmerge\n");

    auto loaded = app_config::load(dir_);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value().subtitle.patch.remuxer, tool);
}

TEST_F(AppConfigLoadTest, MissingFileIsConfigNotFound) {
    std::filesystem::remove(dir_ / "series.list");
    write("media_fetch.conf", "MOVELOCAL=ON\nLOCALPATCH=/srv/library\n");

    auto loaded = app_config::load(dir_);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, error_code::config_not_found);
}

TEST_F(AppConfigLoadTest, MissingRequiredSettings) {
    write("media_fetch.conf", "HOST=seedbox\nUSER=me\nLOCALPATCH=/srv/library\n");
    auto no_remote_dir = app_config::load(dir_);
    ASSERT_FALSE(no_remote_dir.has_value());
    EXPECT_EQ(no_remote_dir.error().code, error_code::config_invalid);

    write("media_fetch.conf", "REMOTEPATCH=/downloads\nLOCALPATCH=/srv/library\n");
    auto no_host = app_config::load(dir_);
    ASSERT_FALSE(no_host.has_value());
    EXPECT_EQ(no_host.error().code, error_code::config_invalid);

    write("media_fetch.conf", "MOVELOCAL=ON\n");
    auto no_library = app_config::load(dir_);
    ASSERT_FALSE(no_library.has_value());
    EXPECT_EQ(no_library.error().code, error_code::config_invalid);
}

TEST_F(AppConfigLoadTest, MalformedValues) {
    const char* cases[] = {
        "MOVELOCAL=maybe\nLOCALPATCH=/srv\n",
        "MOVELOCAL=ON\nLOCALPATCH=/srv\nCHUNKS=three\n",
        "MOVELOCAL=ON\nLOCALPATCH=/srv\nCHUNKS=0\n",
        "MOVELOCAL=ON\nLOCALPATCH=/srv\nMAX_TRANSFERS=0\n",
        "MOVELOCAL=ON\nLOCALPATCH=/srv\nLOG_LEVEL=loud\n",
        "MOVELOCAL=ON\nLOCALPATCH=/srv\nLOG_FORMAT=xml\n",
        "REMOTE_BACKEND=ftp\nREMOTEPATCH=/d\nLOCALPATCH=/srv\n",
    };
    for (const char* text : cases) {
        write("media_fetch.conf", text);
        auto loaded = app_config::load(dir_);
        ASSERT_FALSE(loaded.has_value()) << text;
        EXPECT_EQ(loaded.error().code, error_code::config_invalid) << text;
    }
}

TEST_F(AppConfigLoadTest, InvalidSeriesLineIsReported) {
    write("media_fetch.conf", "MOVELOCAL=ON\nLOCALPATCH=/srv/library\n");
    write("series.list", "Show|ShowFolder|1\nBroken|Folder|-2\n");

    auto loaded = app_config::load(dir_);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().message.find("series.list line 2"), std::string::npos);
}

TEST_F(AppConfigLoadTest, ShiftJisSeriesList) {
    write("media_fetch.conf", "MOVELOCAL=ON\nLOCALPATCH=/srv/library\n");
    // "日本|Nihon|1" in CP932
    write("series.list", "\x93\xFA\x96\x7B|Nihon|1\n");

    auto loaded = app_config::load(dir_);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    EXPECT_EQ(loaded.value().library.series.at(0).match, "\xE6\x97\xA5\xE6\x9C\xAC");
}

}  // namespace kcenon::media_fetch::test
