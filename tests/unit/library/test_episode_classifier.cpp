/**
 * @file test_episode_classifier.cpp
 * @brief Unit tests for episode_classifier
 */

#include <gtest/gtest.h>

#include <kcenon/media_fetch/library/episode_classifier.h>

namespace kcenon::media_fetch::test {

class EpisodeClassifierTest : public ::testing::Test {
protected:
    series_table table_{
        {"Show", "ShowFolder", 1, std::nullopt},
        {"Show S2", "ShowFolder", 2, std::nullopt},
        {"Other", "OtherFolder", 3, std::filesystem::path("/rules/other.txt")},
    };
};

TEST_F(EpisodeClassifierTest, AnnotatedName) {
    episode_classifier classifier(table_, true);
    auto outcome = classifier.classify("[GroupA] Show 01 (WEB).mkv");

    ASSERT_TRUE(outcome.is_placeable());
    EXPECT_TRUE(outcome.matched);
    EXPECT_EQ(outcome.episode, "01");
    EXPECT_EQ(outcome.extension, ".mkv");
    EXPECT_EQ(outcome.folder, "ShowFolder");
    EXPECT_EQ(outcome.season, 1);
    EXPECT_EQ(outcome.target_name, "S01E01.mkv");
    EXPECT_EQ(*outcome.destination_path,
              std::filesystem::path("ShowFolder") / "Season 1" / "S01E01.mkv");
}

TEST_F(EpisodeClassifierTest, BracketAnnotationAndPlainForm) {
    episode_classifier classifier(table_, true);

    auto bracket = classifier.classify("[GroupA] Other 12 [1080p][HEVC].mp4");
    ASSERT_TRUE(bracket.is_placeable());
    EXPECT_EQ(bracket.target_name, "S03E12.mp4");
    EXPECT_EQ(bracket.ruleset_source, std::filesystem::path("/rules/other.txt"));

    auto plain = classifier.classify("[GroupA] Show 07.mkv");
    ASSERT_TRUE(plain.is_placeable());
    EXPECT_EQ(plain.target_name, "S01E07.mkv");
}

TEST_F(EpisodeClassifierTest, FirstMatchingRuleWins) {
    episode_classifier classifier(table_, true);

    // "Show" precedes "Show S2" in the table
    auto outcome = classifier.classify("[GroupA] Show S2 05 (WEB).mkv");
    ASSERT_TRUE(outcome.matched);
    EXPECT_EQ(outcome.season, 1);
}

TEST_F(EpisodeClassifierTest, RenameDisabledKeepsName) {
    episode_classifier classifier(table_, false);
    auto outcome = classifier.classify("[GroupA] Show 01 (WEB).mkv");

    ASSERT_TRUE(outcome.is_placeable());
    EXPECT_EQ(outcome.target_name, "[GroupA] Show 01 (WEB).mkv");
    EXPECT_EQ(*outcome.destination_path,
              std::filesystem::path("ShowFolder") / "Season 1" / "[GroupA] Show 01 (WEB).mkv");
}

TEST_F(EpisodeClassifierTest, NoRuleMatch) {
    episode_classifier classifier(table_, true);
    auto outcome = classifier.classify("[GroupA] Unknown 01.mkv");

    EXPECT_FALSE(outcome.matched);
    EXPECT_FALSE(outcome.is_placeable());
    ASSERT_TRUE(outcome.err.has_value());
    EXPECT_EQ(outcome.err->code, error_code::no_rule_match);
}

TEST_F(EpisodeClassifierTest, MatchedWithoutEpisode) {
    episode_classifier classifier(table_, true);
    auto outcome = classifier.classify("[GroupA] Show Special.mkv");

    EXPECT_TRUE(outcome.matched);
    EXPECT_FALSE(outcome.is_placeable());
    ASSERT_TRUE(outcome.err.has_value());
    EXPECT_EQ(outcome.err->code, error_code::no_episode_number);
}

TEST_F(EpisodeClassifierTest, MatchIsCaseSensitive) {
    episode_classifier classifier(table_, true);
    EXPECT_FALSE(classifier.classify("[GroupA] show 01.mkv").matched);
}

TEST_F(EpisodeClassifierTest, ExtractEpisode) {
    auto found = episode_classifier::extract_episode("Show 03 (WEB 1080p).en.ass");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->episode, "03");
    EXPECT_EQ(found->extension, ".ass");

    EXPECT_FALSE(episode_classifier::extract_episode("Show 3.mkv").has_value());
    EXPECT_FALSE(episode_classifier::extract_episode("Show 103.mkv").has_value());
    EXPECT_FALSE(episode_classifier::extract_episode("Show 01").has_value());
}

TEST_F(EpisodeClassifierTest, Deterministic) {
    episode_classifier classifier(table_, true);
    auto a = classifier.classify("[GroupA] Show 09 (WEB).mkv");
    auto b = classifier.classify("[GroupA] Show 09 (WEB).mkv");
    EXPECT_EQ(a.destination_path, b.destination_path);
    EXPECT_EQ(a.target_name, b.target_name);
}

TEST_F(EpisodeClassifierTest, FormatTargetName) {
    EXPECT_EQ(episode_classifier::format_target_name(1, "01", ".mkv"), "S01E01.mkv");
    EXPECT_EQ(episode_classifier::format_target_name(12, "24", ".mp4"), "S12E24.mp4");
}

TEST_F(EpisodeClassifierTest, SeriesRuleValidation) {
    EXPECT_TRUE((series_rule{"Show", "ShowFolder", 1, std::nullopt}).validate().has_value());
    EXPECT_FALSE((series_rule{"", "ShowFolder", 1, std::nullopt}).validate().has_value());
    EXPECT_FALSE((series_rule{"Show", "", 1, std::nullopt}).validate().has_value());
    EXPECT_FALSE((series_rule{"Show", "ShowFolder", 0, std::nullopt}).validate().has_value());
}

}  // namespace kcenon::media_fetch::test
