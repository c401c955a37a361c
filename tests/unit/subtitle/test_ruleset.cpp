/**
 * @file test_ruleset.cpp
 * @brief Unit tests for subtitle replacement rules
 */

#include <gtest/gtest.h>

#include <kcenon/media_fetch/subtitle/ruleset.h>

#include <filesystem>
#include <fstream>

namespace kcenon::media_fetch::test {

// =============================================================================
// Parsing
// =============================================================================

class RulesetParseTest : public ::testing::Test {};

TEST_F(RulesetParseTest, ParsesPairsAndSkipsBlankLines) {
    auto rules = parse_ruleset("Kirito|Kazuto\n\n  Mr.|Mister  \r\n");
    ASSERT_TRUE(rules.has_value()) << rules.error().message;
    ASSERT_EQ(rules.value().size(), 2u);
    EXPECT_EQ(rules.value()[0], (replacement_rule{"Kirito", "Kazuto"}));
    EXPECT_EQ(rules.value()[1], (replacement_rule{"Mr.", "Mister"}));
}

TEST_F(RulesetParseTest, EmptyTextIsEmptyRuleset) {
    auto rules = parse_ruleset("");
    ASSERT_TRUE(rules.has_value());
    EXPECT_TRUE(rules.value().empty());
}

TEST_F(RulesetParseTest, MissingSeparator) {
    auto rules = parse_ruleset("Kirito|Kazuto\nAsuna\n");
    ASSERT_FALSE(rules.has_value());
    EXPECT_EQ(rules.error().code, error_code::invalid_ruleset);
    EXPECT_NE(rules.error().message.find("line 2"), std::string::npos);
}

TEST_F(RulesetParseTest, TooManySeparators) {
    auto rules = parse_ruleset("a|b|c");
    ASSERT_FALSE(rules.has_value());
    EXPECT_EQ(rules.error().code, error_code::invalid_ruleset);
}

TEST_F(RulesetParseTest, EmptyField) {
    EXPECT_FALSE(parse_ruleset("|Kazuto").has_value());
    EXPECT_FALSE(parse_ruleset("Kirito|").has_value());
}

TEST_F(RulesetParseTest, LoadFromFile) {
    auto dir = std::filesystem::temp_directory_path() / "media_fetch_test_ruleset";
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "replace.txt") << "Kirito|Kazuto\n";
    std::ofstream(dir / "broken.txt") << "Kirito\n";

    auto loaded = load_ruleset(dir / "replace.txt");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded.value().size(), 1u);

    auto broken = load_ruleset(dir / "broken.txt");
    ASSERT_FALSE(broken.has_value());
    EXPECT_NE(broken.error().message.find("broken.txt"), std::string::npos);

    auto missing = load_ruleset(dir / "absent.txt");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::file_read_error);

    std::filesystem::remove_all(dir);
}

// =============================================================================
// Standard replacements
// =============================================================================

class StandardReplacementsTest : public ::testing::Test {};

TEST_F(StandardReplacementsTest, Stutters) {
    EXPECT_EQ(apply_standard_replacements("Wh-what?"), "W-What?");
    EXPECT_EQ(apply_standard_replacements("Th-that"), "T-That");
    EXPECT_EQ(apply_standard_replacements("I-it's fine"), "I-It's fine");
    EXPECT_EQ(apply_standard_replacements("N-no"), "N-No");
}

TEST_F(StandardReplacementsTest, VAndXAreLeftAlone) {
    EXPECT_EQ(apply_standard_replacements("V-very X-xenon"), "V-very X-xenon");
}

TEST_F(StandardReplacementsTest, LineBreakSpacing) {
    EXPECT_EQ(apply_standard_replacements(R"(first\Nsecond\hthird)"),
              R"(first\N second\h third)");
}

TEST_F(StandardReplacementsTest, ListShape) {
    const auto& list = standard_replacements();
    // 4 two-letter stutters, 24 single letters, 2 line-break rules
    EXPECT_EQ(list.size(), 30u);
}

// =============================================================================
// Token-bounded rules
// =============================================================================

class ApplyRulesetTest : public ::testing::Test {};

TEST_F(ApplyRulesetTest, ReplacesWholeTokens) {
    ruleset rules{{"Kirito", "Kazuto"}};
    EXPECT_EQ(apply_ruleset("Kirito and Kirito!", rules), "Kazuto and Kazuto!");
    EXPECT_EQ(apply_ruleset("Kiritos", rules), "Kiritos");
    EXPECT_EQ(apply_ruleset("AKirito", rules), "AKirito");
}

TEST_F(ApplyRulesetTest, PreservesPossessive) {
    ruleset rules{{"Kirito", "Kazuto"}};
    EXPECT_EQ(apply_ruleset("Kirito's sword", rules), "Kazuto's sword");
    EXPECT_EQ(apply_ruleset("Kirito\xE2\x80\x99s sword", rules), "Kazuto\xE2\x80\x99s sword");
}

TEST_F(ApplyRulesetTest, StutterRuleDoesNotTouchLongerWord) {
    ruleset rules{{"Wh-wh", "W-Wh"}};
    EXPECT_EQ(apply_ruleset("Wh-whats", rules), "Wh-whats");
    EXPECT_EQ(apply_ruleset("wh-whats", rules), "wh-whats");
    EXPECT_EQ(apply_ruleset("Wh-wh!", rules), "W-Wh!");
}

TEST_F(ApplyRulesetTest, RegexCharactersAreLiteral) {
    ruleset rules{{"Mr.", "Mister"}, {"(laughs)", "[laughs]"}};
    EXPECT_EQ(apply_ruleset("Mr. Smith (laughs)", rules), "Mister Smith [laughs]");
    EXPECT_EQ(apply_ruleset("Mrs Smith", rules), "Mrs Smith");
}

TEST_F(ApplyRulesetTest, RulesApplyInOrder) {
    ruleset rules{{"Asuna", "Yuuki"}, {"Yuuki", "Konno"}};
    EXPECT_EQ(apply_ruleset("Asuna", rules), "Konno");
}

}  // namespace kcenon::media_fetch::test
