/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes and result types
 */

#include <gtest/gtest.h>

#include <kcenon/media_fetch/core/types.h>

#include <string>

namespace kcenon::media_fetch::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Configuration and process errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::config_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::instance_locked), -103);

    // Transfer errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::connect_failed), -120);
    EXPECT_EQ(static_cast<int>(error_code::size_mismatch), -123);

    // Classification errors: -140 to -149
    EXPECT_EQ(static_cast<int>(error_code::no_rule_match), -140);

    // Placement errors: -150 to -159
    EXPECT_EQ(static_cast<int>(error_code::destination_unwritable), -150);

    // Subtitle patch errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::invalid_ruleset), -160);
    EXPECT_EQ(static_cast<int>(error_code::patch_commit_failed), -163);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::size_mismatch), "size mismatch");
    EXPECT_STREQ(to_string(error_code::remux_failed), "remux failed");
}

TEST_F(ErrorCodeTest, FatalFamilies) {
    EXPECT_TRUE(is_fatal(error_code::config_invalid));
    EXPECT_TRUE(is_fatal(error_code::instance_locked));
    EXPECT_TRUE(is_fatal(error_code::list_failed));

    EXPECT_FALSE(is_fatal(error_code::size_mismatch));
    EXPECT_FALSE(is_fatal(error_code::remote_delete_failed));
    EXPECT_FALSE(is_fatal(error_code::no_rule_match));
    EXPECT_FALSE(is_fatal(error_code::remux_failed));
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<std::string> r = unexpected(error{error_code::stat_failed, "no such file"});
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::stat_failed);
    EXPECT_EQ(r.error().message, "no such file");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error{error_code::file_write_error});
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().message, "file write error");
}

TEST_F(ResultTest, ErrorBoolConversion) {
    EXPECT_FALSE(static_cast<bool>(error{}));
    EXPECT_TRUE(static_cast<bool>(error{error_code::internal_error}));
}

}  // namespace kcenon::media_fetch::test
