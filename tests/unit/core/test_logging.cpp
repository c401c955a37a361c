/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/media_fetch/core/logging.h>

#include <mutex>
#include <string>
#include <vector>

namespace kcenon::media_fetch::test {

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, NoneConfigLeavesInputAlone) {
    sensitive_info_masker masker;
    const std::string input = "connect 192.168.1.20 /srv/media/[GroupA] Show 01.mkv";
    EXPECT_EQ(masker.mask(input), input);
}

TEST_F(SensitiveInfoMaskerTest, MasksIpAddresses) {
    sensitive_info_masker masker(masking_config{false, true, "*"});
    auto masked = masker.mask("connect 192.168.1.20 failed");
    EXPECT_EQ(masked.find("192.168.1.20"), std::string::npos);
    EXPECT_NE(masked.find(".20 failed"), std::string::npos);
}

TEST_F(SensitiveInfoMaskerTest, PathMaskingKeepsFileName) {
    sensitive_info_masker masker(masking_config{true, false, "*"});
    auto masked = masker.mask_path("/srv/library/ShowFolder/S01E01.mkv");
    EXPECT_EQ(masked.find("/srv/library"), std::string::npos);
    EXPECT_NE(masked.find("S01E01.mkv"), std::string::npos);
}

// =============================================================================
// Log Level Tests
// =============================================================================

class LogLevelTest : public ::testing::Test {};

TEST_F(LogLevelTest, ParseNames) {
    EXPECT_EQ(log_level_from_string("debug"), log_level::debug);
    EXPECT_EQ(log_level_from_string("WARN"), log_level::warn);
    EXPECT_EQ(log_level_from_string("Error"), log_level::error);
    EXPECT_FALSE(log_level_from_string("loud").has_value());
}

TEST_F(LogLevelTest, ToString) {
    EXPECT_EQ(log_level_to_string(log_level::info), "INFO");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, JsonCarriesFileAndStage) {
    transfer_log_context ctx;
    ctx.filename = "[GroupA] Show 01 (WEB).mkv";
    ctx.stage = "transfer";
    ctx.file_size = 5'000'000;
    ctx.error_message = "size mismatch";

    auto json = ctx.to_json();
    EXPECT_NE(json.find("\"filename\":\"[GroupA] Show 01 (WEB).mkv\""), std::string::npos);
    EXPECT_NE(json.find("\"stage\":\"transfer\""), std::string::npos);
    EXPECT_NE(json.find("\"size\":5000000"), std::string::npos);
}

TEST_F(TransferLogContextTest, EmptyContext) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

// =============================================================================
// Logger Tests
// =============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        get_logger().set_level(log_level::trace);
        get_logger().set_callback([this](log_level level, std::string_view category,
                                         std::string_view message,
                                         const transfer_log_context* ctx) {
            std::lock_guard lock(mutex_);
            records_.push_back({level, std::string(category), std::string(message),
                                ctx ? ctx->stage : std::string{}});
        });
    }

    void TearDown() override {
        get_logger().set_callback(nullptr);
        get_logger().set_level(log_level::info);
    }

    struct record {
        log_level level;
        std::string category;
        std::string message;
        std::string stage;
    };

    std::mutex mutex_;
    std::vector<record> records_;
};

TEST_F(LoggerTest, MacrosReachCallback) {
    MF_LOG_INFO(log_category::transfer, "Starting transfer");

    transfer_log_context ctx;
    ctx.filename = "a.mkv";
    ctx.stage = "place";
    MF_LOG_ERROR_CTX(log_category::placement, "Placement failed", ctx);

    ASSERT_EQ(records_.size(), 2u);
    EXPECT_EQ(records_[0].level, log_level::info);
    EXPECT_EQ(records_[0].category, "media_fetch.transfer");
    EXPECT_EQ(records_[0].message, "Starting transfer");
    EXPECT_EQ(records_[1].level, log_level::error);
    EXPECT_EQ(records_[1].stage, "place");
}

TEST_F(LoggerTest, LevelFiltersRecords) {
    get_logger().set_level(log_level::warn);

    MF_LOG_DEBUG(log_category::app, "hidden");
    MF_LOG_INFO(log_category::app, "hidden");
    MF_LOG_WARN(log_category::app, "shown");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "shown");
}

}  // namespace kcenon::media_fetch::test
