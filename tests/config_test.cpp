// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/config.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace logroll {
namespace {

bool has_error(const std::vector<ConfigError>& errors, ConfigError err) {
    return std::find(errors.begin(), errors.end(), err) != errors.end();
}

RollingConfigBuilder daily() {
    RollingConfigBuilder builder;
    builder.file("logs/app.log").file_name_pattern("logs/app-{date}.log");
    return builder;
}

// ============================================================================
// Defaults
// ============================================================================

TEST(RollingConfigTest, Defaults) {
    RollingConfig config;
    EXPECT_EQ(config.name, kDefaultAppenderName);
    EXPECT_EQ(config.rollover_period, std::chrono::hours(24));
    EXPECT_EQ(config.max_file_size, 0u);
    EXPECT_TRUE(config.append);
    EXPECT_TRUE(config.immediate_flush);
    EXPECT_EQ(config.compression_level, 3);
    EXPECT_EQ(config.encoder_pattern, PatternEncoder::kDefaultPattern);
    EXPECT_FALSE(config.compressed());
}

TEST(RollingConfigTest, DailyPatternIsValid) {
    auto config = daily().build();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->file, std::filesystem::path("logs/app.log"));
}

TEST(RollingConfigTest, SizeAndTimeTogether) {
    auto config = RollingConfigBuilder()
        .file("app.log")
        .file_name_pattern("app-{date}.{index}.log.zst")
        .max_file_size(1024)
        .compression_level(19)
        .build();
    ASSERT_TRUE(config.has_value());
    EXPECT_TRUE(config->compressed());
}

TEST(RollingConfigTest, SizeOnlyDisablesTimeTrigger) {
    auto config = RollingConfigBuilder()
        .file("app.log")
        .file_name_pattern("app-{index}.log")
        .size_only(4096)
        .build();
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->rollover_period.count(), 0);
    EXPECT_EQ(config->max_file_size, 4096u);
}

TEST(RollingConfigTest, BuilderCarriesEverySetting) {
    auto config = daily()
        .name("AUDIT")
        .max_history(7)
        .max_age(std::chrono::hours(48))
        .total_size_cap(1 << 20)
        .append(false)
        .immediate_flush(false)
        .encoder("{msg}{n}", "header\n")
        .build_unchecked();

    EXPECT_EQ(config.name, "AUDIT");
    EXPECT_EQ(config.max_history, 7u);
    EXPECT_EQ(config.max_age, std::chrono::hours(48));
    EXPECT_EQ(config.total_size_cap, 1u << 20);
    EXPECT_FALSE(config.append);
    EXPECT_FALSE(config.immediate_flush);
    EXPECT_EQ(config.encoder_pattern, "{msg}{n}");
    EXPECT_EQ(config.encoder_header, "header\n");
    EXPECT_EQ(config.encoder_footer, "");
}

// ============================================================================
// Validation
// ============================================================================

TEST(RollingConfigTest, EmptyConfigReportsAllErrors) {
    RollingConfig config;
    config.name.clear();
    auto result = config.validate();
    ASSERT_FALSE(result.has_value());

    const auto& errors = result.error();
    EXPECT_TRUE(has_error(errors, ConfigError::EmptyName));
    EXPECT_TRUE(has_error(errors, ConfigError::EmptyFile));
    EXPECT_TRUE(has_error(errors, ConfigError::EmptyFileNamePattern));
}

TEST(RollingConfigTest, PatternNeedsTokens) {
    auto result = daily().file_name_pattern("logs/app.old.log").build();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(has_error(result.error(), ConfigError::PatternWithoutTokens));
    EXPECT_TRUE(has_error(result.error(), ConfigError::TimeTriggerWithoutDate));
}

TEST(RollingConfigTest, SizeTriggerNeedsIndex) {
    auto result = daily().max_file_size(100).build();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(has_error(result.error(), ConfigError::SizeTriggerWithoutIndex));
}

TEST(RollingConfigTest, TimeTriggerNeedsDate) {
    auto result = daily().file_name_pattern("logs/app-{index}.log").build();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(has_error(result.error(), ConfigError::TimeTriggerWithoutDate));
}

TEST(RollingConfigTest, NoTrigger) {
    auto result = daily().rollover_period(std::chrono::milliseconds(0)).build();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(has_error(result.error(), ConfigError::NoTrigger));
}

TEST(RollingConfigTest, RolloverPeriodTooShort) {
    auto result = daily().rollover_period(std::chrono::milliseconds(500)).build();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(has_error(result.error(), ConfigError::InvalidRolloverPeriod));
}

TEST(RollingConfigTest, TokensInDirectoryRejected) {
    auto result = daily().file_name_pattern("logs/{date}/app.log").build();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(has_error(result.error(), ConfigError::TokensInDirectory));
}

TEST(RollingConfigTest, CompressionLevelCheckedOnlyWhenCompressing) {
    EXPECT_TRUE(daily().compression_level(99).build().has_value());

    auto result = daily().file_name_pattern("logs/app-{date}.log.zst").compression_level(99).build();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(has_error(result.error(), ConfigError::InvalidCompressionLevel));
}

TEST(RollingConfigTest, FileEqualToPatternRejected) {
    auto result = daily().file("logs/app-{date}.log").build();
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(has_error(result.error(), ConfigError::FileEqualsPattern));
}

TEST(RollingConfigTest, EveryErrorHasMessage) {
    for (auto err : {ConfigError::EmptyName, ConfigError::EmptyFile, ConfigError::EmptyFileNamePattern,
                     ConfigError::PatternWithoutTokens, ConfigError::SizeTriggerWithoutIndex,
                     ConfigError::TimeTriggerWithoutDate, ConfigError::NoTrigger,
                     ConfigError::InvalidRolloverPeriod, ConfigError::TokensInDirectory,
                     ConfigError::InvalidCompressionLevel, ConfigError::FileEqualsPattern}) {
        EXPECT_NE(config_error_message(err), "unknown configuration error");
    }
}

} // namespace
} // namespace logroll
