// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include "encoder.hpp"
#include "file_namer.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace logroll {

// ============================================================================
// Constants
// ============================================================================

/// Default appender name used when none is specified
inline constexpr const char* kDefaultAppenderName = "ROLLING";

/// Constraints
inline constexpr int kMinCompressionLevel = 1;
inline constexpr int kMaxCompressionLevel = 22;
inline constexpr auto kMinRolloverPeriod = std::chrono::seconds{1};

// ============================================================================
// Configuration Error
// ============================================================================

enum class ConfigError {
    EmptyName,
    EmptyFile,
    EmptyFileNamePattern,
    PatternWithoutTokens,      // Neither {date} nor {index}
    SizeTriggerWithoutIndex,   // max_file_size set, pattern has no {index}
    TimeTriggerWithoutDate,    // rollover_period set, pattern has no {date}
    NoTrigger,                 // Neither max_file_size nor rollover_period
    InvalidRolloverPeriod,     // Shorter than one second
    TokensInDirectory,         // Tokens before the last path separator
    InvalidCompressionLevel,   // Out of range [1, 22]
    FileEqualsPattern,         // Active file would be overwritten by rotation
};

/// Get human-readable error message
[[nodiscard]] constexpr std::string_view config_error_message(ConfigError err) noexcept {
    switch (err) {
        case ConfigError::EmptyName:
            return "name cannot be empty";
        case ConfigError::EmptyFile:
            return "file cannot be empty";
        case ConfigError::EmptyFileNamePattern:
            return "file_name_pattern cannot be empty";
        case ConfigError::PatternWithoutTokens:
            return "file_name_pattern must contain {date} or {index}";
        case ConfigError::SizeTriggerWithoutIndex:
            return "file_name_pattern must contain {index} when max_file_size is set";
        case ConfigError::TimeTriggerWithoutDate:
            return "file_name_pattern must contain {date} when rollover_period is set";
        case ConfigError::NoTrigger:
            return "at least one of max_file_size or rollover_period must be set";
        case ConfigError::InvalidRolloverPeriod:
            return "rollover_period must be at least 1s";
        case ConfigError::TokensInDirectory:
            return "file_name_pattern tokens are only allowed in the file name";
        case ConfigError::InvalidCompressionLevel:
            return "compression_level must be in range [1, 22]";
        case ConfigError::FileEqualsPattern:
            return "file and file_name_pattern must differ";
    }
    return "unknown configuration error";
}

// ============================================================================
// Configuration
// ============================================================================

struct RollingConfig {
    // Appender name, used in status messages and collision reports
    std::string name = kDefaultAppenderName;

    // Required: active log file
    std::filesystem::path file;

    // Required: rotated file naming, e.g. "logs/app-{date}.{index}.log".
    // Ending it in ".zst" compresses rotated files.
    std::string file_name_pattern;

    // Size trigger (0 = off)
    std::uint64_t max_file_size = 0;

    // Time trigger, periods aligned to the UTC epoch (0 = off)
    std::chrono::milliseconds rollover_period = std::chrono::hours{24};

    // Retention (0 = unlimited)
    std::size_t max_history = 0;
    std::chrono::milliseconds max_age{0};
    std::uint64_t total_size_cap = 0;

    // Keep existing content of the active file on start
    bool append = true;

    // Flush after every event
    bool immediate_flush = true;

    /// Zstd level, used when file_name_pattern ends in ".zst"
    int compression_level = 3;

    // Encoder
    std::string encoder_pattern = std::string(PatternEncoder::kDefaultPattern);
    std::string encoder_header;
    std::string encoder_footer;

    [[nodiscard]] bool compressed() const noexcept {
        return std::string_view(file_name_pattern).ends_with(PatternFileNamer::kCompressionSuffix);
    }

    // ========================================================================
    // Validation
    // ========================================================================

    /// Comprehensive validation returning all errors
    [[nodiscard]] std::expected<void, std::vector<ConfigError>> validate() const {
        std::vector<ConfigError> errors;

        // Required fields
        if (name.empty()) {
            errors.push_back(ConfigError::EmptyName);
        }
        if (file.empty()) {
            errors.push_back(ConfigError::EmptyFile);
        }

        if (file_name_pattern.empty()) {
            errors.push_back(ConfigError::EmptyFileNamePattern);
        } else {
            auto tokens = scan_pattern_tokens(file_name_pattern);
            if (tokens.tokens_in_directory) {
                errors.push_back(ConfigError::TokensInDirectory);
            }
            if (!tokens.has_date && !tokens.has_index) {
                errors.push_back(ConfigError::PatternWithoutTokens);
            }
            if (max_file_size > 0 && !tokens.has_index) {
                errors.push_back(ConfigError::SizeTriggerWithoutIndex);
            }
            if (rollover_period.count() > 0 && !tokens.has_date) {
                errors.push_back(ConfigError::TimeTriggerWithoutDate);
            }
            if (!file.empty() && file == std::filesystem::path(file_name_pattern)) {
                errors.push_back(ConfigError::FileEqualsPattern);
            }
        }

        // Triggers
        if (max_file_size == 0 && rollover_period.count() <= 0) {
            errors.push_back(ConfigError::NoTrigger);
        } else if (rollover_period.count() > 0 && rollover_period < kMinRolloverPeriod) {
            errors.push_back(ConfigError::InvalidRolloverPeriod);
        }

        // Range checks
        if (compressed() &&
            (compression_level < kMinCompressionLevel || compression_level > kMaxCompressionLevel)) {
            errors.push_back(ConfigError::InvalidCompressionLevel);
        }

        if (errors.empty()) {
            return {};
        }
        return std::unexpected(std::move(errors));
    }
};

// ============================================================================
// Config Builder (Fluent API with optional semantics)
// ============================================================================

class RollingConfigBuilder {
public:
    RollingConfigBuilder() = default;

    RollingConfigBuilder& name(std::string value) {
        config_.name = std::move(value);
        return *this;
    }

    /// Set required active file
    RollingConfigBuilder& file(std::filesystem::path path) {
        config_.file = std::move(path);
        return *this;
    }

    /// Set required rotation naming pattern
    RollingConfigBuilder& file_name_pattern(std::string pattern) {
        config_.file_name_pattern = std::move(pattern);
        return *this;
    }

    /// Rotate when the active file reaches `bytes` (0 = off)
    RollingConfigBuilder& max_file_size(std::uint64_t bytes) {
        config_.max_file_size = bytes;
        return *this;
    }

    /// Rotate on period boundaries (0 = off)
    RollingConfigBuilder& rollover_period(std::chrono::milliseconds period) {
        config_.rollover_period = period;
        return *this;
    }

    RollingConfigBuilder& size_only(std::uint64_t bytes) {
        config_.max_file_size = bytes;
        config_.rollover_period = std::chrono::milliseconds{0};
        return *this;
    }

    RollingConfigBuilder& max_history(std::size_t files) {
        config_.max_history = files;
        return *this;
    }

    RollingConfigBuilder& max_age(std::chrono::milliseconds age) {
        config_.max_age = age;
        return *this;
    }

    RollingConfigBuilder& total_size_cap(std::uint64_t bytes) {
        config_.total_size_cap = bytes;
        return *this;
    }

    RollingConfigBuilder& append(bool enable = true) {
        config_.append = enable;
        return *this;
    }

    RollingConfigBuilder& immediate_flush(bool enable = true) {
        config_.immediate_flush = enable;
        return *this;
    }

    /// Set zstd level (only used with a ".zst" pattern)
    RollingConfigBuilder& compression_level(int level) {
        config_.compression_level = level;
        return *this;
    }

    RollingConfigBuilder& encoder(std::string pattern,
                                  std::optional<std::string> header = std::nullopt,
                                  std::optional<std::string> footer = std::nullopt) {
        config_.encoder_pattern = std::move(pattern);
        if (header.has_value()) {
            config_.encoder_header = std::move(*header);
        }
        if (footer.has_value()) {
            config_.encoder_footer = std::move(*footer);
        }
        return *this;
    }

    /// Build with validation (fast, no I/O)
    [[nodiscard]] std::expected<RollingConfig, std::vector<ConfigError>> build() const {
        auto result = config_.validate();
        if (!result) {
            return std::unexpected(std::move(result.error()));
        }
        return config_;
    }

    /// Build without validation (fast, no checks)
    [[nodiscard]] RollingConfig build_unchecked() const {
        return config_;
    }

private:
    RollingConfig config_;
};

} // namespace logroll
