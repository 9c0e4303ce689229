// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace logroll {

// Which period and which slot within it a rotated file belongs to
struct NamingState {
    std::int64_t period_start_ms = 0;
    std::uint32_t index = 0;
};

// ============================================================================
// File Namer Interface - names rotated files
// ============================================================================

class IFileNamer {
public:
    virtual ~IFileNamer() = default;

    [[nodiscard]] virtual std::filesystem::path resolve(const NamingState& state) const = 0;

    // Directory all rotated files live in
    [[nodiscard]] virtual std::filesystem::path directory() const = 0;

    // true for any name resolve() could have produced, compressed or not
    [[nodiscard]] virtual bool matches(std::string_view file_name) const = 0;

    // Index encoded in `file_name` when it belongs to the given period
    [[nodiscard]] virtual std::optional<std::uint32_t>
    index_of(std::string_view file_name, std::int64_t period_start_ms) const = 0;

    [[nodiscard]] virtual bool has_index() const noexcept = 0;

    // true when resolved names carry the compression suffix
    [[nodiscard]] virtual bool compressed() const noexcept = 0;
};

// ============================================================================
// Pattern File Namer
// ============================================================================
//
// Tokens (file name part only):
//   {date}           - UTC date of the period start, "%Y-%m-%d"
//   {date:<format>}  - UTC period start rendered with strftime <format>
//   {index}          - Rotation index within the period, from 0
//
// A pattern ending in ".zst" produces compressed archives.

class PatternFileNamer final : public IFileNamer {
public:
    static constexpr std::string_view kDefaultDateFormat = "%Y-%m-%d";
    static constexpr std::string_view kCompressionSuffix = ".zst";

    explicit PatternFileNamer(std::string pattern);
    ~PatternFileNamer() override;

    PatternFileNamer(const PatternFileNamer&) = delete;
    PatternFileNamer& operator=(const PatternFileNamer&) = delete;

    [[nodiscard]] std::filesystem::path resolve(const NamingState& state) const override;
    [[nodiscard]] std::filesystem::path directory() const override;
    [[nodiscard]] bool matches(std::string_view file_name) const override;
    [[nodiscard]] std::optional<std::uint32_t>
    index_of(std::string_view file_name, std::int64_t period_start_ms) const override;
    [[nodiscard]] bool has_index() const noexcept override;
    [[nodiscard]] bool compressed() const noexcept override;

    [[nodiscard]] const std::string& pattern() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Token summary of a naming pattern, used by configuration checks
struct PatternTokens {
    bool has_date = false;
    bool has_index = false;
    bool tokens_in_directory = false;
};

[[nodiscard]] PatternTokens scan_pattern_tokens(std::string_view pattern);

} // namespace logroll
