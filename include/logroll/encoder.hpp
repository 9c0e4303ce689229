// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include "types.hpp"

#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace logroll {

// ============================================================================
// Encoder Interface - turns records into bytes
// ============================================================================

class IEncoder {
public:
    virtual ~IEncoder() = default;

    // Bytes written once at the top of every freshly installed stream
    [[nodiscard]] virtual std::expected<std::string, std::error_code> header_bytes() = 0;

    // Bytes written once before a stream is closed or replaced
    [[nodiscard]] virtual std::expected<std::string, std::error_code> footer_bytes() = 0;

    [[nodiscard]] virtual std::expected<std::string, std::error_code> encode(const Record& record) = 0;
};

// ============================================================================
// Pattern Encoder
// ============================================================================
//
// Supported tokens:
//   {level}  - Single letter level (D, I, W, E, F)
//   {Level}  - Full level name (DEBUG, INFO, etc.)
//   {time}   - Local timestamp (YYYY-MM-DD HH:MM:SS.mmm)
//   {date}   - Local date (YYYY-MM-DD)
//   {pid}    - Process ID
//   {tid}    - Thread ID
//   {tag}    - Log tag
//   {file}   - Source file name (without path)
//   {line}   - Source line number
//   {func}   - Function name
//   {msg}    - Log message
//   {n}      - Newline
//
// Unknown tokens are copied through literally.

class PatternEncoder final : public IEncoder {
public:
    static constexpr std::string_view kDefaultPattern =
        "{time} [{tid}] {Level} {tag} - {msg}{n}";

    explicit PatternEncoder(std::string_view pattern = kDefaultPattern,
                            std::string header = {},
                            std::string footer = {});
    ~PatternEncoder() override;

    PatternEncoder(const PatternEncoder&) = delete;
    PatternEncoder& operator=(const PatternEncoder&) = delete;

    [[nodiscard]] std::expected<std::string, std::error_code> header_bytes() override;
    [[nodiscard]] std::expected<std::string, std::error_code> footer_bytes() override;
    [[nodiscard]] std::expected<std::string, std::error_code> encode(const Record& record) override;

    [[nodiscard]] std::string_view pattern() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

[[nodiscard]] constexpr std::string_view extract_filename(std::string_view path) noexcept {
    if (auto pos = path.find_last_of("/\\"); pos != std::string_view::npos) {
        return path.substr(pos + 1);
    }
    return path;
}

} // namespace logroll
