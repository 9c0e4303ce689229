// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include <string>
#include <system_error>
#include <type_traits>

namespace logroll {

// ============================================================================
// Library Error Codes
// ============================================================================

enum class Errc {
    stream_closed = 1,   // Write/flush with no output stream installed
    short_write,         // Fewer bytes accepted than requested
    encoder_failure,     // Encoder could not produce bytes
    compression_failed,  // zstd reported an error
    rename_failed,       // Rotated file could not be moved into place
    open_failed,         // Output file could not be opened
};

[[nodiscard]] const std::error_category& logroll_category() noexcept;

[[nodiscard]] inline std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), logroll_category()};
}

// "message (category:value)" or empty when there is no error
[[nodiscard]] std::string describe(const std::error_code& ec);

} // namespace logroll

template <>
struct std::is_error_code_enum<logroll::Errc> : std::true_type {};
