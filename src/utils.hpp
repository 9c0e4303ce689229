// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#ifndef LOGROLL_UTILS_HPP
#define LOGROLL_UTILS_HPP

#include "logroll/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace logroll::detail {

// ============================================================================
// Time Formatting Utilities
// ============================================================================

// Local time with millis: "YYYY-MM-DD HH:MM:SS.mmm"
[[nodiscard]] std::string format_timestamp(const Timestamp& tv);

// Local date only: "YYYY-MM-DD"
[[nodiscard]] std::string format_date(const Timestamp& tv);

// Local time of day, status style: "HH:MM:SS,mmm"
[[nodiscard]] std::string format_time_of_day(const Timestamp& tv);

// UTC strftime rendering of an epoch-millisecond instant
[[nodiscard]] std::string format_utc(std::int64_t epoch_ms, std::string_view strftime_pattern);

// ============================================================================
// Path/String Helpers
// ============================================================================

// Escapes regex metacharacters so text matches literally in std::regex (ECMAScript)
[[nodiscard]] std::string regex_escape(std::string_view text);

} // namespace logroll::detail

#endif // LOGROLL_UTILS_HPP
