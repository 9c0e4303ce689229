// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

// ============================================================================
// Platform Detection
// ============================================================================

#if defined(__ANDROID__)
    #define LOGROLL_PLATFORM_ANDROID 1
#endif

// ============================================================================
// Platform Utility Functions (implemented in platform.cpp)
// ============================================================================

#include "types.hpp"

#include <cstdint>

namespace logroll {

// Process/Thread ID
[[nodiscard]] std::int64_t get_pid() noexcept;
[[nodiscard]] std::int64_t get_tid() noexcept;

// Timestamps
[[nodiscard]] Timestamp get_timestamp() noexcept;
[[nodiscard]] std::int64_t current_time_millis() noexcept;

// Fills tag/message-independent fields (timestamp, pid, tid) of a record
[[nodiscard]] Record make_record(Level level, std::string_view tag, std::string_view message,
                                 const std::source_location& loc = std::source_location::current()) noexcept;

} // namespace logroll
