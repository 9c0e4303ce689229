// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace logroll {

// Limits applied to rotated files after every rollover. Zero disables a limit.
// Files are ranked newest first (modification time, then name); the active
// file is never touched.
struct RetentionPolicy {
    std::size_t max_history = 0;                // Keep at most this many files
    std::chrono::milliseconds max_age{0};       // Delete files older than this
    std::uint64_t total_size_cap = 0;           // Delete oldest files beyond this many bytes

    [[nodiscard]] constexpr bool enabled() const noexcept {
        return max_history > 0 || max_age.count() > 0 || total_size_cap > 0;
    }
};

} // namespace logroll
