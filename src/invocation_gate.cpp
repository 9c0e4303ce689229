// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/invocation_gate.hpp"
#include "logroll/platform.hpp"

#include <algorithm>

namespace logroll {

DefaultInvocationGate::DefaultInvocationGate() noexcept
    : DefaultInvocationGate(kDefaultMinDelayMs, kDefaultMaxDelayMs, current_time_millis()) {}

DefaultInvocationGate::DefaultInvocationGate(std::int64_t min_delay_ms,
                                             std::int64_t max_delay_ms,
                                             std::int64_t now_ms) noexcept
    : min_delay_(min_delay_ms),
      max_delay_(max_delay_ms) {
    update_limits(now_ms);
}

bool DefaultInvocationGate::is_too_soon(std::int64_t now_ms) {
    if (mask_ == 0) {
        return false;
    }

    const bool match = (counter_++ & mask_) == mask_;

    if (now_ms > upper_limit_) {
        mask_ >>= kMaskDecreaseRightShift;
        update_limits(now_ms);
        return false;
    }

    if (match) {
        if (now_ms < lower_limit_) {
            mask_ = std::min((mask_ << 1) | 1, kMaxMask);
        }
        update_limits(now_ms);
        return false;
    }

    return true;
}

void DefaultInvocationGate::update_limits(std::int64_t now_ms) noexcept {
    lower_limit_ = now_ms + min_delay_;
    upper_limit_ = now_ms + max_delay_;
}

} // namespace logroll
