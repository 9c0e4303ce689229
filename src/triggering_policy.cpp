// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/triggering_policy.hpp"

namespace logroll {

// ============================================================================
// SizeTriggeringPolicy
// ============================================================================

bool SizeTriggeringPolicy::is_triggering(const TriggerContext& ctx) {
    return ctx.file_system.length(ctx.active_file) >= max_file_size_;
}

// ============================================================================
// TimeTriggeringPolicy
// ============================================================================

void TimeTriggeringPolicy::start(std::int64_t now_ms) {
    next_check_ = floor_to_period(now_ms) + period_ms_;
}

bool TimeTriggeringPolicy::is_triggering(const TriggerContext& ctx) {
    if (ctx.now_ms < next_check_) {
        return false;
    }
    next_check_ = floor_to_period(ctx.now_ms) + period_ms_;
    return true;
}

std::optional<std::int64_t> TimeTriggeringPolicy::period_start(std::int64_t now_ms) const {
    return floor_to_period(now_ms);
}

std::int64_t TimeTriggeringPolicy::floor_to_period(std::int64_t now_ms) const noexcept {
    if (period_ms_ <= 0) {
        return now_ms;
    }
    auto q = now_ms / period_ms_;
    if (now_ms % period_ms_ < 0) {
        --q;
    }
    return q * period_ms_;
}

// ============================================================================
// CompositeTriggeringPolicy
// ============================================================================

void CompositeTriggeringPolicy::start(std::int64_t now_ms) {
    for (const auto& policy : policies_) {
        policy->start(now_ms);
    }
}

bool CompositeTriggeringPolicy::is_triggering(const TriggerContext& ctx) {
    bool triggered = false;
    for (const auto& policy : policies_) {
        triggered = policy->is_triggering(ctx) || triggered;
    }
    return triggered;
}

std::optional<std::int64_t> CompositeTriggeringPolicy::period_start(std::int64_t now_ms) const {
    for (const auto& policy : policies_) {
        if (auto start = policy->period_start(now_ms)) {
            return start;
        }
    }
    return std::nullopt;
}

} // namespace logroll
