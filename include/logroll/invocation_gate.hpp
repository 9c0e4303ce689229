// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include <cstdint>

namespace logroll {

// ============================================================================
// Invocation Gate - throttles expensive periodic checks
// ============================================================================

class IInvocationGate {
public:
    virtual ~IInvocationGate() = default;

    // true when the caller should skip the expensive check this time
    [[nodiscard]] virtual bool is_too_soon(std::int64_t now_ms) = 0;
};

// Lets only every (mask + 1)-th invocation through, widening the mask when
// checks arrive faster than min_delay and narrowing it when they arrive
// slower than max_delay. A mask that reaches 0 stays there: every later call
// goes through.
//
// Not thread-safe; callers serialize access.
class DefaultInvocationGate final : public IInvocationGate {
public:
    static constexpr std::uint64_t kDefaultMask = 0xF;
    static constexpr std::uint64_t kMaxMask = 0xFFFF;
    static constexpr int kMaskDecreaseRightShift = 2;

    static constexpr std::int64_t kDefaultMinDelayMs = 100;
    static constexpr std::int64_t kDefaultMaxDelayMs = 800;

    DefaultInvocationGate() noexcept;
    DefaultInvocationGate(std::int64_t min_delay_ms, std::int64_t max_delay_ms,
                          std::int64_t now_ms) noexcept;

    [[nodiscard]] bool is_too_soon(std::int64_t now_ms) override;

    [[nodiscard]] std::uint64_t mask() const noexcept { return mask_; }
    [[nodiscard]] std::uint64_t invocation_counter() const noexcept { return counter_; }

private:
    void update_limits(std::int64_t now_ms) noexcept;

    std::int64_t min_delay_;
    std::int64_t max_delay_;
    std::int64_t lower_limit_ = 0;
    std::int64_t upper_limit_ = 0;
    std::uint64_t mask_ = kDefaultMask;
    std::uint64_t counter_ = 0;
};

// Never too soon; for tests and for triggers cheap enough to run every time
class PassThroughInvocationGate final : public IInvocationGate {
public:
    [[nodiscard]] bool is_too_soon(std::int64_t) override { return false; }
};

} // namespace logroll
