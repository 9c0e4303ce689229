// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include "file_system.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace logroll {

// What a triggering policy may inspect when asked about rotation
struct TriggerContext {
    const std::filesystem::path& active_file;
    std::int64_t now_ms;
    const IFileSystem& file_system;
};

// ============================================================================
// Triggering Policy Interface
// ============================================================================

class ITriggeringPolicy {
public:
    virtual ~ITriggeringPolicy() = default;

    // Called once when the owning appender starts
    virtual void start(std::int64_t now_ms) { (void)now_ms; }

    // true when the active file should be rotated now
    [[nodiscard]] virtual bool is_triggering(const TriggerContext& ctx) = 0;

    // Start of the time period containing `now_ms`, for policies that
    // rotate on time boundaries
    [[nodiscard]] virtual std::optional<std::int64_t> period_start(std::int64_t now_ms) const {
        (void)now_ms;
        return std::nullopt;
    }
};

// ============================================================================
// Size Triggering Policy
// ============================================================================

class SizeTriggeringPolicy final : public ITriggeringPolicy {
public:
    static constexpr std::uint64_t kDefaultMaxFileSize = 10 * 1024 * 1024;

    explicit SizeTriggeringPolicy(std::uint64_t max_file_size = kDefaultMaxFileSize) noexcept
        : max_file_size_(max_file_size) {}

    [[nodiscard]] bool is_triggering(const TriggerContext& ctx) override;

    [[nodiscard]] std::uint64_t max_file_size() const noexcept { return max_file_size_; }

private:
    std::uint64_t max_file_size_;
};

// ============================================================================
// Time Triggering Policy - fixed-length periods aligned to the UTC epoch
// ============================================================================

class TimeTriggeringPolicy final : public ITriggeringPolicy {
public:
    static constexpr std::int64_t kDailyPeriodMs = 24LL * 60 * 60 * 1000;
    static constexpr std::int64_t kHourlyPeriodMs = 60LL * 60 * 1000;

    explicit TimeTriggeringPolicy(std::int64_t period_ms = kDailyPeriodMs) noexcept
        : period_ms_(period_ms) {}

    void start(std::int64_t now_ms) override;

    // Triggers on the first call at or after the next period boundary
    [[nodiscard]] bool is_triggering(const TriggerContext& ctx) override;

    [[nodiscard]] std::optional<std::int64_t> period_start(std::int64_t now_ms) const override;

    [[nodiscard]] std::int64_t period_ms() const noexcept { return period_ms_; }
    [[nodiscard]] std::int64_t next_check() const noexcept { return next_check_; }

private:
    [[nodiscard]] std::int64_t floor_to_period(std::int64_t now_ms) const noexcept;

    std::int64_t period_ms_;
    std::int64_t next_check_ = 0;
};

// ============================================================================
// Composite Triggering Policy - triggers when any member triggers
// ============================================================================

class CompositeTriggeringPolicy final : public ITriggeringPolicy {
public:
    CompositeTriggeringPolicy() = default;
    explicit CompositeTriggeringPolicy(std::vector<std::shared_ptr<ITriggeringPolicy>> policies)
        : policies_(std::move(policies)) {}

    void add(std::shared_ptr<ITriggeringPolicy> policy) { policies_.push_back(std::move(policy)); }

    void start(std::int64_t now_ms) override;

    // Every member is consulted so stateful members stay current
    [[nodiscard]] bool is_triggering(const TriggerContext& ctx) override;

    // First member that has periods
    [[nodiscard]] std::optional<std::int64_t> period_start(std::int64_t now_ms) const override;

    [[nodiscard]] std::size_t size() const noexcept { return policies_.size(); }

private:
    std::vector<std::shared_ptr<ITriggeringPolicy>> policies_;
};

} // namespace logroll
