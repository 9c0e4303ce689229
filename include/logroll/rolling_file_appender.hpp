// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include "config.hpp"
#include "file_appender.hpp"
#include "file_namer.hpp"
#include "file_system.hpp"
#include "invocation_gate.hpp"
#include "retention_policy.hpp"
#include "triggering_policy.hpp"
#include "types.hpp"

#include <expected>
#include <memory>
#include <string>
#include <vector>

namespace logroll {

// ============================================================================
// RollingFileAppender - FileAppender that rotates its file
// ============================================================================
//
// Before each event the triggering policy is consulted (throttled by the
// invocation gate). When it fires, the active file is closed, renamed to the
// next name from the naming pattern and reopened. Rotated files matching the
// pattern are then compressed and pruned per the retention policy.

class RollingFileAppender : public FileAppender {
public:
    RollingFileAppender(Context& context, std::string name);
    ~RollingFileAppender() override;

    void start() override;

    // Rotates now, regardless of the triggering policy
    void rollover();

    // ========================================================================
    // Configuration (before start)
    // ========================================================================

    void set_file_name_pattern(std::string pattern);
    [[nodiscard]] const std::string& file_name_pattern() const noexcept;

    void set_triggering_policy(std::shared_ptr<ITriggeringPolicy> policy);
    [[nodiscard]] const std::shared_ptr<ITriggeringPolicy>& triggering_policy() const noexcept;

    void set_retention(RetentionPolicy retention);
    [[nodiscard]] const RetentionPolicy& retention() const noexcept;

    // Zstd level for ".zst" patterns
    void set_compression_level(int level);

    // Defaults: LocalFileSystem, PatternFileNamer over the pattern,
    // DefaultInvocationGate, system clock
    void set_file_system(std::shared_ptr<IFileSystem> file_system);
    void set_file_namer(std::shared_ptr<IFileNamer> namer);
    void set_invocation_gate(std::shared_ptr<IInvocationGate> gate);
    void set_clock(Clock clock);

    [[nodiscard]] NamingState naming_state() const;

protected:
    void sub_append(Event& event) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Builds an unstarted appender from a validated configuration
[[nodiscard]] std::expected<std::unique_ptr<RollingFileAppender>, std::vector<ConfigError>>
make_rolling_file_appender(const RollingConfig& config, Context& context);

} // namespace logroll
