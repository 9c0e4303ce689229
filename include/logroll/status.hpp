// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include "types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace logroll {

// ============================================================================
// Status - diagnostics emitted by the logging core itself
// ============================================================================

enum class StatusLevel : std::uint8_t {
    Info = 0,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view status_level_name(StatusLevel level) noexcept {
    switch (level) {
        case StatusLevel::Info:  return "INFO";
        case StatusLevel::Warn:  return "WARN";
        case StatusLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

struct Status {
    StatusLevel level = StatusLevel::Info;
    std::string message;
    std::string origin;       // Component that emitted the status
    std::error_code cause;    // Empty when there is no underlying error
    Timestamp timestamp{};
};

// ============================================================================
// StatusManager - append-only status sink shared by one Context
// ============================================================================

class StatusManager {
public:
    using Listener = std::function<void(const Status&)>;
    using ListenerId = std::uint64_t;

    // The first kMaxHeaderCount statuses are kept; later ones rotate
    // through a tail of kTailSize entries.
    static constexpr std::size_t kMaxHeaderCount = 150;
    static constexpr std::size_t kTailSize = 150;

    StatusManager();
    ~StatusManager();

    StatusManager(const StatusManager&) = delete;
    StatusManager& operator=(const StatusManager&) = delete;

    // Thread-safe. Listeners run on the calling thread after the status is
    // recorded, outside the manager's lock.
    void add(Status status);

    [[nodiscard]] std::vector<Status> copy_of_list() const;

    // Total statuses ever added, including those evicted from the tail
    [[nodiscard]] std::size_t count() const noexcept;
    [[nodiscard]] std::size_t count(StatusLevel level) const noexcept;
    [[nodiscard]] StatusLevel highest_level() const noexcept;

    void clear();

    ListenerId add_listener(Listener listener);
    bool remove_listener(ListenerId id);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// StatusReporter - per-component helper that stamps the origin
// ============================================================================

class StatusReporter {
public:
    StatusReporter(StatusManager& manager, std::string origin)
        : manager_(&manager), origin_(std::move(origin)) {}

    void add_info(std::string message);
    void add_warn(std::string message, std::error_code cause = {});
    void add_error(std::string message, std::error_code cause = {});

    [[nodiscard]] const std::string& origin() const noexcept { return origin_; }
    [[nodiscard]] StatusManager& manager() const noexcept { return *manager_; }

private:
    void add(StatusLevel level, std::string message, std::error_code cause);

    StatusManager* manager_;
    std::string origin_;
};

// ============================================================================
// ConsoleStatusListener - prints statuses to stderr
// ============================================================================

class ConsoleStatusListener {
public:
    explicit ConsoleStatusListener(StatusLevel threshold = StatusLevel::Info);

    // Use ANSI colors for WARN/ERROR (default: on when stderr is a terminal)
    void set_use_colors(bool enable) noexcept { use_colors_ = enable; }
    [[nodiscard]] bool use_colors() const noexcept { return use_colors_; }

    void operator()(const Status& status) const;

    // "HH:MM:SS,mmm |-WARN in origin - message (cause)"
    [[nodiscard]] static std::string format(const Status& status);

private:
    StatusLevel threshold_;
    bool use_colors_;
};

} // namespace logroll
