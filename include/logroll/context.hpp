// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include "collision_registry.hpp"
#include "status.hpp"

#include <atomic>
#include <cstdint>
#include <string>

namespace logroll {

// ============================================================================
// Context - shared state for a group of appenders
// ============================================================================
//
// Owns the status channel and the collision table. Appenders keep a
// reference to their context, so it must outlive them.

class Context {
public:
    static constexpr const char* kDefaultName = "default";

    explicit Context(std::string name = kDefaultName);
    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] StatusManager& status_manager() noexcept { return status_manager_; }
    [[nodiscard]] const StatusManager& status_manager() const noexcept { return status_manager_; }

    [[nodiscard]] CollisionRegistry& collision_registry() noexcept { return collisions_; }

    // Epoch milliseconds at construction
    [[nodiscard]] std::int64_t birth_time() const noexcept { return birth_time_; }

    // Unique per context, never reused
    [[nodiscard]] std::uint64_t next_appender_id() noexcept {
        return next_appender_id_.fetch_add(1, std::memory_order_relaxed);
    }

private:
    std::string name_;
    std::int64_t birth_time_;
    StatusManager status_manager_;
    CollisionRegistry collisions_;
    std::atomic<std::uint64_t> next_appender_id_{1};
};

} // namespace logroll
