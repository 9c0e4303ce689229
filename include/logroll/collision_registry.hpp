// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace logroll {

// ============================================================================
// CollisionRegistry - detects appenders sharing an output path or pattern
// ============================================================================

class CollisionRegistry {
public:
    using OwnerId = std::uint64_t;

    struct Owner {
        OwnerId id = 0;
        std::string name;
    };

    CollisionRegistry();
    ~CollisionRegistry();

    CollisionRegistry(const CollisionRegistry&) = delete;
    CollisionRegistry& operator=(const CollisionRegistry&) = delete;

    /// Claim a fixed output path for `owner`.
    /// @return the earlier owner when another appender already holds the path,
    ///         std::nullopt when the claim succeeded (or was already ours)
    [[nodiscard]] std::optional<Owner> register_file(const std::filesystem::path& file,
                                                     const Owner& owner);

    /// Same as register_file, keyed by a rotation naming pattern
    [[nodiscard]] std::optional<Owner> register_pattern(std::string_view pattern,
                                                        const Owner& owner);

    // Drops every claim held by `id`
    void release(OwnerId id);

    [[nodiscard]] std::size_t file_count() const;
    [[nodiscard]] std::size_t pattern_count() const;

    /// Absolute, lexically normal form used as the registry key
    [[nodiscard]] static std::string normalize(const std::filesystem::path& path);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// "'<option>' option has the same value "<value>" as that given for appender [<owner>] defined earlier."
[[nodiscard]] std::string collision_message(std::string_view option, std::string_view value,
                                            std::string_view owner);

} // namespace logroll
