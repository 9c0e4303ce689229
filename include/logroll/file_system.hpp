// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace logroll {

// Receives the directory being listed and one entry name in it
using FileFilter = std::function<bool(const std::filesystem::path& dir, std::string_view name)>;

// ============================================================================
// File System Interface - every file operation rotation performs
// ============================================================================

class IFileSystem {
public:
    virtual ~IFileSystem() = default;

    // Entries of `dir` accepted by `filter` (all entries when filter is empty)
    [[nodiscard]] virtual std::expected<std::vector<std::filesystem::path>, std::error_code>
    list_files(const std::filesystem::path& dir, const FileFilter& filter) const = 0;

    // Same as list_files, names only
    [[nodiscard]] virtual std::expected<std::vector<std::string>, std::error_code>
    list(const std::filesystem::path& dir, const FileFilter& filter) const = 0;

    // true when the file was deleted
    virtual bool remove(const std::filesystem::path& file) = 0;

    // Size in bytes, 0 when the file does not exist
    [[nodiscard]] virtual std::uint64_t length(const std::filesystem::path& file) const = 0;

    [[nodiscard]] virtual bool exists(const std::filesystem::path& file) const = 0;
    [[nodiscard]] virtual bool is_directory(const std::filesystem::path& file) const = 0;

    // Creates missing parent directories of `to` first
    [[nodiscard]] virtual std::expected<void, std::error_code>
    rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;

    [[nodiscard]] virtual std::expected<void, std::error_code>
    create_directories(const std::filesystem::path& dir) = 0;

    // Modification time in epoch milliseconds
    [[nodiscard]] virtual std::optional<std::int64_t>
    last_modified(const std::filesystem::path& file) const = 0;
};

// ============================================================================
// Local File System - std::filesystem, error_code overloads only
// ============================================================================

class LocalFileSystem final : public IFileSystem {
public:
    [[nodiscard]] std::expected<std::vector<std::filesystem::path>, std::error_code>
    list_files(const std::filesystem::path& dir, const FileFilter& filter) const override;

    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
    list(const std::filesystem::path& dir, const FileFilter& filter) const override;

    bool remove(const std::filesystem::path& file) override;

    [[nodiscard]] std::uint64_t length(const std::filesystem::path& file) const override;
    [[nodiscard]] bool exists(const std::filesystem::path& file) const override;
    [[nodiscard]] bool is_directory(const std::filesystem::path& file) const override;

    [[nodiscard]] std::expected<void, std::error_code>
    rename(const std::filesystem::path& from, const std::filesystem::path& to) override;

    [[nodiscard]] std::expected<void, std::error_code>
    create_directories(const std::filesystem::path& dir) override;

    [[nodiscard]] std::optional<std::int64_t>
    last_modified(const std::filesystem::path& file) const override;
};

} // namespace logroll
