// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include <cstdio>
#include <expected>
#include <filesystem>
#include <memory>
#include <string_view>
#include <system_error>

namespace logroll {

// ============================================================================
// Output Stream Interface - byte destination owned by an appender
// ============================================================================

class IOutputStream {
public:
    virtual ~IOutputStream() = default;

    [[nodiscard]] virtual std::expected<void, std::error_code> write(std::string_view data) = 0;
    [[nodiscard]] virtual std::expected<void, std::error_code> flush() = 0;

    // Later calls to write/flush fail with Errc::stream_closed
    [[nodiscard]] virtual std::expected<void, std::error_code> close() = 0;
};

// ============================================================================
// File Output Stream - stdio FILE* in binary mode
// ============================================================================

class FileOutputStream final : public IOutputStream {
public:
    /// Opens `path`, creating missing parent directories.
    /// @param append keep existing content (true) or truncate (false)
    [[nodiscard]] static std::expected<std::unique_ptr<FileOutputStream>, std::error_code>
    open(const std::filesystem::path& path, bool append);

    ~FileOutputStream() override;

    FileOutputStream(const FileOutputStream&) = delete;
    FileOutputStream& operator=(const FileOutputStream&) = delete;

    [[nodiscard]] std::expected<void, std::error_code> write(std::string_view data) override;
    [[nodiscard]] std::expected<void, std::error_code> flush() override;
    [[nodiscard]] std::expected<void, std::error_code> close() override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    FileOutputStream(std::FILE* file, std::filesystem::path path) noexcept;

    std::FILE* file_;
    std::filesystem::path path_;
};

} // namespace logroll
