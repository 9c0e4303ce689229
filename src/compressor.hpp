// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

namespace logroll::detail {

// ============================================================================
// Compressor Interface - archives rotated files
// ============================================================================

class ICompressor {
public:
    virtual ~ICompressor() = default;

    // Compresses `src` into a new file `dst` (truncated if present).
    // Returns: bytes written to dst, or error. `src` is left in place.
    [[nodiscard]] virtual std::expected<std::uint64_t, std::error_code>
    compress_file(const std::filesystem::path& src, const std::filesystem::path& dst) = 0;

    // File name suffix of archives this compressor produces
    [[nodiscard]] virtual std::string_view extension() const noexcept = 0;
};

// ============================================================================
// Zstd Compressor
// ============================================================================

class ZstdCompressor final : public ICompressor {
public:
    // Compression level: 1 (fast) to 22 (best)
    static constexpr int kDefaultLevel = 3;
    static constexpr int kMinLevel = 1;
    static constexpr int kMaxLevel = 22;

    explicit ZstdCompressor(int level = kDefaultLevel);
    ~ZstdCompressor() override;

    // Non-copyable
    ZstdCompressor(const ZstdCompressor&) = delete;
    ZstdCompressor& operator=(const ZstdCompressor&) = delete;

    // Movable
    ZstdCompressor(ZstdCompressor&&) noexcept;
    ZstdCompressor& operator=(ZstdCompressor&&) noexcept;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    compress_file(const std::filesystem::path& src, const std::filesystem::path& dst) override;

    [[nodiscard]] std::string_view extension() const noexcept override { return ".zst"; }

    // One complete frame for `input`
    [[nodiscard]] std::expected<std::vector<std::byte>, std::error_code>
    compress(std::span<const std::byte> input);

    // Decodes every frame in `input`
    [[nodiscard]] std::expected<std::vector<std::byte>, std::error_code>
    decompress(std::span<const std::byte> input);

    [[nodiscard]] int level() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace logroll::detail
