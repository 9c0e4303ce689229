// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "compressor.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace logroll {
namespace {

using detail::ZstdCompressor;

std::vector<std::byte> to_bytes(const std::string& text) {
    std::vector<std::byte> data(text.size());
    std::memcpy(data.data(), text.data(), text.size());
    return data;
}

std::string to_string(const std::vector<std::byte>& data) {
    return std::string(reinterpret_cast<const char*>(data.data()), data.size());
}

// Text with enough repetition to compress well, like a real log file
std::string make_log_text(std::size_t lines) {
    std::string text;
    for (std::size_t i = 0; i < lines; ++i) {
        text += "2024-06-30 12:00:00.000 [1234] INFO Test - line " + std::to_string(i) + "\n";
    }
    return text;
}

void write_file(const std::filesystem::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary);
    out << text;
}

// ============================================================================
// Construction
// ============================================================================

TEST(ZstdCompressorTest, DefaultLevel) {
    ZstdCompressor compressor;
    EXPECT_EQ(compressor.level(), ZstdCompressor::kDefaultLevel);
    EXPECT_EQ(compressor.extension(), ".zst");
}

TEST(ZstdCompressorTest, LevelIsClamped) {
    EXPECT_EQ(ZstdCompressor(0).level(), ZstdCompressor::kMinLevel);
    EXPECT_EQ(ZstdCompressor(99).level(), ZstdCompressor::kMaxLevel);
    EXPECT_EQ(ZstdCompressor(9).level(), 9);
}

TEST(ZstdCompressorTest, MoveConstruction) {
    ZstdCompressor original(5);
    ZstdCompressor moved(std::move(original));
    EXPECT_EQ(moved.level(), 5);

    auto compressed = moved.compress(to_bytes("hello"));
    ASSERT_TRUE(compressed.has_value());
}

// ============================================================================
// Buffers
// ============================================================================

TEST(ZstdCompressorTest, BufferRoundTrip) {
    ZstdCompressor compressor;
    auto text = make_log_text(200);

    auto compressed = compressor.compress(to_bytes(text));
    ASSERT_TRUE(compressed.has_value());
    EXPECT_LT(compressed->size(), text.size());

    auto restored = compressor.decompress(*compressed);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(to_string(*restored), text);
}

TEST(ZstdCompressorTest, DecompressRejectsGarbage) {
    ZstdCompressor compressor;
    auto result = compressor.decompress(to_bytes("definitely not a zstd frame"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), make_error_code(Errc::compression_failed));
}

TEST(ZstdCompressorTest, DecompressRejectsTruncatedFrame) {
    ZstdCompressor compressor;
    auto compressed = compressor.compress(to_bytes(make_log_text(50)));
    ASSERT_TRUE(compressed.has_value());
    compressed->resize(compressed->size() / 2);

    EXPECT_FALSE(compressor.decompress(*compressed).has_value());
}

// ============================================================================
// Files
// ============================================================================

class ZstdFileTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = testing::unique_temp_dir("logroll_zstd"); }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string decompress_file(ZstdCompressor& compressor, const std::filesystem::path& path) {
        auto restored = compressor.decompress(to_bytes(testing::read_file(path)));
        EXPECT_TRUE(restored.has_value());
        return restored ? to_string(*restored) : std::string();
    }

    std::filesystem::path dir_;
};

TEST_F(ZstdFileTest, CompressFileRoundTrip) {
    ZstdCompressor compressor;
    auto text = make_log_text(1000);
    write_file(dir_ / "app.0.log", text);

    auto written = compressor.compress_file(dir_ / "app.0.log", dir_ / "app.0.log.zst");
    ASSERT_TRUE(written.has_value());
    EXPECT_EQ(*written, std::filesystem::file_size(dir_ / "app.0.log.zst"));
    EXPECT_LT(*written, text.size());

    // Source is left for the caller to remove
    EXPECT_TRUE(std::filesystem::exists(dir_ / "app.0.log"));
    EXPECT_EQ(decompress_file(compressor, dir_ / "app.0.log.zst"), text);
}

TEST_F(ZstdFileTest, LargerThanOneChunk) {
    ZstdCompressor compressor(1);
    std::mt19937 gen(12345);
    std::uniform_int_distribution<int> dist('a', 'z');
    std::string text(512 * 1024, ' ');
    for (auto& c : text) {
        c = static_cast<char>(dist(gen));
    }
    write_file(dir_ / "big.log", text);

    ASSERT_TRUE(compressor.compress_file(dir_ / "big.log", dir_ / "big.log.zst").has_value());
    EXPECT_EQ(decompress_file(compressor, dir_ / "big.log.zst"), text);
}

TEST_F(ZstdFileTest, EmptyFileProducesValidFrame) {
    ZstdCompressor compressor;
    write_file(dir_ / "empty.log", "");

    auto written = compressor.compress_file(dir_ / "empty.log", dir_ / "empty.log.zst");
    ASSERT_TRUE(written.has_value());
    EXPECT_GT(*written, 0u);
    EXPECT_EQ(decompress_file(compressor, dir_ / "empty.log.zst"), "");
}

TEST_F(ZstdFileTest, MissingSourceFails) {
    ZstdCompressor compressor;
    auto written = compressor.compress_file(dir_ / "missing.log", dir_ / "missing.log.zst");
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error(), std::make_error_code(std::errc::no_such_file_or_directory));
    EXPECT_FALSE(std::filesystem::exists(dir_ / "missing.log.zst"));
}

TEST_F(ZstdFileTest, ReusedForSeveralArchives) {
    ZstdCompressor compressor;
    for (int i = 0; i < 3; ++i) {
        auto text = make_log_text(10 + i);
        auto src = dir_ / ("app." + std::to_string(i) + ".log");
        write_file(src, text);
        auto dst = src;
        dst += ".zst";
        ASSERT_TRUE(compressor.compress_file(src, dst).has_value());
        EXPECT_EQ(decompress_file(compressor, dst), text);
    }
}

} // namespace
} // namespace logroll
