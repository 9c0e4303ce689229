// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "compressor.hpp"
#include "logroll/error.hpp"

#include <zstd.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>

namespace logroll::detail {

namespace {

struct FileCloser {
    void operator()(std::FILE* file) const noexcept {
        if (file) std::fclose(file);
    }
};

using FilePtr = std::unique_ptr<std::FILE, FileCloser>;

std::error_code errno_or(Errc fallback) {
    return errno != 0 ? std::error_code(errno, std::generic_category())
                      : make_error_code(fallback);
}

} // anonymous namespace

struct ZstdCompressor::Impl {
    ZSTD_CCtx* cctx = nullptr;  // Compression context (reused)
    ZSTD_DCtx* dctx = nullptr;  // Decompression context (reused)
    int level = kDefaultLevel;

    explicit Impl(int level_) : level(std::clamp(level_, kMinLevel, kMaxLevel)) {
        cctx = ZSTD_createCCtx();
        dctx = ZSTD_createDCtx();
    }

    ~Impl() {
        if (cctx) {
            ZSTD_freeCCtx(cctx);
        }
        if (dctx) {
            ZSTD_freeDCtx(dctx);
        }
    }

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    // Fresh frame parameters for every archive
    bool begin_frame() {
        if (!cctx) return false;
        ZSTD_CCtx_reset(cctx, ZSTD_reset_session_only);
        return !ZSTD_isError(ZSTD_CCtx_setParameter(cctx, ZSTD_c_compressionLevel, level)) &&
               !ZSTD_isError(ZSTD_CCtx_setParameter(cctx, ZSTD_c_checksumFlag, 1));
    }
};

ZstdCompressor::ZstdCompressor(int level)
    : impl_(std::make_unique<Impl>(level)) {
}

ZstdCompressor::~ZstdCompressor() = default;

ZstdCompressor::ZstdCompressor(ZstdCompressor&&) noexcept = default;
ZstdCompressor& ZstdCompressor::operator=(ZstdCompressor&&) noexcept = default;

int ZstdCompressor::level() const noexcept {
    return impl_->level;
}

std::expected<std::uint64_t, std::error_code>
ZstdCompressor::compress_file(const std::filesystem::path& src, const std::filesystem::path& dst) {
    if (!impl_->begin_frame()) {
        return std::unexpected(make_error_code(Errc::compression_failed));
    }

    errno = 0;
    FilePtr in(std::fopen(src.string().c_str(), "rb"));
    if (!in) {
        return std::unexpected(errno_or(Errc::open_failed));
    }
    errno = 0;
    FilePtr out(std::fopen(dst.string().c_str(), "wb"));
    if (!out) {
        return std::unexpected(errno_or(Errc::open_failed));
    }

    std::vector<char> in_buf(ZSTD_CStreamInSize());
    std::vector<char> out_buf(ZSTD_CStreamOutSize());
    std::uint64_t total = 0;

    for (;;) {
        std::size_t read = std::fread(in_buf.data(), 1, in_buf.size(), in.get());
        if (std::ferror(in.get())) {
            return std::unexpected(errno_or(Errc::compression_failed));
        }
        const bool last = read < in_buf.size();
        const auto mode = last ? ZSTD_e_end : ZSTD_e_continue;

        ZSTD_inBuffer input = {in_buf.data(), read, 0};
        bool finished = false;
        while (!finished) {
            ZSTD_outBuffer output = {out_buf.data(), out_buf.size(), 0};
            std::size_t remaining = ZSTD_compressStream2(impl_->cctx, &output, &input, mode);
            if (ZSTD_isError(remaining)) {
                return std::unexpected(make_error_code(Errc::compression_failed));
            }

            if (output.pos > 0 &&
                std::fwrite(out_buf.data(), 1, output.pos, out.get()) != output.pos) {
                return std::unexpected(errno_or(Errc::short_write));
            }
            total += output.pos;

            // ZSTD_e_end is done once nothing remains to flush;
            // ZSTD_e_continue once the input chunk is consumed
            finished = last ? remaining == 0 : input.pos == input.size;
        }

        if (last) {
            break;
        }
    }

    std::FILE* raw = out.release();
    if (std::fclose(raw) != 0) {
        return std::unexpected(errno_or(Errc::short_write));
    }
    return total;
}

std::expected<std::vector<std::byte>, std::error_code>
ZstdCompressor::compress(std::span<const std::byte> input) {
    if (!impl_->begin_frame()) {
        return std::unexpected(make_error_code(Errc::compression_failed));
    }

    std::vector<std::byte> output(ZSTD_compressBound(input.size()));
    std::size_t result = ZSTD_compress2(impl_->cctx, output.data(), output.size(),
                                        input.data(), input.size());
    if (ZSTD_isError(result)) {
        return std::unexpected(make_error_code(Errc::compression_failed));
    }
    output.resize(result);
    return output;
}

std::expected<std::vector<std::byte>, std::error_code>
ZstdCompressor::decompress(std::span<const std::byte> input) {
    if (!impl_->dctx) {
        return std::unexpected(make_error_code(Errc::compression_failed));
    }

    // Reset decompression context for new frame
    ZSTD_DCtx_reset(impl_->dctx, ZSTD_reset_session_only);

    std::vector<std::byte> output(std::max<std::size_t>(input.size() * 4, ZSTD_DStreamOutSize()));
    ZSTD_inBuffer in_buf = {input.data(), input.size(), 0};
    ZSTD_outBuffer out_buf = {output.data(), output.size(), 0};

    std::size_t last_result = 0;
    while (in_buf.pos < in_buf.size || last_result != 0) {
        last_result = ZSTD_decompressStream(impl_->dctx, &out_buf, &in_buf);
        if (ZSTD_isError(last_result)) {
            return std::unexpected(make_error_code(Errc::compression_failed));
        }

        // If output buffer is full, expand it
        if (out_buf.pos == out_buf.size) {
            output.resize(output.size() * 2);
            out_buf.dst = output.data();
            out_buf.size = output.size();
        } else if (in_buf.pos == in_buf.size && last_result != 0) {
            // Truncated frame
            return std::unexpected(make_error_code(Errc::compression_failed));
        }
    }

    output.resize(out_buf.pos);
    return output;
}

} // namespace logroll::detail
