// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/output_stream.hpp"
#include "logroll/error.hpp"

#include <cerrno>

namespace logroll {

namespace {

std::error_code last_errno_or(Errc fallback) {
    if (errno != 0) {
        return {errno, std::generic_category()};
    }
    return make_error_code(fallback);
}

} // anonymous namespace

std::expected<std::unique_ptr<FileOutputStream>, std::error_code>
FileOutputStream::open(const std::filesystem::path& path, bool append) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(ec);
        }
    }

    errno = 0;
    std::FILE* file = std::fopen(path.string().c_str(), append ? "ab" : "wb");
    if (!file) {
        return std::unexpected(last_errno_or(Errc::open_failed));
    }
    return std::unique_ptr<FileOutputStream>(new FileOutputStream(file, path));
}

FileOutputStream::FileOutputStream(std::FILE* file, std::filesystem::path path) noexcept
    : file_(file), path_(std::move(path)) {}

FileOutputStream::~FileOutputStream() {
    if (file_) {
        std::fclose(file_);
    }
}

std::expected<void, std::error_code> FileOutputStream::write(std::string_view data) {
    if (!file_) {
        return std::unexpected(make_error_code(Errc::stream_closed));
    }
    if (data.empty()) {
        return {};
    }

    errno = 0;
    auto written = std::fwrite(data.data(), 1, data.size(), file_);
    if (written != data.size()) {
        return std::unexpected(last_errno_or(Errc::short_write));
    }
    return {};
}

std::expected<void, std::error_code> FileOutputStream::flush() {
    if (!file_) {
        return std::unexpected(make_error_code(Errc::stream_closed));
    }
    errno = 0;
    if (std::fflush(file_) != 0) {
        return std::unexpected(last_errno_or(Errc::short_write));
    }
    return {};
}

std::expected<void, std::error_code> FileOutputStream::close() {
    if (!file_) {
        return {};
    }
    errno = 0;
    int rc = std::fclose(file_);
    file_ = nullptr;
    if (rc != 0) {
        return std::unexpected(last_errno_or(Errc::short_write));
    }
    return {};
}

} // namespace logroll
