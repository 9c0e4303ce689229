// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/file_system.hpp"

#include <chrono>

namespace logroll {

namespace fs = std::filesystem;

std::expected<std::vector<fs::path>, std::error_code>
LocalFileSystem::list_files(const fs::path& dir, const FileFilter& filter) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(ec);
    }

    std::vector<fs::path> out;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            return std::unexpected(ec);
        }
        const auto& entry = it->path();
        if (!filter || filter(dir, entry.filename().string())) {
            out.push_back(entry);
        }
    }
    if (ec) {
        return std::unexpected(ec);
    }
    return out;
}

std::expected<std::vector<std::string>, std::error_code>
LocalFileSystem::list(const fs::path& dir, const FileFilter& filter) const {
    auto files = list_files(dir, filter);
    if (!files) {
        return std::unexpected(files.error());
    }

    std::vector<std::string> names;
    names.reserve(files->size());
    for (const auto& file : *files) {
        names.push_back(file.filename().string());
    }
    return names;
}

bool LocalFileSystem::remove(const fs::path& file) {
    std::error_code ec;
    return fs::remove(file, ec) && !ec;
}

std::uint64_t LocalFileSystem::length(const fs::path& file) const {
    std::error_code ec;
    auto size = fs::file_size(file, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool LocalFileSystem::exists(const fs::path& file) const {
    std::error_code ec;
    return fs::exists(file, ec);
}

bool LocalFileSystem::is_directory(const fs::path& file) const {
    std::error_code ec;
    return fs::is_directory(file, ec);
}

std::expected<void, std::error_code>
LocalFileSystem::rename(const fs::path& from, const fs::path& to) {
    if (to.has_parent_path()) {
        if (auto created = create_directories(to.parent_path()); !created) {
            return created;
        }
    }

    std::error_code ec;
    fs::rename(from, to, ec);
    if (ec) {
        return std::unexpected(ec);
    }
    return {};
}

std::expected<void, std::error_code>
LocalFileSystem::create_directories(const fs::path& dir) {
    if (dir.empty()) {
        return {};
    }
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(ec);
    }
    return {};
}

std::optional<std::int64_t> LocalFileSystem::last_modified(const fs::path& file) const {
    std::error_code ec;
    auto ftime = fs::last_write_time(file, ec);
    if (ec) {
        return std::nullopt;
    }
    auto sys = std::chrono::file_clock::to_sys(ftime);
    return std::chrono::duration_cast<std::chrono::milliseconds>(sys.time_since_epoch()).count();
}

} // namespace logroll
