// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include "appender.hpp"

#include <filesystem>
#include <string>

namespace logroll {

// ============================================================================
// FileAppender - OutputStreamAppender writing to one fixed file
// ============================================================================

class FileAppender : public OutputStreamAppender {
public:
    FileAppender(Context& context, std::string name);
    ~FileAppender() override;

    void start() override;
    void stop() override;

    void set_file(std::filesystem::path file) { file_ = std::move(file); }
    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

    // Keep existing content (default) or truncate on open
    void set_append(bool append) noexcept { append_ = append; }
    [[nodiscard]] bool append_mode() const noexcept { return append_; }

protected:
    // Opens file() and installs it; false (with an error reported) on failure
    bool open_file();

    // Reports a collision when another appender already writes to file()
    void check_file_collision();

    // Undoes a start that did not reach Started: drops the stream without a
    // footer and releases every claim
    void abandon_start();

private:
    std::filesystem::path file_;
    bool append_ = true;
};

} // namespace logroll
