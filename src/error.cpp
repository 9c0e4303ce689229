// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/error.hpp"

namespace logroll {

namespace {

class LogrollCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "logroll"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
            case Errc::stream_closed:      return "output stream is not open";
            case Errc::short_write:        return "short write to output stream";
            case Errc::encoder_failure:    return "encoder failed to produce bytes";
            case Errc::compression_failed: return "compression failed";
            case Errc::rename_failed:      return "rename failed";
            case Errc::open_failed:        return "failed to open output file";
        }
        return "unknown logroll error";
    }
};

} // anonymous namespace

const std::error_category& logroll_category() noexcept {
    static const LogrollCategory category;
    return category;
}

std::string describe(const std::error_code& ec) {
    if (!ec) return {};
    return ec.message() + " (" + ec.category().name() + ":" + std::to_string(ec.value()) + ")";
}

} // namespace logroll
