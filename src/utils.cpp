// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "utils.hpp"

#include <array>
#include <cstdio>
#include <ctime>

namespace logroll::detail {

// ============================================================================
// Internal: Platform-specific time conversion wrappers
// ============================================================================

namespace {

inline std::tm localtime_safe(std::time_t time) {
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif
    return tm_buf;
}

inline std::tm gmtime_safe(std::time_t time) {
    std::tm tm_buf{};
#ifdef _WIN32
    gmtime_s(&tm_buf, &time);
#else
    gmtime_r(&time, &tm_buf);
#endif
    return tm_buf;
}

// Floor division so instants before 1970 land in the right second
inline std::time_t to_time_t(std::int64_t epoch_ms) {
    std::int64_t sec = epoch_ms / 1000;
    if (epoch_ms % 1000 < 0) --sec;
    return static_cast<std::time_t>(sec);
}

} // anonymous namespace

// ============================================================================
// Time Formatting Functions
// ============================================================================

std::string format_timestamp(const Timestamp& tv) {
    auto tm_buf = localtime_safe(static_cast<std::time_t>(tv.tv_sec));
    std::array<char, 32> buf{};
    int n = std::snprintf(buf.data(), buf.size(), "%04d-%02d-%02d %02d:%02d:%02d.%03d",
        1900 + tm_buf.tm_year, 1 + tm_buf.tm_mon, tm_buf.tm_mday,
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(tv.tv_usec / 1000));
    return n > 0 ? std::string(buf.data(), static_cast<std::size_t>(n)) : std::string{};
}

std::string format_date(const Timestamp& tv) {
    auto tm_buf = localtime_safe(static_cast<std::time_t>(tv.tv_sec));
    std::array<char, 16> buf{};
    int n = std::snprintf(buf.data(), buf.size(), "%04d-%02d-%02d",
        1900 + tm_buf.tm_year, 1 + tm_buf.tm_mon, tm_buf.tm_mday);
    return n > 0 ? std::string(buf.data(), static_cast<std::size_t>(n)) : std::string{};
}

std::string format_time_of_day(const Timestamp& tv) {
    auto tm_buf = localtime_safe(static_cast<std::time_t>(tv.tv_sec));
    std::array<char, 16> buf{};
    int n = std::snprintf(buf.data(), buf.size(), "%02d:%02d:%02d,%03d",
        tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
        static_cast<int>(tv.tv_usec / 1000));
    return n > 0 ? std::string(buf.data(), static_cast<std::size_t>(n)) : std::string{};
}

std::string format_utc(std::int64_t epoch_ms, std::string_view strftime_pattern) {
    if (strftime_pattern.empty()) return {};

    auto tm_buf = gmtime_safe(to_time_t(epoch_ms));
    std::string fmt(strftime_pattern);
    std::array<char, 256> buf{};
    std::size_t n = std::strftime(buf.data(), buf.size(), fmt.c_str(), &tm_buf);
    return std::string(buf.data(), n);
}

// ============================================================================
// String Helpers
// ============================================================================

std::string regex_escape(std::string_view text) {
    static constexpr std::string_view kSpecial = R"(\^$.|?*+()[]{})";

    std::string out;
    out.reserve(text.size() * 2);
    for (char c : text) {
        if (kSpecial.find(c) != std::string_view::npos) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

} // namespace logroll::detail
