// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <chrono>
#include <source_location>

namespace logroll {

// ============================================================================
// Timestamp
// ============================================================================

struct Timestamp {
    std::int64_t tv_sec = 0;   // Seconds since epoch
    std::int64_t tv_usec = 0;  // Microseconds

    static Timestamp now() noexcept {
        auto tp = std::chrono::system_clock::now();
        auto sec = std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch());
        auto usec = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) - sec;
        return {sec.count(), usec.count()};
    }
};

// Millisecond clock used by rollover decisions; tests substitute their own.
using Clock = std::function<std::int64_t()>;

// ============================================================================
// Log Levels
// ============================================================================

enum class Level : std::uint8_t {
    Verbose = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

[[nodiscard]] constexpr std::string_view level_name(Level level) noexcept {
    switch (level) {
        case Level::Verbose: return "V";
        case Level::Debug:   return "D";
        case Level::Info:    return "I";
        case Level::Warn:    return "W";
        case Level::Error:   return "E";
        case Level::Fatal:   return "F";
        case Level::Off:     return "O";
    }
    return "?";
}

[[nodiscard]] constexpr std::string_view level_full_name(Level level) noexcept {
    switch (level) {
        case Level::Verbose: return "VERBOSE";
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO";
        case Level::Warn:    return "WARN";
        case Level::Error:   return "ERROR";
        case Level::Fatal:   return "FATAL";
        case Level::Off:     return "OFF";
    }
    return "UNKNOWN";
}

// ============================================================================
// Log Record
// ============================================================================

// tag and message are borrowed. A producer that hands a record to another
// thread, or keeps it past the append() call, must own the storage.
struct Record {
    Level level = Level::Info;
    std::string_view tag;
    std::string_view message;
    std::source_location location;

    Timestamp timestamp{};

    std::int64_t pid = 0;
    std::int64_t tid = 0;
};

// ============================================================================
// Event - what appenders consume
// ============================================================================

struct Event {
    Record record;

    // Optional capability: runs once, before the record is encoded, then is
    // cleared by the appender. Typical use is copying borrowed views into
    // storage owned by the producer.
    std::function<void(Record&)> prepare_for_deferred_processing;
};

} // namespace logroll
