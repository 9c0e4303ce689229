// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/platform.hpp"

#include <chrono>
#include <cstdint>

#ifdef _WIN32
#include <windows.h>
#include <processthreadsapi.h>
#else
#include <unistd.h>
#include <pthread.h>
#ifdef __linux__
#include <sys/syscall.h>
#endif
#endif

namespace logroll {

// ============================================================================
// Process/Thread ID Functions
// ============================================================================

std::int64_t get_pid() noexcept {
#ifdef _WIN32
    return static_cast<std::int64_t>(GetCurrentProcessId());
#else
    return static_cast<std::int64_t>(getpid());
#endif
}

std::int64_t get_tid() noexcept {
#ifdef _WIN32
    return static_cast<std::int64_t>(GetCurrentThreadId());
#elif defined(__APPLE__)
    std::uint64_t tid = 0;
    pthread_threadid_np(nullptr, &tid);
    return static_cast<std::int64_t>(tid);
#elif defined(__linux__)
    return static_cast<std::int64_t>(syscall(SYS_gettid));
#else
    return static_cast<std::int64_t>(pthread_self());
#endif
}

// ============================================================================
// Timestamp Functions
// ============================================================================

Timestamp get_timestamp() noexcept {
    return Timestamp::now();
}

std::int64_t current_time_millis() noexcept {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

Record make_record(Level level, std::string_view tag, std::string_view message,
                   const std::source_location& loc) noexcept {
    return Record{
        .level = level,
        .tag = tag,
        .message = message,
        .location = loc,
        .timestamp = get_timestamp(),
        .pid = get_pid(),
        .tid = get_tid()
    };
}

} // namespace logroll
