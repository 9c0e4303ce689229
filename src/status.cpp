// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/status.hpp"
#include "logroll/error.hpp"
#include "logroll/platform.hpp"
#include "utils.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <utility>

#ifdef LOGROLL_PLATFORM_ANDROID
    #include <android/log.h>
#endif

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace logroll {

// ============================================================================
// StatusManager Implementation
// ============================================================================

struct StatusManager::Impl {
    mutable std::mutex mutex;
    std::vector<Status> header;
    std::vector<Status> tail;     // Ring buffer once full
    std::size_t tail_next = 0;

    std::atomic<std::size_t> total{0};
    std::array<std::atomic<std::size_t>, 3> per_level{};

    std::mutex listener_mutex;
    std::vector<std::pair<ListenerId, Listener>> listeners;
    ListenerId next_listener_id = 1;

    void record(Status status) {
        std::lock_guard lock(mutex);
        if (header.size() < kMaxHeaderCount) {
            header.push_back(std::move(status));
        } else if (tail.size() < kTailSize) {
            tail.push_back(std::move(status));
        } else {
            tail[tail_next] = std::move(status);
            tail_next = (tail_next + 1) % kTailSize;
        }
    }

    std::vector<Listener> snapshot_listeners() {
        std::lock_guard lock(listener_mutex);
        std::vector<Listener> out;
        out.reserve(listeners.size());
        for (const auto& [_, listener] : listeners) {
            out.push_back(listener);
        }
        return out;
    }
};

StatusManager::StatusManager() : impl_(std::make_unique<Impl>()) {}

StatusManager::~StatusManager() = default;

void StatusManager::add(Status status) {
    if (status.timestamp.tv_sec == 0 && status.timestamp.tv_usec == 0) {
        status.timestamp = get_timestamp();
    }

    impl_->total.fetch_add(1, std::memory_order_relaxed);
    impl_->per_level[static_cast<std::size_t>(status.level)].fetch_add(1, std::memory_order_relaxed);

    auto listeners = impl_->snapshot_listeners();
    if (listeners.empty()) {
        impl_->record(std::move(status));
        return;
    }

    impl_->record(status);
    for (const auto& listener : listeners) {
        listener(status);
    }
}

std::vector<Status> StatusManager::copy_of_list() const {
    std::lock_guard lock(impl_->mutex);

    std::vector<Status> out;
    out.reserve(impl_->header.size() + impl_->tail.size());
    out.insert(out.end(), impl_->header.begin(), impl_->header.end());

    // Oldest tail entry sits at tail_next once the ring has wrapped
    const auto& tail = impl_->tail;
    for (std::size_t i = 0; i < tail.size(); ++i) {
        out.push_back(tail[(impl_->tail_next + i) % tail.size()]);
    }
    return out;
}

std::size_t StatusManager::count() const noexcept {
    return impl_->total.load(std::memory_order_relaxed);
}

std::size_t StatusManager::count(StatusLevel level) const noexcept {
    return impl_->per_level[static_cast<std::size_t>(level)].load(std::memory_order_relaxed);
}

StatusLevel StatusManager::highest_level() const noexcept {
    if (count(StatusLevel::Error) > 0) return StatusLevel::Error;
    if (count(StatusLevel::Warn) > 0) return StatusLevel::Warn;
    return StatusLevel::Info;
}

void StatusManager::clear() {
    std::lock_guard lock(impl_->mutex);
    impl_->header.clear();
    impl_->tail.clear();
    impl_->tail_next = 0;
    impl_->total.store(0, std::memory_order_relaxed);
    for (auto& counter : impl_->per_level) {
        counter.store(0, std::memory_order_relaxed);
    }
}

StatusManager::ListenerId StatusManager::add_listener(Listener listener) {
    std::lock_guard lock(impl_->listener_mutex);
    auto id = impl_->next_listener_id++;
    impl_->listeners.emplace_back(id, std::move(listener));
    return id;
}

bool StatusManager::remove_listener(ListenerId id) {
    std::lock_guard lock(impl_->listener_mutex);
    auto it = std::find_if(impl_->listeners.begin(), impl_->listeners.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == impl_->listeners.end()) return false;
    impl_->listeners.erase(it);
    return true;
}

// ============================================================================
// StatusReporter
// ============================================================================

void StatusReporter::add_info(std::string message) {
    add(StatusLevel::Info, std::move(message), {});
}

void StatusReporter::add_warn(std::string message, std::error_code cause) {
    add(StatusLevel::Warn, std::move(message), cause);
}

void StatusReporter::add_error(std::string message, std::error_code cause) {
    add(StatusLevel::Error, std::move(message), cause);
}

void StatusReporter::add(StatusLevel level, std::string message, std::error_code cause) {
    manager_->add(Status{
        .level = level,
        .message = std::move(message),
        .origin = origin_,
        .cause = cause,
        .timestamp = get_timestamp()
    });
}

// ============================================================================
// ConsoleStatusListener
// ============================================================================

namespace {

constexpr std::string_view kColorReset = "\033[0m";
constexpr std::string_view kColorYellow = "\033[33m";
constexpr std::string_view kColorRed = "\033[31m";

} // anonymous namespace

ConsoleStatusListener::ConsoleStatusListener(StatusLevel threshold)
    : threshold_(threshold),
      use_colors_(isatty(fileno(stderr)) != 0) {}

std::string ConsoleStatusListener::format(const Status& status) {
    std::string line;
    line.reserve(64 + status.origin.size() + status.message.size());
    line.append(detail::format_time_of_day(status.timestamp));
    line.append(" |-");
    line.append(status_level_name(status.level));
    line.append(" in ");
    line.append(status.origin);
    line.append(" - ");
    line.append(status.message);
    if (status.cause) {
        line.append(" (");
        line.append(describe(status.cause));
        line.push_back(')');
    }
    return line;
}

void ConsoleStatusListener::operator()(const Status& status) const {
    if (status.level < threshold_) return;

    auto line = format(status);

#ifdef LOGROLL_PLATFORM_ANDROID
    int prio = status.level == StatusLevel::Error ? ANDROID_LOG_ERROR
             : status.level == StatusLevel::Warn  ? ANDROID_LOG_WARN
                                                  : ANDROID_LOG_INFO;
    __android_log_print(prio, "logroll", "%s", line.c_str());
#else
    std::string_view color;
    if (use_colors_) {
        if (status.level == StatusLevel::Error) color = kColorRed;
        else if (status.level == StatusLevel::Warn) color = kColorYellow;
    }

    // stdio calls are thread-safe; one fprintf per line keeps lines whole
    if (color.empty()) {
        std::fprintf(stderr, "%s\n", line.c_str());
    } else {
        std::fprintf(stderr, "%.*s%s%.*s\n",
                     static_cast<int>(color.size()), color.data(), line.c_str(),
                     static_cast<int>(kColorReset.size()), kColorReset.data());
    }
    std::fflush(stderr);
#endif
}

} // namespace logroll
