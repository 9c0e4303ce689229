// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#pragma once

#include "context.hpp"
#include "encoder.hpp"
#include "output_stream.hpp"
#include "status.hpp"
#include "types.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace logroll {

namespace detail {
class LockedWriter;
} // namespace detail

// ============================================================================
// Appender Lifecycle
// ============================================================================

enum class AppenderState : std::uint8_t {
    Idle = 0,   // Constructed or failed to start
    Started,    // Accepting events
    Stopped,    // Terminal
    Failed      // Write error; events are dropped until stop()
};

enum class AppenderTransition : std::uint8_t {
    Start,
    Stop,
    IoFailure
};

[[nodiscard]] constexpr AppenderState next_state(AppenderState state,
                                                 AppenderTransition transition) noexcept {
    if (transition == AppenderTransition::Stop) {
        return AppenderState::Stopped;
    }
    switch (state) {
        case AppenderState::Idle:
            return transition == AppenderTransition::Start ? AppenderState::Started
                                                           : AppenderState::Idle;
        case AppenderState::Started:
            return transition == AppenderTransition::IoFailure ? AppenderState::Failed
                                                               : AppenderState::Started;
        case AppenderState::Stopped:
        case AppenderState::Failed:
            return state;
    }
    return state;
}

[[nodiscard]] constexpr std::string_view appender_state_name(AppenderState state) noexcept {
    switch (state) {
        case AppenderState::Idle:    return "IDLE";
        case AppenderState::Started: return "STARTED";
        case AppenderState::Stopped: return "STOPPED";
        case AppenderState::Failed:  return "FAILED";
    }
    return "UNKNOWN";
}

// ============================================================================
// OutputStreamAppender - encodes events onto one output stream
// ============================================================================
//
// Thread-safe: append() may be called from any number of threads. Each
// event's bytes reach the stream as one uninterrupted write. Problems are
// reported to the context's StatusManager, never thrown.

class OutputStreamAppender {
public:
    OutputStreamAppender(Context& context, std::string name);
    virtual ~OutputStreamAppender();

    OutputStreamAppender(const OutputStreamAppender&) = delete;
    OutputStreamAppender& operator=(const OutputStreamAppender&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /// Moves Idle -> Started when an encoder and an output stream are set.
    /// Each missing precondition is reported as an error and the appender
    /// stays Idle.
    virtual void start();

    /// Moves to Stopped, then writes the footer and closes the stream, both
    /// under the write lock. Idempotent.
    virtual void stop();

    [[nodiscard]] AppenderState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool is_started() const noexcept { return state() == AppenderState::Started; }

    // ========================================================================
    // Appending
    // ========================================================================

    // Dropped unless Started
    void append(Event& event);
    void append(const Record& record);

    // ========================================================================
    // Configuration
    // ========================================================================

    void set_encoder(std::shared_ptr<IEncoder> encoder);
    [[nodiscard]] const std::shared_ptr<IEncoder>& encoder() const noexcept { return encoder_; }

    // Closes (with footer) any previous stream, then installs `stream` and
    // writes the header when an encoder is set
    void set_output_stream(std::unique_ptr<IOutputStream> stream);

    // Flush after every event (default: true)
    void set_immediate_flush(bool enable) noexcept;
    [[nodiscard]] bool immediate_flush() const noexcept;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] Context& context() const noexcept { return *context_; }

protected:
    // Called with the appender Started. Runs the deferred-processing hook and
    // encodes; the bytes are dropped if the appender stopped meanwhile.
    virtual void sub_append(Event& event);

    // Applies `transition` atomically; true when this call changed the state
    bool transition(AppenderTransition transition) noexcept;

    // Demotes to Failed; only the caller that wins the demotion reports it
    void fail(const std::error_code& cause);

    // Reports a missing encoder; false when none is set
    bool require_encoder();

    [[nodiscard]] detail::LockedWriter& writer() noexcept { return *writer_; }
    [[nodiscard]] StatusReporter& reporter() noexcept { return reporter_; }

private:
    static constexpr int kMaxNotStartedWarnings = 3;

    Context* context_;
    std::string name_;
    std::uint64_t id_;
    StatusReporter reporter_;

    std::shared_ptr<IEncoder> encoder_;
    std::unique_ptr<detail::LockedWriter> writer_;

    std::atomic<AppenderState> state_{AppenderState::Idle};
    std::atomic<int> not_started_warnings_{0};
};

} // namespace logroll
