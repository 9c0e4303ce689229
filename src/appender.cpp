// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/appender.hpp"
#include "locked_writer.hpp"

#include <expected>
#include <utility>

namespace logroll {

namespace {

std::string quote_name(std::string_view name) {
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back('"');
    out.append(name);
    out.push_back('"');
    return out;
}

} // anonymous namespace

OutputStreamAppender::OutputStreamAppender(Context& context, std::string name)
    : context_(&context),
      name_(std::move(name)),
      id_(context.next_appender_id()),
      reporter_(context.status_manager(), name_),
      writer_(std::make_unique<detail::LockedWriter>()) {}

OutputStreamAppender::~OutputStreamAppender() {
    // Derived classes stop in their own destructors; this covers a bare
    // OutputStreamAppender.
    OutputStreamAppender::stop();
}

// ============================================================================
// Lifecycle
// ============================================================================

void OutputStreamAppender::start() {
    switch (state()) {
        case AppenderState::Started:
            return;
        case AppenderState::Stopped:
        case AppenderState::Failed:
            reporter_.add_warn("Appender named " + quote_name(name_) + " is " +
                               std::string(appender_state_name(state())) +
                               " and cannot be started.");
            return;
        case AppenderState::Idle:
            break;
    }

    int errors = 0;
    if (!require_encoder()) {
        ++errors;
    }
    if (!writer_->is_open()) {
        reporter_.add_error("No output stream set for the appender named " + quote_name(name_) + ".");
        ++errors;
    }
    if (errors > 0) {
        return;
    }

    {
        auto session = writer_->acquire();
        if (auto header = session.write_header(); !header) {
            reporter_.add_error("Failed to write header for the appender named " + quote_name(name_) + ".",
                                header.error());
            return;
        }
    }

    transition(AppenderTransition::Start);
}

void OutputStreamAppender::stop() {
    if (state() == AppenderState::Stopped) {
        return;
    }

    std::expected<void, std::error_code> closed;
    {
        // Writers re-check the state under the same lock, so nothing is
        // written once the stream is closed here.
        auto session = writer_->acquire();
        transition(AppenderTransition::Stop);
        closed = session.close();
    }
    if (!closed) {
        reporter_.add_error("Could not close output stream for the appender named " +
                            quote_name(name_) + ".", closed.error());
    }
}

bool OutputStreamAppender::require_encoder() {
    if (encoder_) {
        return true;
    }
    reporter_.add_error("No encoder set for the appender named " + quote_name(name_) + ".");
    return false;
}

bool OutputStreamAppender::transition(AppenderTransition t) noexcept {
    auto current = state_.load(std::memory_order_acquire);
    for (;;) {
        auto next = next_state(current, t);
        if (next == current) {
            return false;
        }
        if (state_.compare_exchange_weak(current, next, std::memory_order_acq_rel,
                                         std::memory_order_acquire)) {
            return true;
        }
    }
}

void OutputStreamAppender::fail(const std::error_code& cause) {
    if (transition(AppenderTransition::IoFailure)) {
        reporter_.add_error("IO failure in appender named " + quote_name(name_) + ".", cause);
    }
}

// ============================================================================
// Appending
// ============================================================================

void OutputStreamAppender::append(Event& event) {
    auto current = state();
    if (current == AppenderState::Started) {
        sub_append(event);
        return;
    }

    if (current == AppenderState::Idle &&
        not_started_warnings_.fetch_add(1, std::memory_order_relaxed) < kMaxNotStartedWarnings) {
        reporter_.add_warn("Attempted to append to non started appender [" + name_ + "].");
    }
}

void OutputStreamAppender::append(const Record& record) {
    Event event{record, {}};
    append(event);
}

void OutputStreamAppender::sub_append(Event& event) {
    if (auto prepare = std::exchange(event.prepare_for_deferred_processing, nullptr)) {
        prepare(event.record);
    }

    auto bytes = encoder_->encode(event.record);
    if (!bytes) {
        fail(bytes.error());
        return;
    }

    std::expected<void, std::error_code> written;
    {
        auto session = writer_->acquire();
        if (!is_started()) {
            return;
        }
        written = session.write(*bytes);
    }
    if (!written) {
        fail(written.error());
    }
}

// ============================================================================
// Configuration
// ============================================================================

void OutputStreamAppender::set_encoder(std::shared_ptr<IEncoder> encoder) {
    encoder_ = std::move(encoder);
    writer_->bind_encoder(encoder_);
}

void OutputStreamAppender::set_output_stream(std::unique_ptr<IOutputStream> stream) {
    auto session = writer_->acquire();
    if (auto replaced = session.replace(std::move(stream)); !replaced) {
        reporter_.add_error("Could not close previous output stream for the appender named " +
                            quote_name(name_) + ".", replaced.error());
    }

    if (!encoder_) {
        reporter_.add_warn("Encoder has not been set. Cannot invoke its init method.");
        return;
    }
    if (auto header = session.write_header(); !header) {
        reporter_.add_error("Failed to write header for the appender named " + quote_name(name_) + ".",
                            header.error());
    }
}

void OutputStreamAppender::set_immediate_flush(bool enable) noexcept {
    writer_->set_immediate_flush(enable);
}

bool OutputStreamAppender::immediate_flush() const noexcept {
    return writer_->immediate_flush();
}

} // namespace logroll
