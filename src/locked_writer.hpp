// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#ifndef LOGROLL_LOCKED_WRITER_HPP
#define LOGROLL_LOCKED_WRITER_HPP

#include "logroll/encoder.hpp"
#include "logroll/output_stream.hpp"

#include <atomic>
#include <expected>
#include <memory>
#include <mutex>
#include <string_view>
#include <system_error>

namespace logroll::detail {

// ============================================================================
// LockedWriter - one output stream behind one mutex
// ============================================================================
//
// Every mutation of the stream happens with the mutex held. Single writes
// lock internally; compound operations (install + header, footer + close,
// rotation) take a Session, which holds the lock until it is destroyed.

class LockedWriter {
public:
    class Session {
    public:
        Session(Session&&) noexcept = default;
        Session& operator=(Session&&) noexcept = default;

        [[nodiscard]] std::expected<void, std::error_code> write(std::string_view data);
        [[nodiscard]] std::expected<void, std::error_code> flush();

        // Header of the installed stream, at most once per stream
        [[nodiscard]] std::expected<void, std::error_code> write_header();

        // Footer and close of the current stream (if any), then installs
        // `stream`. The header of the new stream is not written.
        [[nodiscard]] std::expected<void, std::error_code>
        replace(std::unique_ptr<IOutputStream> stream);

        // Footer and close of the current stream; no-op without one
        [[nodiscard]] std::expected<void, std::error_code> close();

        // Close of the current stream without a footer
        [[nodiscard]] std::expected<void, std::error_code> discard();

        [[nodiscard]] bool is_open() const noexcept;

    private:
        friend class LockedWriter;
        explicit Session(LockedWriter& writer);

        LockedWriter* writer_;
        std::unique_lock<std::mutex> lock_;
    };

    LockedWriter() = default;
    ~LockedWriter() = default;

    LockedWriter(const LockedWriter&) = delete;
    LockedWriter& operator=(const LockedWriter&) = delete;

    // Empty input returns without taking the lock
    [[nodiscard]] std::expected<void, std::error_code> write(std::string_view data);
    [[nodiscard]] std::expected<void, std::error_code> flush();

    [[nodiscard]] Session acquire();

    // Source of header/footer bytes; bind before the first stream is installed
    void bind_encoder(std::shared_ptr<IEncoder> encoder);

    void set_immediate_flush(bool enable) noexcept {
        immediate_flush_.store(enable, std::memory_order_relaxed);
    }
    [[nodiscard]] bool immediate_flush() const noexcept {
        return immediate_flush_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool is_open() const;

private:
    std::expected<void, std::error_code> write_locked(std::string_view data);
    std::expected<void, std::error_code> close_locked(bool with_footer = true);

    mutable std::mutex mutex_;
    std::unique_ptr<IOutputStream> stream_;
    std::shared_ptr<IEncoder> encoder_;
    bool header_written_ = false;
    std::atomic<bool> immediate_flush_{true};
};

} // namespace logroll::detail

#endif // LOGROLL_LOCKED_WRITER_HPP
