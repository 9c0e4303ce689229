// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "locked_writer.hpp"
#include "logroll/error.hpp"

namespace logroll::detail {

// ============================================================================
// LockedWriter
// ============================================================================

std::expected<void, std::error_code> LockedWriter::write(std::string_view data) {
    if (data.empty()) {
        return {};
    }
    std::lock_guard lock(mutex_);
    return write_locked(data);
}

std::expected<void, std::error_code> LockedWriter::flush() {
    std::lock_guard lock(mutex_);
    if (!stream_) {
        return std::unexpected(make_error_code(Errc::stream_closed));
    }
    return stream_->flush();
}

LockedWriter::Session LockedWriter::acquire() {
    return Session(*this);
}

void LockedWriter::bind_encoder(std::shared_ptr<IEncoder> encoder) {
    std::lock_guard lock(mutex_);
    encoder_ = std::move(encoder);
}

bool LockedWriter::is_open() const {
    std::lock_guard lock(mutex_);
    return stream_ != nullptr;
}

std::expected<void, std::error_code> LockedWriter::write_locked(std::string_view data) {
    if (!stream_) {
        return std::unexpected(make_error_code(Errc::stream_closed));
    }
    if (auto written = stream_->write(data); !written) {
        return written;
    }
    if (immediate_flush()) {
        return stream_->flush();
    }
    return {};
}

std::expected<void, std::error_code> LockedWriter::close_locked(bool with_footer) {
    if (!stream_) {
        return {};
    }

    std::expected<void, std::error_code> result;
    if (with_footer && encoder_) {
        if (auto footer = encoder_->footer_bytes(); !footer) {
            result = std::unexpected(footer.error());
        } else if (!footer->empty()) {
            result = stream_->write(*footer);
        }
    }

    // The stream is closed and dropped even when the footer failed
    auto closed = stream_->close();
    stream_.reset();
    header_written_ = false;

    if (!result) {
        return result;
    }
    return closed;
}

// ============================================================================
// Session
// ============================================================================

LockedWriter::Session::Session(LockedWriter& writer)
    : writer_(&writer), lock_(writer.mutex_) {}

std::expected<void, std::error_code> LockedWriter::Session::write(std::string_view data) {
    if (data.empty()) {
        return {};
    }
    return writer_->write_locked(data);
}

std::expected<void, std::error_code> LockedWriter::Session::flush() {
    if (!writer_->stream_) {
        return std::unexpected(make_error_code(Errc::stream_closed));
    }
    return writer_->stream_->flush();
}

std::expected<void, std::error_code> LockedWriter::Session::write_header() {
    auto& w = *writer_;
    if (!w.stream_ || w.header_written_ || !w.encoder_) {
        return {};
    }

    auto header = w.encoder_->header_bytes();
    if (!header) {
        return std::unexpected(header.error());
    }
    w.header_written_ = true;
    if (header->empty()) {
        return {};
    }
    return w.write_locked(*header);
}

std::expected<void, std::error_code>
LockedWriter::Session::replace(std::unique_ptr<IOutputStream> stream) {
    auto closed = writer_->close_locked();
    writer_->stream_ = std::move(stream);
    writer_->header_written_ = false;
    return closed;
}

std::expected<void, std::error_code> LockedWriter::Session::close() {
    return writer_->close_locked();
}

std::expected<void, std::error_code> LockedWriter::Session::discard() {
    return writer_->close_locked(false);
}

bool LockedWriter::Session::is_open() const noexcept {
    return writer_->stream_ != nullptr;
}

} // namespace logroll::detail
