// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#ifndef LOGROLL_ROLLOVER_CONTROLLER_HPP
#define LOGROLL_ROLLOVER_CONTROLLER_HPP

#include "compressor.hpp"
#include "locked_writer.hpp"
#include "logroll/file_namer.hpp"
#include "logroll/file_system.hpp"
#include "logroll/invocation_gate.hpp"
#include "logroll/output_stream.hpp"
#include "logroll/retention_policy.hpp"
#include "logroll/status.hpp"
#include "logroll/triggering_policy.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>

namespace logroll::detail {

// Opens the active file after a rotation
using StreamOpener = std::function<std::expected<std::unique_ptr<IOutputStream>, std::error_code>(
    const std::filesystem::path& path, bool append)>;

[[nodiscard]] StreamOpener file_stream_opener();

struct RolloverSettings {
    std::filesystem::path active_file;
    std::shared_ptr<ITriggeringPolicy> trigger;
    std::shared_ptr<IFileNamer> namer;
    std::shared_ptr<IFileSystem> file_system;
    std::shared_ptr<IInvocationGate> gate;
    std::shared_ptr<ICompressor> compressor;   // Null: archives stay uncompressed
    RetentionPolicy retention;
    StreamOpener opener;
};

// Work left over from a rotation, done without the write lock
struct Housekeeping {
    std::int64_t now_ms = 0;
    std::filesystem::path uncompressed;   // Empty when there is nothing to compress
    std::filesystem::path archive;
};

// ============================================================================
// RolloverController - decides and performs rotation of the active file
// ============================================================================
//
// maybe_rollover()/rollover() run with the appender's write lock held (the
// Session argument) so no event lands between closing and reopening the
// active file. Compression and retention cleanup run afterwards in finish(),
// outside the write lock; a housekeeping mutex keeps them from overlapping
// the next rotation.

class RolloverController {
public:
    RolloverController(RolloverSettings settings, StatusReporter& reporter);
    ~RolloverController();

    RolloverController(const RolloverController&) = delete;
    RolloverController& operator=(const RolloverController&) = delete;

    // Resolves the current period and resumes the index from files on disk
    void start(std::int64_t now_ms);

    // Rotates when the gate allows a check and the trigger fires
    [[nodiscard]] std::optional<Housekeeping>
    maybe_rollover(std::int64_t now_ms, LockedWriter::Session& session);

    // Unconditional rotation
    [[nodiscard]] std::optional<Housekeeping>
    rollover(std::int64_t now_ms, LockedWriter::Session& session);

    void finish(const Housekeeping& work);

    // Applies the retention policy; returns the number of files deleted
    std::size_t cleanup(std::int64_t now_ms);

    [[nodiscard]] NamingState naming_state() const;
    [[nodiscard]] const std::filesystem::path& active_file() const noexcept {
        return settings_.active_file;
    }

private:
    std::optional<Housekeeping> rollover_locked(std::int64_t now_ms, LockedWriter::Session& session);
    std::size_t cleanup_locked(std::int64_t now_ms);
    [[nodiscard]] std::int64_t period_of(std::int64_t now_ms) const;

    RolloverSettings settings_;
    StatusReporter* reporter_;

    // Guards state_, compression and cleanup
    mutable std::mutex housekeeping_mutex_;
    NamingState state_;
};

} // namespace logroll::detail

#endif // LOGROLL_ROLLOVER_CONTROLLER_HPP
