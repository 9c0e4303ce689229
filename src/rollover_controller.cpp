// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "rollover_controller.hpp"
#include "logroll/collision_registry.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace logroll::detail {

namespace fs = std::filesystem;

namespace {

constexpr std::int64_t kDayMs = 24LL * 60 * 60 * 1000;

std::string quote(const fs::path& path) {
    return "\"" + path.string() + "\"";
}

std::int64_t floor_to_day(std::int64_t now_ms) {
    auto q = now_ms / kDayMs;
    if (now_ms % kDayMs < 0) {
        --q;
    }
    return q * kDayMs;
}

} // anonymous namespace

StreamOpener file_stream_opener() {
    return [](const fs::path& path, bool append)
               -> std::expected<std::unique_ptr<IOutputStream>, std::error_code> {
        auto stream = FileOutputStream::open(path, append);
        if (!stream) {
            return std::unexpected(stream.error());
        }
        return std::unique_ptr<IOutputStream>(std::move(*stream));
    };
}

RolloverController::RolloverController(RolloverSettings settings, StatusReporter& reporter)
    : settings_(std::move(settings)),
      reporter_(&reporter) {
    if (!settings_.opener) {
        settings_.opener = file_stream_opener();
    }
}

RolloverController::~RolloverController() = default;

std::int64_t RolloverController::period_of(std::int64_t now_ms) const {
    return settings_.trigger->period_start(now_ms).value_or(floor_to_day(now_ms));
}

NamingState RolloverController::naming_state() const {
    std::lock_guard lock(housekeeping_mutex_);
    return state_;
}

// ============================================================================
// Start: period and index resume
// ============================================================================

void RolloverController::start(std::int64_t now_ms) {
    std::lock_guard lock(housekeeping_mutex_);
    state_ = NamingState{period_of(now_ms), 0};

    const auto& namer = *settings_.namer;
    if (!namer.has_index()) {
        return;
    }

    auto dir = namer.directory();
    if (dir.empty()) {
        dir = ".";
    }
    if (!settings_.file_system->is_directory(dir)) {
        return;
    }

    auto names = settings_.file_system->list(dir, [&namer](const fs::path&, std::string_view name) {
        return namer.matches(name);
    });
    if (!names) {
        reporter_->add_warn("Could not scan " + quote(dir) + " for existing rotated files.",
                            names.error());
        return;
    }

    std::optional<std::uint32_t> highest;
    for (const auto& name : *names) {
        if (auto index = namer.index_of(name, state_.period_start_ms)) {
            highest = std::max(highest.value_or(0), *index);
        }
    }
    if (highest) {
        state_.index = *highest + 1;
    }
}

// ============================================================================
// Rotation
// ============================================================================

std::optional<Housekeeping>
RolloverController::maybe_rollover(std::int64_t now_ms, LockedWriter::Session& session) {
    if (settings_.gate && settings_.gate->is_too_soon(now_ms)) {
        return std::nullopt;
    }

    // Housekeeping of the previous rotation still running: check next time
    std::unique_lock lock(housekeeping_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return std::nullopt;
    }

    TriggerContext ctx{settings_.active_file, now_ms, *settings_.file_system};
    if (!settings_.trigger->is_triggering(ctx)) {
        return std::nullopt;
    }
    return rollover_locked(now_ms, session);
}

std::optional<Housekeeping>
RolloverController::rollover(std::int64_t now_ms, LockedWriter::Session& session) {
    std::lock_guard lock(housekeeping_mutex_);
    return rollover_locked(now_ms, session);
}

std::optional<Housekeeping>
RolloverController::rollover_locked(std::int64_t now_ms, LockedWriter::Session& session) {
    auto& file_system = *settings_.file_system;
    const auto& active = settings_.active_file;

    if (auto closed = session.close(); !closed) {
        reporter_->add_error("Failed to close " + quote(active) + " before rollover.", closed.error());
    }

    const auto archive = settings_.namer->resolve(state_);
    const bool compress = settings_.compressor && settings_.namer->compressed();

    // Compressed archives are renamed to the suffix-less name first
    auto destination = archive;
    if (compress) {
        auto name = archive.string();
        name.resize(name.size() - PatternFileNamer::kCompressionSuffix.size());
        destination = name;
    }

    bool renamed = false;
    if (file_system.exists(archive) || file_system.exists(destination)) {
        reporter_->add_error("Rollover target " + quote(archive) + " already exists; keeping " +
                             quote(active) + ".");
    } else if (!file_system.exists(active)) {
        reporter_->add_warn("Nothing to roll over: " + quote(active) + " does not exist.");
    } else if (auto moved = file_system.rename(active, destination); !moved) {
        reporter_->add_error("Failed to rename " + quote(active) + " to " + quote(destination) + ".",
                             moved.error());
    } else {
        renamed = true;
    }

    // Append so a failed rename loses nothing
    if (auto stream = settings_.opener(active, true); !stream) {
        reporter_->add_error("Failed to reopen " + quote(active) + " after rollover.", stream.error());
    } else {
        if (auto installed = session.replace(std::move(*stream)); !installed) {
            reporter_->add_error("Failed to install " + quote(active) + " after rollover.",
                                 installed.error());
        }
        if (auto header = session.write_header(); !header) {
            reporter_->add_error("Failed to write header to " + quote(active) + ".", header.error());
        }
    }

    const auto period = period_of(now_ms);
    if (period != state_.period_start_ms) {
        state_ = NamingState{period, 0};
    } else if (renamed) {
        ++state_.index;
    }

    Housekeeping work{.now_ms = now_ms, .uncompressed = {}, .archive = archive};
    if (renamed && compress) {
        work.uncompressed = destination;
    }
    return work;
}

// ============================================================================
// Housekeeping: compression and retention
// ============================================================================

void RolloverController::finish(const Housekeeping& work) {
    std::lock_guard lock(housekeeping_mutex_);
    auto& file_system = *settings_.file_system;

    if (!work.uncompressed.empty()) {
        auto written = settings_.compressor->compress_file(work.uncompressed, work.archive);
        if (!written) {
            reporter_->add_error("Failed to compress " + quote(work.uncompressed) + " into " +
                                 quote(work.archive) + ".", written.error());
            if (file_system.exists(work.archive) && !file_system.remove(work.archive)) {
                reporter_->add_warn("Could not delete partial archive " + quote(work.archive) + ".");
            }
        } else if (!file_system.remove(work.uncompressed)) {
            reporter_->add_error("Failed to delete " + quote(work.uncompressed) + " after compression.");
        }
    }

    if (settings_.retention.enabled()) {
        cleanup_locked(work.now_ms);
    }
}

std::size_t RolloverController::cleanup(std::int64_t now_ms) {
    std::lock_guard lock(housekeeping_mutex_);
    return cleanup_locked(now_ms);
}

std::size_t RolloverController::cleanup_locked(std::int64_t now_ms) {
    auto& file_system = *settings_.file_system;
    const auto& namer = *settings_.namer;
    const auto& retention = settings_.retention;

    auto dir = namer.directory();
    if (dir.empty()) {
        dir = ".";
    }

    auto files = file_system.list_files(dir, [&namer](const fs::path&, std::string_view name) {
        return namer.matches(name);
    });
    if (!files) {
        reporter_->add_error("Failed to list " + quote(dir) + " for cleanup.", files.error());
        return 0;
    }

    struct Entry {
        fs::path path;
        std::int64_t modified;
        std::uint64_t size;
    };

    const auto active_key = CollisionRegistry::normalize(settings_.active_file);
    std::vector<Entry> entries;
    entries.reserve(files->size());
    for (auto& file : *files) {
        if (CollisionRegistry::normalize(file) == active_key) {
            continue;
        }
        auto modified = file_system.last_modified(file).value_or(0);
        auto size = file_system.length(file);
        entries.push_back({std::move(file), modified, size});
    }

    // Newest first
    std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
        if (a.modified != b.modified) {
            return a.modified > b.modified;
        }
        return a.path.filename().string() > b.path.filename().string();
    });

    std::size_t deleted = 0;
    std::size_t kept = 0;
    std::uint64_t kept_bytes = 0;
    for (const auto& entry : entries) {
        const bool over_history = retention.max_history > 0 && kept >= retention.max_history;
        const bool too_old = retention.max_age.count() > 0 &&
                             now_ms - entry.modified > retention.max_age.count();
        const bool over_cap = retention.total_size_cap > 0 &&
                              kept_bytes + entry.size > retention.total_size_cap;

        if (!over_history && !too_old && !over_cap) {
            ++kept;
            kept_bytes += entry.size;
            continue;
        }

        if (file_system.remove(entry.path)) {
            ++deleted;
        } else {
            reporter_->add_error("Failed to delete " + quote(entry.path) + " during cleanup.");
        }
    }
    return deleted;
}

} // namespace logroll::detail
