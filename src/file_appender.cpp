// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/file_appender.hpp"
#include "locked_writer.hpp"

#include <expected>

namespace logroll {

FileAppender::FileAppender(Context& context, std::string name)
    : OutputStreamAppender(context, std::move(name)) {}

FileAppender::~FileAppender() {
    FileAppender::stop();
}

void FileAppender::start() {
    if (state() != AppenderState::Idle) {
        OutputStreamAppender::start();
        return;
    }

    // Nothing is claimed or opened until every precondition holds
    int errors = 0;
    if (file_.empty()) {
        reporter().add_error("\"File\" property not set for appender named [" + name() + "].");
        ++errors;
    }
    if (!require_encoder()) {
        ++errors;
    }
    if (errors > 0) {
        return;
    }

    check_file_collision();

    if (!open_file()) {
        context().collision_registry().release(id());
        return;
    }
    OutputStreamAppender::start();
    if (!is_started()) {
        abandon_start();
    }
}

void FileAppender::stop() {
    if (state() == AppenderState::Stopped) {
        return;
    }
    OutputStreamAppender::stop();
    context().collision_registry().release(id());
}

void FileAppender::abandon_start() {
    std::expected<void, std::error_code> discarded;
    {
        auto session = writer().acquire();
        discarded = session.discard();
    }
    if (!discarded) {
        reporter().add_error("Could not close file \"" + file_.string() + "\" for appender named [" +
                             name() + "].", discarded.error());
    }
    context().collision_registry().release(id());
}

bool FileAppender::open_file() {
    auto stream = FileOutputStream::open(file_, append_);
    if (!stream) {
        reporter().add_error("Failed to open file \"" + file_.string() + "\" for appender named [" +
                             name() + "].", stream.error());
        return false;
    }
    set_output_stream(std::move(*stream));
    return true;
}

void FileAppender::check_file_collision() {
    auto& registry = context().collision_registry();
    if (auto owner = registry.register_file(file_, {id(), name()})) {
        reporter().add_error(collision_message("file", file_.string(), owner->name));
    }
}

} // namespace logroll
