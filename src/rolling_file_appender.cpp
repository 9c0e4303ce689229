// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/rolling_file_appender.hpp"
#include "logroll/platform.hpp"
#include "compressor.hpp"
#include "locked_writer.hpp"
#include "rollover_controller.hpp"

namespace logroll {

struct RollingFileAppender::Impl {
    std::string pattern;
    std::shared_ptr<ITriggeringPolicy> trigger;
    RetentionPolicy retention;
    int compression_level = detail::ZstdCompressor::kDefaultLevel;

    std::shared_ptr<IFileSystem> file_system;
    std::shared_ptr<IFileNamer> namer;
    std::shared_ptr<IInvocationGate> gate;
    Clock clock;

    std::unique_ptr<detail::RolloverController> controller;

    std::int64_t now() const {
        return clock ? clock() : current_time_millis();
    }
};

RollingFileAppender::RollingFileAppender(Context& context, std::string name)
    : FileAppender(context, std::move(name)),
      impl_(std::make_unique<Impl>()) {}

RollingFileAppender::~RollingFileAppender() = default;

// ============================================================================
// Lifecycle
// ============================================================================

void RollingFileAppender::start() {
    if (state() != AppenderState::Idle) {
        FileAppender::start();
        return;
    }

    int errors = 0;
    if (file().empty()) {
        reporter().add_error("\"File\" property not set for appender named [" + name() + "].");
        ++errors;
    }
    if (!require_encoder()) {
        ++errors;
    }
    if (impl_->pattern.empty()) {
        reporter().add_error("No file_name_pattern option set for appender named [" + name() + "].");
        ++errors;
    }
    if (!impl_->trigger) {
        reporter().add_error("No triggering policy set for appender named [" + name() + "].");
        ++errors;
    }
    if (errors > 0) {
        return;
    }

    auto& registry = context().collision_registry();
    if (CollisionRegistry::normalize(file()) == CollisionRegistry::normalize(impl_->pattern)) {
        reporter().add_error("File property collides with file_name_pattern. Aborting.");
        return;
    }
    if (auto owner = registry.register_pattern(impl_->pattern, {id(), name()})) {
        reporter().add_error(collision_message("file_name_pattern", impl_->pattern, owner->name));
    }

    const auto now = impl_->now();

    if (!impl_->file_system) {
        impl_->file_system = std::make_shared<LocalFileSystem>();
    }
    if (!impl_->namer) {
        impl_->namer = std::make_shared<PatternFileNamer>(impl_->pattern);
    }
    if (!impl_->gate) {
        impl_->gate = std::make_shared<DefaultInvocationGate>(
            DefaultInvocationGate::kDefaultMinDelayMs, DefaultInvocationGate::kDefaultMaxDelayMs, now);
    }

    std::shared_ptr<detail::ICompressor> compressor;
    if (impl_->namer->compressed()) {
        compressor = std::make_shared<detail::ZstdCompressor>(impl_->compression_level);
    }

    impl_->controller = std::make_unique<detail::RolloverController>(
        detail::RolloverSettings{
            .active_file = file(),
            .trigger = impl_->trigger,
            .namer = impl_->namer,
            .file_system = impl_->file_system,
            .gate = impl_->gate,
            .compressor = std::move(compressor),
            .retention = impl_->retention,
            .opener = detail::file_stream_opener()
        },
        reporter());

    impl_->trigger->start(now);
    impl_->controller->start(now);

    FileAppender::start();
    if (!is_started()) {
        impl_->controller.reset();
    }
}

void RollingFileAppender::rollover() {
    std::optional<detail::Housekeeping> work;
    bool rolled = false;
    {
        auto session = writer().acquire();
        if (is_started() && impl_->controller) {
            work = impl_->controller->rollover(impl_->now(), session);
            rolled = true;
        }
    }
    if (!rolled) {
        reporter().add_warn("Cannot roll over appender [" + name() + "] that is not started.");
        return;
    }
    if (work) {
        impl_->controller->finish(*work);
    }
}

void RollingFileAppender::sub_append(Event& event) {
    std::optional<detail::Housekeeping> work;
    {
        auto session = writer().acquire();
        // stop() may have closed the stream since append() checked the state
        if (!is_started()) {
            return;
        }
        work = impl_->controller->maybe_rollover(impl_->now(), session);
    }

    FileAppender::sub_append(event);

    if (work) {
        impl_->controller->finish(*work);
    }
}

// ============================================================================
// Configuration
// ============================================================================

void RollingFileAppender::set_file_name_pattern(std::string pattern) {
    impl_->pattern = std::move(pattern);
}

const std::string& RollingFileAppender::file_name_pattern() const noexcept {
    return impl_->pattern;
}

void RollingFileAppender::set_triggering_policy(std::shared_ptr<ITriggeringPolicy> policy) {
    impl_->trigger = std::move(policy);
}

const std::shared_ptr<ITriggeringPolicy>& RollingFileAppender::triggering_policy() const noexcept {
    return impl_->trigger;
}

void RollingFileAppender::set_retention(RetentionPolicy retention) {
    impl_->retention = retention;
}

const RetentionPolicy& RollingFileAppender::retention() const noexcept {
    return impl_->retention;
}

void RollingFileAppender::set_compression_level(int level) {
    impl_->compression_level = level;
}

void RollingFileAppender::set_file_system(std::shared_ptr<IFileSystem> file_system) {
    impl_->file_system = std::move(file_system);
}

void RollingFileAppender::set_file_namer(std::shared_ptr<IFileNamer> namer) {
    impl_->namer = std::move(namer);
}

void RollingFileAppender::set_invocation_gate(std::shared_ptr<IInvocationGate> gate) {
    impl_->gate = std::move(gate);
}

void RollingFileAppender::set_clock(Clock clock) {
    impl_->clock = std::move(clock);
}

NamingState RollingFileAppender::naming_state() const {
    return impl_->controller ? impl_->controller->naming_state() : NamingState{};
}

// ============================================================================
// Factory
// ============================================================================

std::expected<std::unique_ptr<RollingFileAppender>, std::vector<ConfigError>>
make_rolling_file_appender(const RollingConfig& config, Context& context) {
    if (auto valid = config.validate(); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    auto appender = std::make_unique<RollingFileAppender>(context, config.name);
    appender->set_file(config.file);
    appender->set_append(config.append);
    appender->set_immediate_flush(config.immediate_flush);
    appender->set_file_name_pattern(config.file_name_pattern);
    appender->set_compression_level(config.compression_level);
    appender->set_encoder(std::make_shared<PatternEncoder>(
        config.encoder_pattern, config.encoder_header, config.encoder_footer));

    std::vector<std::shared_ptr<ITriggeringPolicy>> triggers;
    if (config.rollover_period.count() > 0) {
        triggers.push_back(std::make_shared<TimeTriggeringPolicy>(config.rollover_period.count()));
    }
    if (config.max_file_size > 0) {
        triggers.push_back(std::make_shared<SizeTriggeringPolicy>(config.max_file_size));
    }
    if (triggers.size() == 1) {
        appender->set_triggering_policy(std::move(triggers.front()));
    } else {
        appender->set_triggering_policy(std::make_shared<CompositeTriggeringPolicy>(std::move(triggers)));
    }

    appender->set_retention(RetentionPolicy{
        .max_history = config.max_history,
        .max_age = config.max_age,
        .total_size_cap = config.total_size_cap
    });
    return appender;
}

} // namespace logroll
