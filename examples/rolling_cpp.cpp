// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors
//
// Logroll C++ Rolling Example
//
// Build:
//   cmake -S . -B build && cmake --build build --target logroll_example

#include <logroll/logroll.hpp>

#include <chrono>
#include <iostream>
#include <string>

int main() {
    logroll::Context context("example");
    context.status_manager().add_listener(logroll::ConsoleStatusListener(logroll::StatusLevel::Warn));

    // Rotate every 4 KiB, keep the five newest archives, compress them
    auto config = logroll::RollingConfigBuilder()
        .name("ROLLING")
        .file("./logs/example.log")
        .file_name_pattern("./logs/example-{date}.{index}.log.zst")
        .size_only(4 * 1024)
        .max_history(5)
        .encoder("{time} [{tid}] {Level} {tag} - {msg}{n}", "--- log start ---\n", "--- log end ---\n")
        .build();

    if (!config) {
        std::cerr << "Config error: ";
        for (auto err : config.error()) {
            std::cerr << logroll::config_error_message(err) << "; ";
        }
        std::cerr << "\n";
        return 1;
    }

    auto appender = logroll::make_rolling_file_appender(*config, context);
    if (!appender) {
        std::cerr << "Failed to create appender\n";
        return 1;
    }

    auto& rolling = **appender;
    rolling.set_invocation_gate(std::make_shared<logroll::PassThroughInvocationGate>());
    rolling.start();
    if (!rolling.is_started()) {
        std::cerr << "Appender did not start\n";
        return 1;
    }

    for (int i = 0; i < 500; ++i) {
        auto message = "Processing item " + std::to_string(i);
        rolling.append(logroll::make_record(logroll::Level::Info, "Main", message));
    }

    // Event whose message is produced only when it is about to be written
    std::string deferred;
    logroll::Event event{logroll::make_record(logroll::Level::Warn, "Network", {}), {}};
    event.prepare_for_deferred_processing = [&deferred](logroll::Record& record) {
        deferred = "Connection timeout after 30 seconds";
        record.message = deferred;
    };
    rolling.append(event);

    rolling.rollover();
    rolling.stop();

    std::cout << "Logs written to ./logs/ (" << context.status_manager().count(logroll::StatusLevel::Error)
              << " errors reported)\n";
    return 0;
}
