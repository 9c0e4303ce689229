// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

/**
 * @file logroll.hpp
 * @brief Logroll - rolling file appenders
 *
 * @code
 * logroll::Context context;
 * context.status_manager().add_listener(logroll::ConsoleStatusListener(logroll::StatusLevel::Warn));
 *
 * auto config = logroll::RollingConfigBuilder()
 *     .file("logs/app.log")
 *     .file_name_pattern("logs/app-{date}.{index}.log.zst")
 *     .max_file_size(10 * 1024 * 1024)
 *     .max_history(30)
 *     .build();
 *
 * auto appender = logroll::make_rolling_file_appender(*config, context);
 * (*appender)->start();
 * (*appender)->append(logroll::make_record(logroll::Level::Info, "Main", "started"));
 * @endcode
 */

#pragma once

#include "appender.hpp"
#include "collision_registry.hpp"
#include "config.hpp"
#include "context.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "file_appender.hpp"
#include "file_namer.hpp"
#include "file_system.hpp"
#include "invocation_gate.hpp"
#include "output_stream.hpp"
#include "platform.hpp"
#include "retention_policy.hpp"
#include "rolling_file_appender.hpp"
#include "status.hpp"
#include "triggering_policy.hpp"
#include "types.hpp"
