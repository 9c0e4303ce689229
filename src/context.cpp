// SPDX-License-Identifier: MIT
// Copyright (c) 2024 Logroll Contributors

#include "logroll/context.hpp"
#include "logroll/platform.hpp"

namespace logroll {

Context::Context(std::string name)
    : name_(std::move(name)),
      birth_time_(current_time_millis()) {}

Context::~Context() = default;

} // namespace logroll
