// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file log.hpp
/// @brief Process-wide logger writing to stderr
///
/// stdout carries protocol bytes only, so every diagnostic goes through this
/// logger, which is bound to stderr.

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace geminimcp
{

/// Name of the shared logger
inline constexpr const char* kLoggerName = "geminimcp";

/// Shared logger; created on first use with an `info` threshold
std::shared_ptr<spdlog::logger> logger();

/// Set the threshold from a level name (trace, debug, info, warn, error, critical, off)
/// @throws std::invalid_argument on an unknown name
void set_log_level(const std::string& level);

/// Parse a level name without applying it
/// @return `spdlog::level::n_levels` when the name is unknown
spdlog::level::level_enum parse_log_level(const std::string& level);

} // namespace geminimcp
