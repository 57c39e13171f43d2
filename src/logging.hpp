// SPDX-License-Identifier: MIT

// src/logging.hpp
#pragma once

#include <string_view>

#include <spdlog/common.h>

namespace geyser_pipe {

inline constexpr std::string_view kLogPattern = "%Y-%m-%d %H:%M:%S - %l - %v";

/// Parse a spdlog level name ("trace", "debug", "info", "warn", ...).
/// Empty or unrecognised names map to info.
spdlog::level::level_enum ParseLogLevel(std::string_view name);

/// Install the client's pattern and level on the default logger.
void ConfigureLogging(spdlog::level::level_enum level);

/// ConfigureLogging() with the level taken from GEYSER_LOG_LEVEL.
void ConfigureLoggingFromEnv();

}  // namespace geyser_pipe
