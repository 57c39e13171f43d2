// SPDX-License-Identifier: MIT

// src/logging.cpp
#include "src/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/spdlog.h>

#include "src/config.hpp"

namespace geyser_pipe {

spdlog::level::level_enum ParseLogLevel(std::string_view name) {
    if (name.empty()) return spdlog::level::info;

    // from_str() returns off for unknown names; only accept "off" when asked for
    auto level = spdlog::level::from_str(std::string(name));
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

void ConfigureLogging(spdlog::level::level_enum level) {
    spdlog::set_pattern(std::string(kLogPattern));
    spdlog::set_level(level);
}

void ConfigureLoggingFromEnv() {
    const char* raw = std::getenv(std::string(kLogLevelEnv).c_str());
    std::string_view name = raw ? raw : "";
    auto level = ParseLogLevel(name);
    ConfigureLogging(level);

    if (!name.empty() && level == spdlog::level::info && name != "info") {
        spdlog::warn("Unknown {} '{}', using info", kLogLevelEnv, name);
    }
}

}  // namespace geyser_pipe
