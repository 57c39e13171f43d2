// SPDX-License-Identifier: MIT

// src/config.hpp
#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

#include "lib/stream/error.hpp"

namespace geyser_pipe {

inline constexpr std::string_view kEndpointEnv = "GEYSER_ENDPOINT";
inline constexpr std::string_view kAccessTokenEnv = "GEYSER_ACCESS_TOKEN";
inline constexpr std::string_view kLogLevelEnv = "GEYSER_LOG_LEVEL";
inline constexpr std::string_view kDefaultPort = "443";
inline constexpr std::string_view kDefaultEndpoint = "grpc.solanavibestation.com:443";

/// Endpoint settings for the process. Immutable once loaded.
struct EndpointConfig {
    std::string endpoint;  ///< host:port, port always present
    std::string x_token;   ///< Access token; empty means no auth metadata

    bool HasToken() const { return !x_token.empty(); }
};

/// Strip an optional http:// or https:// scheme and append the default port
/// when none is given. Bracketed IPv6 literals are recognised.
/// @return InvalidEndpoint if the host part is empty
std::expected<std::string, Error> NormalizeEndpoint(std::string_view endpoint);

/// Load KEY=VALUE lines from `path` into the process environment.
///
/// Blank lines and # comments are skipped, an `export ` prefix is accepted
/// and matching surrounding quotes are removed. Variables already set in the
/// environment are left untouched. A missing file is not an error.
/// @return number of variables set
std::size_t LoadDotEnv(const std::string& path = ".env");

/// Read endpoint and token from the environment. An unset GEYSER_ENDPOINT
/// means kDefaultEndpoint.
/// @return InvalidConfig if GEYSER_ENDPOINT is set but empty
std::expected<EndpointConfig, Error> LoadConfig();

}  // namespace geyser_pipe
