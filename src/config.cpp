// SPDX-License-Identifier: MIT

// src/config.cpp
#include "src/config.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace geyser_pipe {

namespace {

constexpr std::string_view kWhitespace = " \t\r";

std::string_view Trim(std::string_view s) {
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) return {};
    auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

std::string_view Unquote(std::string_view s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') &&
        s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// True if the authority already carries an explicit port.
bool HasPort(std::string_view authority) {
    if (authority.starts_with('[')) {
        auto close = authority.find(']');
        return close != std::string_view::npos &&
               close + 1 < authority.size() && authority[close + 1] == ':';
    }
    return authority.find(':') != std::string_view::npos;
}

std::string_view HostPart(std::string_view authority) {
    if (authority.starts_with('[')) {
        auto close = authority.find(']');
        if (close == std::string_view::npos) return {};
        return authority.substr(1, close - 1);
    }
    return authority.substr(0, authority.find(':'));
}

std::optional<std::string> GetEnv(std::string_view name) {
    const char* value = std::getenv(std::string(name).c_str());
    if (value == nullptr) return std::nullopt;
    return std::string(value);
}

}  // namespace

std::expected<std::string, Error> NormalizeEndpoint(std::string_view endpoint) {
    std::string_view authority = Trim(endpoint);
    for (std::string_view scheme : {"https://", "http://"}) {
        if (authority.starts_with(scheme)) {
            authority.remove_prefix(scheme.size());
            break;
        }
    }
    while (authority.ends_with('/')) {
        authority.remove_suffix(1);
    }

    if (HostPart(authority).empty()) {
        return std::unexpected(Error{ErrorCode::InvalidEndpoint,
                                     fmt::format("Endpoint has no host: '{}'", endpoint)});
    }

    if (HasPort(authority)) {
        if (authority.ends_with(':')) {
            return std::unexpected(Error{
                ErrorCode::InvalidEndpoint,
                fmt::format("Endpoint has an empty port: '{}'", endpoint)});
        }
        return std::string(authority);
    }
    return fmt::format("{}:{}", authority, kDefaultPort);
}

std::size_t LoadDotEnv(const std::string& path) {
    std::ifstream in(path);
    if (!in) return 0;

    std::size_t loaded = 0;
    std::string line;
    while (std::getline(in, line)) {
        std::string_view entry = Trim(line);
        if (entry.empty() || entry.front() == '#') continue;
        if (entry.starts_with("export ")) {
            entry = Trim(entry.substr(7));
        }

        auto eq = entry.find('=');
        if (eq == std::string_view::npos) {
            spdlog::debug("Ignoring malformed line in {}: {}", path, line);
            continue;
        }

        std::string key(Trim(entry.substr(0, eq)));
        std::string value(Unquote(Trim(entry.substr(eq + 1))));
        if (key.empty()) continue;

        // overwrite=0 keeps values already present in the environment
        if (std::getenv(key.c_str()) == nullptr &&
            ::setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++loaded;
        }
    }
    return loaded;
}

std::expected<EndpointConfig, Error> LoadConfig() {
    // Unset falls back to the public endpoint; set-but-empty is a mistake
    std::string raw = GetEnv(kEndpointEnv).value_or(std::string(kDefaultEndpoint));
    if (Trim(raw).empty()) {
        return std::unexpected(Error{ErrorCode::InvalidConfig,
                                     fmt::format("{} is required", kEndpointEnv)});
    }

    auto endpoint = NormalizeEndpoint(raw);
    if (!endpoint) {
        return std::unexpected(endpoint.error());
    }

    EndpointConfig config{
        .endpoint = std::move(*endpoint),
        .x_token = GetEnv(kAccessTokenEnv).value_or(""),
    };

    spdlog::info("Configuration loaded - Endpoint: {} (access token {})",
                 config.endpoint, config.HasToken() ? "set" : "not set");
    return config;
}

}  // namespace geyser_pipe
