// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace geyser_pipe {

/// Error codes for configuration, connection and stream operations.
enum class ErrorCode {
    // Config
    InvalidConfig,         ///< Required setting missing or malformed
    InvalidEndpoint,       ///< Endpoint has no host or an unparsable port

    // Connection
    ConnectionFailed,      ///< Channel could not be created (DNS, TLS, unreachable)
    ConnectionClosed,      ///< Transport handle was closed before or during the call

    // Auth
    CredentialsFailed,     ///< Channel or call credentials could not be built

    // Stream
    StreamFailed,          ///< RPC finished with a non-OK status
    StreamClosed,          ///< Server ended the stream cleanly; reconnect required

    // State
    InvalidState,          ///< Method called in wrong state
};

/// Error payload returned through std::expected.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
    int status_code = 0;           ///< gRPC status code if applicable, 0 otherwise
};

/// Return a short category string for an error code (e.g. "connection", "stream").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig:
        case ErrorCode::InvalidEndpoint:
            return "config";
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionClosed:
            return "connection";
        case ErrorCode::CredentialsFailed:
            return "auth";
        case ErrorCode::StreamFailed:
        case ErrorCode::StreamClosed:
            return "stream";
        case ErrorCode::InvalidState:
            return "state";
    }
    return "unknown";
}

}  // namespace geyser_pipe
