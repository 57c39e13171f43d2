// SPDX-License-Identifier: MIT

// src/reconnect_supervisor.hpp
#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>

#include "lib/stream/error.hpp"
#include "lib/stream/shutdown_token.hpp"
#include "src/channel_factory.hpp"
#include "src/message_dispatcher.hpp"
#include "src/retry_policy.hpp"

namespace geyser_pipe {

struct SupervisorOptions {
    RetryConfig retry = RetryConfig::StreamDefaults();
    std::chrono::milliseconds reconnect_pause{1000};  ///< Pause after a clean server close
};

/// Keeps one subscription alive for the life of the process.
///
/// Each attempt acquires a fresh TransportHandle from the connector, runs
/// one StreamSession on it and releases it on every exit path. Every
/// attempt that ends without shutdown counts as a failure, including a
/// clean server close, and is followed by an exponential backoff. The
/// backoff sequence is continuous across reconnects within one Run().
///
/// Shutdown closes the active handle from the signalling thread, which
/// cancels the blocked receive; Run() then returns without retrying and
/// without reporting errors.
class ReconnectSupervisor {
public:
    using Connector =
        std::function<std::expected<std::unique_ptr<TransportHandle>, Error>()>;
    using BackoffCallback =
        std::function<void(std::chrono::milliseconds delay, uint64_t attempt)>;

    ReconnectSupervisor(Connector connector, ShutdownToken& shutdown,
                        const MessageDispatcher& dispatcher, SupervisorOptions options = {});

    ReconnectSupervisor(const ReconnectSupervisor&) = delete;
    ReconnectSupervisor& operator=(const ReconnectSupervisor&) = delete;

    /// Run until shutdown. With the default unbounded retry config, shutdown
    /// is the only way out; a bounded config also returns once exhausted.
    void Run();

    /// Observe each scheduled retry. Set before Run().
    template <typename H>
    void OnBackoff(H&& h) {
        backoff_handler_ = std::forward<H>(h);
    }

    /// Failed attempts so far.
    uint64_t Attempts() const { return policy_.Attempts(); }

private:
    // One connect-and-subscribe attempt. Success means shutdown interrupted it.
    std::expected<void, Error> RunAttempt();

    Connector connector_;
    ShutdownToken& shutdown_;
    const MessageDispatcher& dispatcher_;
    SupervisorOptions options_;
    RetryPolicy policy_;
    BackoffCallback backoff_handler_;
};

}  // namespace geyser_pipe
