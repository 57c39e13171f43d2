// SPDX-License-Identifier: MIT

// src/reconnect_supervisor.cpp
#include "src/reconnect_supervisor.hpp"

#include <stop_token>
#include <utility>

#include <spdlog/spdlog.h>

#include "src/stream_session.hpp"

namespace geyser_pipe {

ReconnectSupervisor::ReconnectSupervisor(Connector connector, ShutdownToken& shutdown,
                                         const MessageDispatcher& dispatcher,
                                         SupervisorOptions options)
    : connector_(std::move(connector)),
      shutdown_(shutdown),
      dispatcher_(dispatcher),
      options_(options),
      policy_(options.retry) {}

void ReconnectSupervisor::Run() {
    while (!shutdown_.IsRequested()) {
        auto result = RunAttempt();
        if (shutdown_.IsRequested()) {
            break;
        }
        if (result) {
            // Only shutdown ends an attempt without error
            continue;
        }

        if (!policy_.ShouldRetry()) {
            spdlog::error("Retry budget exhausted after {} attempts: {}",
                          policy_.Attempts(), result.error().message);
            return;
        }

        auto delay = policy_.GetNextDelay();
        policy_.RecordAttempt();
        spdlog::warn("Connection failed ({}: {}), will retry in {:.1f}s... (attempt {})",
                     error_category(result.error().code), result.error().message,
                     std::chrono::duration<double>(delay).count(), policy_.Attempts());
        if (backoff_handler_) {
            backoff_handler_(delay, policy_.Attempts());
        }

        if (shutdown_.WaitFor(delay)) {
            break;
        }
    }
    spdlog::info("Supervisor stopped");
}

std::expected<void, Error> ReconnectSupervisor::RunAttempt() {
    auto transport = connector_();
    if (!transport) {
        return std::unexpected(transport.error());
    }
    TransportHandle& handle = **transport;
    handle.OnClose([target = handle.target()] {
        spdlog::info("Connection to {} closed", target);
    });

    // Fires on the signalling thread; closing cancels a receive parked in Read()
    std::stop_callback close_on_shutdown(shutdown_.token(), [&handle] { handle.Close(); });

    StreamSession session(handle, shutdown_, dispatcher_);
    auto outcome = session.Run();
    if (!outcome) {
        return std::unexpected(outcome.error());
    }
    if (*outcome == SessionOutcome::Shutdown || shutdown_.IsRequested()) {
        return {};
    }

    // A dispatcher stop is handled exactly like a clean server close
    spdlog::warn("Stream ended ({}), will reconnect...", session_outcome_name(*outcome));
    if (shutdown_.WaitFor(options_.reconnect_pause)) {
        return {};
    }
    return std::unexpected(Error{ErrorCode::StreamClosed,
                                 "Stream closed, triggering reconnection"});
}

}  // namespace geyser_pipe
