// SPDX-License-Identifier: MIT

// src/stream_session.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <string_view>

#include <grpcpp/grpcpp.h>

#include "geyser.grpc.pb.h"
#include "lib/stream/error.hpp"
#include "lib/stream/shutdown_token.hpp"
#include "src/channel_factory.hpp"
#include "src/liveness_relay.hpp"
#include "src/message_dispatcher.hpp"

namespace geyser_pipe {

inline constexpr std::string_view kSlotFilterName = "client";
inline constexpr std::chrono::milliseconds kRelayPollInterval{1000};

/// How a session ended when it did not fail.
enum class SessionOutcome {
    ServerClosed,       ///< Server finished the stream with OK status
    DispatcherStopped,  ///< Dispatcher reported Stop (update with no variant)
    Shutdown,           ///< Shutdown was requested; any transport error suppressed
};

constexpr std::string_view session_outcome_name(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::ServerClosed:
            return "server closed";
        case SessionOutcome::DispatcherStopped:
            return "dispatcher stopped";
        case SessionOutcome::Shutdown:
            return "shutdown";
    }
    return "unknown";
}

/// Initial subscription: confirmed commitment, slot filter "client" with
/// filter_by_commitment set.
geyser::SubscribeRequest BuildSubscribeRequest();

/// Liveness reply echoing `id`.
geyser::SubscribeRequest BuildPingReply(int32_t id);

/// One subscribe/receive cycle over a TransportHandle.
///
/// Run() opens the duplex Subscribe call and drives it from two threads:
/// - outbound (owned thread): the subscription request, then a liveness
///   reply for every queued ping, polling the relay every kRelayPollInterval
///   so shutdown is noticed while idle, then WritesDone().
/// - inbound (calling thread): reads updates, queues ping ids on the relay,
///   forwards everything else to the dispatcher.
///
/// The outbound thread is always joined before Run() returns. Closing the
/// handle (or shutdown, through the supervisor) cancels the call, which
/// unblocks a pending Read().
///
/// Single-use: construct one session per stream.
class StreamSession {
public:
    StreamSession(TransportHandle& transport, const ShutdownToken& shutdown,
                  const MessageDispatcher& dispatcher);

    StreamSession(const StreamSession&) = delete;
    StreamSession& operator=(const StreamSession&) = delete;

    /// Run until the stream ends.
    /// @return outcome on a clean end; StreamFailed (with the gRPC status
    ///         code) on transport error while shutdown is not requested
    std::expected<SessionOutcome, Error> Run();

    /// Liveness replies written so far.
    uint64_t PingRepliesSent() const { return replies_sent_.load(std::memory_order_acquire); }

private:
    using Stream = grpc::ClientReaderWriterInterface<geyser::SubscribeRequest,
                                                     geyser::SubscribeUpdate>;

    void PumpOutbound(Stream& stream);
    SessionOutcome PumpInbound(Stream& stream);

    TransportHandle& transport_;
    const ShutdownToken& shutdown_;
    const MessageDispatcher& dispatcher_;
    LivenessRelay relay_;

    std::atomic<bool> inbound_done_{false};
    std::atomic<uint64_t> replies_sent_{0};
    bool ran_ = false;
};

}  // namespace geyser_pipe
