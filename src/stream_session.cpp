// SPDX-License-Identifier: MIT

// src/stream_session.cpp
#include "src/stream_session.hpp"

#include <functional>
#include <string>
#include <thread>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace geyser_pipe {

geyser::SubscribeRequest BuildSubscribeRequest() {
    geyser::SubscribeRequest request;
    request.set_commitment(geyser::CONFIRMED);

    geyser::SubscribeRequestFilterSlots filter;
    filter.set_filter_by_commitment(true);
    (*request.mutable_slots())[std::string(kSlotFilterName)] = filter;
    return request;
}

geyser::SubscribeRequest BuildPingReply(int32_t id) {
    geyser::SubscribeRequest request;
    request.mutable_ping()->set_id(id);
    return request;
}

StreamSession::StreamSession(TransportHandle& transport, const ShutdownToken& shutdown,
                             const MessageDispatcher& dispatcher)
    : transport_(transport), shutdown_(shutdown), dispatcher_(dispatcher) {}

std::expected<SessionOutcome, Error> StreamSession::Run() {
    if (ran_) {
        return std::unexpected(Error{ErrorCode::InvalidState,
                                     "StreamSession::Run() called twice"});
    }
    ran_ = true;

    grpc::ClientContext context;
    auto registration = transport_.Track(context);
    if (!registration) {
        if (shutdown_.IsRequested()) return SessionOutcome::Shutdown;
        return std::unexpected(registration.error());
    }

    auto stream = transport_.stub().Subscribe(&context);
    if (!stream) {
        return std::unexpected(Error{ErrorCode::StreamFailed,
                                     fmt::format("Failed to open Subscribe stream to {}",
                                                 transport_.target())});
    }
    spdlog::info("Subscribed to slot updates, waiting for messages...");

    std::thread writer([this, &stream] { PumpOutbound(*stream); });

    // Stops and joins the writer on every exit, including a throwing inbound pump
    bool cancel_call = true;
    auto stop_writer = [&] {
        if (!writer.joinable()) return;
        inbound_done_.store(true, std::memory_order_release);
        relay_.Close();
        if (cancel_call) {
            context.TryCancel();
        }
        writer.join();
    };
    struct ScopeGuard {
        std::function<void()> fn;
        ~ScopeGuard() { fn(); }
    } scope_guard{stop_writer};

    SessionOutcome outcome = PumpInbound(*stream);

    // Abandoning a live call: cancel so Write() and Finish() return promptly
    cancel_call = outcome != SessionOutcome::ServerClosed;
    stop_writer();

    grpc::Status status = stream->Finish();
    spdlog::info("Stream closed ({})", session_outcome_name(outcome));

    if (shutdown_.IsRequested()) {
        if (!status.ok()) {
            spdlog::debug("Ignoring stream status during shutdown: {} - {}",
                          static_cast<int>(status.error_code()), status.error_message());
        }
        return SessionOutcome::Shutdown;
    }
    if (outcome == SessionOutcome::DispatcherStopped) {
        return outcome;
    }
    if (!status.ok()) {
        spdlog::error("Stream error: {} - {}", static_cast<int>(status.error_code()),
                      status.error_message());
        return std::unexpected(Error{ErrorCode::StreamFailed, status.error_message(),
                                     static_cast<int>(status.error_code())});
    }
    return outcome;
}

void StreamSession::PumpOutbound(Stream& stream) {
    if (!stream.Write(BuildSubscribeRequest())) {
        spdlog::debug("Subscribe request not sent: stream already closed");
        return;
    }

    while (!shutdown_.IsRequested() && !inbound_done_.load(std::memory_order_acquire)) {
        auto id = relay_.Dequeue(kRelayPollInterval);
        if (!id) continue;

        if (!stream.Write(BuildPingReply(*id))) {
            spdlog::warn("Failed to send ping reply (id={}): stream closed", *id);
            return;
        }
        replies_sent_.fetch_add(1, std::memory_order_acq_rel);
    }
    stream.WritesDone();
}

SessionOutcome StreamSession::PumpInbound(Stream& stream) {
    geyser::SubscribeUpdate update;
    while (stream.Read(&update)) {
        if (shutdown_.IsRequested()) {
            return SessionOutcome::Shutdown;
        }

        if (update.has_ping()) {
            int32_t id = update.ping().id();
            relay_.Enqueue(id);
            spdlog::info("Received ping from server (id={}) - replying to keep connection alive",
                         id);
            continue;
        }

        if (dispatcher_.Dispatch(update) == DispatchResult::Stop) {
            return SessionOutcome::DispatcherStopped;
        }
    }
    return shutdown_.IsRequested() ? SessionOutcome::Shutdown : SessionOutcome::ServerClosed;
}

}  // namespace geyser_pipe
