// SPDX-License-Identifier: MIT

// src/channel_factory.cpp
#include "src/channel_factory.hpp"

#include <algorithm>

#include <grpc/grpc.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace geyser_pipe {

grpc::Status XTokenAuthenticator::GetMetadata(
    grpc::string_ref /*service_url*/,
    grpc::string_ref /*method_name*/,
    const grpc::AuthContext& /*channel_auth_context*/,
    std::multimap<grpc::string, grpc::string>* metadata) {
    if (!token_.empty()) {
        metadata->insert(std::make_pair(kTokenHeader, token_));
    }
    return grpc::Status::OK;
}

std::shared_ptr<grpc::ChannelCredentials> MakeChannelCredentials(const EndpointConfig& config) {
    auto ssl = grpc::SslCredentials(grpc::SslCredentialsOptions());
    if (!ssl || !config.HasToken()) {
        return ssl;
    }

    auto token = grpc::MetadataCredentialsFromPlugin(
        std::make_unique<XTokenAuthenticator>(config.x_token));
    if (!token) {
        return nullptr;
    }
    return grpc::CompositeChannelCredentials(ssl, token);
}

grpc::ChannelArguments MakeChannelArguments() {
    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, kKeepaliveTimeMs);
    args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, kKeepaliveTimeoutMs);
    args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, kKeepalivePermitWithoutCalls);
    args.SetInt(GRPC_ARG_HTTP2_MAX_PINGS_WITHOUT_DATA, kMaxPingsWithoutData);
    return args;
}

// TransportHandle

void TransportHandle::CallRegistration::Release() {
    if (handle_ && context_) {
        handle_->Untrack(context_);
    }
    handle_ = nullptr;
    context_ = nullptr;
}

TransportHandle::TransportHandle(std::string target, std::shared_ptr<grpc::Channel> channel)
    : target_(std::move(target)),
      channel_(std::move(channel)),
      stub_(geyser::Geyser::NewStub(channel_)) {}

TransportHandle::~TransportHandle() {
    Close();
}

std::expected<TransportHandle::CallRegistration, Error> TransportHandle::Track(
    grpc::ClientContext& context) {
    std::lock_guard lock(mutex_);
    if (closed_) {
        return std::unexpected(Error{ErrorCode::ConnectionClosed,
                                     fmt::format("Transport to {} is closed", target_)});
    }
    calls_.push_back(&context);
    return CallRegistration(this, &context);
}

void TransportHandle::Untrack(grpc::ClientContext* context) {
    std::lock_guard lock(mutex_);
    std::erase(calls_, context);
}

bool TransportHandle::Close() {
    std::vector<std::function<void()>> handlers;
    {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        closed_ = true;

        // TryCancel is thread-safe and also covers calls not yet started
        for (grpc::ClientContext* context : calls_) {
            context->TryCancel();
        }
        handlers.swap(close_handlers_);
    }

    for (auto& handler : handlers) {
        handler();
    }
    return true;
}

void TransportHandle::OnClose(std::function<void()> callback) {
    {
        std::lock_guard lock(mutex_);
        if (!closed_) {
            close_handlers_.push_back(std::move(callback));
            return;
        }
    }
    callback();
}

std::expected<std::unique_ptr<TransportHandle>, Error> Connect(const EndpointConfig& config) {
    spdlog::info("Connecting to gRPC endpoint: {}", config.endpoint);

    auto credentials = MakeChannelCredentials(config);
    if (!credentials) {
        return std::unexpected(Error{ErrorCode::CredentialsFailed,
                                     fmt::format("Failed to build channel credentials for {}",
                                                 config.endpoint)});
    }

    auto channel = grpc::CreateCustomChannel(config.endpoint, credentials,
                                             MakeChannelArguments());
    if (!channel) {
        return std::unexpected(Error{
            ErrorCode::ConnectionFailed,
            fmt::format("Failed to create channel to {}", config.endpoint)});
    }

    spdlog::info("Channel to {} ready", config.endpoint);
    return std::make_unique<TransportHandle>(config.endpoint, std::move(channel));
}

}  // namespace geyser_pipe
