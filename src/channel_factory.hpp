// SPDX-License-Identifier: MIT

// src/channel_factory.hpp
#pragma once

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/security/credentials.h>

#include "geyser.grpc.pb.h"
#include "lib/stream/error.hpp"
#include "src/config.hpp"

namespace geyser_pipe {

inline constexpr int kKeepaliveTimeMs = 30000;
inline constexpr int kKeepaliveTimeoutMs = 10000;
inline constexpr int kKeepalivePermitWithoutCalls = 1;
inline constexpr int kMaxPingsWithoutData = 0;  // 0 = unlimited

inline constexpr char kTokenHeader[] = "x-token";

/// Call-credential plugin that attaches `x-token: <token>` to every call.
class XTokenAuthenticator : public grpc::MetadataCredentialsPlugin {
public:
    explicit XTokenAuthenticator(std::string token) : token_(std::move(token)) {}

    grpc::Status GetMetadata(grpc::string_ref service_url,
                             grpc::string_ref method_name,
                             const grpc::AuthContext& channel_auth_context,
                             std::multimap<grpc::string, grpc::string>* metadata) override;

    bool IsBlocking() const override { return false; }

    const char* GetType() const override { return "x-token"; }

private:
    std::string token_;
};

/// SSL channel credentials, composed with x-token call credentials when the
/// config carries a token. Returns nullptr only if gRPC refuses the options.
std::shared_ptr<grpc::ChannelCredentials> MakeChannelCredentials(const EndpointConfig& config);

/// Keepalive arguments that keep an idle, ping-driven stream open.
grpc::ChannelArguments MakeChannelArguments();

/// Open, authenticated channel to one endpoint plus its Geyser stub.
///
/// Close() cancels every call registered through Track() and refuses new
/// ones; that is what unblocks a reader parked in ClientReaderWriter::Read().
/// Close() is idempotent and thread-safe; the destructor calls it, so a
/// handle is never left open on any exit path.
class TransportHandle {
public:
    /// RAII registration of an in-flight call. Unregisters on destruction.
    class CallRegistration {
    public:
        CallRegistration() = default;
        CallRegistration(TransportHandle* handle, grpc::ClientContext* context)
            : handle_(handle), context_(context) {}
        ~CallRegistration() { Release(); }

        CallRegistration(const CallRegistration&) = delete;
        CallRegistration& operator=(const CallRegistration&) = delete;
        CallRegistration(CallRegistration&& other) noexcept
            : handle_(std::exchange(other.handle_, nullptr)),
              context_(std::exchange(other.context_, nullptr)) {}
        CallRegistration& operator=(CallRegistration&& other) noexcept {
            if (this != &other) {
                Release();
                handle_ = std::exchange(other.handle_, nullptr);
                context_ = std::exchange(other.context_, nullptr);
            }
            return *this;
        }

    private:
        void Release();

        TransportHandle* handle_ = nullptr;
        grpc::ClientContext* context_ = nullptr;
    };

    TransportHandle(std::string target, std::shared_ptr<grpc::Channel> channel);
    ~TransportHandle();

    TransportHandle(const TransportHandle&) = delete;
    TransportHandle& operator=(const TransportHandle&) = delete;
    TransportHandle(TransportHandle&&) = delete;
    TransportHandle& operator=(TransportHandle&&) = delete;

    /// Register a call so Close() can cancel it.
    /// @return ConnectionClosed if the handle is already closed
    std::expected<CallRegistration, Error> Track(grpc::ClientContext& context);

    /// Cancel in-flight calls and refuse new ones. The channel itself is
    /// released when the handle is destroyed.
    /// @return true only for the call that performed the close
    bool Close();

    /// Register a callback invoked once, from whichever thread closes the handle.
    void OnClose(std::function<void()> callback);

    geyser::Geyser::StubInterface& stub() { return *stub_; }
    const std::string& target() const { return target_; }

private:
    void Untrack(grpc::ClientContext* context);

    std::string target_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<geyser::Geyser::StubInterface> stub_;

    mutable std::mutex mutex_;
    bool closed_ = false;
    std::vector<grpc::ClientContext*> calls_;
    std::vector<std::function<void()>> close_handlers_;
};

/// Build credentials and a channel for `config`. Does not send anything and
/// does not retry; the caller owns retries.
std::expected<std::unique_ptr<TransportHandle>, Error> Connect(const EndpointConfig& config);

}  // namespace geyser_pipe
