// SPDX-License-Identifier: MIT

// tests/channel_factory_test.cpp
#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include <grpc/grpc.h>
#include <grpcpp/security/auth_context.h>

#include "src/channel_factory.hpp"
#include "tests/fake_geyser_server.hpp"

using namespace geyser_pipe;
using namespace geyser_pipe::test_support;

namespace {

struct EmptyIterator : grpc::AuthPropertyIterator {
    EmptyIterator() = default;
};

// Unauthenticated context; the x-token plugin never inspects it.
class NullAuthContext : public grpc::AuthContext {
public:
    bool IsPeerAuthenticated() const override { return false; }
    std::vector<grpc::string_ref> GetPeerIdentity() const override { return {}; }
    std::string GetPeerIdentityPropertyName() const override { return {}; }
    std::vector<grpc::string_ref> FindPropertyValues(const std::string&) const override {
        return {};
    }
    grpc::AuthPropertyIterator begin() const override { return EmptyIterator(); }
    grpc::AuthPropertyIterator end() const override { return EmptyIterator(); }
    void AddProperty(const std::string&, const grpc::string_ref&) override {}
    bool SetPeerIdentityPropertyName(const std::string&) override { return false; }
};

std::map<std::string, int> IntegerArgs(const grpc::ChannelArguments& args) {
    grpc_channel_args raw{};
    args.SetChannelArgs(&raw);

    std::map<std::string, int> out;
    for (size_t i = 0; i < raw.num_args; ++i) {
        if (raw.args[i].type == GRPC_ARG_INTEGER) {
            out[raw.args[i].key] = raw.args[i].value.integer;
        }
    }
    return out;
}

}  // namespace

TEST(ChannelArgumentsTest, KeepaliveSettings) {
    auto args = IntegerArgs(MakeChannelArguments());

    EXPECT_EQ(args[GRPC_ARG_KEEPALIVE_TIME_MS], 30000);
    EXPECT_EQ(args[GRPC_ARG_KEEPALIVE_TIMEOUT_MS], 10000);
    EXPECT_EQ(args[GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS], 1);
    EXPECT_EQ(args[GRPC_ARG_HTTP2_MAX_PINGS_WITHOUT_DATA], 0);
}

TEST(XTokenAuthenticatorTest, AttachesToken) {
    XTokenAuthenticator plugin("secret-token");
    NullAuthContext context;
    std::multimap<grpc::string, grpc::string> metadata;

    auto status = plugin.GetMetadata("https://example.com", "Subscribe", context, &metadata);

    EXPECT_TRUE(status.ok());
    ASSERT_EQ(metadata.count("x-token"), 1u);
    EXPECT_EQ(metadata.find("x-token")->second, "secret-token");
    EXPECT_FALSE(plugin.IsBlocking());
}

TEST(XTokenAuthenticatorTest, EmptyTokenAddsNothing) {
    XTokenAuthenticator plugin("");
    NullAuthContext context;
    std::multimap<grpc::string, grpc::string> metadata;

    EXPECT_TRUE(plugin.GetMetadata("", "", context, &metadata).ok());
    EXPECT_TRUE(metadata.empty());
}

TEST(ChannelCredentialsTest, BuildsWithAndWithoutToken) {
    EXPECT_NE(MakeChannelCredentials(EndpointConfig{.endpoint = "example.com:443"}), nullptr);
    EXPECT_NE(MakeChannelCredentials(
                  EndpointConfig{.endpoint = "example.com:443", .x_token = "abc"}),
              nullptr);
}

TEST(ConnectTest, ReturnsOpenHandleWithoutContactingServer) {
    auto handle = Connect(EndpointConfig{.endpoint = "127.0.0.1:1"});

    ASSERT_TRUE(handle.has_value()) << handle.error().message;
    EXPECT_EQ((*handle)->target(), "127.0.0.1:1");

    grpc::ClientContext context;
    EXPECT_TRUE((*handle)->Track(context).has_value());
}

TEST(TransportHandleTest, CloseIsIdempotent) {
    FakeGeyserServer server;
    auto handle = server.Connect();

    EXPECT_TRUE(handle->Close());
    EXPECT_FALSE(handle->Close());
    EXPECT_FALSE(handle->Close());
}

TEST(TransportHandleTest, CloseHandlersRunOnce) {
    FakeGeyserServer server;
    auto handle = server.Connect();
    int closes = 0;
    handle->OnClose([&] { ++closes; });

    handle->Close();
    handle->Close();
    EXPECT_EQ(closes, 1);

    // Registered after the fact: runs immediately
    int late = 0;
    handle->OnClose([&] { ++late; });
    EXPECT_EQ(late, 1);
}

TEST(TransportHandleTest, DestructorCloses) {
    FakeGeyserServer server;
    int closes = 0;
    {
        auto handle = server.Connect();
        handle->OnClose([&] { ++closes; });
    }
    EXPECT_EQ(closes, 1);
}

TEST(TransportHandleTest, TrackRefusedAfterClose) {
    FakeGeyserServer server;
    auto handle = server.Connect();

    grpc::ClientContext before;
    auto registration = handle->Track(before);
    EXPECT_TRUE(registration.has_value());

    handle->Close();

    grpc::ClientContext after;
    auto refused = handle->Track(after);
    ASSERT_FALSE(refused.has_value());
    EXPECT_EQ(refused.error().code, ErrorCode::ConnectionClosed);
}

TEST(TransportHandleTest, SendsTokenMetadata) {
    FakeGeyserServer server;
    auto handle = server.Connect();

    // Call credentials need a secure channel, so attach the header directly
    grpc::ClientContext context;
    context.AddMetadata(kTokenHeader, "abc");
    auto stream = handle->stub().Subscribe(&context);
    stream->WritesDone();
    EXPECT_TRUE(stream->Finish().ok());

    EXPECT_EQ(server.service().TokensSeen(), (std::vector<std::string>{"abc"}));
}
