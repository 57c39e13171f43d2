// SPDX-License-Identifier: MIT

// tests/error_test.cpp
#include <gtest/gtest.h>

#include "lib/stream/error.hpp"

using namespace geyser_pipe;

TEST(ErrorTest, Categories) {
    EXPECT_EQ(error_category(ErrorCode::InvalidConfig), "config");
    EXPECT_EQ(error_category(ErrorCode::InvalidEndpoint), "config");
    EXPECT_EQ(error_category(ErrorCode::ConnectionFailed), "connection");
    EXPECT_EQ(error_category(ErrorCode::ConnectionClosed), "connection");
    EXPECT_EQ(error_category(ErrorCode::CredentialsFailed), "auth");
    EXPECT_EQ(error_category(ErrorCode::StreamFailed), "stream");
    EXPECT_EQ(error_category(ErrorCode::StreamClosed), "stream");
    EXPECT_EQ(error_category(ErrorCode::InvalidState), "state");
}

TEST(ErrorTest, CategoryIsConstexpr) {
    static_assert(error_category(ErrorCode::StreamClosed) == "stream");
    SUCCEED();
}

TEST(ErrorTest, StatusCodeDefaultsToZero) {
    Error error{ErrorCode::StreamClosed, "Stream closed, triggering reconnection"};
    EXPECT_EQ(error.status_code, 0);

    Error failed{ErrorCode::StreamFailed, "unavailable", 14};
    EXPECT_EQ(failed.status_code, 14);
}
