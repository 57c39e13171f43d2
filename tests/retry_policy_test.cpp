// SPDX-License-Identifier: MIT

// tests/retry_policy_test.cpp
#include <gtest/gtest.h>

#include <chrono>

#include "src/retry_policy.hpp"

using namespace geyser_pipe;

TEST(RetryPolicyTest, StreamDefaultsRetryForever) {
    RetryPolicy policy(RetryConfig::StreamDefaults());
    for (int i = 0; i < 10000; ++i) {
        ASSERT_TRUE(policy.ShouldRetry());
        policy.RecordAttempt();
    }
    EXPECT_EQ(policy.Attempts(), 10000u);
}

TEST(RetryPolicyTest, ShouldRetryFalseAfterMaxAttempts) {
    RetryConfig config{.max_retries = 2};
    RetryPolicy policy(config);

    policy.RecordAttempt();
    EXPECT_TRUE(policy.ShouldRetry());

    policy.RecordAttempt();
    EXPECT_FALSE(policy.ShouldRetry());
}

TEST(RetryPolicyTest, GetNextDelayUsesExponentialBackoff) {
    RetryConfig config{
        .initial_delay = std::chrono::milliseconds(100),
        .max_delay = std::chrono::milliseconds(60000),
        .backoff_multiplier = 2.0,
        .jitter_factor = 0.0  // No jitter for predictable test
    };
    RetryPolicy policy(config);

    // First attempt: 100ms
    EXPECT_EQ(policy.GetNextDelay().count(), 100);

    policy.RecordAttempt();
    EXPECT_EQ(policy.GetNextDelay().count(), 200);

    policy.RecordAttempt();
    EXPECT_EQ(policy.GetNextDelay().count(), 400);
}

TEST(RetryPolicyTest, GetNextDelayRespectsMaxDelay) {
    RetryConfig config{
        .initial_delay = std::chrono::milliseconds(1000),
        .max_delay = std::chrono::milliseconds(5000),
        .backoff_multiplier = 10.0,
        .jitter_factor = 0.0
    };
    RetryPolicy policy(config);

    policy.RecordAttempt();
    policy.RecordAttempt();
    EXPECT_EQ(policy.GetNextDelay().count(), 5000);
}

TEST(RetryPolicyTest, DelaysNeverDecrease) {
    RetryPolicy policy(RetryConfig::StreamDefaults());

    auto previous = policy.GetNextDelay();
    EXPECT_EQ(previous, std::chrono::milliseconds(1000));
    for (int i = 0; i < 200; ++i) {
        policy.RecordAttempt();
        auto delay = policy.GetNextDelay();
        EXPECT_GE(delay, previous) << "attempt " << policy.Attempts();
        previous = delay;
    }
    EXPECT_EQ(previous, std::chrono::milliseconds(60000));
}

TEST(RetryPolicyTest, JitterStaysWithinBounds) {
    RetryConfig config{
        .initial_delay = std::chrono::milliseconds(1000),
        .backoff_multiplier = 2.0,
        .jitter_factor = 0.1
    };
    RetryPolicy policy(config);

    for (int i = 0; i < 100; ++i) {
        auto delay = policy.GetNextDelay();
        EXPECT_GE(delay.count(), 900);
        EXPECT_LE(delay.count(), 1100);
    }
}

TEST(RetryPolicyTest, NonGrowingMultiplierKeepsInitialDelay) {
    RetryConfig config{
        .initial_delay = std::chrono::milliseconds(250),
        .backoff_multiplier = 1.0,
    };
    RetryPolicy policy(config);
    for (int i = 0; i < 50; ++i) policy.RecordAttempt();

    EXPECT_EQ(policy.GetNextDelay().count(), 250);
}
