// SPDX-License-Identifier: MIT

// src/retry_policy.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

namespace geyser_pipe {

/// Configuration for exponential backoff retry behavior.
struct RetryConfig {
    std::optional<uint32_t> max_retries = std::nullopt;  ///< nullopt = retry forever
    std::chrono::milliseconds initial_delay{1000};       ///< Delay before first retry
    std::chrono::milliseconds max_delay{60000};          ///< Delay cap
    double backoff_multiplier = 2.0;                     ///< Multiplier per attempt
    double jitter_factor = 0.0;                          ///< Random jitter range (+/- fraction)

    /// Preset for the subscription stream: unbounded, no jitter, so
    /// successive delays never decrease.
    static RetryConfig StreamDefaults() {
        return RetryConfig{
            .max_retries = std::nullopt,
            .initial_delay = std::chrono::milliseconds{1000},
            .max_delay = std::chrono::milliseconds{60000},
            .backoff_multiplier = 2.0,
            .jitter_factor = 0.0,
        };
    }
};

/// Stateful retry policy with exponential backoff and optional jitter.
///
/// Tracks attempt count and computes delays. The delay for attempt n is
/// initial * multiplier^n, capped at max_delay; the attempt count itself
/// may grow without limit.
class RetryPolicy {
public:
    explicit RetryPolicy(RetryConfig config = {})
        : config_(config), attempts_(0) {}

    /// Return true if the retry budget has not been exhausted.
    bool ShouldRetry() const {
        return !config_.max_retries || attempts_ < *config_.max_retries;
    }

    /// Increment the attempt counter.
    void RecordAttempt() {
        ++attempts_;
    }

    /// Calculate next delay with exponential backoff and jitter.
    std::chrono::milliseconds GetNextDelay() const {
        return CalculateBackoff();
    }

    /// Return the number of recorded attempts.
    uint64_t Attempts() const { return attempts_; }

private:
    // Calculate delay using exponential backoff with jitter
    std::chrono::milliseconds CalculateBackoff() const {
        const double cap = static_cast<double>(config_.max_delay.count());

        // Exponential backoff: initial * multiplier^attempts, stop once capped
        double delay_ms = static_cast<double>(config_.initial_delay.count());
        const bool grows = config_.backoff_multiplier > 1.0;
        for (uint64_t i = 0; grows && i < attempts_ && delay_ms < cap; ++i) {
            delay_ms *= config_.backoff_multiplier;
        }
        delay_ms = std::min(delay_ms, cap);

        if (config_.jitter_factor > 0.0) {
            std::random_device rd;
            std::mt19937 gen(rd());
            std::uniform_real_distribution<> dis(
                1.0 - config_.jitter_factor,
                1.0 + config_.jitter_factor);
            delay_ms *= dis(gen);
        }

        return std::chrono::milliseconds(static_cast<int64_t>(delay_ms));
    }

    RetryConfig config_;
    uint64_t attempts_;
};

}  // namespace geyser_pipe
