// SPDX-License-Identifier: MIT

// lib/stream/shutdown_token.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>

namespace geyser_pipe {

/// Process-wide cooperative cancellation flag.
///
/// Set at most once, never reset. Passed by reference into every component
/// that blocks, so shutdown propagation is explicit and testable in isolation.
///
/// Components that block on something other than WaitFor() register a
/// std::stop_callback on token() to be woken when shutdown is requested:
/// @code
/// std::stop_callback cancel(shutdown.token(), [&] { context.TryCancel(); });
/// @endcode
class ShutdownToken {
public:
    ShutdownToken() = default;

    ShutdownToken(const ShutdownToken&) = delete;
    ShutdownToken& operator=(const ShutdownToken&) = delete;
    ShutdownToken(ShutdownToken&&) = delete;
    ShutdownToken& operator=(ShutdownToken&&) = delete;

    /// Request shutdown. Runs registered stop callbacks on the calling thread.
    /// @return true only for the call that performed the transition
    bool Request() {
        return source_.request_stop();
    }

    /// Return true once shutdown has been requested. Thread-safe.
    bool IsRequested() const {
        return source_.stop_requested();
    }

    /// Sleep for up to `timeout`, waking early if shutdown is requested.
    /// @return true if shutdown was requested before or during the wait
    template <typename Rep, typename Period>
    bool WaitFor(std::chrono::duration<Rep, Period> timeout) const {
        std::unique_lock lock(mutex_);
        cv_.wait_for(lock, source_.get_token(), timeout, [] { return false; });
        return source_.stop_requested();
    }

    /// Token for registering std::stop_callback handlers.
    std::stop_token token() const {
        return source_.get_token();
    }

private:
    std::stop_source source_;
    mutable std::mutex mutex_;
    mutable std::condition_variable_any cv_;
};

}  // namespace geyser_pipe
