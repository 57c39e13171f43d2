// SPDX-License-Identifier: MIT

// src/liveness_relay.hpp
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace geyser_pipe {

/// Unbounded FIFO of pending liveness ids.
///
/// Written by the inbound (reader) thread, drained by the outbound (writer)
/// thread. Enqueue never blocks, so ping handling never stalls the inbound
/// path; Dequeue waits at most `timeout` so the writer can re-check shutdown.
class LivenessRelay {
public:
    LivenessRelay() = default;

    LivenessRelay(const LivenessRelay&) = delete;
    LivenessRelay& operator=(const LivenessRelay&) = delete;

    /// Queue a ping id for reply. Dropped if the relay is closed.
    void Enqueue(int32_t id);

    /// Wait up to `timeout` for the oldest pending id.
    /// @return std::nullopt on timeout or once the relay is closed
    std::optional<int32_t> Dequeue(std::chrono::milliseconds timeout);

    /// Wake any waiting Dequeue() and reject further ids.
    void Close();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<int32_t> pending_;
    bool closed_ = false;
};

}  // namespace geyser_pipe
