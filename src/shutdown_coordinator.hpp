// SPDX-License-Identifier: MIT

// src/shutdown_coordinator.hpp
#pragma once

#include <atomic>
#include <thread>

#include <asio.hpp>

#include "lib/stream/shutdown_token.hpp"

namespace geyser_pipe {

/// Turns SIGINT / SIGTERM into a ShutdownToken request.
///
/// Signals are caught by an asio::signal_set serviced on a dedicated
/// thread, so the token (and every stop_callback registered on it) runs in
/// ordinary thread context rather than inside a signal handler. The first
/// signal requests shutdown; later ones are logged and ignored.
class ShutdownCoordinator {
public:
    explicit ShutdownCoordinator(ShutdownToken& shutdown);
    ~ShutdownCoordinator();

    ShutdownCoordinator(const ShutdownCoordinator&) = delete;
    ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

    /// Install the signal handlers and start the signal thread. Idempotent.
    void Start();

    /// Remove the handlers and join the signal thread. Idempotent.
    void Stop();

    /// Number of signals received so far.
    int SignalsReceived() const { return signals_received_.load(std::memory_order_acquire); }

private:
    void AwaitSignal();
    void HandleSignal(const std::error_code& ec, int signal_number);

    ShutdownToken& shutdown_;
    asio::io_context io_;
    asio::signal_set signals_;
    std::thread thread_;
    std::atomic<int> signals_received_{0};
    bool started_ = false;
};

}  // namespace geyser_pipe
