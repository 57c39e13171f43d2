// SPDX-License-Identifier: MIT

// src/shutdown_coordinator.cpp
#include "src/shutdown_coordinator.hpp"

#include <csignal>
#include <cstring>

#include <spdlog/spdlog.h>

namespace geyser_pipe {

ShutdownCoordinator::ShutdownCoordinator(ShutdownToken& shutdown)
    : shutdown_(shutdown), signals_(io_) {}

ShutdownCoordinator::~ShutdownCoordinator() {
    Stop();
}

void ShutdownCoordinator::Start() {
    if (started_) return;
    started_ = true;

    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    AwaitSignal();

    thread_ = std::thread([this] { io_.run(); });
}

void ShutdownCoordinator::Stop() {
    if (!started_) return;
    started_ = false;

    // Post so the signal_set is only touched from the io thread
    asio::post(io_, [this] {
        std::error_code ignored;
        signals_.cancel(ignored);
        signals_.clear(ignored);
    });
    if (thread_.joinable()) {
        thread_.join();
    }
    io_.restart();
}

void ShutdownCoordinator::AwaitSignal() {
    signals_.async_wait([this](const std::error_code& ec, int signal_number) {
        HandleSignal(ec, signal_number);
    });
}

void ShutdownCoordinator::HandleSignal(const std::error_code& ec, int signal_number) {
    if (ec == asio::error::operation_aborted) return;
    if (ec) {
        spdlog::error("Signal wait failed: {}", ec.message());
        return;
    }

    signals_received_.fetch_add(1, std::memory_order_acq_rel);
    if (shutdown_.Request()) {
        spdlog::info("Received {}, shutting down gracefully...", ::strsignal(signal_number));
    } else {
        spdlog::info("Received {}, shutdown already in progress", ::strsignal(signal_number));
    }
    AwaitSignal();
}

}  // namespace geyser_pipe
