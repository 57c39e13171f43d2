// SPDX-License-Identifier: MIT

// src/liveness_relay.cpp
#include "src/liveness_relay.hpp"

namespace geyser_pipe {

void LivenessRelay::Enqueue(int32_t id) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return;
        pending_.push_back(id);
    }
    cv_.notify_one();
}

std::optional<int32_t> LivenessRelay::Dequeue(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return closed_ || !pending_.empty(); });
    if (closed_ || pending_.empty()) {
        return std::nullopt;
    }
    int32_t id = pending_.front();
    pending_.pop_front();
    return id;
}

void LivenessRelay::Close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
        pending_.clear();
    }
    cv_.notify_all();
}

}  // namespace geyser_pipe
