/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace featloop {

// Shared cancellation flag with interruptible waits. Loops that would
// otherwise sleep call waitFor() so a stop request wakes them immediately.
class StopSignal {
public:
    StopSignal() = default;

    StopSignal(const StopSignal&) = delete;
    StopSignal& operator=(const StopSignal&) = delete;

    void request() noexcept {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requested_.store(true);
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool requested() const noexcept { return requested_.load(); }

    // Returns true if stop was requested before the timeout elapsed.
    template <typename Rep, typename Period>
    bool waitFor(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return requested_.load(); });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> requested_{false};
};

}
