/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <set>
#include <thread>
#include <vector>

#include "featloop/types.hpp"

namespace featloop {

using FeatureProcessor = std::function<void(const FeatureId&, int workerId)>;

// Fixed set of worker threads. A feature is in flight from submit() until
// its processor returns, and cannot be submitted again meanwhile.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(FeatureProcessor processor);
    // Waits for running processors to return; queued features are dropped.
    void stop() noexcept;

    // False if the pool is stopped or the feature is already in flight.
    [[nodiscard]] bool submit(const FeatureId& id);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] bool isInFlight(const FeatureId& id) const;
    [[nodiscard]] std::set<FeatureId> inFlight() const;
    [[nodiscard]] std::size_t inFlightCount() const;
    [[nodiscard]] std::size_t queueSize() const;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

    // Blocks until nothing is queued or running. Used by tests and shutdown.
    void waitIdle();

private:
    void workerLoop(int workerId);

    int workers_;
    FeatureProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex queueMutex_;
    std::condition_variable featureAvailable_;
    std::condition_variable idle_;
    std::queue<FeatureId> queue_;
    std::set<FeatureId> inFlight_;

    std::vector<std::thread> workerThreads_;
};

}
