/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/pool.hpp"
#include "featloop/logger.hpp"

namespace featloop {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(FeatureProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid feature processor provided");
        return false;
    }

    processor_ = std::move(processor);
    running_.store(true);
    shutdown_.store(false);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        LOG_INFO("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        shutdown_.store(true);
        running_.store(false);
        featureAvailable_.notify_all();
        for (auto& thread : workerThreads_) {
            if (thread.joinable()) thread.join();
        }
        workerThreads_.clear();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
        // Queued features never started, so they are no longer in flight
        while (!queue_.empty()) {
            inFlight_.erase(queue_.front());
            queue_.pop();
        }
    }
    featureAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();
    idle_.notify_all();

    LOG_INFO("Pool stopped");
}

bool Pool::submit(const FeatureId& id) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        if (!running_.load() || shutdown_.load()) {
            LOG_DEBUG("Cannot submit feature to stopped pool: " + id);
            return false;
        }
        if (!inFlight_.insert(id).second) {
            LOG_WARN("Feature already in flight, submission rejected: " + id);
            return false;
        }
        queue_.push(id);
    }
    featureAvailable_.notify_one();
    LOG_DEBUG("Feature queued: " + id);
    return true;
}

bool Pool::isInFlight(const FeatureId& id) const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return inFlight_.count(id) > 0;
}

std::set<FeatureId> Pool::inFlight() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return inFlight_;
}

std::size_t Pool::inFlightCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return inFlight_.size();
}

std::size_t Pool::queueSize() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

void Pool::waitIdle() {
    std::unique_lock<std::mutex> lock(queueMutex_);
    idle_.wait(lock, [this] { return inFlight_.empty() || !running_.load(); });
}

void Pool::workerLoop(int workerId) {
    setThreadName("Worker-" + std::to_string(workerId));
    LOG_DEBUG("Worker-" + std::to_string(workerId) + " thread started");

    while (true) {
        FeatureId id;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            featureAvailable_.wait(lock, [this] {
                return !queue_.empty() || shutdown_.load();
            });

            if (shutdown_.load()) {
                break;
            }
            id = queue_.front();
            queue_.pop();
        }

        LOG_INFO("Worker-" + std::to_string(workerId) + " claimed feature: " + id);
        try {
            processor_(id, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " processing error: " +
                      std::string(e.what()) + " (feature: " + id + ")");
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            inFlight_.erase(id);
        }
        idle_.notify_all();
    }

    LOG_DEBUG("Worker " + std::to_string(workerId) + " stopped");
}

}
