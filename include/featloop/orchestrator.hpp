/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "featloop/activity_log.hpp"
#include "featloop/agent.hpp"
#include "featloop/config.hpp"
#include "featloop/executor.hpp"
#include "featloop/inspector.hpp"
#include "featloop/merge_watcher.hpp"
#include "featloop/pool.hpp"
#include "featloop/scanner.hpp"
#include "featloop/state_store.hpp"
#include "featloop/stop_signal.hpp"
#include "featloop/vcs.hpp"
#include "featloop/workspace.hpp"

namespace featloop {

class Orchestrator final {
public:
    Orchestrator(Config config, VersionControl& vcs, CodeHosting& hosting, CodingAgent& agent);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;
    Orchestrator(Orchestrator&&) = delete;
    Orchestrator& operator=(Orchestrator&&) = delete;

    // Claims the state file, recovers orphans and starts the worker pool,
    // without the poll thread.
    [[nodiscard]] bool initialize();

    // initialize() plus the background poll thread.
    [[nodiscard]] bool start();

    // Requests stop, waits for the poll thread and for running workflows
    // to reach a cancellation point.
    void shutdown() noexcept;

    // One discovery/launch/reconcile cycle. Returns true once there is
    // nothing left to do, after marking the orchestrator Complete.
    bool pollOnce();

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] bool isDone() const noexcept { return done_.load(); }

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] StateStore& state() noexcept { return state_; }
    [[nodiscard]] Pool& pool() noexcept { return pool_; }

private:
    void pollLoop();
    [[nodiscard]] bool recoverOrphanedFeatures() noexcept;
    bool launch(const FeatureId& id);
    bool ensureWorkspace(const FeatureId& id);
    void processFeature(const FeatureId& id, int workerId);
    void recordFailure(const FeatureId& id, const std::string& reason);

    Config config_;
    VersionControl& vcs_;
    CodeHosting& hosting_;

    StateStore state_;
    ActivityLog activity_;
    Scanner scanner_;
    WorkspaceManager workspaces_;
    ArtifactInspector inspector_;
    AgentPhaseExecutor executor_;
    MergeWatcher watcher_;
    Pool pool_;

    StopSignal stop_;
    std::atomic<bool> running_{false};
    std::atomic<bool> done_{false};
    std::thread pollThread_;
};

// Operator actions on a state file, safe while an orchestrator runs.

// Signals every recorded worker and the owning process, marks the run
// Stopped. Returns the number of processes signalled.
int stopOrchestrator(StateStore& state, ActivityLog& activity);

// Clears failures and makes a paused, needs-input or exhausted feature
// resumable. Returns an error message, empty on success.
std::string resumeFeature(StateStore& state, ActivityLog& activity, const FeatureId& id);

// Whether one feature may run outside the daemon. Refuses a retired feature,
// one with a live agent, and any run while another live orchestrator owns the
// state file. Returns an error message, empty when the run may go ahead.
std::string checkStandaloneRun(const StateDocument& doc, const FeatureId& id);

// Reclaims the feature's workspace and moves it to the failed list.
std::string abandonFeature(StateStore& state, ActivityLog& activity, WorkspaceManager& workspaces,
                           const FeatureId& id);

}
