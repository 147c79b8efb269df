/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstdint>

#include "featloop/activity_log.hpp"
#include "featloop/config.hpp"
#include "featloop/executor.hpp"
#include "featloop/inspector.hpp"
#include "featloop/state_store.hpp"
#include "featloop/stop_signal.hpp"

namespace featloop {

enum class WorkflowOutcome : std::uint8_t { Complete, NeedsInput, Paused, MaxIterations, Cancelled };

const char* toString(WorkflowOutcome outcome) noexcept;

struct WorkflowOptions {
    int maxIterations = 15;
    int maxFailures = 3;
    std::chrono::milliseconds mergeCooldown{60000};
    std::chrono::milliseconds iterationDelay{2000};

    static WorkflowOptions from(const Config& config);
};

// Per-feature loop: detect the phase from artifacts, execute it, interpret
// the outcome, persist. Stops at completion, escalation or the iteration
// budget of this run.
class FeatureWorkflow {
public:
    FeatureWorkflow(const ArtifactInspector& inspector, PhaseExecutor& executor,
                    StateStore& state, ActivityLog& activity, WorkflowOptions options);

    WorkflowOutcome run(const FeatureContext& ctx, StopSignal& stop);

private:
    const ArtifactInspector& inspector_;
    PhaseExecutor& executor_;
    StateStore& state_;
    ActivityLog& activity_;
    WorkflowOptions options_;
};

}
