/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/workflow.hpp"
#include "featloop/logger.hpp"
#include <algorithm>

namespace featloop {

const char* toString(WorkflowOutcome outcome) noexcept {
    switch (outcome) {
        case WorkflowOutcome::Complete: return "complete";
        case WorkflowOutcome::NeedsInput: return "needs_input";
        case WorkflowOutcome::Paused: return "paused";
        case WorkflowOutcome::MaxIterations: return "max_iterations";
        case WorkflowOutcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

WorkflowOptions WorkflowOptions::from(const Config& config) {
    WorkflowOptions options;
    options.maxIterations = config.maxIterations;
    options.maxFailures = config.maxFailures;
    options.mergeCooldown = config.mergeCooldown;
    options.iterationDelay = config.iterationDelay;
    return options;
}

FeatureWorkflow::FeatureWorkflow(const ArtifactInspector& inspector, PhaseExecutor& executor,
                                 StateStore& state, ActivityLog& activity, WorkflowOptions options)
    : inspector_(inspector), executor_(executor), state_(state), activity_(activity), options_(options) {
}

WorkflowOutcome FeatureWorkflow::run(const FeatureContext& ctx, StopSignal& stop) {
    ScopedFeatureTag tag(ctx.id);
    const FeatureId& id = ctx.id;

    // The agent child pid is recorded while it runs so --stop can reach it
    ChildObserver onWorker = [this, &id](pid_t pid) {
        try {
            state_.updateFeature(id, [pid](FeatureRecord& r) { r.pid = static_cast<int>(pid); });
        } catch (const std::exception& e) {
            LOG_WARN("Could not record worker pid: " + std::string(e.what()));
        }
    };

    LOG_INFO("Workflow started for " + id + " in " + ctx.workspace.string());

    for (int iteration = 1; iteration <= options_.maxIterations; ++iteration) {
        if (stop.requested()) {
            state_.updateFeature(id, [](FeatureRecord& r) { r.status = FeatureStatus::Waiting; });
            return WorkflowOutcome::Cancelled;
        }

        const Phase phase = inspector_.detect(ctx);
        state_.updateFeature(id, [&](FeatureRecord& r) {
            r.status = FeatureStatus::Running;
            r.phase = phase;
            if (ctx.isolated) {
                r.workspace = ctx.workspace.string();
            }
        });

        if (phase == Phase::Complete) {
            state_.updateFeature(id, [](FeatureRecord& r) { r.status = FeatureStatus::Complete; });
            activity_.append("\xF0\x9F\x8E\x89 **" + id + "** complete");
            LOG_INFO("Feature complete: " + id);
            return WorkflowOutcome::Complete;
        }

        LOG_INFO("Iteration " + std::to_string(iteration) + "/" + std::to_string(options_.maxIterations) +
                 " - phase " + displayName(phase));

        const PhaseOutcome outcome = executor_.execute(phase, ctx, onWorker);

        // --stop marks the feature Waiting when it kills the agent. An
        // interrupted phase is re-detected on the next run and costs no failure.
        bool interrupted = stop.requested();
        bool waitingForMerge = false;
        FeatureRecord record = state_.updateFeature(id, [&](FeatureRecord& r) {
            r.iterations += 1;
            r.pid = 0;
            if (outcome != PhaseOutcome::Complete && (interrupted || r.status == FeatureStatus::Waiting)) {
                interrupted = true;
                r.status = FeatureStatus::Waiting;
                return;
            }
            switch (outcome) {
                case PhaseOutcome::Success:
                    r.failures = 0;
                    break;
                case PhaseOutcome::Progress:
                    r.failures = 0;
                    if (phase == Phase::Merge) {
                        r.status = FeatureStatus::Waiting;
                        waitingForMerge = true;
                    }
                    break;
                case PhaseOutcome::NeedsInput:
                    r.status = FeatureStatus::NeedsInput;
                    break;
                case PhaseOutcome::Failed:
                    r.failures = std::min(r.failures + 1, options_.maxFailures);
                    if (r.failures >= options_.maxFailures) {
                        r.status = FeatureStatus::Paused;
                    }
                    break;
                case PhaseOutcome::Complete:
                    r.status = FeatureStatus::Complete;
                    r.phase = Phase::Complete;
                    break;
            }
        });

        if (interrupted) {
            LOG_INFO(std::string(displayName(phase)) + " interrupted by stop for " + id);
            return WorkflowOutcome::Cancelled;
        }

        switch (outcome) {
            case PhaseOutcome::Success:
                activity_.append("\xE2\x9C\x85 **" + id + "** " + displayName(phase) + " phase completed");
                break;
            case PhaseOutcome::Progress:
                LOG_INFO(std::string(displayName(phase)) + " progressed for " + id);
                break;
            case PhaseOutcome::NeedsInput:
                activity_.append("\xE2\x9D\x93 **" + id + "** needs human input (" + displayName(phase) + ")");
                LOG_WARN("Feature needs human input: " + id);
                return WorkflowOutcome::NeedsInput;
            case PhaseOutcome::Failed:
                LOG_WARN(std::string(displayName(phase)) + " failed for " + id + " (" +
                         std::to_string(record.failures) + "/" + std::to_string(options_.maxFailures) + ")");
                if (record.status == FeatureStatus::Paused) {
                    activity_.append("\xE2\x8F\xB8\xEF\xB8\x8F **" + id + "** paused after " +
                                     std::to_string(record.failures) + " consecutive failures in " +
                                     displayName(phase));
                    LOG_ERROR("Feature paused: " + id);
                    return WorkflowOutcome::Paused;
                }
                break;
            case PhaseOutcome::Complete:
                activity_.append("\xF0\x9F\x8E\x89 **" + id + "** complete");
                LOG_INFO("Feature complete: " + id);
                return WorkflowOutcome::Complete;
        }

        if (waitingForMerge) {
            LOG_INFO("Waiting " + std::to_string(options_.mergeCooldown.count()) + "ms for merge of " + id);
            if (stop.waitFor(options_.mergeCooldown)) {
                return WorkflowOutcome::Cancelled;
            }
            continue;
        }

        if (stop.waitFor(options_.iterationDelay)) {
            state_.updateFeature(id, [](FeatureRecord& r) { r.status = FeatureStatus::Waiting; });
            return WorkflowOutcome::Cancelled;
        }
    }

    state_.updateFeature(id, [](FeatureRecord& r) { r.status = FeatureStatus::MaxIterations; });
    activity_.append("\xE2\x9A\xA0\xEF\xB8\x8F **" + id + "** reached the iteration limit (" +
                     std::to_string(options_.maxIterations) + ")");
    LOG_WARN("Max iterations reached for " + id);
    return WorkflowOutcome::MaxIterations;
}

}
