/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <string>

#include "featloop/agent.hpp"
#include "featloop/feature_context.hpp"
#include "featloop/types.hpp"
#include "featloop/vcs.hpp"
#include "featloop/workspace.hpp"

namespace featloop {

class PhaseExecutor {
public:
    virtual ~PhaseExecutor() = default;

    // Runs one phase to completion. Never throws; problems become Failed.
    virtual PhaseOutcome execute(Phase phase, const FeatureContext& ctx, const ChildObserver& onWorker) = 0;
};

// Drives each phase through the coding agent, with the mechanical steps
// (branching, pushing, opening and polling pull requests) done directly.
class AgentPhaseExecutor final : public PhaseExecutor {
public:
    AgentPhaseExecutor(CodingAgent& agent, VersionControl& vcs, CodeHosting& hosting,
                       WorkspaceManager& workspaces, int implementBatch = 3);

    PhaseOutcome execute(Phase phase, const FeatureContext& ctx, const ChildObserver& onWorker) override;

private:
    PhaseOutcome interview(const FeatureContext& ctx, const ChildObserver& onWorker);
    PhaseOutcome plan(const FeatureContext& ctx, const ChildObserver& onWorker);
    PhaseOutcome branch(const FeatureContext& ctx, const ChildObserver& onWorker);
    PhaseOutcome implement(const FeatureContext& ctx, const ChildObserver& onWorker);
    PhaseOutcome pullRequest(const FeatureContext& ctx, const ChildObserver& onWorker);
    PhaseOutcome merge(const FeatureContext& ctx);
    PhaseOutcome wrapUp(const FeatureContext& ctx, const ChildObserver& onWorker);

    AgentReply ask(const std::string& instruction, const FeatureContext& ctx, const ChildObserver& onWorker);
    void recordBookkeeping(Phase phase, PhaseOutcome outcome, const FeatureContext& ctx);

    CodingAgent& agent_;
    VersionControl& vcs_;
    CodeHosting& hosting_;
    WorkspaceManager& workspaces_;
    int implementBatch_;
};

// Instruction text for the agent. Names the documents to read and write and
// the completion tokens to emit.
std::string phaseInstruction(Phase phase, const FeatureContext& ctx, int implementBatch = 3);

// "FEAT-001-user-auth" -> "FEAT-001-user-auth: User auth"
std::string pullRequestTitle(const FeatureId& id);
std::string pullRequestBody(const FeatureContext& ctx);

}
