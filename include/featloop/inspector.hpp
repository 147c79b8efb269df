/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <set>

#include "featloop/artifacts.hpp"
#include "featloop/config.hpp"
#include "featloop/feature_context.hpp"
#include "featloop/types.hpp"
#include "featloop/vcs.hpp"

namespace featloop {

// Observable facts about a feature, gathered from its documents and from
// version control / code hosting.
struct Evidence {
    bool wrapUpDone = false;
    std::set<Phase> marked;                 // status-table rows marked done
    PullRequestState pullRequest = PullRequestState::None;
    bool featureBranchExists = false;
    ChecklistCounts checklist;
    int filledDecisionRows = 0;
    bool designExists = false;
    bool tasksExist = false;

    [[nodiscard]] bool isMarked(Phase phase) const { return marked.count(phase) > 0; }
};

// Latest phase whose entry condition holds, checked from the end of the
// lifecycle backwards. Ties resolve to the earlier phase.
[[nodiscard]] Phase derivePhase(const Evidence& evidence, const DetectionThresholds& thresholds) noexcept;

class ArtifactInspector {
public:
    ArtifactInspector(VersionControl& vcs, CodeHosting& hosting, DetectionThresholds thresholds);

    // Never throws: unreadable files and failing queries count as absent.
    [[nodiscard]] Evidence gather(const FeatureContext& ctx) const noexcept;
    [[nodiscard]] Phase detect(const FeatureContext& ctx) const noexcept;

    [[nodiscard]] const DetectionThresholds& thresholds() const noexcept { return thresholds_; }

private:
    VersionControl& vcs_;
    CodeHosting& hosting_;
    DetectionThresholds thresholds_;
};

}
