/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/inspector.hpp"
#include "featloop/logger.hpp"

namespace featloop {

namespace {
bool fileExists(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}
}

Phase derivePhase(const Evidence& e, const DetectionThresholds& thresholds) noexcept {
    if (e.wrapUpDone) {
        return Phase::Complete;
    }
    if (e.isMarked(Phase::Merge)) {
        return Phase::WrapUp;
    }

    const bool prExists = e.pullRequest != PullRequestState::None;
    if (e.pullRequest == PullRequestState::Merged || (prExists && e.isMarked(Phase::PR))) {
        return Phase::Merge;
    }
    if (prExists) {
        return Phase::PR;
    }

    if (e.featureBranchExists) {
        const bool ready = e.checklist.total > 0 && e.checklist.ratio() >= thresholds.prReadyRatio;
        if (ready || e.isMarked(Phase::Implement)) {
            return Phase::PR;
        }
        return Phase::Implement;
    }

    if (e.designExists && e.tasksExist) {
        return Phase::Branch;
    }
    if (e.filledDecisionRows >= thresholds.minDecisionRows || e.isMarked(Phase::Interview)) {
        return Phase::Plan;
    }
    return Phase::Interview;
}

ArtifactInspector::ArtifactInspector(VersionControl& vcs, CodeHosting& hosting, DetectionThresholds thresholds)
    : vcs_(vcs), hosting_(hosting), thresholds_(thresholds) {
}

Evidence ArtifactInspector::gather(const FeatureContext& ctx) const noexcept {
    Evidence e;
    const auto& layout = ctx.layout;

    e.wrapUpDone = wrapUpDone(layout.wrapUp());
    e.marked = completedPhases(layout.status());
    e.checklist = countChecklist(layout.tasks());
    e.filledDecisionRows = countFilledDecisionRows(layout.spec());
    e.designExists = fileExists(layout.design());
    e.tasksExist = fileExists(layout.tasks());

    try {
        e.featureBranchExists = vcs_.branchExists(ctx.featureBranch);
    } catch (const std::exception& ex) {
        LOG_WARN("Branch query failed for " + ctx.featureBranch + ": " + ex.what());
        e.featureBranchExists = false;
    }

    // No pull request can exist before the plan is done
    if (e.featureBranchExists || (e.designExists && e.tasksExist)) {
        try {
            e.pullRequest = hosting_.getPullRequestState(ctx.workspace, ctx.featureBranch);
        } catch (const std::exception& ex) {
            LOG_WARN("Pull request query failed for " + ctx.featureBranch + ": " + ex.what());
            e.pullRequest = PullRequestState::None;
        }
    }

    LOG_TRACE("Evidence for " + ctx.id + ": branch=" + (e.featureBranchExists ? "yes" : "no") +
              " pr=" + toString(e.pullRequest) +
              " checklist=" + std::to_string(e.checklist.checked) + "/" + std::to_string(e.checklist.total) +
              " decisions=" + std::to_string(e.filledDecisionRows));
    return e;
}

Phase ArtifactInspector::detect(const FeatureContext& ctx) const noexcept {
    Phase phase = derivePhase(gather(ctx), thresholds_);
    LOG_DEBUG("Detected phase for " + ctx.id + ": " + toString(phase));
    return phase;
}

}
