/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/merge_watcher.hpp"
#include "featloop/logger.hpp"

namespace featloop {

MergeWatcher::MergeWatcher(const Config& config, VersionControl& vcs, CodeHosting& hosting,
                           WorkspaceManager& workspaces, StateStore& state, ActivityLog& activity)
    : config_(config), vcs_(vcs), hosting_(hosting), workspaces_(workspaces),
      state_(state), activity_(activity) {
}

bool MergeWatcher::isIntegrated(const FeatureRecord& record) {
    const std::string branch = WorkspaceManager::featureBranch(record.id);
    const std::filesystem::path workdir = record.workspace.empty() ? config_.repoRoot
                                                                   : std::filesystem::path(record.workspace);

    if (hosting_.getPullRequestState(workdir, branch) == PullRequestState::Merged) {
        return true;
    }
    // A freshly created branch is trivially an ancestor of mainline
    if (isBefore(record.phase, Phase::PR)) {
        return false;
    }
    return vcs_.isBranchMerged(branch, config_.mainlineRefs);
}

std::vector<FeatureId> MergeWatcher::pass(const std::set<FeatureId>& skip) {
    std::vector<FeatureId> retired;
    StateDocument doc = state_.load();

    for (const auto& [id, record] : doc.features) {
        if (skip.count(id) > 0) {
            continue;
        }
        try {
            if (!isIntegrated(record)) {
                continue;
            }
            LOG_INFO("Feature merged: " + id);
            if (!record.workspace.empty()) {
                workspaces_.reclaim(record.workspace);
            }
            state_.update([&id](StateDocument& d) { d.retire(id, true); });
            activity_.append("\xE2\x9C\x85 **" + id + "** merged to " + config_.mainline());
            retired.push_back(id);
        } catch (const std::exception& e) {
            LOG_ERROR("Merge check failed for " + id + ": " + e.what());
        }
    }
    return retired;
}

}
