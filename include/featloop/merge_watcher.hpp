/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <set>
#include <string>
#include <vector>

#include "featloop/activity_log.hpp"
#include "featloop/config.hpp"
#include "featloop/state_store.hpp"
#include "featloop/vcs.hpp"
#include "featloop/workspace.hpp"

namespace featloop {

// Retires tracked features whose work reached the mainline outside the
// workflow loop, including paused ones.
class MergeWatcher {
public:
    MergeWatcher(const Config& config, VersionControl& vcs, CodeHosting& hosting,
                 WorkspaceManager& workspaces, StateStore& state, ActivityLog& activity);

    // Checks every tracked feature not in skip. Returns the ids retired.
    std::vector<FeatureId> pass(const std::set<FeatureId>& skip);

    [[nodiscard]] bool isIntegrated(const FeatureRecord& record);

private:
    const Config& config_;
    VersionControl& vcs_;
    CodeHosting& hosting_;
    WorkspaceManager& workspaces_;
    StateStore& state_;
    ActivityLog& activity_;
};

}
