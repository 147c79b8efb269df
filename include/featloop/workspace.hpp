/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "featloop/config.hpp"
#include "featloop/feature_context.hpp"
#include "featloop/vcs.hpp"

namespace featloop {

// One isolated working copy per feature, next to the main repository:
// <workspacesRoot>/<repo>-<id>-loop on branch feature/<nnn-slug>.
class WorkspaceManager {
public:
    WorkspaceManager(const Config& config, VersionControl& vcs);

    // Idempotent. Throws if the branch or working copy cannot be created.
    std::filesystem::path provision(const FeatureId& id);

    // No-op for an empty or already removed path, and for the main working copy.
    void reclaim(const std::filesystem::path& workspace);

    [[nodiscard]] std::filesystem::path workspacePath(const FeatureId& id) const;
    [[nodiscard]] FeatureContext context(const FeatureId& id, const std::filesystem::path& workspace) const;

    // Creates the feature branch from the workspace branch and checks it out.
    void createFeatureBranch(const FeatureContext& ctx);

    [[nodiscard]] static std::string workspaceBranch(const FeatureId& id);
    [[nodiscard]] static std::string featureBranch(const FeatureId& id);

private:
    std::string baseRef();

    const Config& config_;
    VersionControl& vcs_;
    std::string repoName_;
};

}
