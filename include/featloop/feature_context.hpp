/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <utility>

#include "featloop/artifacts.hpp"
#include "featloop/types.hpp"

namespace featloop {

// Everything a phase needs to know about where a feature lives.
struct FeatureContext {
    FeatureContext(FeatureId featureId, std::filesystem::path workspacePath,
                   const std::filesystem::path& featuresDir,
                   std::string workspaceBranchName, std::string featureBranchName)
        : id(std::move(featureId)),
          workspace(std::move(workspacePath)),
          workspaceBranch(std::move(workspaceBranchName)),
          featureBranch(std::move(featureBranchName)),
          layout(workspace, featuresDir, id) {}

    FeatureId id;
    std::filesystem::path workspace;
    std::string workspaceBranch;    // empty: branch from whatever is checked out
    std::string featureBranch;
    FeatureLayout layout;
    // False when running in the main checkout, which is never recorded or reclaimed
    bool isolated = true;
};

}
