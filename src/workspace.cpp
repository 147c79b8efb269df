/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/workspace.hpp"
#include "featloop/logger.hpp"
#include <algorithm>
#include <cctype>
#include <regex>

namespace featloop {

namespace {
const char* const kPrefix = "FEAT-";

bool hasFeaturePrefix(const std::string& id) {
    return id.size() > 5 && std::equal(id.begin(), id.begin() + 5, kPrefix, [](char a, char b) {
        return std::toupper(static_cast<unsigned char>(a)) == b;
    });
}
}

WorkspaceManager::WorkspaceManager(const Config& config, VersionControl& vcs)
    : config_(config), vcs_(vcs) {
    auto root = std::filesystem::absolute(config_.repoRoot).lexically_normal();
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    repoName_ = root.filename().string();
}

std::string WorkspaceManager::workspaceBranch(const FeatureId& id) {
    std::string name = hasFeaturePrefix(id) ? id.substr(5) : id;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return "feature/" + name;
}

std::string WorkspaceManager::featureBranch(const FeatureId& id) {
    static const std::regex numbered("^[Ff][Ee][Aa][Tt]-([0-9]+)");
    std::smatch match;
    if (std::regex_search(id, match, numbered)) {
        return "feat/FEAT-" + match[1].str();
    }
    return "feat/" + id;
}

std::filesystem::path WorkspaceManager::workspacePath(const FeatureId& id) const {
    return config_.workspacesRoot() / (repoName_ + "-" + id + "-loop");
}

FeatureContext WorkspaceManager::context(const FeatureId& id, const std::filesystem::path& workspace) const {
    return FeatureContext(id, workspace, config_.featuresDir, workspaceBranch(id), featureBranch(id));
}

std::string WorkspaceManager::baseRef() {
    for (const auto& ref : config_.mainlineRefs) {
        if (vcs_.branchExists(ref)) {
            return ref;
        }
    }
    return config_.mainline();
}

std::filesystem::path WorkspaceManager::provision(const FeatureId& id) {
    const auto path = workspacePath(id);
    const auto branch = workspaceBranch(id);

    if (!vcs_.branchExists(branch)) {
        vcs_.createBranch(branch, baseRef());
    }
    auto created = vcs_.createIsolatedWorkspace(branch, path);
    LOG_INFO("Workspace ready for " + id + ": " + created.string());
    return created;
}

void WorkspaceManager::reclaim(const std::filesystem::path& workspace) {
    if (workspace.empty()) {
        return;
    }
    std::error_code ec;
    if (std::filesystem::equivalent(workspace, config_.repoRoot, ec)) {
        LOG_WARN("Not removing the main working copy: " + workspace.string());
        return;
    }
    vcs_.removeIsolatedWorkspace(workspace);
}

void WorkspaceManager::createFeatureBranch(const FeatureContext& ctx) {
    const std::string from = ctx.workspaceBranch.empty() ? std::string("HEAD") : ctx.workspaceBranch;
    vcs_.createBranch(ctx.featureBranch, from);
    vcs_.checkout(ctx.workspace, ctx.featureBranch);
    LOG_INFO("Feature branch " + ctx.featureBranch + " checked out in " + ctx.workspace.string());
}

}
