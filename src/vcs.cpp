/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/vcs.hpp"
#include "featloop/logger.hpp"
#include "featloop/process.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

namespace featloop {

namespace {
std::string trimmed(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
    auto start = s.find_first_not_of(" \n\r\t");
    return start == std::string::npos ? std::string() : s.substr(start);
}
}

const char* toString(PullRequestState state) noexcept {
    switch (state) {
        case PullRequestState::None: return "none";
        case PullRequestState::Open: return "open";
        case PullRequestState::Merged: return "merged";
        case PullRequestState::Closed: return "closed";
    }
    return "unknown";
}

// ---------------------------------------------------------------- GitClient

GitClient::GitClient(std::filesystem::path repoRoot, std::string remote)
    : repoRoot_(std::move(repoRoot)), remote_(std::move(remote)) {
}

std::vector<std::string> GitClient::git(std::initializer_list<std::string> args) const {
    std::vector<std::string> argv{"git", "-C", repoRoot_.string()};
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

bool GitClient::refExists(const std::string& ref) {
    return runCommand(git({"rev-parse", "--verify", "--quiet", ref})).ok();
}

std::filesystem::path GitClient::createIsolatedWorkspace(const std::string& branch,
                                                         const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path / ".git", ec)) {
        LOG_DEBUG("Worktree already present: " + path.string());
        return path;
    }
    runChecked(git({"worktree", "prune"}));
    runChecked(git({"worktree", "add", path.string(), branch}));
    LOG_INFO("Worktree created: " + path.string() + " (" + branch + ")");
    return path;
}

void GitClient::removeIsolatedWorkspace(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        runChecked(git({"worktree", "prune"}));
        return;
    }
    runChecked(git({"worktree", "remove", "--force", path.string()}));
    LOG_INFO("Worktree removed: " + path.string());
}

bool GitClient::branchExists(const std::string& name) {
    return runCommand(git({"show-ref", "--verify", "--quiet", "refs/heads/" + name})).ok();
}

void GitClient::createBranch(const std::string& name, const std::string& fromRef) {
    runChecked(git({"branch", name, fromRef}));
    LOG_INFO("Branch created: " + name + " from " + fromRef);
}

bool GitClient::isBranchMerged(const std::string& name, const std::vector<std::string>& targetRefs) {
    if (!branchExists(name)) {
        return false;
    }
    for (const auto& target : targetRefs) {
        for (const auto& ref : {target, remote_ + "/" + target}) {
            if (!refExists(ref)) continue;
            if (runCommand(git({"merge-base", "--is-ancestor", name, ref})).ok()) {
                return true;
            }
        }
    }
    return false;
}

void GitClient::checkout(const std::filesystem::path& workdir, const std::string& branch) {
    runChecked({"git", "checkout", branch}, workdir);
}

void GitClient::pushBranch(const std::filesystem::path& workdir, const std::string& branch) {
    runChecked({"git", "push", "-u", remote_, branch}, workdir);
    LOG_INFO("Pushed " + branch + " to " + remote_);
}

// ----------------------------------------------------------------- GhClient

GhClient::GhClient(std::string baseBranch) : baseBranch_(std::move(baseBranch)) {
}

std::string GhClient::createPullRequest(const std::filesystem::path& workdir, const std::string& branch,
                                        const std::string& title, const std::string& body) {
    auto result = runChecked({"gh", "pr", "create",
                              "--title", title,
                              "--body", body,
                              "--base", baseBranch_,
                              "--head", branch}, workdir);
    auto url = trimmed(result.output);
    auto nl = url.rfind('\n');
    if (nl != std::string::npos) {
        url = url.substr(nl + 1);
    }
    LOG_INFO("Pull request opened for " + branch + ": " + url);
    return url;
}

PullRequestState GhClient::getPullRequestState(const std::filesystem::path& workdir,
                                               const std::string& branch) {
    auto result = runCommand({"gh", "pr", "view", branch, "--json", "state"}, workdir);
    if (!result.ok()) {
        // gh exits non-zero when the branch has no pull request
        if (result.output.find("no pull requests found") != std::string::npos) {
            return PullRequestState::None;
        }
        throw CommandError("gh pr view failed: " + trimmed(result.output), result.exitCode);
    }

    auto doc = nlohmann::json::parse(result.output, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("state")) {
        throw CommandError("Unexpected gh pr view output: " + trimmed(result.output));
    }
    std::string state = doc["state"].get<std::string>();
    std::transform(state.begin(), state.end(), state.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (state == "OPEN") return PullRequestState::Open;
    if (state == "MERGED") return PullRequestState::Merged;
    if (state == "CLOSED") return PullRequestState::Closed;
    throw CommandError("Unknown pull request state: " + state);
}

}
