/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <initializer_list>
#include <string>
#include <vector>

namespace featloop {

enum class PullRequestState : std::uint8_t { None, Open, Merged, Closed };

const char* toString(PullRequestState state) noexcept;

// Version control operations the orchestrator needs. Implementations throw
// CommandError (or another std::runtime_error) when an operation fails.
class VersionControl {
public:
    virtual ~VersionControl() = default;

    // Binds an isolated working copy at path to branch. Returns the path.
    virtual std::filesystem::path createIsolatedWorkspace(const std::string& branch,
                                                          const std::filesystem::path& path) = 0;
    virtual void removeIsolatedWorkspace(const std::filesystem::path& path) = 0;

    virtual bool branchExists(const std::string& name) = 0;
    virtual void createBranch(const std::string& name, const std::string& fromRef) = 0;

    // True if name is an ancestor of any existing ref in targetRefs.
    virtual bool isBranchMerged(const std::string& name, const std::vector<std::string>& targetRefs) = 0;

    virtual void checkout(const std::filesystem::path& workdir, const std::string& branch) = 0;
    virtual void pushBranch(const std::filesystem::path& workdir, const std::string& branch) = 0;
};

class CodeHosting {
public:
    virtual ~CodeHosting() = default;

    // Returns an identifier for the new pull request (usually its URL).
    virtual std::string createPullRequest(const std::filesystem::path& workdir, const std::string& branch,
                                          const std::string& title, const std::string& body) = 0;

    virtual PullRequestState getPullRequestState(const std::filesystem::path& workdir,
                                                 const std::string& branch) = 0;
};

// git(1) against a single repository, worktrees for isolation.
class GitClient : public VersionControl {
public:
    explicit GitClient(std::filesystem::path repoRoot, std::string remote = "origin");

    std::filesystem::path createIsolatedWorkspace(const std::string& branch,
                                                  const std::filesystem::path& path) override;
    void removeIsolatedWorkspace(const std::filesystem::path& path) override;
    bool branchExists(const std::string& name) override;
    void createBranch(const std::string& name, const std::string& fromRef) override;
    bool isBranchMerged(const std::string& name, const std::vector<std::string>& targetRefs) override;
    void checkout(const std::filesystem::path& workdir, const std::string& branch) override;
    void pushBranch(const std::filesystem::path& workdir, const std::string& branch) override;

private:
    bool refExists(const std::string& ref);
    std::vector<std::string> git(std::initializer_list<std::string> args) const;

    std::filesystem::path repoRoot_;
    std::string remote_;
};

// GitHub through the gh CLI.
class GhClient : public CodeHosting {
public:
    explicit GhClient(std::string baseBranch = "main");

    std::string createPullRequest(const std::filesystem::path& workdir, const std::string& branch,
                                  const std::string& title, const std::string& body) override;
    PullRequestState getPullRequestState(const std::filesystem::path& workdir,
                                         const std::string& branch) override;

private:
    std::string baseBranch_;
};

}
