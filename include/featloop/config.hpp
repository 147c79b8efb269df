/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace featloop {

// Phase-detection heuristics. Kept tunable rather than hard-coded.
struct DetectionThresholds {
    double prReadyRatio = 0.90;     // checked / total checklist items that makes a feature PR-ready
    int minDecisionRows = 2;        // filled decision rows that make the interview complete
};

struct Config {
    // Orchestrator
    int maxParallel = 3;
    std::chrono::seconds pollInterval{30};

    // Feature workflow
    int maxIterations = 15;
    int maxFailures = 3;
    int implementBatch = 3;
    std::chrono::seconds mergeCooldown{60};
    std::chrono::milliseconds iterationDelay{2000};
    DetectionThresholds thresholds;

    // Repository layout, relative paths resolve against repoRoot
    std::filesystem::path repoRoot;
    std::filesystem::path featuresDir = "docs/features";
    std::filesystem::path stateFile = "feature-loop-state.json";
    std::filesystem::path activityLog = "activity.md";
    std::filesystem::path workspacesDir;    // empty = parent of repoRoot
    std::vector<std::string> mainlineRefs = {"main", "master"};

    // Agent
    std::string agentCommand = "claude -p {instruction} --output-format text";
    std::string modelPath;                  // non-empty selects the in-process llama.cpp agent

    // Defaults overridden by FEATLOOP_* environment variables.
    static Config fromEnv();

    [[nodiscard]] std::filesystem::path resolve(const std::filesystem::path& path) const;
    [[nodiscard]] std::filesystem::path featuresIndex() const { return resolve(featuresDir) / "_index.md"; }
    [[nodiscard]] std::filesystem::path workspacesRoot() const;
    [[nodiscard]] const std::string& mainline() const { return mainlineRefs.front(); }

    // Empty string when valid, otherwise a description of the first problem.
    [[nodiscard]] std::string validate() const;
};

// Tolerant environment readers: unset, empty or malformed values yield the default.
int envInt(const char* name, int defv) noexcept;
double envDouble(const char* name, double defv) noexcept;
std::string envString(const char* name, const std::string& defv);

}
