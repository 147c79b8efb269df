/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/config.hpp"
#include "featloop/logger.hpp"
#include <cstdlib>
#include <sstream>

namespace featloop {

int envInt(const char* name, int defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    char* end = nullptr;
    long parsed = std::strtol(val, &end, 10);
    if (end == val || *end != '\0') {
        return defv;
    }
    return static_cast<int>(parsed);
}

double envDouble(const char* name, double defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    char* end = nullptr;
    double parsed = std::strtod(val, &end);
    if (end == val || *end != '\0') {
        return defv;
    }
    return parsed;
}

std::string envString(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

Config Config::fromEnv() {
    Config config;

    std::error_code ec;
    config.repoRoot = std::filesystem::current_path(ec);
    if (ec) {
        config.repoRoot = ".";
    }

    config.pollInterval = std::chrono::seconds(envInt("FEATLOOP_POLL_INTERVAL", 30));
    config.maxIterations = envInt("FEATLOOP_MAX_ITERATIONS", config.maxIterations);
    config.maxFailures = envInt("FEATLOOP_MAX_FAILURES", config.maxFailures);
    config.implementBatch = envInt("FEATLOOP_IMPLEMENT_BATCH", config.implementBatch);
    config.mergeCooldown = std::chrono::seconds(envInt("FEATLOOP_MERGE_COOLDOWN", 60));
    config.iterationDelay = std::chrono::milliseconds(envInt("FEATLOOP_ITERATION_DELAY", 2000));
    config.thresholds.prReadyRatio = envDouble("FEATLOOP_PR_READY_RATIO", config.thresholds.prReadyRatio);
    config.thresholds.minDecisionRows = envInt("FEATLOOP_MIN_DECISIONS", config.thresholds.minDecisionRows);

    config.featuresDir = envString("FEATLOOP_FEATURES_DIR", config.featuresDir.string());
    config.stateFile = envString("FEATLOOP_STATE_FILE", config.stateFile.string());
    config.activityLog = envString("FEATLOOP_ACTIVITY_LOG", config.activityLog.string());
    config.workspacesDir = envString("FEATLOOP_WORKSPACES_DIR", "");

    std::string mainline = envString("FEATLOOP_MAINLINE", "");
    if (!mainline.empty()) {
        config.mainlineRefs.clear();
        std::stringstream ss(mainline);
        std::string ref;
        while (std::getline(ss, ref, ',')) {
            if (!ref.empty()) config.mainlineRefs.push_back(ref);
        }
        if (config.mainlineRefs.empty()) {
            config.mainlineRefs = {"main", "master"};
        }
    }

    config.agentCommand = envString("FEATLOOP_AGENT_CMD", config.agentCommand);
    config.modelPath = envString("FEATLOOP_MODEL", "");

    LOG_DEBUG("Config loaded - poll: " + std::to_string(config.pollInterval.count()) +
              "s, max iterations: " + std::to_string(config.maxIterations) +
              ", max failures: " + std::to_string(config.maxFailures));
    return config;
}

std::filesystem::path Config::resolve(const std::filesystem::path& path) const {
    if (path.is_absolute() || repoRoot.empty()) {
        return path;
    }
    return repoRoot / path;
}

std::filesystem::path Config::workspacesRoot() const {
    if (!workspacesDir.empty()) {
        return resolve(workspacesDir);
    }
    auto root = std::filesystem::absolute(repoRoot).lexically_normal();
    if (!root.has_filename()) {
        root = root.parent_path();
    }
    return root.parent_path();
}

std::string Config::validate() const {
    if (maxParallel < 1) return "max_parallel must be at least 1";
    if (maxIterations < 1) return "max iterations must be at least 1";
    if (maxFailures < 1) return "max failures must be at least 1";
    if (implementBatch < 1) return "implement batch must be at least 1";
    if (thresholds.prReadyRatio <= 0.0 || thresholds.prReadyRatio > 1.0) {
        return "PR ready ratio must be in (0, 1]";
    }
    if (mainlineRefs.empty()) return "at least one mainline ref is required";
    if (agentCommand.empty() && modelPath.empty()) return "no agent command or model configured";
    return "";
}

}
