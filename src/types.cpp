/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/types.hpp"
#include <algorithm>
#include <cctype>

namespace featloop {

namespace {
std::string normalize(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    value.erase(std::remove_if(value.begin(), value.end(),
        [](unsigned char c) { return c == '-' || c == '_' || std::isspace(c); }), value.end());
    return value;
}
}

const char* toString(Phase phase) noexcept {
    switch (phase) {
        case Phase::Interview: return "interview";
        case Phase::Plan:      return "plan";
        case Phase::Branch:    return "branch";
        case Phase::Implement: return "implement";
        case Phase::PR:        return "pr";
        case Phase::Merge:     return "merge";
        case Phase::WrapUp:    return "wrapup";
        case Phase::Complete:  return "complete";
    }
    return "unknown";
}

const char* toString(FeatureStatus status) noexcept {
    switch (status) {
        case FeatureStatus::Running:       return "running";
        case FeatureStatus::Waiting:       return "waiting";
        case FeatureStatus::NeedsInput:    return "needs_input";
        case FeatureStatus::Paused:        return "paused";
        case FeatureStatus::MaxIterations: return "max_iterations";
        case FeatureStatus::Complete:      return "complete";
    }
    return "unknown";
}

const char* toString(OrchestratorStatus status) noexcept {
    switch (status) {
        case OrchestratorStatus::Idle:     return "idle";
        case OrchestratorStatus::Running:  return "running";
        case OrchestratorStatus::Stopped:  return "stopped";
        case OrchestratorStatus::Complete: return "complete";
    }
    return "unknown";
}

const char* toString(PhaseOutcome outcome) noexcept {
    switch (outcome) {
        case PhaseOutcome::Success:    return "success";
        case PhaseOutcome::Progress:   return "progress";
        case PhaseOutcome::NeedsInput: return "needs_input";
        case PhaseOutcome::Failed:     return "failed";
        case PhaseOutcome::Complete:   return "complete";
    }
    return "unknown";
}

const char* displayName(Phase phase) noexcept {
    switch (phase) {
        case Phase::Interview: return "Interview";
        case Phase::Plan:      return "Plan";
        case Phase::Branch:    return "Branch";
        case Phase::Implement: return "Implement";
        case Phase::PR:        return "PR";
        case Phase::Merge:     return "Merge";
        case Phase::WrapUp:    return "Wrap-up";
        case Phase::Complete:  return "Complete";
    }
    return "Unknown";
}

std::optional<Phase> parsePhase(const std::string& value) {
    const std::string v = normalize(value);
    if (v == "interview") return Phase::Interview;
    if (v == "plan") return Phase::Plan;
    if (v == "branch") return Phase::Branch;
    if (v == "implement") return Phase::Implement;
    if (v == "pr") return Phase::PR;
    if (v == "merge") return Phase::Merge;
    if (v == "wrapup") return Phase::WrapUp;
    if (v == "complete" || v == "done") return Phase::Complete;
    return std::nullopt;
}

std::optional<FeatureStatus> parseFeatureStatus(const std::string& value) {
    const std::string v = normalize(value);
    if (v == "running") return FeatureStatus::Running;
    if (v == "waiting") return FeatureStatus::Waiting;
    if (v == "needsinput") return FeatureStatus::NeedsInput;
    if (v == "paused") return FeatureStatus::Paused;
    if (v == "maxiterations") return FeatureStatus::MaxIterations;
    if (v == "complete") return FeatureStatus::Complete;
    return std::nullopt;
}

std::optional<OrchestratorStatus> parseOrchestratorStatus(const std::string& value) {
    const std::string v = normalize(value);
    if (v == "idle") return OrchestratorStatus::Idle;
    if (v == "running") return OrchestratorStatus::Running;
    if (v == "stopped") return OrchestratorStatus::Stopped;
    if (v == "complete") return OrchestratorStatus::Complete;
    return std::nullopt;
}

}
