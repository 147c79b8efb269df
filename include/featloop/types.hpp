/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace featloop {

// Workflow phases in lifecycle order. Complete is the terminal pseudo-phase.
enum class Phase : std::uint8_t { Interview, Plan, Branch, Implement, PR, Merge, WrapUp, Complete };

enum class FeatureStatus : std::uint8_t { Running, Waiting, NeedsInput, Paused, MaxIterations, Complete };

enum class OrchestratorStatus : std::uint8_t { Idle, Running, Stopped, Complete };

// Result of executing a single phase. Complete is terminal success (WrapUp only).
enum class PhaseOutcome : std::uint8_t { Success, Progress, NeedsInput, Failed, Complete };

// External ticket key, e.g. FEAT-001-auth. Never generated here.
using FeatureId = std::string;

const char* toString(Phase phase) noexcept;
const char* toString(FeatureStatus status) noexcept;
const char* toString(OrchestratorStatus status) noexcept;
const char* toString(PhaseOutcome outcome) noexcept;

// Display name as used in status tables ("Interview", "Wrap-up", ...).
const char* displayName(Phase phase) noexcept;

std::optional<Phase> parsePhase(const std::string& value);
std::optional<FeatureStatus> parseFeatureStatus(const std::string& value);
std::optional<OrchestratorStatus> parseOrchestratorStatus(const std::string& value);

inline bool isBefore(Phase a, Phase b) noexcept {
    return static_cast<std::uint8_t>(a) < static_cast<std::uint8_t>(b);
}

} // namespace featloop
