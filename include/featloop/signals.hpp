/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <set>
#include <string>

namespace featloop {

// Completion tokens an agent emits as <phase>NAME</phase>.
enum class Signal : std::uint8_t {
    InterviewComplete,
    InterviewNeedsInput,
    PlanComplete,
    BranchComplete,
    ImplementComplete,
    ImplementProgress,
    PrComplete,
    WrapUpComplete,
    FeatureComplete,
};

const char* tokenName(Signal signal) noexcept;
std::optional<Signal> parseTokenName(const std::string& name);

// Literal marker to put in an instruction, e.g. "<phase>PLAN_COMPLETE</phase>".
std::string phaseToken(Signal signal);

class AgentSignals {
public:
    [[nodiscard]] bool has(Signal signal) const { return signals_.count(signal) > 0; }
    [[nodiscard]] bool empty() const noexcept { return signals_.empty(); }
    [[nodiscard]] const std::set<Signal>& all() const noexcept { return signals_; }

    void add(Signal signal) { signals_.insert(signal); }

private:
    std::set<Signal> signals_;
};

// Collects every recognised token in free-form agent output. Unknown names
// and malformed markers are ignored.
AgentSignals parseSignals(const std::string& output);

}
