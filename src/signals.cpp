/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/signals.hpp"
#include <regex>

namespace featloop {

const char* tokenName(Signal signal) noexcept {
    switch (signal) {
        case Signal::InterviewComplete: return "INTERVIEW_COMPLETE";
        case Signal::InterviewNeedsInput: return "INTERVIEW_NEEDS_INPUT";
        case Signal::PlanComplete: return "PLAN_COMPLETE";
        case Signal::BranchComplete: return "BRANCH_COMPLETE";
        case Signal::ImplementComplete: return "IMPLEMENT_COMPLETE";
        case Signal::ImplementProgress: return "IMPLEMENT_PROGRESS";
        case Signal::PrComplete: return "PR_COMPLETE";
        case Signal::WrapUpComplete: return "WRAPUP_COMPLETE";
        case Signal::FeatureComplete: return "FEATURE_COMPLETE";
    }
    return "UNKNOWN";
}

std::optional<Signal> parseTokenName(const std::string& name) {
    for (Signal s : {Signal::InterviewComplete, Signal::InterviewNeedsInput, Signal::PlanComplete,
                     Signal::BranchComplete, Signal::ImplementComplete, Signal::ImplementProgress,
                     Signal::PrComplete, Signal::WrapUpComplete, Signal::FeatureComplete}) {
        if (name == tokenName(s)) {
            return s;
        }
    }
    return std::nullopt;
}

std::string phaseToken(Signal signal) {
    return std::string("<phase>") + tokenName(signal) + "</phase>";
}

AgentSignals parseSignals(const std::string& output) {
    static const std::regex tokenRegex("<phase>\\s*([A-Z_]+)\\s*</phase>");

    AgentSignals signals;
    for (auto it = std::sregex_iterator(output.begin(), output.end(), tokenRegex);
         it != std::sregex_iterator(); ++it) {
        if (auto signal = parseTokenName((*it)[1].str())) {
            signals.add(*signal);
        }
    }
    return signals;
}

}
