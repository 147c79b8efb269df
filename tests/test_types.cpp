/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>

#include "featloop/types.hpp"

namespace featloop {
namespace {

TEST(TypesTest, PhaseNamesRoundTrip) {
    for (Phase p : {Phase::Interview, Phase::Plan, Phase::Branch, Phase::Implement,
                    Phase::PR, Phase::Merge, Phase::WrapUp, Phase::Complete}) {
        auto parsed = parsePhase(toString(p));
        ASSERT_TRUE(parsed.has_value()) << toString(p);
        EXPECT_EQ(*parsed, p);
        EXPECT_EQ(parsePhase(displayName(p)), p);
    }
}

TEST(TypesTest, ParsePhaseIsLenient) {
    EXPECT_EQ(parsePhase("Wrap-up"), Phase::WrapUp);
    EXPECT_EQ(parsePhase("WRAP_UP"), Phase::WrapUp);
    EXPECT_EQ(parsePhase("  Implement "), Phase::Implement);
    EXPECT_EQ(parsePhase("done"), Phase::Complete);
    EXPECT_FALSE(parsePhase("deploy").has_value());
    EXPECT_FALSE(parsePhase("").has_value());
}

TEST(TypesTest, FeatureStatusParsing) {
    EXPECT_EQ(parseFeatureStatus("needs_input"), FeatureStatus::NeedsInput);
    EXPECT_EQ(parseFeatureStatus("max-iterations"), FeatureStatus::MaxIterations);
    EXPECT_EQ(parseFeatureStatus("Paused"), FeatureStatus::Paused);
    EXPECT_FALSE(parseFeatureStatus("crashed").has_value());
}

TEST(TypesTest, OrchestratorStatusParsing) {
    EXPECT_EQ(parseOrchestratorStatus("running"), OrchestratorStatus::Running);
    EXPECT_EQ(parseOrchestratorStatus("stopped"), OrchestratorStatus::Stopped);
    EXPECT_FALSE(parseOrchestratorStatus("unknown").has_value());
}

TEST(TypesTest, PhaseOrdering) {
    EXPECT_TRUE(isBefore(Phase::Interview, Phase::Plan));
    EXPECT_TRUE(isBefore(Phase::Implement, Phase::PR));
    EXPECT_TRUE(isBefore(Phase::WrapUp, Phase::Complete));
    EXPECT_FALSE(isBefore(Phase::Merge, Phase::Merge));
    EXPECT_FALSE(isBefore(Phase::PR, Phase::Branch));
}

}
}
