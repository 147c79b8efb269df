/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <ostream>

#include "featloop/state_store.hpp"

namespace featloop {

struct ReportOptions {
    bool color = true;
    bool ownerAlive = true;     // false marks a Running orchestrator as stale
};

// Human-readable summary of a state document. Reads nothing else.
void renderStatus(const StateDocument& doc, std::ostream& out, const ReportOptions& options = {});

}
