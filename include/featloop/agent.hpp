/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <string>

#include "featloop/process.hpp"

namespace featloop {

struct AgentReply {
    bool ok = false;
    std::string output;
    std::string error;
};

// An autonomous coding agent. invoke() blocks until the agent finishes and
// reports failure through the reply rather than by throwing.
class CodingAgent {
public:
    virtual ~CodingAgent() = default;

    // onWorker receives the pid of a spawned child (0 when it exits), if any.
    [[nodiscard]] virtual AgentReply invoke(const std::string& instruction,
                                            const std::filesystem::path& workdir,
                                            const ChildObserver& onWorker = {}) = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

// Runs an external agent command. The template is split on whitespace and
// "{instruction}" is replaced by the instruction as a single argument.
class CommandAgent final : public CodingAgent {
public:
    explicit CommandAgent(std::string commandTemplate);

    [[nodiscard]] AgentReply invoke(const std::string& instruction,
                                    const std::filesystem::path& workdir,
                                    const ChildObserver& onWorker = {}) override;

    [[nodiscard]] std::string name() const override;

private:
    std::string commandTemplate_;
};

}
