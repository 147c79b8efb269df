/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "featloop/agent.hpp"

namespace featloop {

struct ChatTurn {
    std::string role;       // "user" or "assistant"
    std::string content;
};

// Produces the model's next reply to a conversation.
using ChatModel = std::function<AgentReply(const std::vector<ChatTurn>& conversation)>;

struct ToolLoopOptions {
    int maxSteps = 8;
    std::size_t maxCommandOutput = 2000;
};

// Lets a text-only model act on a working copy. A reply may carry shell
// commands in <bash>...</bash> blocks; each runs with sh -c in workdir and
// the outputs come back as the next user turn. The loop ends at the first
// reply without a command, or after maxSteps replies.
//
// The returned output is every model reply joined, never command output, so
// completion tokens are only taken from what the model itself said.
AgentReply runToolLoop(const std::string& instruction, const std::filesystem::path& workdir,
                       const ChatModel& model, const ChildObserver& onWorker = {},
                       const ToolLoopOptions& options = {});

// Contents of the <bash> blocks in a reply, trimmed, empty blocks skipped.
std::vector<std::string> extractCommands(const std::string& reply);

}
