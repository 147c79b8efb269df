/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/agent.hpp"
#include "featloop/logger.hpp"

namespace featloop {

namespace {
constexpr const char* kPlaceholder = "{instruction}";
}

CommandAgent::CommandAgent(std::string commandTemplate)
    : commandTemplate_(std::move(commandTemplate)) {
}

std::string CommandAgent::name() const {
    auto space = commandTemplate_.find(' ');
    return space == std::string::npos ? commandTemplate_ : commandTemplate_.substr(0, space);
}

AgentReply CommandAgent::invoke(const std::string& instruction,
                                const std::filesystem::path& workdir,
                                const ChildObserver& onWorker) {
    auto args = expandCommand(commandTemplate_, kPlaceholder, instruction);
    if (commandTemplate_.find(kPlaceholder) == std::string::npos) {
        args.push_back(instruction);
    }

    LOG_DEBUG("Invoking agent " + name() + " in " + workdir.string());
    try {
        auto result = runCommand(args, workdir, onWorker);
        LOG_DEBUG("Agent exited with " + std::to_string(result.exitCode) + " after " +
                  std::to_string(result.duration.count()) + "ms, " +
                  std::to_string(result.output.size()) + " bytes");
        if (!result.ok()) {
            return {false, result.output, "agent exited with code " + std::to_string(result.exitCode)};
        }
        return {true, result.output, ""};
    } catch (const std::exception& e) {
        LOG_ERROR("Agent invocation failed: " + std::string(e.what()));
        return {false, "", e.what()};
    }
}

}
