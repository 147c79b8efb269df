/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/tool_loop.hpp"
#include "featloop/logger.hpp"
#include "featloop/process.hpp"
#include <csignal>
#include <regex>

namespace featloop {

namespace {
std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

std::string protocol(const std::filesystem::path& workdir) {
    return "You are working in the repository at " + workdir.string() + ".\n"
           "To run a shell command there, put it in a block like <bash>ls docs</bash>.\n"
           "You will be shown each command's exit code and output. Use commands to read\n"
           "and write files. When the task is done, reply without any <bash> block and\n"
           "include the completion markers the task asks for.";
}
}

std::vector<std::string> extractCommands(const std::string& reply) {
    static const std::regex block("<bash>([\\s\\S]*?)</bash>");
    std::vector<std::string> commands;
    for (auto it = std::sregex_iterator(reply.begin(), reply.end(), block); it != std::sregex_iterator(); ++it) {
        std::string command = trim((*it)[1].str());
        if (!command.empty()) {
            commands.push_back(std::move(command));
        }
    }
    return commands;
}

AgentReply runToolLoop(const std::string& instruction, const std::filesystem::path& workdir,
                       const ChatModel& model, const ChildObserver& onWorker,
                       const ToolLoopOptions& options) {
    std::vector<ChatTurn> conversation{{"user", protocol(workdir) + "\n\n" + instruction}};
    std::string transcript;

    for (int step = 1; step <= options.maxSteps; ++step) {
        AgentReply reply = model(conversation);
        if (!reply.ok) {
            return {false, transcript, reply.error};
        }
        if (!transcript.empty()) {
            transcript += '\n';
        }
        transcript += reply.output;
        conversation.push_back({"assistant", reply.output});

        const auto commands = extractCommands(reply.output);
        if (commands.empty()) {
            LOG_DEBUG("Tool loop finished after " + std::to_string(step) + " step(s)");
            return {true, transcript, ""};
        }

        std::string feedback;
        for (const auto& command : commands) {
            LOG_DEBUG("Step " + std::to_string(step) + " runs: " + command);
            CommandResult result;
            try {
                result = runCommand({"sh", "-c", command}, workdir, onWorker);
            } catch (const CommandError& e) {
                return {false, transcript, e.what()};
            }
            // Killed from outside: the run is over, not a command for the model to fix
            if (result.exitCode == 128 + SIGTERM || result.exitCode == 128 + SIGKILL) {
                return {false, transcript, "command terminated: " + command};
            }
            std::string output = result.output;
            if (output.size() > options.maxCommandOutput) {
                output = output.substr(0, options.maxCommandOutput) + "\n[... output truncated ...]";
            }
            feedback += "$ " + command + "\n(exit " + std::to_string(result.exitCode) + ")\n" + output + "\n";
        }
        conversation.push_back({"user", "Command output:\n" + feedback +
                                         "\nContinue, or reply without a <bash> block when the task is done."});
    }

    LOG_WARN("Tool loop stopped after " + std::to_string(options.maxSteps) + " steps");
    return {true, transcript, ""};
}

}
