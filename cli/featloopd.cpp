/*
 * featloop - Orchestrator daemon (featloopd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/activity_log.hpp"
#include "featloop/agent.hpp"
#include "featloop/config.hpp"
#include "featloop/llama_agent.hpp"
#include "featloop/logger.hpp"
#include "featloop/orchestrator.hpp"
#include "featloop/process.hpp"
#include "featloop/report.hpp"
#include "featloop/state_store.hpp"
#include "featloop/vcs.hpp"
#include "featloop/workspace.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

using namespace featloop;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "featloop orchestrator v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " [max_parallel] [--model <gguf>] [--repo <dir>] [--log-file <path>]\n";
    std::cout << "       " << progName << " --status\n";
    std::cout << "       " << progName << " --stop\n";
    std::cout << "       " << progName << " --resume <feature-id>\n";
    std::cout << "       " << progName << " --abandon <feature-id>\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Runs every pending feature of docs/features/_index.md through\n";
    std::cout << "Interview, Plan, Branch, Implement, PR, Merge and Wrap-up, each in its\n";
    std::cout << "own git worktree next to the repository.\n\n";
    std::cout << "Options:\n";
    std::cout << "  max_parallel        Features worked on at once (default 3)\n";
    std::cout << "  --model <gguf>      Use a local llama.cpp model instead of the agent command\n";
    std::cout << "  --repo <dir>        Repository root (default: current directory)\n";
    std::cout << "  --log-file <path>   Also write diagnostics to a file\n";
    std::cout << "  --status            Show orchestrator and feature state\n";
    std::cout << "  --stop              Signal the running orchestrator and its agents\n";
    std::cout << "  --resume <id>       Make a paused or waiting-for-input feature resumable\n";
    std::cout << "  --abandon <id>      Remove a feature's worktree and give up on it\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  FEATLOOP_AGENT_CMD      Agent command, {instruction} is substituted\n";
    std::cout << "  FEATLOOP_POLL_INTERVAL  Seconds between polls (default 30)\n";
    std::cout << "  FEATLOOP_MAX_ITERATIONS Iterations per feature run (default 15)\n";
    std::cout << "  FEATLOOP_MAX_FAILURES   Consecutive failures before pausing (default 3)\n";
    std::cout << "  FEATLOOP_AGENT_STEPS    Model replies per phase with --model (default 8)\n";
    std::cout << "  FEATLOOP_LOG_LEVEL      Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " 3\n";
    std::cout << "  " << progName << " 1 --model ./models/qwen2.5-coder-7b.gguf\n";
    std::cout << "  " << progName << " --resume FEAT-003-billing\n";
}

bool isNumber(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); });
}

int showStatus(const Config& config) {
    StateStore state(config.resolve(config.stateFile));
    StateDocument doc = state.load();
    ReportOptions options;
    options.color = ::isatty(STDOUT_FILENO) != 0;
    options.ownerAlive = isProcessAlive(static_cast<pid_t>(doc.orchestrator.pid));
    renderStatus(doc, std::cout, options);
    return 0;
}

std::unique_ptr<CodingAgent> makeAgent(const Config& config) {
    if (!config.modelPath.empty()) {
        return std::make_unique<LlamaAgent>(config.modelPath);
    }
    return std::make_unique<CommandAgent>(config.agentCommand);
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        }
        if (arg == "-v" || arg == "--version") {
            std::cout << VERSION << "\n";
            return 0;
        }
    }

    Config config = Config::fromEnv();
    std::string command;
    std::string featureId;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--status" || arg == "--stop") {
            command = arg;
        } else if ((arg == "--resume" || arg == "--abandon") && i + 1 < argc) {
            command = arg;
            featureId = argv[++i];
        } else if (arg == "--model" && i + 1 < argc) {
            config.modelPath = argv[++i];
        } else if (arg == "--repo" && i + 1 < argc) {
            config.repoRoot = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            if (!Logger::setLogFile(argv[++i])) {
                std::cerr << "Error: Cannot open log file: " << argv[i] << "\n";
                return 1;
            }
        } else if (isNumber(arg)) {
            try {
                config.maxParallel = std::stoi(arg);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid max_parallel: " << arg << "\n";
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown argument: " << arg << "\n\n";
            printUsage(argv[0]);
            return 1;
        }
    }

    try {
        if (command == "--status") {
            return showStatus(config);
        }

        StateStore state(config.resolve(config.stateFile));
        ActivityLog activity(config.resolve(config.activityLog));

        if (command == "--stop") {
            int signalled = stopOrchestrator(state, activity);
            std::cout << "Stopped (" << signalled << " process" << (signalled == 1 ? "" : "es") << " signalled)\n";
            return 0;
        }
        if (command == "--resume") {
            std::string error = resumeFeature(state, activity, featureId);
            if (!error.empty()) {
                std::cerr << "Error: " << error << "\n";
                return 1;
            }
            std::cout << featureId << " will resume on the next orchestrator run\n";
            return 0;
        }
        if (command == "--abandon") {
            GitClient git(config.repoRoot);
            WorkspaceManager workspaces(config, git);
            std::string error = abandonFeature(state, activity, workspaces, featureId);
            if (!error.empty()) {
                std::cerr << "Error: " << error << "\n";
                return 1;
            }
            std::cout << featureId << " abandoned\n";
            return 0;
        }
    } catch (const std::exception& e) {
        LOG_ERROR(e.what());
        return 1;
    }

    std::string invalid = config.validate();
    if (!invalid.empty()) {
        std::cerr << "Error: " << invalid << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    try {
        GitClient git(config.repoRoot);
        GhClient gh(config.mainline());
        std::unique_ptr<CodingAgent> agent = makeAgent(config);

        std::cout << "\n";
        std::cout << "  \033[1mfeatloop\033[0m " << VERSION << "             \033[90mfeature workflow orchestrator\033[0m\n";
        std::cout << "  \033[90m─────────────────────────────────────────────────────────────────\033[0m\n\n";
        std::cout << "    Repository    " << config.repoRoot.string() << "\n";
        std::cout << "    Max parallel  " << config.maxParallel << "\n";
        std::cout << "    Agent         " << agent->name() << "\n";
        std::cout << "    Worktrees     " << config.workspacesRoot().string() << "\n\n";
        std::cout << "  Status:  " << argv[0] << " --status\n";
        std::cout << "  Stop:    " << argv[0] << " --stop\n\n";

        Orchestrator orchestrator(config, git, gh, *agent);
        if (!orchestrator.start()) {
            std::cout << "  \033[31mFailed to start\033[0m\n";
            return 1;
        }

        while (!g_shutdown_requested && !orchestrator.isDone()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (g_shutdown_requested) {
            std::cout << "\nShutdown requested, waiting for running phases..." << std::endl;
        } else {
            std::cout << "\n  \033[32mAll features complete\033[0m\n";
        }
        orchestrator.shutdown();

    } catch (const std::exception& e) {
        LOG_ERROR("Orchestrator error: " + std::string(e.what()));
        return 1;
    }

    LOG_DEBUG("featloop orchestrator stopped");
    return 0;
}
