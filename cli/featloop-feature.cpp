/*
 * featloop - Single feature loop (featloop-feature)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/activity_log.hpp"
#include "featloop/agent.hpp"
#include "featloop/config.hpp"
#include "featloop/executor.hpp"
#include "featloop/inspector.hpp"
#include "featloop/llama_agent.hpp"
#include "featloop/logger.hpp"
#include "featloop/orchestrator.hpp"
#include "featloop/state_store.hpp"
#include "featloop/stop_signal.hpp"
#include "featloop/vcs.hpp"
#include "featloop/workflow.hpp"
#include "featloop/workspace.hpp"
#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <regex>
#include <thread>

using namespace featloop;

constexpr const char* VERSION = "0.1.0";

static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "featloop single feature loop v" << VERSION << "\n\n";
    std::cout << "Usage: " << progName << " <feature-id> [max_iterations] [--model <gguf>]\n";
    std::cout << "       " << progName << " <feature-id> --detect\n";
    std::cout << "       " << progName << " --help | --version\n\n";
    std::cout << "Runs one feature's workflow in the current working copy until it\n";
    std::cout << "completes, needs input, pauses or uses up its iterations.\n\n";
    std::cout << "Options:\n";
    std::cout << "  max_iterations    Iteration budget for this run (default 15)\n";
    std::cout << "  --model <gguf>    Use a local llama.cpp model instead of the agent command\n";
    std::cout << "  --detect          Print the detected phase and exit\n\n";
    std::cout << "Exit codes: 0 complete, 2 needs input, 3 paused, 4 iteration limit, 130 interrupted\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " FEAT-001-auth\n";
    std::cout << "  " << progName << " FEAT-002-billing 30\n";
}

int exitCode(WorkflowOutcome outcome) {
    switch (outcome) {
        case WorkflowOutcome::Complete: return 0;
        case WorkflowOutcome::NeedsInput: return 2;
        case WorkflowOutcome::Paused: return 3;
        case WorkflowOutcome::MaxIterations: return 4;
        case WorkflowOutcome::Cancelled: return 130;
    }
    return 1;
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

    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    const FeatureId id = argv[1];
    static const std::regex idPattern("^FEAT-[0-9]+-[A-Za-z0-9_-]+$");
    if (!std::regex_match(id, idPattern)) {
        std::cerr << "Error: Feature id must look like FEAT-001-name: " << id << "\n";
        return 1;
    }

    Config config = Config::fromEnv();
    bool detectOnly = false;
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--model" && i + 1 < argc) {
            config.modelPath = argv[++i];
        } else if (arg == "--detect") {
            detectOnly = true;
        } else {
            try {
                config.maxIterations = std::stoi(arg);
            } catch (const std::exception&) {
                std::cerr << "Error: Invalid iteration count: " << arg << "\n";
                return 1;
            }
        }
    }

    std::string invalid = config.validate();
    if (!invalid.empty()) {
        std::cerr << "Error: " << invalid << "\n";
        return 1;
    }

    try {
        GitClient git(config.repoRoot);
        GhClient gh(config.mainline());
        WorkspaceManager workspaces(config, git);

        // The current checkout is the workspace; the feature branch starts from HEAD
        FeatureContext ctx(id, config.repoRoot, config.featuresDir, "", WorkspaceManager::featureBranch(id));
        ctx.isolated = false;
        if (!std::filesystem::exists(ctx.layout.dir())) {
            std::cerr << "Error: Feature directory not found: " << ctx.layout.dir().string() << "\n";
            return 1;
        }

        ArtifactInspector inspector(git, gh, config.thresholds);
        if (detectOnly) {
            std::cout << toString(inspector.detect(ctx)) << "\n";
            return 0;
        }

        std::unique_ptr<CodingAgent> agent;
        if (!config.modelPath.empty()) {
            agent = std::make_unique<LlamaAgent>(config.modelPath);
        } else {
            agent = std::make_unique<CommandAgent>(config.agentCommand);
        }

        StateStore state(config.resolve(config.stateFile));
        const std::string busy = checkStandaloneRun(state.load(), id);
        if (!busy.empty()) {
            std::cerr << "Error: " << busy << "\n";
            return 1;
        }
        ActivityLog activity(config.resolve(config.activityLog));
        AgentPhaseExecutor executor(*agent, git, gh, workspaces, config.implementBatch);
        FeatureWorkflow workflow(inspector, executor, state, activity, WorkflowOptions::from(config));

        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        StopSignal stop;
        std::atomic<bool> finished{false};
        std::thread watcher([&] {
            while (!finished.load()) {
                if (g_shutdown_requested) {
                    stop.request();
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        std::cout << "Feature loop: " << id << " (max " << config.maxIterations << " iterations)\n";
        WorkflowOutcome outcome = WorkflowOutcome::Cancelled;
        try {
            outcome = workflow.run(ctx, stop);
        } catch (const std::exception&) {
            finished.store(true);
            watcher.join();
            throw;
        }
        finished.store(true);
        watcher.join();

        std::cout << id << ": " << toString(outcome) << "\n";
        return exitCode(outcome);

    } catch (const std::exception& e) {
        LOG_ERROR("Feature loop error: " + std::string(e.what()));
        return 1;
    }
}
