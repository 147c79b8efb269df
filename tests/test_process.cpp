/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <unistd.h>

#include "fakes.hpp"
#include "featloop/agent.hpp"
#include "featloop/process.hpp"

namespace featloop {
namespace {

using testing::TempDir;

TEST(ProcessTest, CapturesOutputAndExitCode) {
    auto result = runCommand({"sh", "-c", "echo hello; echo oops >&2; exit 3"});
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_FALSE(result.ok());
    EXPECT_NE(result.output.find("hello"), std::string::npos);
    EXPECT_NE(result.output.find("oops"), std::string::npos);
}

TEST(ProcessTest, RunsInWorkingDirectory) {
    TempDir dir;
    auto result = runCommand({"pwd"}, dir.path());
    ASSERT_TRUE(result.ok());
    EXPECT_NE(result.output.find(dir.path().filename().string()), std::string::npos);
}

TEST(ProcessTest, MissingProgramExitsWith127) {
    auto result = runCommand({"featloop-no-such-program-xyz"});
    EXPECT_EQ(result.exitCode, 127);
}

TEST(ProcessTest, EmptyCommandThrows) {
    EXPECT_THROW(runCommand({}), CommandError);
}

TEST(ProcessTest, RunCheckedThrowsOnFailure) {
    EXPECT_NO_THROW(runChecked({"true"}));
    try {
        runChecked({"sh", "-c", "exit 4"});
        FAIL() << "expected CommandError";
    } catch (const CommandError& e) {
        EXPECT_EQ(e.exitCode(), 4);
    }
}

TEST(ProcessTest, ObserverSeesPidThenZero) {
    std::vector<pid_t> seen;
    auto result = runCommand({"true"}, {}, [&seen](pid_t pid) { seen.push_back(pid); });
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_GT(seen[0], 0);
    EXPECT_EQ(seen[1], 0);
}

TEST(ProcessTest, TerminateReachesGrandchildren) {
    std::atomic<pid_t> child{0};
    CommandResult result;
    auto start = std::chrono::steady_clock::now();
    std::thread runner([&] {
        // The backgrounded sleep keeps the output pipe open after sh dies
        result = runCommand({"sh", "-c", "sleep 30 & wait"}, {}, [&child](pid_t pid) {
            if (pid > 0) child = pid;
        });
    });
    for (int i = 0; i < 500 && child.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_GT(child.load(), 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_TRUE(terminateProcessGroup(child.load()));
    runner.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_FALSE(result.ok());
}

TEST(ProcessTest, ShortCommandsFinishBesideALongOne) {
    std::atomic<pid_t> longChild{0};
    std::thread slow([&longChild] {
        runCommand({"sleep", "5"}, {}, [&longChild](pid_t pid) {
            if (pid > 0) longChild = pid;
        });
    });

    // Each short command returns on its own EOF, not when the sleep exits
    for (int i = 0; i < 20; ++i) {
        auto start = std::chrono::steady_clock::now();
        std::thread other([] { runCommand({"sleep", "0"}); });
        auto result = runCommand({"echo", "quick"});
        other.join();
        EXPECT_TRUE(result.ok());
        EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    }

    for (int i = 0; i < 500 && longChild.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    terminateProcessGroup(longChild.load());
    slow.join();
}

TEST(ProcessTest, TerminateIgnoresInvalidPid) {
    EXPECT_FALSE(terminateProcessGroup(0));
    EXPECT_FALSE(terminateProcessGroup(-1));
}

TEST(ProcessTest, ExpandCommandKeepsInstructionAsOneArgument) {
    auto args = expandCommand("claude -p {instruction} --output-format text", "{instruction}",
                              "do the thing\nwith newlines");
    ASSERT_EQ(args.size(), 5u);
    EXPECT_EQ(args[0], "claude");
    EXPECT_EQ(args[2], "do the thing\nwith newlines");
    EXPECT_EQ(args[4], "text");
}

TEST(ProcessTest, ExpandCommandSubstitutesInsideTokens) {
    auto args = expandCommand("agent --task={instruction}", "{instruction}", "{instruction}x");
    ASSERT_EQ(args.size(), 2u);
    EXPECT_EQ(args[1], "--task={instruction}x");
}

TEST(ProcessTest, ProcessAliveChecks) {
    EXPECT_TRUE(isProcessAlive(::getpid()));
    EXPECT_FALSE(isProcessAlive(0));
    EXPECT_FALSE(isProcessAlive(-1));
}

// -----------------------------------------------------------------------------
// CommandAgent
// -----------------------------------------------------------------------------
TEST(CommandAgentTest, PassesInstructionAndReturnsOutput) {
    TempDir dir;
    CommandAgent agent("echo {instruction}");
    auto reply = agent.invoke("<phase>PLAN_COMPLETE</phase>", dir.path());
    EXPECT_TRUE(reply.ok);
    EXPECT_NE(reply.output.find("<phase>PLAN_COMPLETE</phase>"), std::string::npos);
}

TEST(CommandAgentTest, AppendsInstructionWithoutPlaceholder) {
    TempDir dir;
    CommandAgent agent("echo prefix");
    auto reply = agent.invoke("suffix", dir.path());
    EXPECT_TRUE(reply.ok);
    EXPECT_NE(reply.output.find("prefix suffix"), std::string::npos);
}

TEST(CommandAgentTest, ReportsFailureInReply) {
    TempDir dir;
    CommandAgent failing("false");
    auto reply = failing.invoke("anything", dir.path());
    EXPECT_FALSE(reply.ok);
    EXPECT_FALSE(reply.error.empty());

    CommandAgent missing("featloop-no-such-agent-xyz {instruction}");
    EXPECT_FALSE(missing.invoke("anything", dir.path()).ok);
}

}
}
