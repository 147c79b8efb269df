/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <unistd.h>

#include "fakes.hpp"
#include "featloop/orchestrator.hpp"
#include "featloop/process.hpp"

namespace featloop {
namespace {

using testing::FakeHosting;
using testing::FakeVcs;
using testing::ScriptedAgent;
using testing::SimulatedAgent;
using testing::TempDir;

void writeIndex(const Config& config, const std::vector<FeatureId>& ids) {
    std::string content = "# Features\n\n| ID | Status |\n|----|--------|\n";
    for (const auto& id : ids) {
        content += "| " + id + " | \xE2\x9A\xAA Pending |\n";
    }
    testing::writeFile(config.featuresIndex(), content);
}

// Polls until the orchestrator reports nothing left to do.
bool drive(Orchestrator& orchestrator, int maxPolls = 30) {
    for (int i = 0; i < maxPolls; ++i) {
        if (orchestrator.pollOnce()) {
            return true;
        }
        orchestrator.pool().waitIdle();
    }
    return false;
}

// Pid of a process that has already exited and been reaped.
pid_t deadPid() {
    pid_t pid = 0;
    runCommand({"true"}, {}, [&pid](pid_t p) {
        if (p > 0) pid = p;
    });
    return pid;
}

class OrchestratorTest : public ::testing::Test {
protected:
    OrchestratorTest() : config(testing::testConfig(dir.path())) {
        config.maxParallel = 2;
    }

    StateStore store() { return StateStore(config.resolve(config.stateFile)); }

    TempDir dir;
    Config config;
    FakeVcs vcs;
    FakeHosting hosting;
};

// -----------------------------------------------------------------------------
// Discovery and completion
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, CompletesEveryPendingFeature) {
    writeIndex(config, {"FEAT-001-auth", "FEAT-002-search", "FEAT-003-export"});
    hosting.createdState = PullRequestState::Merged;
    SimulatedAgent agent(config.featuresDir, 3, 2);
    agent.callDuration = std::chrono::milliseconds(10);

    Orchestrator orchestrator(config, vcs, hosting, agent);
    ASSERT_TRUE(orchestrator.initialize());
    ASSERT_TRUE(drive(orchestrator));
    EXPECT_TRUE(orchestrator.isDone());

    StateDocument doc = StateStore(config.resolve(config.stateFile)).load();
    EXPECT_EQ(doc.orchestrator.status, OrchestratorStatus::Complete);
    EXPECT_EQ(doc.orchestrator.pid, static_cast<int>(::getpid()));
    EXPECT_EQ(doc.completed.size(), 3u);
    EXPECT_TRUE(doc.features.empty());
    EXPECT_TRUE(vcs.workspaces().empty());
    EXPECT_EQ(hosting.created(), 3);

    const auto activityLog = testing::readFile(config.resolve(config.activityLog));
    EXPECT_NE(activityLog.find("Orchestrator started"), std::string::npos);
    EXPECT_NE(activityLog.find("All features complete"), std::string::npos);
    orchestrator.shutdown();
}

TEST_F(OrchestratorTest, NeverExceedsMaxParallel) {
    writeIndex(config, {"FEAT-001-a", "FEAT-002-b", "FEAT-003-c", "FEAT-004-d", "FEAT-005-e"});
    hosting.createdState = PullRequestState::Merged;
    SimulatedAgent agent(config.featuresDir, 2, 2);
    agent.callDuration = std::chrono::milliseconds(15);

    Orchestrator orchestrator(config, vcs, hosting, agent);
    ASSERT_TRUE(orchestrator.initialize());

    // Counts Running records in the state file while the run goes on
    std::atomic<bool> sampling{true};
    std::atomic<int> maxRunning{0};
    std::atomic<int> samples{0};
    std::thread sampler([&] {
        StateStore reader(config.resolve(config.stateFile));
        while (sampling.load()) {
            int running = 0;
            for (const auto& [id, record] : reader.load().features) {
                if (record.status == FeatureStatus::Running) ++running;
            }
            if (running > maxRunning.load()) maxRunning = running;
            ++samples;
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    });

    EXPECT_FALSE(orchestrator.pollOnce());
    EXPECT_LE(orchestrator.pool().inFlightCount(), 2u);

    const bool finished = drive(orchestrator);
    sampling = false;
    sampler.join();
    ASSERT_TRUE(finished);

    EXPECT_GT(samples.load(), 0);
    EXPECT_GE(maxRunning.load(), 1);
    EXPECT_LE(maxRunning.load(), 2);
    EXPECT_LE(agent.maxConcurrent(), 2);
    EXPECT_GE(agent.maxConcurrent(), 1);
    EXPECT_EQ(StateStore(config.resolve(config.stateFile)).load().completed.size(), 5u);
}

TEST_F(OrchestratorTest, EmptyIndexCompletesImmediately) {
    ScriptedAgent agent([](const std::string&, const std::filesystem::path&) { return AgentReply{}; });
    Orchestrator orchestrator(config, vcs, hosting, agent);
    ASSERT_TRUE(orchestrator.start());

    for (int i = 0; i < 200 && !orchestrator.isDone(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_TRUE(orchestrator.isDone());
    orchestrator.shutdown();
    EXPECT_FALSE(orchestrator.isRunning());
    EXPECT_EQ(agent.calls(), 0);
    EXPECT_EQ(StateStore(config.resolve(config.stateFile)).load().orchestrator.status, OrchestratorStatus::Complete);
}

TEST_F(OrchestratorTest, RetiredFeaturesAreNotRestarted) {
    writeIndex(config, {"FEAT-001-done", "FEAT-002-gone"});
    {
        StateStore s(config.resolve(config.stateFile));
        s.update([](StateDocument& doc) {
            doc.completed.push_back("FEAT-001-done");
            doc.failed.push_back("FEAT-002-gone");
        });
    }
    ScriptedAgent agent([](const std::string&, const std::filesystem::path&) { return AgentReply{}; });
    Orchestrator orchestrator(config, vcs, hosting, agent);
    ASSERT_TRUE(orchestrator.initialize());
    EXPECT_TRUE(orchestrator.pollOnce());
    EXPECT_EQ(agent.calls(), 0);
}

// -----------------------------------------------------------------------------
// Failures
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, FailingAgentPausesFeature) {
    writeIndex(config, {"FEAT-001-auth"});
    ScriptedAgent agent([](const std::string&, const std::filesystem::path&) {
        return AgentReply{false, "", "agent crashed"};
    });

    Orchestrator orchestrator(config, vcs, hosting, agent);
    ASSERT_TRUE(orchestrator.initialize());
    ASSERT_TRUE(drive(orchestrator));
    EXPECT_EQ(agent.calls(), 3);

    auto record = orchestrator.state().feature("FEAT-001-auth");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, FeatureStatus::Paused);
    EXPECT_EQ(record->failures, 3);

    // A paused feature is left alone by later polls
    EXPECT_TRUE(orchestrator.pollOnce());
    orchestrator.pool().waitIdle();
    EXPECT_EQ(agent.calls(), 3);
}

TEST_F(OrchestratorTest, ProvisioningFailuresCountTowardsPause) {
    writeIndex(config, {"FEAT-001-auth"});
    vcs.failProvisioning = true;
    ScriptedAgent agent([](const std::string&, const std::filesystem::path&) { return AgentReply{}; });

    Orchestrator orchestrator(config, vcs, hosting, agent);
    ASSERT_TRUE(orchestrator.initialize());
    ASSERT_TRUE(drive(orchestrator));

    auto record = orchestrator.state().feature("FEAT-001-auth");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, FeatureStatus::Paused);
    EXPECT_EQ(record->failures, 3);
    EXPECT_EQ(agent.calls(), 0);
}

// -----------------------------------------------------------------------------
// Restart behaviour
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, RecoversOrphanedFeatures) {
    {
        StateStore s(config.resolve(config.stateFile));
        s.updateFeature("FEAT-001-orphan", [](FeatureRecord& r) {
            r.status = FeatureStatus::Running;
            r.phase = Phase::Implement;
            r.pid = 999999;
        });
        s.updateFeature("FEAT-002-paused", [](FeatureRecord& r) { r.status = FeatureStatus::Paused; });
    }
    ScriptedAgent agent([](const std::string&, const std::filesystem::path&) { return AgentReply{}; });
    Orchestrator orchestrator(config, vcs, hosting, agent);
    ASSERT_TRUE(orchestrator.initialize());

    auto orphan = orchestrator.state().feature("FEAT-001-orphan");
    ASSERT_TRUE(orphan.has_value());
    EXPECT_EQ(orphan->status, FeatureStatus::Waiting);
    EXPECT_EQ(orphan->pid, 0);
    EXPECT_EQ(orphan->phase, Phase::Implement);
    EXPECT_EQ(orchestrator.state().feature("FEAT-002-paused")->status, FeatureStatus::Paused);
    orchestrator.shutdown();
}

TEST_F(OrchestratorTest, ResumesTrackedFeatureAfterRestart) {
    WorkspaceManager workspaces(config, vcs);
    const FeatureId id = "FEAT-001-auth";
    auto path = workspaces.provision(id);
    FeatureContext ctx = workspaces.context(id, path);
    testing::writeInterviewedSpec(ctx.layout);
    testing::writePlan(ctx.layout, 4, 1);
    vcs.addBranch(ctx.featureBranch);
    {
        StateStore s(config.resolve(config.stateFile));
        s.updateFeature(id, [&path](FeatureRecord& r) {
            r.status = FeatureStatus::Running;
            r.phase = Phase::Implement;
            r.iterations = 4;
            r.workspace = path.string();
        });
    }
    hosting.createdState = PullRequestState::Merged;
    SimulatedAgent agent(config.featuresDir, 4, 3);

    Orchestrator orchestrator(config, vcs, hosting, agent);
    ASSERT_TRUE(orchestrator.initialize());
    ASSERT_TRUE(drive(orchestrator));

    EXPECT_EQ(agent.callsFor("INTERVIEW phase"), 0);
    EXPECT_EQ(agent.callsFor("PLAN phase"), 0);
    EXPECT_EQ(agent.callsFor("IMPLEMENT phase"), 1);
    StateDocument doc = orchestrator.state().load();
    EXPECT_TRUE(doc.isCompleted(id));
    EXPECT_GE(doc.archive.at(id).iterations, 4);
}

TEST_F(OrchestratorTest, RefusesWhenAnotherOwnerIsAlive) {
    {
        StateStore s(config.resolve(config.stateFile));
        s.update([](StateDocument& doc) {
            doc.orchestrator.status = OrchestratorStatus::Running;
            doc.orchestrator.pid = static_cast<int>(::getppid());
        });
    }
    ScriptedAgent agent([](const std::string&, const std::filesystem::path&) { return AgentReply{}; });
    Orchestrator orchestrator(config, vcs, hosting, agent);
    EXPECT_FALSE(orchestrator.initialize());
    EXPECT_FALSE(orchestrator.isRunning());
}

TEST_F(OrchestratorTest, TakesOverFromDeadOwner) {
    const int stale = static_cast<int>(deadPid());
    {
        StateStore s(config.resolve(config.stateFile));
        s.update([stale](StateDocument& doc) {
            doc.orchestrator.status = OrchestratorStatus::Running;
            doc.orchestrator.pid = stale;
        });
    }
    ScriptedAgent agent([](const std::string&, const std::filesystem::path&) { return AgentReply{}; });
    Orchestrator orchestrator(config, vcs, hosting, agent);
    ASSERT_TRUE(orchestrator.initialize());
    EXPECT_EQ(orchestrator.state().load().orchestrator.pid, static_cast<int>(::getpid()));
    orchestrator.shutdown();
    EXPECT_EQ(orchestrator.state().load().orchestrator.status, OrchestratorStatus::Stopped);
}

// -----------------------------------------------------------------------------
// Merge reconciliation
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, PausedFeatureMergedByHandIsRetired) {
    WorkspaceManager workspaces(config, vcs);
    auto path = workspaces.provision("FEAT-007-manual");
    {
        StateStore s(config.resolve(config.stateFile));
        s.updateFeature("FEAT-007-manual", [&path](FeatureRecord& r) {
            r.status = FeatureStatus::Paused;
            r.phase = Phase::Merge;
            r.failures = 3;
            r.workspace = path.string();
        });
    }
    hosting.setState("feat/FEAT-007", PullRequestState::Merged);
    ScriptedAgent agent([](const std::string&, const std::filesystem::path&) { return AgentReply{}; });

    Orchestrator orchestrator(config, vcs, hosting, agent);
    ASSERT_TRUE(orchestrator.initialize());
    EXPECT_TRUE(orchestrator.pollOnce());

    StateDocument doc = orchestrator.state().load();
    EXPECT_TRUE(doc.isCompleted("FEAT-007-manual"));
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_EQ(agent.calls(), 0);
}

// -----------------------------------------------------------------------------
// Operator actions
// -----------------------------------------------------------------------------
TEST_F(OrchestratorTest, ResumeClearsFailures) {
    StateStore s = store();
    ActivityLog activity(config.resolve(config.activityLog));
    s.updateFeature("FEAT-001-p", [](FeatureRecord& r) {
        r.status = FeatureStatus::Paused;
        r.failures = 3;
    });
    s.updateFeature("FEAT-002-r", [](FeatureRecord& r) { r.status = FeatureStatus::Running; });
    s.update([](StateDocument& doc) { doc.completed.push_back("FEAT-003-c"); });

    EXPECT_EQ(resumeFeature(s, activity, "FEAT-001-p"), "");
    auto record = s.feature("FEAT-001-p");
    EXPECT_EQ(record->status, FeatureStatus::Waiting);
    EXPECT_EQ(record->failures, 0);

    EXPECT_NE(resumeFeature(s, activity, "FEAT-002-r"), "");
    EXPECT_NE(resumeFeature(s, activity, "FEAT-003-c"), "");
    EXPECT_NE(resumeFeature(s, activity, "FEAT-404-x"), "");
}

TEST_F(OrchestratorTest, AbandonMovesFeatureToFailed) {
    StateStore s = store();
    ActivityLog activity(config.resolve(config.activityLog));
    WorkspaceManager workspaces(config, vcs);
    auto path = workspaces.provision("FEAT-001-a");
    s.updateFeature("FEAT-001-a", [&path](FeatureRecord& r) {
        r.status = FeatureStatus::NeedsInput;
        r.workspace = path.string();
    });

    EXPECT_EQ(abandonFeature(s, activity, workspaces, "FEAT-001-a"), "");
    StateDocument doc = s.load();
    EXPECT_TRUE(doc.isFailed("FEAT-001-a"));
    EXPECT_TRUE(doc.features.empty());
    EXPECT_FALSE(std::filesystem::exists(path));
    EXPECT_NE(abandonFeature(s, activity, workspaces, "FEAT-001-a"), "");
}

TEST_F(OrchestratorTest, AbandonRefusesFeatureOfLiveOrchestrator) {
    StateStore s = store();
    ActivityLog activity(config.resolve(config.activityLog));
    WorkspaceManager workspaces(config, vcs);
    auto path = workspaces.provision("FEAT-001-a");
    // Between agent calls: Running, no child pid
    s.updateFeature("FEAT-001-a", [&path](FeatureRecord& r) {
        r.status = FeatureStatus::Running;
        r.iterations = 4;
        r.workspace = path.string();
    });
    s.update([](StateDocument& doc) {
        doc.orchestrator.status = OrchestratorStatus::Running;
        doc.orchestrator.pid = static_cast<int>(::getpid());
    });

    EXPECT_NE(abandonFeature(s, activity, workspaces, "FEAT-001-a"), "");
    StateDocument doc = s.load();
    EXPECT_FALSE(doc.isFailed("FEAT-001-a"));
    EXPECT_EQ(doc.features.at("FEAT-001-a").iterations, 4);
    EXPECT_TRUE(std::filesystem::exists(path));

    // Once the owner is gone the feature can be abandoned
    s.update([](StateDocument& d) { d.orchestrator.status = OrchestratorStatus::Stopped; });
    EXPECT_EQ(abandonFeature(s, activity, workspaces, "FEAT-001-a"), "");

    // A late write from the old workflow does not bring the record back
    EXPECT_THROW(s.updateFeature("FEAT-001-a", [](FeatureRecord& r) { r.iterations = 1; }), FeatureRetired);
    doc = s.load();
    EXPECT_TRUE(doc.features.empty());
    EXPECT_EQ(doc.failed, (std::vector<FeatureId>{"FEAT-001-a"}));
    EXPECT_EQ(doc.archive.at("FEAT-001-a").iterations, 4);
}

TEST_F(OrchestratorTest, StandaloneRunChecksTheStateFile) {
    StateDocument doc;
    EXPECT_EQ(checkStandaloneRun(doc, "FEAT-001-a"), "");

    doc.orchestrator.status = OrchestratorStatus::Running;
    doc.orchestrator.pid = static_cast<int>(::getppid());
    EXPECT_NE(checkStandaloneRun(doc, "FEAT-001-a"), "");

    doc.orchestrator.pid = static_cast<int>(deadPid());
    EXPECT_EQ(checkStandaloneRun(doc, "FEAT-001-a"), "");

    FeatureRecord busy;
    busy.id = "FEAT-001-a";
    busy.status = FeatureStatus::Running;
    busy.pid = static_cast<int>(::getppid());
    doc.features[busy.id] = busy;
    EXPECT_NE(checkStandaloneRun(doc, "FEAT-001-a"), "");

    doc.completed.push_back("FEAT-002-done");
    EXPECT_NE(checkStandaloneRun(doc, "FEAT-002-done"), "");
}

TEST_F(OrchestratorTest, StopSignalsRecordedWorkers) {
    StateStore s = store();
    ActivityLog activity(config.resolve(config.activityLog));

    std::atomic<pid_t> child{0};
    std::thread runner([&child] {
        runCommand({"sleep", "30"}, {}, [&child](pid_t pid) {
            if (pid > 0) child = pid;
        });
    });
    for (int i = 0; i < 500 && child.load() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    ASSERT_GT(child.load(), 0);

    const int worker = static_cast<int>(child.load());
    const int stale = static_cast<int>(deadPid());
    s.updateFeature("FEAT-001-a", [worker](FeatureRecord& r) {
        r.status = FeatureStatus::Running;
        r.pid = worker;
    });
    s.update([stale](StateDocument& doc) {
        doc.orchestrator.status = OrchestratorStatus::Running;
        doc.orchestrator.pid = stale;
    });

    EXPECT_EQ(stopOrchestrator(s, activity), 1);
    runner.join();

    StateDocument doc = s.load();
    EXPECT_EQ(doc.orchestrator.status, OrchestratorStatus::Stopped);
    EXPECT_EQ(doc.features.at("FEAT-001-a").pid, 0);
    EXPECT_EQ(doc.features.at("FEAT-001-a").status, FeatureStatus::Waiting);
    EXPECT_NE(testing::readFile(activity.path()).find("stopped by user"), std::string::npos);
}

}
}
