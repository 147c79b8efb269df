/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>

#include "fakes.hpp"
#include "featloop/state_store.hpp"

namespace featloop {
namespace {

using testing::TempDir;
using testing::readFile;
using testing::writeFile;

TEST(StateStoreTest, AbsentFileLoadsFreshDocument) {
    TempDir dir;
    StateStore store(dir.path() / "feature-loop-state.json");
    StateDocument doc = store.load();
    EXPECT_EQ(doc.orchestrator.status, OrchestratorStatus::Idle);
    EXPECT_TRUE(doc.features.empty());
    EXPECT_TRUE(doc.completed.empty());
    EXPECT_FALSE(std::filesystem::exists(store.path()));
}

TEST(StateStoreTest, ReadingAnAbsentFileLeavesNoTrace) {
    TempDir dir;
    const auto nested = dir.path() / "nested" / "feature-loop-state.json";
    StateStore store(nested);
    EXPECT_TRUE(store.load().features.empty());
    EXPECT_FALSE(store.feature("FEAT-001-a").has_value());
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "nested"));

    store.updateFeature("FEAT-001-a", [](FeatureRecord&) {});
    EXPECT_TRUE(std::filesystem::exists(nested));
    EXPECT_TRUE(std::filesystem::exists(nested.string() + ".lock"));
}

TEST(StateStoreTest, RetiredFeatureIsNotRecreated) {
    TempDir dir;
    StateStore store(dir.path() / "feature-loop-state.json");
    store.updateFeature("FEAT-002-b", [](FeatureRecord& r) { r.iterations = 6; });
    store.update([](StateDocument& doc) { doc.retire("FEAT-002-b", true); });

    EXPECT_THROW(store.updateFeature("FEAT-002-b", [](FeatureRecord& r) { r.status = FeatureStatus::Running; }),
                 FeatureRetired);
    StateDocument doc = store.load();
    EXPECT_TRUE(doc.features.empty());
    EXPECT_TRUE(doc.isCompleted("FEAT-002-b"));
    EXPECT_EQ(doc.archive.at("FEAT-002-b").iterations, 6);
}

TEST(StateStoreTest, UpdateFeatureCreatesAndPersists) {
    TempDir dir;
    StateStore store(dir.path() / "state.json");
    auto record = store.updateFeature("FEAT-001-auth", [](FeatureRecord& r) {
        r.status = FeatureStatus::Running;
        r.phase = Phase::Implement;
        r.iterations = 4;
        r.workspace = "/work/app-FEAT-001-auth-loop";
    });
    EXPECT_EQ(record.id, "FEAT-001-auth");
    EXPECT_FALSE(record.startedAt.empty());
    EXPECT_FALSE(record.updatedAt.empty());

    StateStore reopened(dir.path() / "state.json");
    auto loaded = reopened.feature("FEAT-001-auth");
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->status, FeatureStatus::Running);
    EXPECT_EQ(loaded->phase, Phase::Implement);
    EXPECT_EQ(loaded->iterations, 4);
    EXPECT_EQ(loaded->workspace, "/work/app-FEAT-001-auth-loop");
    EXPECT_FALSE(reopened.feature("FEAT-999-none").has_value());
}

TEST(StateStoreTest, IterationsNeverDecrease) {
    TempDir dir;
    StateStore store(dir.path() / "state.json");
    store.updateFeature("FEAT-001-a", [](FeatureRecord& r) { r.iterations = 5; });
    auto record = store.updateFeature("FEAT-001-a", [](FeatureRecord& r) { r.iterations = 2; });
    EXPECT_EQ(record.iterations, 5);
}

TEST(StateStoreTest, WrittenJsonUsesDocumentedKeys) {
    TempDir dir;
    StateStore store(dir.path() / "state.json");
    store.update([](StateDocument& doc) {
        doc.orchestrator.status = OrchestratorStatus::Running;
        doc.orchestrator.pid = 1234;
        doc.orchestrator.maxParallel = 2;
    });
    store.updateFeature("FEAT-002-b", [](FeatureRecord& r) {
        r.status = FeatureStatus::NeedsInput;
        r.workspace = "/w";
    });

    auto j = nlohmann::json::parse(readFile(store.path()));
    EXPECT_EQ(j["orchestrator"]["status"], "running");
    EXPECT_EQ(j["orchestrator"]["pid"], 1234);
    EXPECT_EQ(j["orchestrator"]["max_parallel"], 2);
    EXPECT_EQ(j["features"]["FEAT-002-b"]["status"], "needs_input");
    EXPECT_EQ(j["features"]["FEAT-002-b"]["worktree"], "/w");
    EXPECT_TRUE(j["completed"].is_array());
    EXPECT_TRUE(j["failed"].is_array());
}

TEST(StateStoreTest, NoTempFilesLeftBehind) {
    TempDir dir;
    StateStore store(dir.path() / "state.json");
    for (int i = 0; i < 5; ++i) {
        store.updateFeature("FEAT-00" + std::to_string(i) + "-x", [](FeatureRecord& r) { r.failures = 1; });
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir.path())) {
        const auto name = entry.path().filename().string();
        EXPECT_TRUE(name == "state.json" || name == "state.json.lock") << name;
    }
}

TEST(StateStoreTest, MalformedFileThrows) {
    TempDir dir;
    writeFile(dir.path() / "state.json", "{ not json");
    StateStore store(dir.path() / "state.json");
    EXPECT_THROW(store.load(), StateError);
}

TEST(StateStoreTest, EmptyFileIsFresh) {
    TempDir dir;
    writeFile(dir.path() / "state.json", "  \n");
    StateStore store(dir.path() / "state.json");
    EXPECT_TRUE(store.load().features.empty());
}

TEST(StateStoreTest, ConcurrentUpdatesAreNotLost) {
    TempDir dir;
    StateStore store(dir.path() / "state.json");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store, t] {
            const FeatureId id = "FEAT-00" + std::to_string(t) + "-c";
            for (int i = 0; i < 25; ++i) {
                store.updateFeature(id, [](FeatureRecord& r) { r.failures += 1; });
            }
        });
    }
    for (auto& thread : threads) thread.join();

    StateDocument doc = store.load();
    ASSERT_EQ(doc.features.size(), 4u);
    for (const auto& [id, record] : doc.features) {
        EXPECT_EQ(record.failures, 25) << id;
    }
}

TEST(StateStoreTest, TwoStoresOnOneFileShareTheLock) {
    TempDir dir;
    StateStore a(dir.path() / "state.json");
    StateStore b(dir.path() / "state.json");
    std::thread ta([&a] {
        for (int i = 0; i < 20; ++i) a.update([](StateDocument& d) { d.orchestrator.maxParallel += 1; });
    });
    std::thread tb([&b] {
        for (int i = 0; i < 20; ++i) b.update([](StateDocument& d) { d.orchestrator.maxParallel += 1; });
    });
    ta.join();
    tb.join();
    EXPECT_EQ(a.load().orchestrator.maxParallel, 40);
}

// -----------------------------------------------------------------------------
// StateDocument
// -----------------------------------------------------------------------------
TEST(StateDocumentTest, RetireMovesRecordToArchive) {
    StateDocument doc;
    FeatureRecord record;
    record.id = "FEAT-003-r";
    record.status = FeatureStatus::Paused;
    record.workspace = "/w";
    record.pid = 99;
    doc.features[record.id] = record;

    doc.retire("FEAT-003-r", true);
    EXPECT_TRUE(doc.features.empty());
    EXPECT_TRUE(doc.isCompleted("FEAT-003-r"));
    EXPECT_TRUE(doc.isKnown("FEAT-003-r"));
    ASSERT_EQ(doc.archive.count("FEAT-003-r"), 1u);
    EXPECT_EQ(doc.archive["FEAT-003-r"].status, FeatureStatus::Complete);
    EXPECT_EQ(doc.archive["FEAT-003-r"].pid, 0);
    EXPECT_TRUE(doc.archive["FEAT-003-r"].workspace.empty());

    doc.retire("FEAT-003-r", true);
    EXPECT_EQ(doc.completed.size(), 1u);
}

TEST(StateDocumentTest, FailedRetirementKeepsStatus) {
    StateDocument doc;
    FeatureRecord record;
    record.id = "FEAT-004-f";
    record.status = FeatureStatus::Paused;
    doc.features[record.id] = record;

    doc.retire("FEAT-004-f", false);
    EXPECT_TRUE(doc.isFailed("FEAT-004-f"));
    EXPECT_FALSE(doc.isCompleted("FEAT-004-f"));
    EXPECT_EQ(doc.archive["FEAT-004-f"].status, FeatureStatus::Paused);
}

TEST(StateDocumentTest, SerializeRoundTripsEveryField) {
    StateDocument doc;
    doc.orchestrator = {OrchestratorStatus::Stopped, "2025-01-01T00:00:00Z", 3, 42};
    FeatureRecord r;
    r.id = "FEAT-005-s";
    r.status = FeatureStatus::MaxIterations;
    r.phase = Phase::WrapUp;
    r.iterations = 15;
    r.failures = 2;
    r.workspace = "/w/s";
    r.pid = 7;
    r.startedAt = "a";
    r.updatedAt = "b";
    doc.features[r.id] = r;
    doc.completed = {"FEAT-000-old"};
    doc.failed = {"FEAT-006-bad"};

    StateDocument back = deserialize(serialize(doc));
    EXPECT_EQ(back.orchestrator.status, OrchestratorStatus::Stopped);
    EXPECT_EQ(back.orchestrator.pid, 42);
    const auto& br = back.features.at("FEAT-005-s");
    EXPECT_EQ(br.id, "FEAT-005-s");
    EXPECT_EQ(br.status, FeatureStatus::MaxIterations);
    EXPECT_EQ(br.phase, Phase::WrapUp);
    EXPECT_EQ(br.iterations, 15);
    EXPECT_EQ(br.failures, 2);
    EXPECT_EQ(br.workspace, "/w/s");
    EXPECT_EQ(br.pid, 7);
    EXPECT_EQ(back.completed, doc.completed);
    EXPECT_EQ(back.failed, doc.failed);
}

TEST(StateDocumentTest, UnknownValuesFallBackToDefaults) {
    StateDocument doc = deserialize(R"({"features": {"FEAT-007-u": {"status": "exploded", "phase": "deploy"}}})");
    const auto& r = doc.features.at("FEAT-007-u");
    EXPECT_EQ(r.status, FeatureStatus::Waiting);
    EXPECT_EQ(r.phase, Phase::Interview);
    EXPECT_EQ(doc.orchestrator.status, OrchestratorStatus::Idle);
}

}
}
