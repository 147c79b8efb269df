/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "featloop/types.hpp"

namespace featloop {

struct OrchestratorRecord {
    OrchestratorStatus status = OrchestratorStatus::Idle;
    std::string startedAt;
    int maxParallel = 0;
    int pid = 0;
};

struct FeatureRecord {
    FeatureId id;
    FeatureStatus status = FeatureStatus::Waiting;
    Phase phase = Phase::Interview;
    int iterations = 0;
    int failures = 0;
    std::string workspace;
    int pid = 0;                // running agent child, 0 if none
    std::string startedAt;
    std::string updatedAt;
};

struct StateDocument {
    OrchestratorRecord orchestrator;
    std::map<FeatureId, FeatureRecord> features;
    std::vector<FeatureId> completed;
    std::vector<FeatureId> failed;
    std::map<FeatureId, FeatureRecord> archive;

    [[nodiscard]] bool isCompleted(const FeatureId& id) const;
    [[nodiscard]] bool isFailed(const FeatureId& id) const;
    // Known in any form: active, completed or failed.
    [[nodiscard]] bool isKnown(const FeatureId& id) const;

    // Moves an active record to the completed (or failed) list, keeping a copy in the archive.
    void retire(const FeatureId& id, bool completedOk);
};

class StateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A write to a feature that was already moved to the completed or failed list.
class FeatureRetired : public StateError {
public:
    using StateError::StateError;
};

// Durable state document. Every read-modify-write runs under an in-process
// mutex and an exclusive flock on "<file>.lock", and is published by
// writing a temp file and renaming it over the target.
class StateStore {
public:
    using Mutator = std::function<void(StateDocument&)>;

    explicit StateStore(std::filesystem::path file);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    // Absent file yields a fresh document and touches nothing on disk.
    // Throws StateError on unreadable content.
    [[nodiscard]] StateDocument load() const;

    // Applies fn to the current document and persists the result. Returns the new document.
    StateDocument update(const Mutator& fn);

    // Creates the record when missing. Throws FeatureRetired for a retired id,
    // leaving the document untouched.
    FeatureRecord updateFeature(const FeatureId& id, const std::function<void(FeatureRecord&)>& fn);

    [[nodiscard]] std::optional<FeatureRecord> feature(const FeatureId& id) const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return file_; }

private:
    StateDocument readUnlocked() const;
    void writeUnlocked(const StateDocument& doc) const;

    std::filesystem::path file_;
    std::filesystem::path lockFile_;
    mutable std::mutex mutex_;
};

// ISO-8601 UTC, second precision.
std::string utcTimestamp();

std::string serialize(const StateDocument& doc);
StateDocument deserialize(const std::string& text);

}
