/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "featloop/types.hpp"

namespace featloop {

// Fixed document set of one feature, rooted at <workspace>/<featuresDir>/<id>.
class FeatureLayout {
public:
    FeatureLayout(const std::filesystem::path& workspace, const std::filesystem::path& featuresDir,
                  const FeatureId& id);

    [[nodiscard]] const std::filesystem::path& dir() const noexcept { return dir_; }
    [[nodiscard]] std::filesystem::path spec() const { return dir_ / "spec.md"; }
    [[nodiscard]] std::filesystem::path design() const { return dir_ / "design.md"; }
    [[nodiscard]] std::filesystem::path tasks() const { return dir_ / "tasks.md"; }
    [[nodiscard]] std::filesystem::path status() const { return dir_ / "status.md"; }
    [[nodiscard]] std::filesystem::path sessionLog() const { return dir_ / "context" / "session_log.md"; }
    [[nodiscard]] std::filesystem::path wrapUp() const { return dir_ / "context" / "wrap_up.md"; }

    // Path relative to the workspace, for instructions given to the agent.
    [[nodiscard]] std::string relative(const std::filesystem::path& path) const;

private:
    std::filesystem::path workspace_;
    std::filesystem::path dir_;
};

struct ChecklistCounts {
    int total = 0;
    int checked = 0;

    [[nodiscard]] int unchecked() const noexcept { return total - checked; }
    [[nodiscard]] double ratio() const noexcept {
        return total > 0 ? static_cast<double>(checked) / static_cast<double>(total) : 0.0;
    }
};

// Markers the wrap-up record carries once the feature is done.
const std::vector<std::string>& wrapUpDoneMarkers();

[[nodiscard]] std::optional<std::string> readText(const std::filesystem::path& path);

// Writes to a sibling temp file and renames it over the target.
[[nodiscard]] bool writeTextAtomic(const std::filesystem::path& path, const std::string& content) noexcept;

// "- [ ]" items are open, "- [x]" items are checked. Missing file counts as empty.
[[nodiscard]] ChecklistCounts countChecklist(const std::filesystem::path& tasksFile) noexcept;

// Numbered decision rows ("| 3 | ... |") whose cells hold no TBD placeholder.
[[nodiscard]] int countFilledDecisionRows(const std::filesystem::path& specFile) noexcept;

// Phases whose status-table row carries the done marker.
[[nodiscard]] std::set<Phase> completedPhases(const std::filesystem::path& statusFile) noexcept;

// Marks the phase row done, creating the table (or the row) when absent.
[[nodiscard]] bool markPhaseComplete(const std::filesystem::path& statusFile, const FeatureId& id, Phase phase);

[[nodiscard]] bool wrapUpDone(const std::filesystem::path& wrapUpFile) noexcept;

// Appends the primary done marker unless one is already present.
[[nodiscard]] bool ensureWrapUpDone(const std::filesystem::path& wrapUpFile);

// One timestamped line, appended. Parent directories are created as needed.
bool appendSessionLog(const std::filesystem::path& sessionLog, const std::string& message) noexcept;

}
