/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "featloop/types.hpp"

namespace featloop {

// Finds pending features in the features index (docs/features/_index.md):
// table rows naming a FEAT-<n>-<slug> id and marked pending.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& index) noexcept;

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    // In index order, without duplicates. Missing index yields nothing.
    [[nodiscard]] std::vector<FeatureId> scan() const noexcept;

    [[nodiscard]] const std::filesystem::path& index() const noexcept { return index_; }

private:
    std::filesystem::path index_;
};

// Pending ids in one index document.
std::vector<FeatureId> parsePendingFeatures(const std::string& indexContent);

}
