/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/scanner.hpp"
#include "featloop/artifacts.hpp"
#include "featloop/logger.hpp"
#include <algorithm>
#include <regex>
#include <sstream>

namespace featloop {

std::vector<FeatureId> parsePendingFeatures(const std::string& indexContent) {
    static const std::regex rowRegex("\\|\\s*(FEAT-[0-9]+-[A-Za-z0-9_-]+)");
    static const std::string pendingMark = "\xE2\x9A\xAA";     // ⚪

    std::vector<FeatureId> features;
    std::istringstream ss(indexContent);
    std::string line;
    while (std::getline(ss, line)) {
        std::smatch match;
        if (!std::regex_search(line, match, rowRegex)) continue;
        if (line.find(pendingMark) == std::string::npos && line.find("Pending") == std::string::npos) {
            continue;
        }
        FeatureId id = match[1].str();
        if (std::find(features.begin(), features.end(), id) == features.end()) {
            features.push_back(id);
        }
    }
    return features;
}

Scanner::Scanner(const std::filesystem::path& index) noexcept : index_(index) {
}

std::vector<FeatureId> Scanner::scan() const noexcept {
    std::vector<FeatureId> features;
    try {
        auto content = readText(index_);
        if (!content) {
            LOG_DEBUG("Features index not found: " + index_.string());
            return features;
        }
        features = parsePendingFeatures(*content);
        if (!features.empty()) {
            LOG_DEBUG("Scanner found " + std::to_string(features.size()) + " pending features");
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error: " + std::string(e.what()));
        features.clear();
    }
    return features;
}

}
