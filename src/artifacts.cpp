/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/artifacts.hpp"
#include "featloop/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace featloop {

namespace {
const char* const kDoneMark = "\xE2\x9C\x85";   // ✅

// Replaced by the done mark when a row is completed.
const std::vector<std::string>& pendingMarks() {
    static const std::vector<std::string> marks = {
        "\xE2\x9A\xAA",         // ⚪
        "\xF0\x9F\x9F\xA1",     // 🟡
        "\xE2\xAC\x9C",         // ⬜
        "\xE2\x8F\xB3",         // ⏳
        "\xE2\x9D\x8C",         // ❌
    };
    return marks;
}

std::string trim(const std::string& value) {
    auto notSpace = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(value.begin(), value.end(), notSpace);
    auto end = std::find_if(value.rbegin(), value.rend(), notSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::vector<std::string> splitLines(const std::string& content) {
    std::vector<std::string> lines;
    std::istringstream ss(content);
    std::string line;
    while (std::getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::string joinLines(const std::vector<std::string>& lines) {
    std::string out;
    for (const auto& line : lines) {
        out += line;
        out += '\n';
    }
    return out;
}

std::vector<std::string> tableCells(const std::string& line) {
    std::vector<std::string> cells;
    std::string t = trim(line);
    if (t.empty() || t.front() != '|') {
        return cells;
    }
    std::stringstream ss(t.substr(1));
    std::string cell;
    while (std::getline(ss, cell, '|')) {
        cells.push_back(trim(cell));
    }
    return cells;
}

// Phase named by a status-table row, if any.
std::optional<Phase> rowPhase(const std::string& line) {
    for (const auto& cell : tableCells(line)) {
        if (cell.empty()) continue;
        if (auto phase = parsePhase(cell); phase && *phase != Phase::Complete) {
            return phase;
        }
    }
    return std::nullopt;
}

std::string statusTemplate(const FeatureId& id) {
    std::string content = "# Status: " + id + "\n\n";
    content += "| Phase | Status |\n";
    content += "|-------|--------|\n";
    for (Phase p : {Phase::Interview, Phase::Plan, Phase::Branch, Phase::Implement,
                    Phase::PR, Phase::Merge, Phase::WrapUp}) {
        content += std::string("| ") + displayName(p) + " | " + pendingMarks().front() + " |\n";
    }
    return content;
}

std::string completeRow(std::string line) {
    for (const auto& mark : pendingMarks()) {
        auto pos = line.find(mark);
        if (pos != std::string::npos) {
            line.replace(pos, mark.size(), kDoneMark);
            return line;
        }
    }
    std::string t = trim(line);
    if (!t.empty() && t.back() == '|') {
        auto pos = line.rfind('|');
        line.insert(pos, std::string(kDoneMark) + " ");
    } else {
        line += std::string(" ") + kDoneMark + " |";
    }
    return line;
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}
}

FeatureLayout::FeatureLayout(const std::filesystem::path& workspace,
                             const std::filesystem::path& featuresDir,
                             const FeatureId& id)
    : workspace_(workspace), dir_(workspace / featuresDir / id) {
}

std::string FeatureLayout::relative(const std::filesystem::path& path) const {
    auto rel = path.lexically_relative(workspace_);
    return rel.empty() ? path.string() : rel.string();
}

const std::vector<std::string>& wrapUpDoneMarkers() {
    static const std::vector<std::string> markers = {"Wrap-up completado", "Wrap-up complete"};
    return markers;
}

std::optional<std::string> readText(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

bool writeTextAtomic(const std::filesystem::path& path, const std::string& content) noexcept {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        auto temp = path;
        temp += ".tmp." + std::to_string(::getpid());
        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) return false;
            file << content;
            file.flush();
            if (!file.good()) {
                std::error_code ec;
                std::filesystem::remove(temp, ec);
                return false;
            }
        }
        std::filesystem::rename(temp, path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write " + path.string() + ": " + e.what());
        return false;
    }
}

ChecklistCounts countChecklist(const std::filesystem::path& tasksFile) noexcept {
    ChecklistCounts counts;
    try {
        auto content = readText(tasksFile);
        if (!content) {
            return counts;
        }
        for (const auto& line : splitLines(*content)) {
            if (line.rfind("- [", 0) != 0) continue;
            ++counts.total;
            if (line.rfind("- [x]", 0) == 0 || line.rfind("- [X]", 0) == 0) {
                ++counts.checked;
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Cannot read checklist " + tasksFile.string() + ": " + e.what());
        return ChecklistCounts{};
    }
    return counts;
}

int countFilledDecisionRows(const std::filesystem::path& specFile) noexcept {
    try {
        auto content = readText(specFile);
        if (!content) {
            return 0;
        }
        int filled = 0;
        for (const auto& line : splitLines(*content)) {
            auto cells = tableCells(line);
            if (cells.size() < 2 || cells[0].empty()) continue;
            if (!std::all_of(cells[0].begin(), cells[0].end(),
                             [](unsigned char c) { return std::isdigit(c); })) {
                continue;
            }
            if (line.find("TBD") != std::string::npos) continue;
            ++filled;
        }
        return filled;
    } catch (const std::exception& e) {
        LOG_WARN("Cannot read spec " + specFile.string() + ": " + e.what());
        return 0;
    }
}

std::set<Phase> completedPhases(const std::filesystem::path& statusFile) noexcept {
    std::set<Phase> done;
    try {
        auto content = readText(statusFile);
        if (!content) {
            return done;
        }
        for (const auto& line : splitLines(*content)) {
            if (line.find(kDoneMark) == std::string::npos) continue;
            if (auto phase = rowPhase(line)) {
                done.insert(*phase);
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Cannot read status table " + statusFile.string() + ": " + e.what());
        done.clear();
    }
    return done;
}

bool markPhaseComplete(const std::filesystem::path& statusFile, const FeatureId& id, Phase phase) {
    std::string content = readText(statusFile).value_or(statusTemplate(id));
    std::vector<std::string> lines = splitLines(content);

    bool found = false;
    std::size_t lastRow = lines.size();
    for (std::size_t i = 0; i < lines.size(); ++i) {
        auto rp = rowPhase(lines[i]);
        if (!rp) continue;
        lastRow = i;
        if (*rp != phase) continue;
        found = true;
        if (lines[i].find(kDoneMark) == std::string::npos) {
            lines[i] = completeRow(lines[i]);
        }
    }

    if (!found) {
        std::string row = std::string("| ") + displayName(phase) + " | " + kDoneMark + " |";
        if (lastRow < lines.size()) {
            lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(lastRow) + 1, row);
        } else {
            lines.push_back("");
            lines.push_back(row);
        }
    }

    return writeTextAtomic(statusFile, joinLines(lines));
}

bool wrapUpDone(const std::filesystem::path& wrapUpFile) noexcept {
    try {
        auto content = readText(wrapUpFile);
        if (!content) {
            return false;
        }
        for (const auto& marker : wrapUpDoneMarkers()) {
            if (content->find(marker) != std::string::npos) {
                return true;
            }
        }
    } catch (const std::exception& e) {
        LOG_WARN("Cannot read wrap-up record " + wrapUpFile.string() + ": " + e.what());
    }
    return false;
}

bool ensureWrapUpDone(const std::filesystem::path& wrapUpFile) {
    if (wrapUpDone(wrapUpFile)) {
        return true;
    }
    std::string content = readText(wrapUpFile).value_or("# Wrap-up\n");
    if (!content.empty() && content.back() != '\n') {
        content += '\n';
    }
    content += "\n" + wrapUpDoneMarkers().front() + " (" + timestamp() + ")\n";
    return writeTextAtomic(wrapUpFile, content);
}

bool appendSessionLog(const std::filesystem::path& sessionLog, const std::string& message) noexcept {
    try {
        std::filesystem::create_directories(sessionLog.parent_path());
        std::ofstream file(sessionLog, std::ios::app);
        if (!file) {
            LOG_WARN("Cannot open session log: " + sessionLog.string());
            return false;
        }
        file << "- [" << timestamp() << "] [featloop] " << message << "\n";
        file.flush();
        return file.good();
    } catch (const std::exception& e) {
        LOG_WARN("Failed to append session log " + sessionLog.string() + ": " + e.what());
        return false;
    }
}

}
