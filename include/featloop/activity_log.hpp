/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <mutex>
#include <string>

namespace featloop {

// Append-only markdown narrative for humans: "- **[YYYY-MM-DD HH:MM:SS]** message".
class ActivityLog {
public:
    explicit ActivityLog(std::filesystem::path file);

    ActivityLog(const ActivityLog&) = delete;
    ActivityLog& operator=(const ActivityLog&) = delete;

    // Writes the header if the file does not exist yet.
    bool ensureExists() noexcept;
    bool append(const std::string& message) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return file_; }

private:
    bool writeHeaderUnlocked() noexcept;

    std::filesystem::path file_;
    std::mutex mutex_;
};

}
