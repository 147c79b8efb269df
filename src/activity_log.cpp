/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/activity_log.hpp"
#include "featloop/logger.hpp"
#include <chrono>
#include <ctime>
#include <fstream>

namespace featloop {

ActivityLog::ActivityLog(std::filesystem::path file) : file_(std::move(file)) {
}

bool ActivityLog::writeHeaderUnlocked() noexcept {
    std::error_code ec;
    if (std::filesystem::exists(file_, ec)) {
        return true;
    }
    if (file_.has_parent_path()) {
        std::filesystem::create_directories(file_.parent_path(), ec);
    }
    std::ofstream out(file_);
    if (!out) {
        LOG_WARN("Cannot create activity log: " + file_.string());
        return false;
    }
    out << "# Feature Loop Activity\n\n"
        << "Chronological record of every autonomous workflow action.\n\n"
        << "---\n\n";
    return out.good();
}

bool ActivityLog::ensureExists() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return writeHeaderUnlocked();
}

bool ActivityLog::append(const std::string& message) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!writeHeaderUnlocked()) {
        return false;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);

    std::ofstream out(file_, std::ios::app);
    if (!out) {
        LOG_WARN("Cannot append to activity log: " + file_.string());
        return false;
    }
    out << "- **[" << stamp << "]** " << message << "\n";
    return out.good();
}

}
