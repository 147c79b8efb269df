/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>

namespace featloop {

enum class LogLevel : uint8_t { 
    ERROR = 0, 
    WARN = 1, 
    INFO = 2, 
    DEBUG = 3, 
    TRACE = 4 
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    static void initFromEnv() noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Mirror every line to a file as well as stderr. Empty path disables it.
    static bool setLogFile(const std::filesystem::path& path) noexcept;
    
    static void log(LogLevel level, const std::string& message) noexcept;
    
    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for better logging context
void setThreadName(const std::string& name);
std::string getThreadName(int worker_id);

// Tags every line logged from this thread with the feature being worked on.
// Pass an empty id to clear.
void setThreadFeature(const std::string& featureId);

class ScopedFeatureTag {
public:
    explicit ScopedFeatureTag(const std::string& featureId) { setThreadFeature(featureId); }
    ~ScopedFeatureTag() { setThreadFeature(""); }

    ScopedFeatureTag(const ScopedFeatureTag&) = delete;
    ScopedFeatureTag& operator=(const ScopedFeatureTag&) = delete;
};

}

// Convenience macros for common usage
#define LOG_ERROR(msg) ::featloop::Logger::error(msg)
#define LOG_WARN(msg)  ::featloop::Logger::warn(msg)  
#define LOG_INFO(msg)  ::featloop::Logger::info(msg)
#define LOG_DEBUG(msg) ::featloop::Logger::debug(msg)
#define LOG_TRACE(msg) ::featloop::Logger::trace(msg)
