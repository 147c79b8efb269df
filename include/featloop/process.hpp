/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sys/types.h>

namespace featloop {

struct CommandResult {
    int exitCode = -1;
    std::string output;     // stdout and stderr, interleaved
    std::chrono::milliseconds duration{0};

    [[nodiscard]] bool ok() const noexcept { return exitCode == 0; }
};

// Thrown when a required external command cannot be run or exits non-zero.
class CommandError : public std::runtime_error {
public:
    CommandError(const std::string& message, int exitCode = -1)
        : std::runtime_error(message), exitCode_(exitCode) {}
    [[nodiscard]] int exitCode() const noexcept { return exitCode_; }

private:
    int exitCode_;
};

// Called with the child pid right after fork, and with 0 once the child was reaped.
using ChildObserver = std::function<void(pid_t)>;

// Runs argv[0] from PATH with the given arguments, blocking until it exits.
// The child leads its own process group, so terminateProcessGroup(pid) also
// reaches anything it spawned.
// Throws CommandError if the process cannot be spawned; a non-zero exit is
// reported through the result.
CommandResult runCommand(const std::vector<std::string>& args,
                         const std::filesystem::path& workdir = {},
                         const ChildObserver& observer = {});

// Like runCommand but throws CommandError on a non-zero exit.
CommandResult runChecked(const std::vector<std::string>& args,
                         const std::filesystem::path& workdir = {});

// Splits a command template on whitespace and substitutes {placeholder} tokens.
// A token consisting only of a placeholder becomes exactly one argument.
std::vector<std::string> expandCommand(const std::string& commandTemplate,
                                       const std::string& placeholder,
                                       const std::string& value);

// SIGTERM to the process group led by pid, falling back to the pid alone.
bool terminateProcessGroup(pid_t pid) noexcept;

bool isProcessAlive(pid_t pid) noexcept;

}
