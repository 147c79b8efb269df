/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/process.hpp"
#include "featloop/logger.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sstream>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace featloop {

namespace {
constexpr std::size_t kMaxOutput = 4 * 1024 * 1024;

std::string drain(int fd) {
    std::string result;
    char buffer[4096];
    while (true) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            if (result.size() < kMaxOutput) {
                result.append(buffer, static_cast<std::size_t>(n));
            }
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }
    if (result.size() >= kMaxOutput) {
        result += "\n[... output truncated ...]";
    }
    return result;
}

void childFailure(const char* message) noexcept {
    ssize_t ignored = ::write(STDERR_FILENO, message, std::strlen(message));
    (void)ignored;
}

std::string joinArgs(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) joined += ' ';
        joined += arg.size() > 60 ? arg.substr(0, 57) + "..." : arg;
    }
    return joined;
}
}

CommandResult runCommand(const std::vector<std::string>& args,
                         const std::filesystem::path& workdir,
                         const ChildObserver& observer) {
    if (args.empty()) {
        throw CommandError("Cannot execute empty command");
    }

    auto start = std::chrono::steady_clock::now();

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const char* dir = workdir.empty() ? nullptr : workdir.c_str();

    int out[2];
    if (::pipe2(out, O_CLOEXEC) != 0) {
        throw CommandError(std::string("Failed to create pipe: ") + std::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(out[0]);
        ::close(out[1]);
        throw CommandError(std::string("Failed to fork process: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Only async-signal-safe calls between fork and exec
        ::setpgid(0, 0);
        ::dup2(out[1], STDOUT_FILENO);
        ::dup2(out[1], STDERR_FILENO);

        int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
        }

        if (dir && ::chdir(dir) != 0) {
            childFailure("Failed to enter working directory\n");
            _exit(126);
        }

        ::execvp(argv[0], argv.data());
        childFailure("Failed to execute command\n");
        _exit(127);
    }

    // Also set from the parent so a signal sent right after fork reaches the group
    ::setpgid(pid, pid);
    ::close(out[1]);
    if (observer) {
        observer(pid);
    }
    LOG_TRACE("Spawned pid " + std::to_string(pid) + ": " + joinArgs(args));

    std::string output = drain(out[0]);
    ::close(out[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (observer) {
        observer(0);
    }

    if (waited < 0) {
        throw CommandError(std::string("Failed to wait for child process: ") + std::strerror(errno));
    }

    CommandResult result;
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exitCode = 128 + WTERMSIG(status);
    }
    result.output = std::move(output);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    return result;
}

CommandResult runChecked(const std::vector<std::string>& args, const std::filesystem::path& workdir) {
    CommandResult result = runCommand(args, workdir);
    if (!result.ok()) {
        std::string detail = result.output;
        if (detail.size() > 500) detail = detail.substr(0, 500);
        throw CommandError(joinArgs(args) + " exited with " + std::to_string(result.exitCode) +
                           (detail.empty() ? "" : ": " + detail), result.exitCode);
    }
    return result;
}

std::vector<std::string> expandCommand(const std::string& commandTemplate,
                                       const std::string& placeholder,
                                       const std::string& value) {
    std::vector<std::string> args;
    std::istringstream ss(commandTemplate);
    std::string token;
    while (ss >> token) {
        if (token == placeholder) {
            args.push_back(value);
            continue;
        }
        std::size_t pos = 0;
        while ((pos = token.find(placeholder, pos)) != std::string::npos) {
            token.replace(pos, placeholder.size(), value);
            pos += value.size();
        }
        args.push_back(token);
    }
    return args;
}

bool terminateProcessGroup(pid_t pid) noexcept {
    if (pid <= 0) {
        return false;
    }
    if (::kill(-pid, SIGTERM) == 0) {
        return true;
    }
    return ::kill(pid, SIGTERM) == 0;
}

bool isProcessAlive(pid_t pid) noexcept {
    if (pid <= 0) {
        return false;
    }
    if (::kill(pid, 0) == 0) {
        return true;
    }
    return errno == EPERM;
}

}
