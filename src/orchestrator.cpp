/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/orchestrator.hpp"
#include "featloop/logger.hpp"
#include "featloop/process.hpp"
#include "featloop/workflow.hpp"
#include <algorithm>
#include <csignal>
#include <unistd.h>

namespace featloop {

namespace {
bool isResumable(const FeatureRecord& record) {
    return record.status == FeatureStatus::Running || record.status == FeatureStatus::Waiting;
}
}

Orchestrator::Orchestrator(Config config, VersionControl& vcs, CodeHosting& hosting, CodingAgent& agent)
    : config_(std::move(config)),
      vcs_(vcs),
      hosting_(hosting),
      state_(config_.resolve(config_.stateFile)),
      activity_(config_.resolve(config_.activityLog)),
      scanner_(config_.featuresIndex()),
      workspaces_(config_, vcs_),
      inspector_(vcs_, hosting_, config_.thresholds),
      executor_(agent, vcs_, hosting_, workspaces_, config_.implementBatch),
      watcher_(config_, vcs_, hosting_, workspaces_, state_, activity_),
      pool_(config_.maxParallel) {
    LOG_DEBUG("Orchestrator created - repo: " + config_.repoRoot.string() +
              ", max parallel: " + std::to_string(config_.maxParallel));
}

Orchestrator::~Orchestrator() {
    shutdown();
}

bool Orchestrator::initialize() {
    if (running_.load()) {
        LOG_WARN("Orchestrator already running");
        return false;
    }

    const int self = static_cast<int>(::getpid());
    try {
        auto current = state_.load().orchestrator;
        if (current.status == OrchestratorStatus::Running && current.pid != self &&
            isProcessAlive(static_cast<pid_t>(current.pid))) {
            LOG_ERROR("Another orchestrator is running (PID " + std::to_string(current.pid) + ")");
            return false;
        }

        activity_.ensureExists();
        state_.update([&](StateDocument& doc) {
            doc.orchestrator.status = OrchestratorStatus::Running;
            doc.orchestrator.startedAt = utcTimestamp();
            doc.orchestrator.maxParallel = config_.maxParallel;
            doc.orchestrator.pid = self;
        });
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot claim state file: " + std::string(e.what()));
        return false;
    }

    if (!recoverOrphanedFeatures()) {
        LOG_WARN("Some orphaned features could not be recovered");
    }

    if (!pool_.start([this](const FeatureId& id, int workerId) { processFeature(id, workerId); })) {
        LOG_ERROR("Failed to start worker pool");
        return false;
    }

    running_.store(true);
    done_.store(false);
    activity_.append("\xF0\x9F\x8E\xAD **Orchestrator started** (max parallel: " +
                     std::to_string(config_.maxParallel) + ")");
    LOG_INFO("Orchestrator started (max parallel: " + std::to_string(config_.maxParallel) + ")");
    return true;
}

bool Orchestrator::start() {
    setThreadName("Main");
    if (!initialize()) {
        return false;
    }
    try {
        pollThread_ = std::thread(&Orchestrator::pollLoop, this);
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start poll thread: " + std::string(e.what()));
        shutdown();
        return false;
    }
    return true;
}

void Orchestrator::shutdown() noexcept {
    if (!running_.load()) {
        return;
    }
    LOG_INFO("Shutting down orchestrator...");

    stop_.request();
    if (pollThread_.joinable()) {
        pollThread_.join();
    }
    pool_.stop();
    running_.store(false);

    if (!done_.load()) {
        try {
            state_.update([](StateDocument& doc) {
                doc.orchestrator.status = OrchestratorStatus::Stopped;
            });
        } catch (const std::exception& e) {
            LOG_ERROR("Failed to record shutdown: " + std::string(e.what()));
        }
        activity_.append("\xE2\x8F\xB9\xEF\xB8\x8F **Orchestrator stopped**");
    }
    LOG_INFO("Orchestrator shutdown complete");
}

bool Orchestrator::recoverOrphanedFeatures() noexcept {
    try {
        int recovered = 0;
        state_.update([&recovered](StateDocument& doc) {
            for (auto& [id, record] : doc.features) {
                if (record.status != FeatureStatus::Running) continue;
                LOG_WARN("Recovering orphaned feature: " + id);
                record.status = FeatureStatus::Waiting;
                record.pid = 0;
                record.updatedAt = utcTimestamp();
                ++recovered;
            }
        });
        if (recovered > 0) {
            LOG_INFO("Recovered " + std::to_string(recovered) + " orphaned feature(s)");
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Error recovering orphaned features: " + std::string(e.what()));
        return false;
    }
}

void Orchestrator::recordFailure(const FeatureId& id, const std::string& reason) {
    LOG_ERROR("Feature " + id + " failed: " + reason);
    try {
        auto record = state_.updateFeature(id, [this](FeatureRecord& r) {
            r.failures = std::min(r.failures + 1, config_.maxFailures);
            r.pid = 0;
            r.status = r.failures >= config_.maxFailures ? FeatureStatus::Paused : FeatureStatus::Waiting;
        });
        if (record.status == FeatureStatus::Paused) {
            activity_.append("\xE2\x8F\xB8\xEF\xB8\x8F **" + id + "** paused after " +
                             std::to_string(record.failures) + " consecutive failures: " + reason);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Cannot record failure for " + id + ": " + e.what());
    }
}

bool Orchestrator::ensureWorkspace(const FeatureId& id) {
    auto record = state_.feature(id);
    if (record && !record->workspace.empty()) {
        std::error_code ec;
        if (std::filesystem::exists(record->workspace, ec)) {
            return true;
        }
    }
    try {
        auto path = workspaces_.provision(id);
        state_.updateFeature(id, [&path](FeatureRecord& r) { r.workspace = path.string(); });
        return true;
    } catch (const std::exception& e) {
        recordFailure(id, std::string("workspace provisioning failed: ") + e.what());
        return false;
    }
}

bool Orchestrator::launch(const FeatureId& id) {
    if (!ensureWorkspace(id)) {
        return false;
    }
    state_.updateFeature(id, [](FeatureRecord& r) { r.status = FeatureStatus::Running; });
    if (!pool_.submit(id)) {
        state_.updateFeature(id, [](FeatureRecord& r) { r.status = FeatureStatus::Waiting; });
        return false;
    }
    auto record = state_.feature(id);
    activity_.append("\xF0\x9F\x9A\x80 Started loop for **" + id + "** (worktree: " +
                     (record ? record->workspace : std::string()) + ")");
    return true;
}

bool Orchestrator::pollOnce() {
    if (stop_.requested()) {
        return false;
    }

    const auto pending = scanner_.scan();
    StateDocument doc = state_.load();

    auto slotsFree = [this] {
        return static_cast<int>(pool_.inFlightCount()) < config_.maxParallel;
    };

    // Tracked features first, then new ones from the index
    for (const auto& [id, record] : doc.features) {
        if (!slotsFree()) break;
        if (!isResumable(record) || pool_.isInFlight(id)) continue;
        // The snapshot may predate a workflow that just finished
        auto current = state_.feature(id);
        if (!current || !isResumable(*current)) continue;
        LOG_INFO("Resuming feature: " + id + " (" + toString(current->phase) + ")");
        launch(id);
    }
    for (const auto& id : pending) {
        if (!slotsFree()) break;
        if (doc.isKnown(id)) continue;
        LOG_INFO("Found pending feature: " + id);
        state_.updateFeature(id, [](FeatureRecord& r) {
            r.status = FeatureStatus::Waiting;
            r.phase = Phase::Interview;
        });
        launch(id);
    }

    const auto retired = watcher_.pass(pool_.inFlight());
    for (const auto& id : retired) {
        LOG_INFO("Retired merged feature: " + id);
    }

    doc = state_.load();
    const auto inFlight = pool_.inFlight();
    const bool anyResumable = std::any_of(doc.features.begin(), doc.features.end(), [&](const auto& entry) {
        return isResumable(entry.second) && inFlight.count(entry.first) == 0;
    });
    const bool anyPending = std::any_of(pending.begin(), pending.end(), [&doc](const FeatureId& id) {
        return !doc.isKnown(id);
    });

    if (inFlight.empty() && !anyResumable && !anyPending) {
        state_.update([](StateDocument& d) { d.orchestrator.status = OrchestratorStatus::Complete; });
        activity_.append("\xF0\x9F\x8E\x89 **All features complete** - orchestrator idle");
        LOG_INFO("All features complete");
        done_.store(true);
        return true;
    }
    return false;
}

void Orchestrator::pollLoop() {
    setThreadName("Poll");
    LOG_DEBUG("Poll loop started");

    while (!stop_.requested()) {
        try {
            if (pollOnce()) {
                break;
            }
        } catch (const std::exception& e) {
            LOG_ERROR("Poll loop error: " + std::string(e.what()));
        }
        if (stop_.waitFor(config_.pollInterval)) {
            break;
        }
    }

    LOG_DEBUG("Poll loop stopped");
}

void Orchestrator::processFeature(const FeatureId& id, int workerId) {
    ScopedFeatureTag tag(id);
    try {
        auto record = state_.feature(id);
        if (!record) {
            LOG_WARN("Worker-" + std::to_string(workerId) + " got untracked feature: " + id);
            return;
        }

        FeatureContext ctx = workspaces_.context(id, record->workspace);
        FeatureWorkflow workflow(inspector_, executor_, state_, activity_, WorkflowOptions::from(config_));
        WorkflowOutcome outcome = workflow.run(ctx, stop_);
        LOG_INFO("Workflow for " + id + " ended: " + toString(outcome));

        if (outcome == WorkflowOutcome::Complete) {
            try {
                workspaces_.reclaim(ctx.workspace);
            } catch (const std::exception& e) {
                LOG_WARN("Could not reclaim workspace " + ctx.workspace.string() + ": " + e.what());
            }
            state_.update([&id](StateDocument& doc) { doc.retire(id, true); });
        }
    } catch (const FeatureRetired& e) {
        LOG_WARN("Feature " + id + " was retired while its workflow ran: " + e.what());
    } catch (const std::exception& e) {
        recordFailure(id, e.what());
    }
}

int stopOrchestrator(StateStore& state, ActivityLog& activity) {
    int signalled = 0;
    const pid_t self = ::getpid();
    state.update([&](StateDocument& doc) {
        for (auto& [id, record] : doc.features) {
            if (record.pid > 0 && record.pid != self && isProcessAlive(record.pid)) {
                LOG_INFO("Stopping worker for " + id + " (PID " + std::to_string(record.pid) + ")");
                if (terminateProcessGroup(record.pid)) ++signalled;
                record.status = FeatureStatus::Waiting;
            }
            record.pid = 0;
        }
        const int owner = doc.orchestrator.pid;
        if (owner > 0 && owner != self && isProcessAlive(owner)) {
            LOG_INFO("Stopping orchestrator (PID " + std::to_string(owner) + ")");
            if (::kill(owner, SIGTERM) == 0) ++signalled;
        }
        doc.orchestrator.status = OrchestratorStatus::Stopped;
    });
    activity.append("\xE2\x8F\xB9\xEF\xB8\x8F **Orchestrator stopped** by user");
    return signalled;
}

std::string resumeFeature(StateStore& state, ActivityLog& activity, const FeatureId& id) {
    std::string error;
    state.update([&](StateDocument& doc) {
        auto it = doc.features.find(id);
        if (it == doc.features.end()) {
            error = doc.isKnown(id) ? "feature is already retired: " + id : "unknown feature: " + id;
            return;
        }
        FeatureRecord& r = it->second;
        if (r.status == FeatureStatus::Running || r.status == FeatureStatus::Complete) {
            error = "feature is " + std::string(toString(r.status)) + ": " + id;
            return;
        }
        r.status = FeatureStatus::Waiting;
        r.failures = 0;
        r.updatedAt = utcTimestamp();
    });
    if (error.empty()) {
        activity.append("\xE2\x96\xB6\xEF\xB8\x8F **" + id + "** resumed by operator");
    }
    return error;
}

std::string checkStandaloneRun(const StateDocument& doc, const FeatureId& id) {
    if (doc.isCompleted(id) || doc.isFailed(id)) {
        return "feature is already retired: " + id;
    }
    auto it = doc.features.find(id);
    if (it != doc.features.end() && it->second.pid > 0 &&
        isProcessAlive(static_cast<pid_t>(it->second.pid))) {
        return "feature has a live worker (PID " + std::to_string(it->second.pid) + "): " + id;
    }
    // A live orchestrator resumes any Running record it finds, tracked before or not
    const OrchestratorRecord& owner = doc.orchestrator;
    if (owner.status == OrchestratorStatus::Running && owner.pid != static_cast<int>(::getpid()) &&
        isProcessAlive(static_cast<pid_t>(owner.pid))) {
        return "an orchestrator is running on this state file (PID " + std::to_string(owner.pid) +
               "), stop it first: " + id;
    }
    return "";
}

std::string abandonFeature(StateStore& state, ActivityLog& activity, WorkspaceManager& workspaces,
                           const FeatureId& id) {
    auto record = state.feature(id);
    if (!record) {
        return "unknown feature: " + id;
    }
    if (record->status == FeatureStatus::Running && record->pid > 0 && isProcessAlive(record->pid)) {
        return "feature has a live worker (PID " + std::to_string(record->pid) + "): " + id;
    }
    // Between agent calls a running workflow holds no child pid, only the owner's claim
    const OrchestratorRecord owner = state.load().orchestrator;
    if ((record->status == FeatureStatus::Running || record->status == FeatureStatus::Waiting) &&
        owner.status == OrchestratorStatus::Running && isProcessAlive(static_cast<pid_t>(owner.pid))) {
        return "feature is " + std::string(toString(record->status)) + " under a live orchestrator (PID " +
               std::to_string(owner.pid) + "), stop it first: " + id;
    }
    if (!record->workspace.empty()) {
        try {
            workspaces.reclaim(record->workspace);
        } catch (const std::exception& e) {
            LOG_WARN("Could not reclaim workspace " + record->workspace + ": " + e.what());
        }
    }
    state.update([&id](StateDocument& doc) { doc.retire(id, false); });
    activity.append("\xF0\x9F\x97\x91\xEF\xB8\x8F **" + id + "** abandoned by operator");
    return "";
}

}
