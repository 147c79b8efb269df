/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/executor.hpp"
#include "featloop/artifacts.hpp"
#include "featloop/logger.hpp"
#include "featloop/signals.hpp"
#include <cctype>
#include <regex>
#include <sstream>

namespace featloop {

namespace {
bool fileExists(const std::filesystem::path& path) noexcept {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

bool planDone(const FeatureLayout& layout) noexcept {
    return fileExists(layout.design()) && fileExists(layout.tasks());
}

std::string bookkeepingInstruction(const FeatureContext& ctx, Phase phase, const std::string& detail,
                                   Signal signal) {
    std::ostringstream out;
    out << "Update " << ctx.layout.relative(ctx.layout.status()) << " to mark the "
        << displayName(phase) << " phase as done (\xE2\x9C\x85).\n"
        << detail << "\n\n"
        << "Emit: " << phaseToken(signal) << "\n";
    return out.str();
}
}

std::string phaseInstruction(Phase phase, const FeatureContext& ctx, int implementBatch) {
    const auto& l = ctx.layout;
    const std::string spec = l.relative(l.spec());
    const std::string status = l.relative(l.status());
    const std::string log = l.relative(l.sessionLog());
    std::ostringstream out;

    switch (phase) {
        case Phase::Interview:
            out << "INTERVIEW phase for " << ctx.id << ".\n\n"
                << "1. Read " << spec << ".\n"
                << "2. Fill every TBD cell of the Technical Decisions table with a concrete, sensible choice.\n"
                << "3. Mark Interview as done in " << status << ".\n"
                << "4. Add a checkpoint line to " << log << ".\n\n"
                << "When the decisions are recorded, emit: " << phaseToken(Signal::InterviewComplete) << "\n"
                << "If a decision cannot be made without a human, emit: "
                << phaseToken(Signal::InterviewNeedsInput) << "\n";
            break;
        case Phase::Plan:
            out << "PLAN phase for " << ctx.id << ".\n\n"
                << "1. Read " << spec << " for the requirements.\n"
                << "2. Write " << l.relative(l.design()) << ": architecture, data model, API and file layout.\n"
                << "3. Write " << l.relative(l.tasks()) << " as an ordered checklist, one \"- [ ]\" line per task.\n"
                << "4. Mark Plan as done in " << status << ".\n"
                << "5. Add a checkpoint line to " << log << ".\n\n"
                << "When both documents exist, emit: " << phaseToken(Signal::PlanComplete) << "\n";
            break;
        case Phase::Branch:
            out << bookkeepingInstruction(ctx, phase, "Record the branch name: " + ctx.featureBranch,
                                          Signal::BranchComplete);
            break;
        case Phase::Implement: {
            auto counts = countChecklist(l.tasks());
            out << "IMPLEMENT phase for " << ctx.id << " on branch " << ctx.featureBranch << ".\n"
                << "Progress: " << counts.checked << "/" << counts.total << " tasks done.\n\n"
                << "1. Read " << l.relative(l.tasks()) << " and pick the next open \"- [ ]\" tasks.\n"
                << "2. Complete up to " << implementBatch << " of them. For each one:\n"
                << "   - implement and test the change\n"
                << "   - change its line to \"- [x]\"\n"
                << "   - commit: git add -A && git commit -m \"" << ctx.id << ": <task>\"\n"
                << "3. Update the progress in " << status << ".\n"
                << "4. Add a log line to " << log << ".\n\n"
                << "If every task is done, emit: " << phaseToken(Signal::ImplementComplete) << "\n"
                << "If tasks remain, emit: " << phaseToken(Signal::ImplementProgress) << "\n";
            break;
        }
        case Phase::PR:
            out << bookkeepingInstruction(ctx, phase, "Add the pull request link if it is available.",
                                          Signal::PrComplete);
            break;
        case Phase::WrapUp:
            out << "WRAP-UP phase for " << ctx.id << ". This is the final phase.\n\n"
                << "1. Create or update " << l.relative(l.wrapUp()) << " with:\n"
                << "   - dates and the pull request number\n"
                << "   - a summary of what was delivered\n"
                << "   - metrics taken from " << l.relative(l.tasks()) << "\n"
                << "   - key decisions and learnings\n"
                << "2. Mark Wrap-up as done in " << status << ".\n"
                << "3. Add a final line to " << log << ".\n\n"
                << "When finished, emit: " << phaseToken(Signal::WrapUpComplete) << "\n"
                << "Then emit: " << phaseToken(Signal::FeatureComplete) << "\n";
            break;
        case Phase::Merge:
        case Phase::Complete:
            break;
    }
    return out.str();
}

std::string pullRequestTitle(const FeatureId& id) {
    static const std::regex prefix("^[Ff][Ee][Aa][Tt]-[0-9]+-?");
    std::string words = std::regex_replace(id, prefix, "");
    for (auto& c : words) {
        if (c == '-' || c == '_') c = ' ';
    }
    if (words.empty()) {
        return id;
    }
    words[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(words[0])));
    return id + ": " + words;
}

std::string pullRequestBody(const FeatureContext& ctx) {
    std::ostringstream out;
    out << "## Summary\n\n"
        << "Automated pull request for " << ctx.id << ".\n"
        << "Specification and design: `" << ctx.layout.relative(ctx.layout.dir()) << "/`\n\n"
        << "## Checklist\n"
        << "- [x] Implementation complete\n"
        << "- [x] Tests passing\n"
        << "- [ ] Review approved\n";
    return out.str();
}

AgentPhaseExecutor::AgentPhaseExecutor(CodingAgent& agent, VersionControl& vcs, CodeHosting& hosting,
                                       WorkspaceManager& workspaces, int implementBatch)
    : agent_(agent), vcs_(vcs), hosting_(hosting), workspaces_(workspaces), implementBatch_(implementBatch) {
}

PhaseOutcome AgentPhaseExecutor::execute(Phase phase, const FeatureContext& ctx, const ChildObserver& onWorker) {
    LOG_INFO("Executing " + std::string(displayName(phase)) + " phase for " + ctx.id);

    PhaseOutcome outcome = PhaseOutcome::Failed;
    try {
        switch (phase) {
            case Phase::Interview: outcome = interview(ctx, onWorker); break;
            case Phase::Plan: outcome = plan(ctx, onWorker); break;
            case Phase::Branch: outcome = branch(ctx, onWorker); break;
            case Phase::Implement: outcome = implement(ctx, onWorker); break;
            case Phase::PR: outcome = pullRequest(ctx, onWorker); break;
            case Phase::Merge: outcome = merge(ctx); break;
            case Phase::WrapUp: outcome = wrapUp(ctx, onWorker); break;
            case Phase::Complete:
                LOG_WARN("Nothing to execute for a complete feature: " + ctx.id);
                outcome = PhaseOutcome::Complete;
                break;
        }
        recordBookkeeping(phase, outcome, ctx);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string(displayName(phase)) + " phase failed for " + ctx.id + ": " + e.what());
        outcome = PhaseOutcome::Failed;
    }

    appendSessionLog(ctx.layout.sessionLog(),
                     std::string(displayName(phase)) + " phase: " + toString(outcome));
    LOG_INFO(std::string(displayName(phase)) + " phase for " + ctx.id + " -> " + toString(outcome));
    return outcome;
}

AgentReply AgentPhaseExecutor::ask(const std::string& instruction, const FeatureContext& ctx,
                                   const ChildObserver& onWorker) {
    AgentReply reply = agent_.invoke(instruction, ctx.workspace, onWorker);
    if (!reply.ok) {
        LOG_WARN("Agent " + agent_.name() + " reported an error for " + ctx.id + ": " + reply.error);
    }
    return reply;
}

void AgentPhaseExecutor::recordBookkeeping(Phase phase, PhaseOutcome outcome, const FeatureContext& ctx) {
    const auto& status = ctx.layout.status();
    if (outcome == PhaseOutcome::Success && phase != Phase::WrapUp && phase != Phase::Complete) {
        if (!markPhaseComplete(status, ctx.id, phase)) {
            LOG_WARN("Could not mark " + std::string(displayName(phase)) + " done in " + status.string());
        }
    } else if (outcome == PhaseOutcome::Complete) {
        if (!markPhaseComplete(status, ctx.id, Phase::WrapUp) || !ensureWrapUpDone(ctx.layout.wrapUp())) {
            LOG_WARN("Could not record wrap-up completion for " + ctx.id);
        }
    }
}

PhaseOutcome AgentPhaseExecutor::interview(const FeatureContext& ctx, const ChildObserver& onWorker) {
    auto reply = ask(phaseInstruction(Phase::Interview, ctx, implementBatch_), ctx, onWorker);
    // The instruction quotes its own tokens, so a failed agent's echo proves nothing
    if (!reply.ok) {
        return PhaseOutcome::Failed;
    }
    auto signals = parseSignals(reply.output);
    if (signals.has(Signal::InterviewComplete)) {
        return PhaseOutcome::Success;
    }
    if (signals.has(Signal::InterviewNeedsInput)) {
        return PhaseOutcome::NeedsInput;
    }
    return PhaseOutcome::Failed;
}

PhaseOutcome AgentPhaseExecutor::plan(const FeatureContext& ctx, const ChildObserver& onWorker) {
    if (planDone(ctx.layout)) {
        LOG_INFO("Plan already complete for " + ctx.id);
        return PhaseOutcome::Success;
    }
    (void)ask(phaseInstruction(Phase::Plan, ctx, implementBatch_), ctx, onWorker);
    return planDone(ctx.layout) ? PhaseOutcome::Success : PhaseOutcome::Failed;
}

PhaseOutcome AgentPhaseExecutor::branch(const FeatureContext& ctx, const ChildObserver& onWorker) {
    if (vcs_.branchExists(ctx.featureBranch)) {
        LOG_INFO("Branch already exists: " + ctx.featureBranch);
        vcs_.checkout(ctx.workspace, ctx.featureBranch);
        return PhaseOutcome::Success;
    }

    workspaces_.createFeatureBranch(ctx);
    (void)ask(phaseInstruction(Phase::Branch, ctx, implementBatch_), ctx, onWorker);
    return PhaseOutcome::Success;
}

PhaseOutcome AgentPhaseExecutor::implement(const FeatureContext& ctx, const ChildObserver& onWorker) {
    const auto before = countChecklist(ctx.layout.tasks());
    LOG_INFO("Tasks for " + ctx.id + ": " + std::to_string(before.checked) + "/" +
             std::to_string(before.total) + " complete");
    if (before.unchecked() == 0) {
        return PhaseOutcome::Success;
    }

    (void)ask(phaseInstruction(Phase::Implement, ctx, implementBatch_), ctx, onWorker);

    const auto after = countChecklist(ctx.layout.tasks());
    if (after.total > 0 && after.unchecked() == 0) {
        return PhaseOutcome::Success;
    }
    if (after.checked > before.checked) {
        return PhaseOutcome::Progress;
    }
    LOG_WARN("No checklist progress for " + ctx.id);
    return PhaseOutcome::Failed;
}

PhaseOutcome AgentPhaseExecutor::pullRequest(const FeatureContext& ctx, const ChildObserver& onWorker) {
    if (hosting_.getPullRequestState(ctx.workspace, ctx.featureBranch) != PullRequestState::None) {
        LOG_INFO("Pull request already exists for " + ctx.featureBranch);
        return PhaseOutcome::Success;
    }

    vcs_.pushBranch(ctx.workspace, ctx.featureBranch);
    hosting_.createPullRequest(ctx.workspace, ctx.featureBranch, pullRequestTitle(ctx.id), pullRequestBody(ctx));
    (void)ask(phaseInstruction(Phase::PR, ctx, implementBatch_), ctx, onWorker);
    return PhaseOutcome::Success;
}

PhaseOutcome AgentPhaseExecutor::merge(const FeatureContext& ctx) {
    switch (hosting_.getPullRequestState(ctx.workspace, ctx.featureBranch)) {
        case PullRequestState::Open:
            LOG_INFO("Pull request for " + ctx.id + " is open, waiting for review");
            return PhaseOutcome::Progress;
        case PullRequestState::Merged:
            return PhaseOutcome::Success;
        case PullRequestState::Closed:
            LOG_ERROR("Pull request for " + ctx.id + " was closed without merging");
            return PhaseOutcome::Failed;
        case PullRequestState::None:
            break;
    }
    LOG_ERROR("No pull request found for " + ctx.featureBranch);
    return PhaseOutcome::Failed;
}

PhaseOutcome AgentPhaseExecutor::wrapUp(const FeatureContext& ctx, const ChildObserver& onWorker) {
    auto reply = ask(phaseInstruction(Phase::WrapUp, ctx, implementBatch_), ctx, onWorker);
    if (!reply.ok) {
        return PhaseOutcome::Failed;
    }
    auto signals = parseSignals(reply.output);
    if (signals.has(Signal::WrapUpComplete) && signals.has(Signal::FeatureComplete)) {
        return PhaseOutcome::Complete;
    }
    return PhaseOutcome::Failed;
}

}
