/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/report.hpp"
#include <string>

namespace featloop {

namespace {
class Style {
public:
    explicit Style(bool enabled) : enabled_(enabled) {}

    std::string operator()(const char* code, const std::string& text) const {
        return enabled_ ? std::string("\033[") + code + "m" + text + "\033[0m" : text;
    }

private:
    bool enabled_;
};

const char* statusColor(FeatureStatus status) {
    switch (status) {
        case FeatureStatus::Running: return "32";
        case FeatureStatus::Waiting: return "36";
        case FeatureStatus::NeedsInput: return "33;1";
        case FeatureStatus::Paused: return "31";
        case FeatureStatus::MaxIterations: return "33";
        case FeatureStatus::Complete: return "32;1";
    }
    return "0";
}

std::string pad(const std::string& text, std::size_t width) {
    return text.size() >= width ? text + " " : text + std::string(width - text.size(), ' ');
}
}

void renderStatus(const StateDocument& doc, std::ostream& out, const ReportOptions& options) {
    const Style s(options.color);
    const std::string rule(65, '-');
    const auto& o = doc.orchestrator;

    out << "\n  " << s("1", "featloop") << "  " << s("90", "feature workflow orchestrator") << "\n";
    out << "  " << s("90", rule) << "\n\n";

    std::string status = toString(o.status);
    if (o.status == OrchestratorStatus::Running && !options.ownerAlive) {
        status += " (stale)";
    }
    out << "  " << s("1", "ORCHESTRATOR") << "  " << status << "\n";
    if (o.pid > 0) out << "    PID           " << o.pid << "\n";
    if (o.maxParallel > 0) out << "    Max parallel  " << o.maxParallel << "\n";
    if (!o.startedAt.empty()) out << "    Started       " << o.startedAt << "\n";
    out << "\n";

    out << "  " << s("1", "FEATURES") << "  " << s("90", std::to_string(doc.features.size()) + " active") << "\n\n";
    if (doc.features.empty()) {
        out << "    " << s("90", "none") << "\n";
    } else {
        out << "    " << s("90", pad("ID", 26) + pad("STATUS", 16) + pad("PHASE", 11) + pad("ITER", 6) + "FAIL") << "\n";
        for (const auto& [id, r] : doc.features) {
            out << "    " << s("36", pad(id, 26))
                << s(statusColor(r.status), pad(toString(r.status), 16))
                << pad(displayName(r.phase), 11)
                << pad(std::to_string(r.iterations), 6)
                << (r.failures > 0 ? s("31", std::to_string(r.failures)) : std::to_string(r.failures))
                << "\n";
            if (!r.workspace.empty()) {
                out << "      " << s("90", r.workspace) << "\n";
            }
        }
    }
    out << "\n";

    out << "  " << s("1", "COMPLETED") << "  " << s("32", std::to_string(doc.completed.size())) << "\n";
    for (const auto& id : doc.completed) {
        out << "    " << id << "\n";
    }
    out << "\n";

    out << "  " << s("1", "FAILED") << "  " << s(doc.failed.empty() ? "90" : "31", std::to_string(doc.failed.size())) << "\n";
    for (const auto& id : doc.failed) {
        out << "    " << id << "\n";
    }
    out << "\n";
}

}
