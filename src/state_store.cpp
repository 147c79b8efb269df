/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "featloop/state_store.hpp"
#include "featloop/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <fstream>
#include <fcntl.h>
#include <nlohmann/json.hpp>
#include <sys/file.h>
#include <unistd.h>

using json = nlohmann::json;

namespace featloop {

// JSON mapping, found by nlohmann through ADL.
void to_json(json& j, const OrchestratorRecord& r) {
    j = json{{"status", toString(r.status)},
             {"started_at", r.startedAt},
             {"max_parallel", r.maxParallel},
             {"pid", r.pid}};
}

void from_json(const json& j, OrchestratorRecord& r) {
    r.status = parseOrchestratorStatus(j.value("status", "idle")).value_or(OrchestratorStatus::Idle);
    r.startedAt = j.value("started_at", "");
    r.maxParallel = j.value("max_parallel", 0);
    r.pid = j.value("pid", 0);
}

void to_json(json& j, const FeatureRecord& r) {
    j = json{{"status", toString(r.status)},
             {"phase", toString(r.phase)},
             {"iterations", r.iterations},
             {"failures", r.failures},
             {"worktree", r.workspace},
             {"pid", r.pid},
             {"started_at", r.startedAt},
             {"updated_at", r.updatedAt}};
}

void from_json(const json& j, FeatureRecord& r) {
    r.status = parseFeatureStatus(j.value("status", "waiting")).value_or(FeatureStatus::Waiting);
    r.phase = parsePhase(j.value("phase", "interview")).value_or(Phase::Interview);
    r.iterations = j.value("iterations", 0);
    r.failures = j.value("failures", 0);
    r.workspace = j.value("worktree", "");
    r.pid = j.value("pid", 0);
    r.startedAt = j.value("started_at", "");
    r.updatedAt = j.value("updated_at", "");
}

namespace {
// Holds an advisory lock on a sidecar file for the lifetime of the object.
class FileLock {
public:
    FileLock(const std::filesystem::path& path, int operation) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            throw StateError("Cannot open lock file " + path.string() + ": " + std::strerror(errno));
        }
        int rc;
        do {
            rc = ::flock(fd_, operation);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0) {
            int err = errno;
            ::close(fd_);
            throw StateError("Cannot lock " + path.string() + ": " + std::strerror(err));
        }
    }

    ~FileLock() {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }

    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

std::map<FeatureId, FeatureRecord> readRecords(const json& j) {
    std::map<FeatureId, FeatureRecord> records;
    if (!j.is_object()) {
        return records;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        FeatureRecord record = it.value().get<FeatureRecord>();
        record.id = it.key();
        records.emplace(it.key(), std::move(record));
    }
    return records;
}

json writeRecords(const std::map<FeatureId, FeatureRecord>& records) {
    json j = json::object();
    for (const auto& [id, record] : records) {
        j[id] = record;
    }
    return j;
}

void appendUnique(std::vector<FeatureId>& list, const FeatureId& id) {
    if (std::find(list.begin(), list.end(), id) == list.end()) {
        list.push_back(id);
    }
}
}

bool StateDocument::isCompleted(const FeatureId& id) const {
    return std::find(completed.begin(), completed.end(), id) != completed.end();
}

bool StateDocument::isFailed(const FeatureId& id) const {
    return std::find(failed.begin(), failed.end(), id) != failed.end();
}

bool StateDocument::isKnown(const FeatureId& id) const {
    return features.count(id) > 0 || isCompleted(id) || isFailed(id);
}

void StateDocument::retire(const FeatureId& id, bool completedOk) {
    auto it = features.find(id);
    if (it != features.end()) {
        FeatureRecord record = it->second;
        record.workspace.clear();
        record.pid = 0;
        if (completedOk) {
            record.status = FeatureStatus::Complete;
            record.phase = Phase::Complete;
        }
        record.updatedAt = utcTimestamp();
        archive[id] = std::move(record);
        features.erase(it);
    }
    appendUnique(completedOk ? completed : failed, id);
}

std::string utcTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&time, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::string serialize(const StateDocument& doc) {
    json j;
    j["orchestrator"] = doc.orchestrator;
    j["features"] = writeRecords(doc.features);
    j["completed"] = doc.completed;
    j["failed"] = doc.failed;
    j["archive"] = writeRecords(doc.archive);
    return j.dump(2) + "\n";
}

StateDocument deserialize(const std::string& text) {
    StateDocument doc;
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return doc;
    }
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw StateError("State document is not a JSON object");
        }
        if (j.contains("orchestrator")) {
            doc.orchestrator = j["orchestrator"].get<OrchestratorRecord>();
        }
        if (j.contains("features")) {
            doc.features = readRecords(j["features"]);
        }
        if (j.contains("completed") && j["completed"].is_array()) {
            doc.completed = j["completed"].get<std::vector<FeatureId>>();
        }
        if (j.contains("failed") && j["failed"].is_array()) {
            doc.failed = j["failed"].get<std::vector<FeatureId>>();
        }
        if (j.contains("archive")) {
            doc.archive = readRecords(j["archive"]);
        }
    } catch (const json::exception& e) {
        throw StateError(std::string("Malformed state document: ") + e.what());
    }
    return doc;
}

StateStore::StateStore(std::filesystem::path file)
    : file_(std::move(file)), lockFile_(file_.string() + ".lock") {
}

StateDocument StateStore::readUnlocked() const {
    std::ifstream in(file_, std::ios::binary);
    if (!in) {
        return StateDocument{};
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return deserialize(text);
}

void StateStore::writeUnlocked(const StateDocument& doc) const {
    auto temp = file_;
    temp += ".tmp." + std::to_string(::getpid());
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw StateError("Cannot write " + temp.string());
        }
        out << serialize(doc);
        out.flush();
        if (!out.good()) {
            std::error_code ec;
            std::filesystem::remove(temp, ec);
            throw StateError("Short write to " + temp.string());
        }
    }
    std::error_code ec;
    std::filesystem::rename(temp, file_, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        throw StateError("Cannot publish " + file_.string() + ": " + ec.message());
    }
}

StateDocument StateStore::load() const {
    std::lock_guard<std::mutex> guard(mutex_);
    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        return StateDocument{};
    }
    FileLock lock(lockFile_, LOCK_SH);
    return readUnlocked();
}

StateDocument StateStore::update(const Mutator& fn) {
    std::lock_guard<std::mutex> guard(mutex_);
    if (file_.has_parent_path()) {
        std::filesystem::create_directories(file_.parent_path());
    }
    FileLock lock(lockFile_, LOCK_EX);
    StateDocument doc = readUnlocked();
    fn(doc);
    writeUnlocked(doc);
    LOG_TRACE("State written: " + file_.string());
    return doc;
}

FeatureRecord StateStore::updateFeature(const FeatureId& id, const std::function<void(FeatureRecord&)>& fn) {
    FeatureRecord result;
    update([&](StateDocument& doc) {
        if (doc.isCompleted(id) || doc.isFailed(id)) {
            throw FeatureRetired("feature is already retired: " + id);
        }
        auto [it, inserted] = doc.features.try_emplace(id);
        FeatureRecord& record = it->second;
        if (inserted) {
            record.id = id;
            record.startedAt = utcTimestamp();
        }
        const int iterations = record.iterations;
        fn(record);
        record.iterations = std::max(record.iterations, iterations);
        record.updatedAt = utcTimestamp();
        result = record;
    });
    return result;
}

std::optional<FeatureRecord> StateStore::feature(const FeatureId& id) const {
    StateDocument doc = load();
    auto it = doc.features.find(id);
    if (it == doc.features.end()) {
        return std::nullopt;
    }
    return it->second;
}

}
