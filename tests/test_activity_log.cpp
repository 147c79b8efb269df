/*
 * featloop - Autonomous Feature Workflow Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include <gtest/gtest.h>
#include <regex>
#include <thread>
#include <vector>

#include "fakes.hpp"
#include "featloop/activity_log.hpp"

namespace featloop {
namespace {

using testing::TempDir;
using testing::readFile;

int countLines(const std::string& content, const std::string& prefix) {
    int n = 0;
    std::size_t pos = 0;
    while ((pos = content.find("\n" + prefix, pos)) != std::string::npos) {
        ++n;
        ++pos;
    }
    return n;
}

TEST(ActivityLogTest, CreatesHeaderOnce) {
    TempDir dir;
    ActivityLog log(dir.path() / "activity.md");
    ASSERT_TRUE(log.ensureExists());
    ASSERT_TRUE(log.ensureExists());
    auto content = readFile(log.path());
    EXPECT_EQ(content.find("# Feature Loop Activity"), 0u);
    EXPECT_EQ(content.find("# Feature Loop Activity"), content.rfind("# Feature Loop Activity"));
}

TEST(ActivityLogTest, AppendsTimestampedLines) {
    TempDir dir;
    ActivityLog log(dir.path() / "nested" / "activity.md");
    ASSERT_TRUE(log.append("Started loop for **FEAT-001-a**"));
    ASSERT_TRUE(log.append("**FEAT-001-a** complete"));

    auto content = readFile(log.path());
    static const std::regex line(R"(- \*\*\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\]\*\* Started loop for \*\*FEAT-001-a\*\*)");
    EXPECT_TRUE(std::regex_search(content, line)) << content;
    EXPECT_LT(content.find("Started loop"), content.find("complete"));
}

TEST(ActivityLogTest, ConcurrentAppendsKeepWholeLines) {
    TempDir dir;
    ActivityLog log(dir.path() / "activity.md");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&log, t] {
            for (int i = 0; i < 20; ++i) {
                log.append("worker " + std::to_string(t) + " line " + std::to_string(i));
            }
        });
    }
    for (auto& thread : threads) thread.join();

    EXPECT_EQ(countLines(readFile(log.path()), "- **["), 80);
}

}
}
