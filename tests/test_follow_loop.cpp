#include <gtest/gtest.h>
#include <managers/follow_loop.hpp>
#include <core/errors.hpp>
#include <platform/interrupt.hpp>
#include "test_support.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <system_error>

namespace fs = std::filesystem;

namespace {

// Each fetch serves the next remote snapshot; the last one repeats.
class ScriptedFetcher : public LogFetcher {
public:
    std::vector<std::string> snapshots;
    int calls = 0;
    int fail_on_call = -1;
    std::function<void()> failure = [] { throw ForgeError("API error 502", 502); };

    void fetch_log(const std::string&, const std::string&, std::uintmax_t start_offset,
                   const fs::path& dest) override {
        int n = calls++;
        if (n == fail_on_call) failure();
        const std::string& remote = snapshots[std::min<size_t>(n, snapshots.size() - 1)];
        std::ofstream out(dest, std::ios::binary | std::ios::trunc);
        if (start_offset < remote.size()) out << remote.substr(start_offset);
    }
};

class ScriptedStatus : public JobStatusProvider {
public:
    std::vector<std::string> statuses;
    int calls = 0;
    std::function<void(int)> on_call;

    std::string current_status(const std::string&) override {
        int n = calls++;
        if (on_call) on_call(n);
        const std::string& s = statuses[std::min<size_t>(n, statuses.size() - 1)];
        if (s == "!") throw BridgeError("status lookup failed");
        return s;
    }
};

} // namespace

class FollowLoopTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::unique_ptr<JobStore> store;
    std::unique_ptr<LogSyncCache> cache;
    ScriptedFetcher fetcher;
    ScriptedStatus status;
    FakeClock clock;
    std::vector<FollowEvent> events;

    void SetUp() override {
        platform::clear_interrupt();
        test_dir = fs::temp_directory_path() / "bridgectl_follow_test";
        fs::remove_all(test_dir);
        store = std::make_unique<JobStore>(test_dir / "jobs.yaml");
        cache = std::make_unique<LogSyncCache>(*store, test_dir / "logs");
    }

    void TearDown() override {
        platform::clear_interrupt();
        fs::remove_all(test_dir);
    }

    std::string run() {
        FollowLoop loop(*cache, fetcher, status, clock.clock(), std::chrono::seconds(30));
        return loop.run("77", "/scratch/77.out", false,
                        [this](const FollowEvent& ev) { events.push_back(ev); });
    }

    std::vector<FollowEvent> of_kind(FollowEvent::Kind kind) const {
        std::vector<FollowEvent> out;
        for (const auto& ev : events) {
            if (ev.kind == kind) out.push_back(ev);
        }
        return out;
    }
};

TEST_F(FollowLoopTest, EmitsDeltasUntilTerminal) {
    fetcher.snapshots = {"a\n", "a\nb\n", "a\nb\nc\n", "a\nb\nc\nd\n"};
    status.statuses = {"RUNNING", "SUCCEEDED"};

    EXPECT_EQ(run(), "SUCCEEDED");

    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.front().kind, FollowEvent::Kind::InitialContent);
    EXPECT_EQ(events.front().content, "a\n");

    auto fresh = of_kind(FollowEvent::Kind::NewContent);
    ASSERT_EQ(fresh.size(), 2u);
    EXPECT_EQ(fresh[0].content, "b\n");
    EXPECT_EQ(fresh[1].content, "c\n");

    auto final_content = of_kind(FollowEvent::Kind::FinalContent);
    ASSERT_EQ(final_content.size(), 1u);
    EXPECT_EQ(final_content[0].content, "d\n");

    EXPECT_EQ(events.back().kind, FollowEvent::Kind::Completed);
    EXPECT_EQ(events.back().status, "SUCCEEDED");
    EXPECT_EQ(fetcher.calls, 4);

    // Two intervals plus the grace period, all on the virtual clock.
    EXPECT_EQ(clock.slept, std::chrono::milliseconds(2 * 30000 + FOLLOW_MEDIATED_GRACE_MS));
}

TEST_F(FollowLoopTest, UsesExistingCacheWithoutInitialFetch) {
    fs::create_directories(test_dir / "logs");
    std::ofstream(test_dir / "logs" / "77.log") << "cached\n";
    fetcher.snapshots = {"cached\nmore\n"};
    status.statuses = {"FAILED"};

    EXPECT_EQ(run(), "FAILED");
    EXPECT_EQ(events.front().content, "cached\n");
    EXPECT_EQ(of_kind(FollowEvent::Kind::NewContent)[0].content, "more\n");
    // one interval fetch plus the final one
    EXPECT_EQ(fetcher.calls, 2);
}

TEST_F(FollowLoopTest, FailuresBecomeWarnings) {
    fetcher.snapshots = {"x\n", "x\ny\n"};
    fetcher.fail_on_call = 1;
    status.statuses = {"!", "RUNNING", "CANCELLED"};

    EXPECT_EQ(run(), "CANCELLED");
    auto warnings = of_kind(FollowEvent::Kind::Warning);
    ASSERT_EQ(warnings.size(), 2u);
    EXPECT_NE(warnings[0].message.find("Fetch failed"), std::string::npos);
    EXPECT_NE(warnings[1].message.find("Status check failed"), std::string::npos);
    EXPECT_EQ(of_kind(FollowEvent::Kind::NewContent)[0].content, "y\n");
}

TEST_F(FollowLoopTest, ShrunkLogIsShownAgain) {
    fetcher.snapshots = {"long line one\n", "new\n"};
    status.statuses = {"SUCCEEDED"};

    run();
    auto warnings = of_kind(FollowEvent::Kind::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_EQ(of_kind(FollowEvent::Kind::NewContent)[0].content, "new\n");
}

TEST_F(FollowLoopTest, InterruptStopsWithEmptyStatus) {
    fetcher.snapshots = {"a\n"};
    status.statuses = {"RUNNING"};
    status.on_call = [](int) { platform::request_interrupt(); };

    EXPECT_EQ(run(), "");
    EXPECT_EQ(events.back().kind, FollowEvent::Kind::Interrupted);
    EXPECT_EQ(status.calls, 1);
    EXPECT_TRUE(of_kind(FollowEvent::Kind::Completed).empty());
}

TEST_F(FollowLoopTest, FirstFetchErrorPropagates) {
    fetcher.snapshots = {""};
    fetcher.fail_on_call = 0;
    status.statuses = {"RUNNING"};

    EXPECT_THROW(run(), ForgeError);
    EXPECT_TRUE(events.empty());
}

TEST_F(FollowLoopTest, LocalWriteFailureDoesNotEndFollow) {
    fetcher.snapshots = {"x\n", "x\n", "x\ny\n"};
    fetcher.fail_on_call = 1;
    fetcher.failure = [] { throw BridgeError("Cannot write /tmp/77.tmp"); };
    status.statuses = {"RUNNING", "SUCCEEDED"};

    EXPECT_EQ(run(), "SUCCEEDED");
    auto warnings = of_kind(FollowEvent::Kind::Warning);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].message.find("Cannot write"), std::string::npos);
    EXPECT_EQ(of_kind(FollowEvent::Kind::NewContent)[0].content, "y\n");
    EXPECT_EQ(events.back().kind, FollowEvent::Kind::Completed);
}

TEST_F(FollowLoopTest, FilesystemErrorBecomesWarning) {
    fetcher.snapshots = {"x\n"};
    fetcher.fail_on_call = 1;
    fetcher.failure = [] {
        throw fs::filesystem_error("rename", std::make_error_code(std::errc::permission_denied));
    };
    status.statuses = {"FAILED"};

    EXPECT_EQ(run(), "FAILED");
    EXPECT_EQ(of_kind(FollowEvent::Kind::Warning).size(), 1u);
}

TEST_F(FollowLoopTest, AuthFailureMidFollowPropagates) {
    fetcher.snapshots = {"x\n"};
    fetcher.fail_on_call = 1;
    fetcher.failure = [] { throw ForgeAuthError("API error 401", "check the token"); };
    status.statuses = {"RUNNING"};

    EXPECT_THROW(run(), ForgeAuthError);
    EXPECT_TRUE(of_kind(FollowEvent::Kind::Completed).empty());
}
