#include <gtest/gtest.h>
#include <managers/transport_router.hpp>
#include <core/errors.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace {

class FakeDirect : public DirectTransport {
public:
    enum class Probe { Ok, Unavailable, Throws };
    Probe probe = Probe::Ok;
    bool command_throws = false;
    RemoteResult result{0, "", ""};

    int probes = 0;
    std::vector<std::string> commands;
    std::vector<int> timeouts;

    bool is_available() override {
        probes++;
        if (probe == Probe::Throws) throw TunnelNotAvailableError("helper not installed");
        return probe == Probe::Ok;
    }

    RemoteResult run_remote_command(const std::string& command, int timeout_secs) override {
        commands.push_back(command);
        timeouts.push_back(timeout_secs);
        if (command_throws) throw TunnelError("Connection reset");
        return result;
    }

    std::string follow_remote_file(const std::string&, const std::string&, int,
                                   JobStatusProvider&, const FollowSink& sink) override {
        commands.push_back("follow");
        if (command_throws) throw TunnelError("channel closed");
        sink({FollowEvent::Kind::Completed, "", "", "SUCCEEDED", 0});
        return "SUCCEEDED";
    }
};

class FakeMediated : public MediatedTransport {
public:
    int execs = 0;
    int syncs = 0;
    int fetches = 0;
    std::string remote_log = "l1\nl2\nl3\n";

    ExecOutcome exec(const ExecRequest&, const StatusCallback&) override {
        execs++;
        ExecOutcome out;
        out.transport = "workflow";
        out.request_id = "1700000000-4242";
        return out;
    }

    SyncOutcome sync(const SyncRequest& request, const StatusCallback&) override {
        syncs++;
        SyncOutcome out;
        out.transport = "workflow";
        out.success = true;
        out.synced_sha = request.commit_sha;
        return out;
    }

    void fetch_log(const std::string&, const std::string&, std::uintmax_t start_offset,
                   const fs::path& dest) override {
        fetches++;
        std::ofstream out(dest, std::ios::binary | std::ios::trunc);
        if (start_offset < remote_log.size()) out << remote_log.substr(start_offset);
    }
};

class FixedStatus : public JobStatusProvider {
public:
    std::string current_status(const std::string&) override { return "SUCCEEDED"; }
};

} // namespace

class TransportRouterTest : public ::testing::Test {
protected:
    FakeDirect direct;
    FakeMediated mediated;
    RemoteSettings remote;
    std::vector<std::string> notices;
    fs::path test_dir;

    void SetUp() override {
        remote.target_dir = "/srv/app";
        remote.env = {{"CUDA_VISIBLE_DEVICES", "0"}};
        test_dir = fs::temp_directory_path() / "bridgectl_router_test";
        fs::remove_all(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    TransportRouter router(bool disabled = false) {
        return TransportRouter(&direct, mediated, remote, disabled,
                               [this](const std::string& msg) { notices.push_back(msg); });
    }

    ExecRequest exec_request(const std::string& command) {
        ExecRequest r;
        r.command = command;
        return r;
    }
};

TEST_F(TransportRouterTest, ExecOverTunnelBuildsCommand) {
    direct.result = {3, "out\n", "err\n"};
    auto outcome = router().exec(exec_request("make test"));

    EXPECT_EQ(outcome.transport, "ssh");
    EXPECT_EQ(outcome.exit_code, 3);
    EXPECT_EQ(outcome.output, "out\nerr\n");
    ASSERT_EQ(direct.commands.size(), 1u);
    EXPECT_EQ(direct.commands[0],
              "export CUDA_VISIBLE_DEVICES=\"0\" && cd \"/srv/app\" && make test");
    EXPECT_EQ(direct.timeouts[0], remote.bridge_action_timeout);
    EXPECT_EQ(mediated.execs, 0);
}

TEST_F(TransportRouterTest, UnavailableTunnelFallsBackOnce) {
    direct.probe = FakeDirect::Probe::Throws;
    auto outcome = router().exec(exec_request("ls"));

    EXPECT_EQ(outcome.transport, "workflow");
    EXPECT_EQ(direct.probes, 1);
    EXPECT_TRUE(direct.commands.empty());
    EXPECT_EQ(mediated.execs, 1);
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0], "Tunnel not available, using Actions workflow");
}

TEST_F(TransportRouterTest, FailedProbeFallsBack) {
    direct.probe = FakeDirect::Probe::Unavailable;
    router().exec(exec_request("ls"));
    EXPECT_EQ(mediated.execs, 1);
    EXPECT_EQ(notices.size(), 1u);
}

TEST_F(TransportRouterTest, ArtifactsForceWorkflow) {
    ExecRequest request = exec_request("python train.py");
    request.artifact_paths = {"out/model.bin"};
    router().exec(request);

    EXPECT_EQ(direct.probes, 0);
    EXPECT_EQ(mediated.execs, 1);
    EXPECT_TRUE(notices.empty());
}

TEST_F(TransportRouterTest, DisabledTunnelIsNeverProbed) {
    router(true).exec(exec_request("ls"));
    EXPECT_EQ(direct.probes, 0);
    EXPECT_EQ(mediated.execs, 1);
    EXPECT_TRUE(notices.empty());
}

TEST_F(TransportRouterTest, TunnelFailureMidCommandFallsBackWithoutRetry) {
    direct.command_throws = true;
    auto outcome = router().exec(exec_request("ls"));

    EXPECT_EQ(outcome.transport, "workflow");
    EXPECT_EQ(direct.commands.size(), 1u);
    EXPECT_EQ(mediated.execs, 1);
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_NE(notices[0].find("SSH execution failed: Connection reset"), std::string::npos);
}

TEST_F(TransportRouterTest, SyncOverTunnelReportsHead) {
    direct.result = {0, "Already up to date.\nabc1234def\n", ""};
    SyncRequest request;
    request.branch = "main";
    request.commit_sha = "abc1234def";
    auto outcome = router().sync(request);

    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.transport, "ssh");
    EXPECT_EQ(outcome.synced_sha, "abc1234def");
    EXPECT_NE(direct.commands[0].find("git pull --ff-only"), std::string::npos);
    EXPECT_EQ(direct.timeouts[0], remote.remote_timeout);
}

TEST_F(TransportRouterTest, SyncFailureCarriesStderr) {
    direct.result = {1, "", "fatal: Not possible to fast-forward\n"};
    SyncRequest request;
    request.branch = "feature";
    request.force = true;
    auto outcome = router().sync(request);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error, "fatal: Not possible to fast-forward");
    EXPECT_NE(direct.commands[0].find("git reset --hard \"origin/feature\""), std::string::npos);
}

TEST_F(TransportRouterTest, SyncRequiresTargetDir) {
    remote.target_dir.clear();
    EXPECT_THROW(router().sync(SyncRequest{}), ConfigError);
}

TEST_F(TransportRouterTest, ReadLogOverTunnel) {
    direct.result = {0, "last line\n", ""};
    JobStore store(test_dir / "jobs.yaml");
    LogSyncCache cache(store, test_dir / "logs");

    LogReadRequest request;
    request.job_id = "12";
    request.remote_path = "/scratch/12.out";
    request.tail_lines = 1;
    auto outcome = router().read_log(request, cache);

    EXPECT_EQ(outcome.transport, "ssh");
    EXPECT_EQ(outcome.content, "last line\n");
    EXPECT_EQ(direct.commands[0], "tail -n 1 '/scratch/12.out'");
    EXPECT_EQ(mediated.fetches, 0);
}

TEST_F(TransportRouterTest, ReadLogFallsBackToCache) {
    direct.probe = FakeDirect::Probe::Throws;
    JobStore store(test_dir / "jobs.yaml");
    LogSyncCache cache(store, test_dir / "logs");

    LogReadRequest request;
    request.job_id = "12";
    request.remote_path = "/scratch/12.out";
    request.tail_lines = 2;
    auto outcome = router().read_log(request, cache);

    EXPECT_EQ(outcome.transport, "workflow");
    EXPECT_EQ(outcome.content, "l2\nl3\n");
    EXPECT_EQ(outcome.fetch.size, 9u);
    EXPECT_EQ(mediated.fetches, 1);
}

TEST_F(TransportRouterTest, ReadLogRemoteFailureFallsBack) {
    direct.result = {1, "", "tail: cannot open"};
    JobStore store(test_dir / "jobs.yaml");
    LogSyncCache cache(store, test_dir / "logs");

    LogReadRequest request;
    request.job_id = "13";
    request.remote_path = "/scratch/13.out";
    auto outcome = router().read_log(request, cache);

    EXPECT_EQ(outcome.transport, "workflow");
    EXPECT_EQ(outcome.content, "l1\nl2\nl3\n");
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_NE(notices[0].find("tail: cannot open"), std::string::npos);
}

TEST_F(TransportRouterTest, FollowPrefersTunnel) {
    JobStore store(test_dir / "jobs.yaml");
    LogSyncCache cache(store, test_dir / "logs");
    FixedStatus status;
    std::vector<FollowEvent> events;

    std::string final_status = router().follow(
        "12", "/scratch/12.out", 50, false, cache, status,
        [&](const FollowEvent& ev) { events.push_back(ev); });

    EXPECT_EQ(final_status, "SUCCEEDED");
    EXPECT_EQ(mediated.fetches, 0);
    ASSERT_EQ(events.size(), 1u);
}

TEST(SliceLines, TailAndHead) {
    std::string text = "a\nb\nc\n";
    EXPECT_EQ(slice_lines(text, 0, 0), text);
    EXPECT_EQ(slice_lines(text, 1, 0), "c\n");
    EXPECT_EQ(slice_lines(text, 0, 2), "a\nb\n");
    EXPECT_EQ(slice_lines(text, 10, 0), text);
    EXPECT_EQ(slice_lines(text, 1, 1), "c\n");
    EXPECT_EQ(slice_lines("x\ny", 1, 0), "y");
    EXPECT_EQ(slice_lines("", 3, 0), "");
}
