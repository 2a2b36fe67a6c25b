#include "ssh_tunnel_transport.hpp"
#include "helper_binary.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/job_status.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/interrupt.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>

namespace fs = std::filesystem;

// ── Command builders ────────────────────────────────────────

std::string build_proxy_command(const BridgeProfile& profile, const fs::path& helper_path,
                                bool quiet) {
    std::string ws = websocket_url(profile.proxy_url);
    if (quiet) {
        std::string inner = fmt::format("{} {} stdio://%h:%p 2>/dev/null",
                                        helper_path.string(), shell_quote(ws));
        return "sh -c " + shell_quote(inner);
    }
    return fmt::format("{} {} {}", shell_quote(helper_path.string()), shell_quote(ws),
                       shell_quote("stdio://%h:%p"));
}

std::string wrap_login_shell(const std::string& command) {
    return "LC_ALL=C LANG=C bash -l -c " + shell_quote(command);
}

std::string build_read_log_command(const std::string& path, int tail_lines, int head_lines) {
    if (tail_lines > 0) return fmt::format("tail -n {} {}", tail_lines, shell_quote(path));
    if (head_lines > 0) return fmt::format("head -n {} {}", head_lines, shell_quote(path));
    return "cat " + shell_quote(path);
}

std::string build_sync_command(const std::string& target_dir, const std::string& branch,
                               bool force) {
    std::string update = force
        ? "git reset --hard " + shell_double_quote("origin/" + branch)
        : std::string("git pull --ff-only");
    return fmt::format("cd {} && git fetch --all && git checkout {} && {} && git rev-parse HEAD",
                       shell_double_quote(target_dir), shell_double_quote(branch), update);
}

// ── SshTunnelTransport ──────────────────────────────────────

SshTunnelTransport::SshTunnelTransport(TunnelConfig config, std::string bridge_name,
                                       std::string helper_url, PollClock clock)
    : config_(std::move(config)), bridge_name_(std::move(bridge_name)),
      helper_url_(std::move(helper_url)), clock_(std::move(clock)) {
}

const BridgeProfile& SshTunnelTransport::profile() const {
    const BridgeProfile* p = config_.get_bridge(bridge_name_);
    if (p) return *p;
    if (!bridge_name_.empty()) {
        throw BridgeNotFoundError("Bridge '" + bridge_name_ + "' not found");
    }
    throw TunnelNotAvailableError(
        "No bridge configured. Run 'bridgectl tunnel add <name> <url>' first.");
}

fs::path SshTunnelTransport::ensure_helper() {
    return ensure_helper_binary(config_.helper_path, helper_url_);
}

TunnelSession& SshTunnelTransport::session(int timeout_secs) {
    if (session_ && session_->connected()) return *session_;

    const BridgeProfile& p = profile();
    ensure_helper();
    session_ = std::make_unique<TunnelSession>(p, config_.helper_path);
    try {
        session_->connect(timeout_secs);
    } catch (const TunnelError&) {
        session_.reset();
        throw;
    }
    return *session_;
}

bool SshTunnelTransport::test_connectivity(int timeout_secs) {
    const BridgeProfile& p = profile();
    try {
        auto r = session(timeout_secs).exec("echo ok", timeout_secs + 5);
        return r.exit_code == 0 && r.stdout_data.find("ok") != std::string::npos;
    } catch (const TunnelError& e) {
        bridge_log(fmt::format("tunnel: connectivity test for {} failed: {}", p.name, e.what()));
        session_.reset();
        return false;
    }
}

bool SshTunnelTransport::is_available() {
    const int retries = 1;
    for (int attempt = 0; attempt <= retries; ++attempt) {
        if (test_connectivity()) return true;
        if (attempt < retries) clock_.sleep(std::chrono::milliseconds(1000));
    }
    return false;
}

RemoteResult SshTunnelTransport::run_remote_command(const std::string& command,
                                                    int timeout_secs) {
    TunnelSession& s = session(TUNNEL_PROBE_TIMEOUT_SECS);
    try {
        return s.exec(wrap_login_shell(command), timeout_secs);
    } catch (const TunnelError&) {
        session_.reset();
        throw;
    }
}

bool SshTunnelTransport::wait_for_file(const std::string& path, const FollowSink& sink) {
    const std::string check = fmt::format("test -f {} && echo exists || echo waiting",
                                          shell_quote(path));
    auto start = clock_.now();
    auto limit = std::chrono::seconds(FOLLOW_FILE_WAIT_SECS);

    while (clock_.now() - start < limit) {
        try {
            auto r = session(TUNNEL_PROBE_TIMEOUT_SECS).exec(check, TUNNEL_PROBE_TIMEOUT_SECS);
            if (r.stdout_data.find("exists") != std::string::npos) return true;
        } catch (const TunnelError& e) {
            session_.reset();
            bridge_log(std::string("follow: existence check failed: ") + e.what());
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(clock_.now() - start);
        sink({FollowEvent::Kind::Waiting, "",
              fmt::format("Waiting for job to start... ({}s)", elapsed.count()), "", 0});

        for (int slept = 0; slept < FOLLOW_FILE_POLL_MS; slept += CANCEL_SLICE_MS) {
            if (platform::interrupted()) return false;
            clock_.sleep(std::chrono::milliseconds(CANCEL_SLICE_MS));
        }
    }
    return false;
}

std::string SshTunnelTransport::follow_remote_file(const std::string& job_id,
                                                   const std::string& path, int tail_lines,
                                                   JobStatusProvider& status,
                                                   const FollowSink& sink) {
    platform::InterruptGuard guard;

    if (!wait_for_file(path, sink)) {
        if (platform::interrupted()) {
            sink({FollowEvent::Kind::Interrupted, "", "Stopped following logs.", "", 0});
        } else {
            sink({FollowEvent::Kind::Warning, "",
                  fmt::format("Timeout: Log file not created after {}s", FOLLOW_FILE_WAIT_SECS),
                  "", 0});
        }
        return "";
    }

    std::string command = fmt::format("tail -n {} -f {}", tail_lines, shell_quote(path));
    try {
        auto channel = session(TUNNEL_PROBE_TIMEOUT_SECS).open_exec(command);
        bridge_log("follow: streaming " + command);
        return stream_remote_tail(*channel, job_id, status, sink, clock_);
    } catch (const TunnelError&) {
        session_.reset();
        throw;
    }
}

namespace {

// Closes the stream on scope exit.
struct StreamCloser {
    RemoteStream& stream;
    ~StreamCloser() { stream.close(); }
};

} // namespace

std::string stream_remote_tail(RemoteStream& stream, const std::string& job_id,
                               JobStatusProvider& status, const FollowSink& sink,
                               const PollClock& clock) {
    StreamCloser closer{stream};

    std::string final_status;
    auto last_check = clock.now();
    bool first = true;

    auto emit = [&](std::string& buf, FollowEvent::Kind kind) {
        if (buf.empty()) return;
        sink({kind, buf, "", "", 0});
        buf.clear();
    };

    std::string buf;
    while (true) {
        if (platform::interrupted()) {
            sink({FollowEvent::Kind::Interrupted, "", "Stopped following logs.", "", 0});
            break;
        }

        bool open = stream.read(buf, FOLLOW_READ_WAIT_MS);
        if (!buf.empty()) {
            emit(buf, first ? FollowEvent::Kind::InitialContent : FollowEvent::Kind::NewContent);
            first = false;
        }
        if (!open) break;

        if (clock.now() - last_check < std::chrono::milliseconds(FOLLOW_STATUS_INTERVAL_MS)) {
            continue;
        }
        last_check = clock.now();
        std::string current;
        try {
            current = status.current_status(job_id);
        } catch (const std::exception& e) {
            bridge_log(std::string("follow: status check failed: ") + e.what());
        }
        if (!is_terminal_job_status(current)) continue;

        final_status = current;
        // Grace period for trailing output
        auto grace_end = clock.now() + std::chrono::milliseconds(FOLLOW_DIRECT_GRACE_MS);
        while (clock.now() < grace_end && stream.read(buf, CANCEL_SLICE_MS)) {
            emit(buf, FollowEvent::Kind::FinalContent);
        }
        emit(buf, FollowEvent::Kind::FinalContent);
        sink({FollowEvent::Kind::Completed, "", "", final_status, 0});
        break;
    }
    return final_status;
}

TunnelStatus SshTunnelTransport::status() {
    TunnelStatus st;
    const BridgeProfile* p = config_.get_bridge(bridge_name_);
    st.configured = p != nullptr;
    for (const auto& b : config_.list_bridges()) st.bridges.push_back(b.name);
    st.default_bridge = config_.default_bridge;
    if (platform::is_executable(config_.helper_path)) st.helper_path = config_.helper_path.string();

    if (!p) {
        st.error = bridge_name_.empty()
            ? "No bridge configured. Run 'bridgectl tunnel add <name> <url>' first."
            : "Bridge '" + bridge_name_ + "' not found.";
        return st;
    }
    st.bridge_name = p->name;
    st.proxy_url = p->proxy_url;

    if (st.helper_path.empty()) {
        try {
            st.helper_path = ensure_helper().string();
        } catch (const TunnelError& e) {
            st.error = e.what();
            return st;
        }
    }

    st.ssh_works = test_connectivity();
    if (!st.ssh_works) {
        st.error = "SSH connection failed. Check proxy URL and Bridge rtunnel server.";
    }
    return st;
}
