#pragma once

#include <memory>
#include <string>
#include <vector>
#include <filesystem>
#include <core/transport.hpp>
#include <core/poll_clock.hpp>
#include "tunnel_config.hpp"
#include "tunnel_session.hpp"

// ── Command builders ────────────────────────────────────────

// ProxyCommand string for OpenSSH: "<helper> <ws-url> stdio://%h:%p".
// quiet wraps it in sh -c with the helper's stderr discarded.
std::string build_proxy_command(const BridgeProfile& profile,
                                const std::filesystem::path& helper_path, bool quiet);

// LC_ALL=C LANG=C bash -l -c '<command>' so the remote profile (PATH) is sourced.
std::string wrap_login_shell(const std::string& command);

// tail -n N / head -n N / cat of a remote file. tail wins over head.
std::string build_read_log_command(const std::string& path, int tail_lines, int head_lines);

// cd, fetch, checkout, then fast-forward (or hard reset when force), and
// print the resulting HEAD.
std::string build_sync_command(const std::string& target_dir, const std::string& branch,
                               bool force);

// Stream a remote `tail -f` to the sink. The job status is checked every
// FOLLOW_STATUS_INTERVAL_MS; on the first terminal status the trailing output
// is drained for FOLLOW_DIRECT_GRACE_MS and streaming stops. The stream is
// closed on every exit. Returns the terminal status, "" if the stream ended
// or was interrupted first.
std::string stream_remote_tail(RemoteStream& stream, const std::string& job_id,
                               JobStatusProvider& status, const FollowSink& sink,
                               const PollClock& clock);

// ── Status report ───────────────────────────────────────────

struct TunnelStatus {
    bool configured = false;
    std::string bridge_name;
    bool ssh_works = false;
    std::string proxy_url;
    std::string helper_path;            // "" when not installed
    std::vector<std::string> bridges;
    std::string default_bridge;
    std::string error;
};

// Direct transport: SSH through the WebSocket helper to a Bridge profile.
// One session is opened lazily and reused for the lifetime of the object.
class SshTunnelTransport : public DirectTransport {
public:
    SshTunnelTransport(TunnelConfig config, std::string bridge_name = "",
                       std::string helper_url = "", PollClock clock = PollClock::system());

    // Selected profile. Throws BridgeNotFoundError for an unknown explicit
    // name, TunnelNotAvailableError when nothing is configured.
    const BridgeProfile& profile() const;

    // Download the helper if missing. Throws TunnelError.
    std::filesystem::path ensure_helper();

    // `echo ok` through the tunnel; true on exit 0 with "ok" in the output.
    bool test_connectivity(int timeout_secs = TUNNEL_PROBE_TIMEOUT_SECS);

    // test_connectivity with one retry after 1s.
    bool is_available() override;

    RemoteResult run_remote_command(const std::string& command, int timeout_secs = 0) override;

    std::string follow_remote_file(const std::string& job_id, const std::string& path,
                                   int tail_lines, JobStatusProvider& status,
                                   const FollowSink& sink) override;

    TunnelStatus status();

    const TunnelConfig& config() const { return config_; }

private:
    TunnelSession& session(int timeout_secs);
    bool wait_for_file(const std::string& path, const FollowSink& sink);

    TunnelConfig config_;
    std::string bridge_name_;
    std::string helper_url_;
    PollClock clock_;
    std::unique_ptr<TunnelSession> session_;
};
