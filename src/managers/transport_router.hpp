#pragma once

#include <string>
#include <chrono>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <core/transport.hpp>
#include "log_sync_cache.hpp"

struct LogReadRequest {
    std::string job_id;
    std::string remote_path;
    int tail_lines = 0;
    int head_lines = 0;
    bool refresh = false;
};

struct LogReadOutcome {
    std::string transport;          // "ssh" or "workflow"
    std::string content;
    LogFetchResult fetch;           // workflow only
};

// Per-call choice between the direct and mediated transports. Direct is
// used when enabled and its probe succeeds; a failed probe or a tunnel
// failure mid-call reports a notice and runs the mediated path once. The
// direct path is never retried within the same call. Artifact-bearing
// exec requests always go mediated.
class TransportRouter {
public:
    // direct may be null (no tunnel configured / disabled).
    TransportRouter(DirectTransport* direct, MediatedTransport& mediated,
                    RemoteSettings remote, bool direct_disabled,
                    StatusCallback notice = nullptr);

    ExecOutcome exec(const ExecRequest& request);
    SyncOutcome sync(const SyncRequest& request);
    LogReadOutcome read_log(const LogReadRequest& request, LogSyncCache& cache);

    // Returns the terminal job status, "" when interrupted.
    std::string follow(const std::string& job_id, const std::string& remote_path,
                       int tail_lines, bool refresh, LogSyncCache& cache,
                       JobStatusProvider& status, const FollowSink& sink,
                       std::chrono::seconds interval = std::chrono::seconds(FOLLOW_INTERVAL_SECS));

    // Probe once. Reports the fallback notice when the tunnel is unusable.
    bool use_direct();

private:
    void fallback_notice(const std::string& what, const std::string& detail);

    DirectTransport* direct_;
    MediatedTransport& mediated_;
    RemoteSettings remote_;
    bool direct_disabled_;
    StatusCallback notice_;
};

// First or last N lines of text (tail wins). Whole text when both are 0.
std::string slice_lines(const std::string& text, int tail_lines, int head_lines);
