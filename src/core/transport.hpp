#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <functional>
#include <filesystem>
#include <cstdint>
#include "types.hpp"

// Seams between the router and the two ways of reaching the Bridge host.
// Direct: an SSH session through the WebSocket helper. Mediated: an
// Actions workflow dispatched on the forge.

// ── Requests / outcomes ─────────────────────────────────────

struct ExecRequest {
    std::string command;
    std::vector<std::string> artifact_paths;     // remote paths to bundle
    std::vector<std::string> denylist;           // merged with config denylist
    std::optional<std::map<std::string, std::string>> env;  // nullopt = config env
    bool wait = true;
    std::filesystem::path download_dir;          // "" = no bundle download
    int timeout_secs = 0;                        // 0 = config default
};

struct ExecOutcome {
    std::string transport;                       // "ssh" or "workflow"
    int exit_code = 0;
    std::string output;
    std::string request_id;
    std::string run_id;
    std::string status;
    std::string conclusion;
    std::string html_url;
    bool triggered_only = false;                 // wait=false: dispatched, not awaited
    std::vector<std::filesystem::path> downloaded;

    bool success() const { return exit_code == 0; }
};

struct SyncRequest {
    std::string branch;
    std::string commit_sha;
    bool force = false;
    bool wait = true;
    int timeout_secs = 0;                        // 0 = config default
};

struct SyncOutcome {
    std::string transport;
    bool success = false;
    std::string synced_sha;
    std::string run_id;
    std::string status;
    std::string conclusion;
    std::string html_url;
    std::string error;
    bool triggered_only = false;
};

// ── Follow events ───────────────────────────────────────────

struct FollowEvent {
    enum class Kind {
        InitialContent,     // cached / first-read log body
        NewContent,         // bytes appended since the last event
        FinalContent,       // bytes read after the job went terminal
        Waiting,            // log file not created yet
        Warning,            // one iteration failed; the loop continues
        Completed,          // job reached a terminal status
        Interrupted,        // SIGINT / request_interrupt()
    };

    Kind kind;
    std::string content;
    std::string message;
    std::string status;                 // Completed only
    std::uintmax_t offset = 0;          // bytes displayed so far (mediated)
};

using FollowSink = std::function<void(const FollowEvent&)>;

// Out-of-band job state lookup used to stop a follow.
class JobStatusProvider {
public:
    virtual ~JobStatusProvider() = default;

    // Current scheduler status. May throw; callers treat a throw as
    // "unknown this tick".
    virtual std::string current_status(const std::string& job_id) = 0;
};

// ── Transports ──────────────────────────────────────────────

class DirectTransport {
public:
    virtual ~DirectTransport() = default;

    // Connectivity probe. May throw TunnelNotAvailableError / BridgeNotFoundError.
    virtual bool is_available() = 0;

    // Run a command in a login shell on the Bridge host. A non-zero remote
    // exit is returned, not thrown; TunnelError means the tunnel itself failed.
    virtual RemoteResult run_remote_command(const std::string& command,
                                            int timeout_secs = 0) = 0;

    // Wait for `path` to exist, then stream `tail -n N -f` to the sink until
    // the job goes terminal or the user interrupts. Returns the terminal
    // status, or "" when interrupted or the file never appeared.
    virtual std::string follow_remote_file(const std::string& job_id,
                                           const std::string& path,
                                           int tail_lines,
                                           JobStatusProvider& status,
                                           const FollowSink& sink) = 0;
};

// Writes the bytes of `remote_path` from `start_offset` onward to `dest`.
// A zero-byte dest means nothing new.
class LogFetcher {
public:
    virtual ~LogFetcher() = default;

    virtual void fetch_log(const std::string& job_id, const std::string& remote_path,
                           std::uintmax_t start_offset,
                           const std::filesystem::path& dest) = 0;
};

class MediatedTransport : public LogFetcher {
public:
    virtual ExecOutcome exec(const ExecRequest& request, const StatusCallback& notice) = 0;
    virtual SyncOutcome sync(const SyncRequest& request, const StatusCallback& notice) = 0;
};
