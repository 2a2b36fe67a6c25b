#include "transport_router.hpp"
#include "follow_loop.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <ssh/ssh_tunnel_transport.hpp>
#include <fmt/format.h>
#include <vector>

TransportRouter::TransportRouter(DirectTransport* direct, MediatedTransport& mediated,
                                 RemoteSettings remote, bool direct_disabled,
                                 StatusCallback notice)
    : direct_(direct), mediated_(mediated), remote_(std::move(remote)),
      direct_disabled_(direct_disabled), notice_(std::move(notice)) {
}

void TransportRouter::fallback_notice(const std::string& what, const std::string& detail) {
    std::string msg = detail.empty()
        ? "Tunnel not available, using Actions workflow"
        : fmt::format("{} failed: {}, falling back to Actions workflow", what, detail);
    bridge_log("router: " + msg);
    if (notice_) notice_(msg);
}

bool TransportRouter::use_direct() {
    if (direct_disabled_ || !direct_) return false;
    try {
        if (direct_->is_available()) return true;
    } catch (const TunnelError& e) {
        bridge_log(std::string("router: probe failed: ") + e.what());
    }
    fallback_notice("", "");
    return false;
}

ExecOutcome TransportRouter::exec(const ExecRequest& request) {
    bool needs_artifacts = !request.artifact_paths.empty() || !request.download_dir.empty();

    if (!needs_artifacts && use_direct()) {
        const auto& env = request.env ? *request.env : remote_.env;
        std::string command = build_env_exports(env);
        if (!remote_.target_dir.empty()) {
            command += "cd " + shell_double_quote(remote_.target_dir) + " && ";
        }
        command += request.command;

        int timeout = request.timeout_secs > 0 ? request.timeout_secs
                                               : remote_.bridge_action_timeout;
        try {
            RemoteResult r = direct_->run_remote_command(command, timeout);
            ExecOutcome outcome;
            outcome.transport = "ssh";
            outcome.exit_code = r.exit_code;
            outcome.output = r.stdout_data + r.stderr_data;
            return outcome;
        } catch (const TunnelError& e) {
            fallback_notice("SSH execution", e.what());
        }
    }
    return mediated_.exec(request, notice_);
}

SyncOutcome TransportRouter::sync(const SyncRequest& request) {
    if (remote_.target_dir.empty()) {
        throw ConfigError("Remote target_dir is not configured (set BRIDGECTL_TARGET_DIR)");
    }

    if (use_direct()) {
        int timeout = request.timeout_secs > 0 ? request.timeout_secs : remote_.remote_timeout;
        try {
            RemoteResult r = direct_->run_remote_command(
                build_sync_command(remote_.target_dir, request.branch, request.force), timeout);
            SyncOutcome outcome;
            outcome.transport = "ssh";
            outcome.success = r.success();
            if (outcome.success) {
                outcome.synced_sha = last_line(r.stdout_data);
            } else {
                outcome.error = r.stderr_data.empty() ? r.stdout_data : r.stderr_data;
                trim(outcome.error);
                if (outcome.error.empty()) {
                    outcome.error = fmt::format("exit code {}", r.exit_code);
                }
            }
            return outcome;
        } catch (const TunnelError& e) {
            fallback_notice("SSH sync", e.what());
        }
    }
    return mediated_.sync(request, notice_);
}

LogReadOutcome TransportRouter::read_log(const LogReadRequest& request, LogSyncCache& cache) {
    if (use_direct()) {
        try {
            RemoteResult r = direct_->run_remote_command(
                build_read_log_command(request.remote_path, request.tail_lines,
                                       request.head_lines));
            if (r.failed()) {
                throw TunnelError("Failed to read log file: " + r.get_output());
            }
            LogReadOutcome outcome;
            outcome.transport = "ssh";
            outcome.content = r.stdout_data;
            return outcome;
        } catch (const TunnelError& e) {
            fallback_notice("SSH log fetch", e.what());
        }
    }

    LogReadOutcome outcome;
    outcome.transport = "workflow";
    outcome.fetch = cache.fetch(request.job_id, request.remote_path, request.refresh, mediated_);
    outcome.content = slice_lines(read_file_from(outcome.fetch.path, 0),
                                  request.tail_lines, request.head_lines);
    return outcome;
}

std::string TransportRouter::follow(const std::string& job_id, const std::string& remote_path,
                                    int tail_lines, bool refresh, LogSyncCache& cache,
                                    JobStatusProvider& status, const FollowSink& sink,
                                    std::chrono::seconds interval) {
    if (use_direct()) {
        try {
            return direct_->follow_remote_file(job_id, remote_path, tail_lines, status, sink);
        } catch (const TunnelError& e) {
            fallback_notice("SSH follow", e.what());
        }
    }
    FollowLoop loop(cache, mediated_, status, PollClock::system(), interval);
    return loop.run(job_id, remote_path, refresh, sink);
}

std::string slice_lines(const std::string& text, int tail_lines, int head_lines) {
    if (tail_lines <= 0 && head_lines <= 0) return text;

    std::vector<size_t> starts{0};
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '\n' && i + 1 < text.size()) starts.push_back(i + 1);
    }
    size_t lines = starts.size();
    if (text.empty()) return text;

    if (tail_lines > 0) {
        if (static_cast<size_t>(tail_lines) >= lines) return text;
        return text.substr(starts[lines - tail_lines]);
    }
    if (static_cast<size_t>(head_lines) >= lines) return text;
    return text.substr(0, starts[head_lines]);
}
