#include "actions_transport.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

ActionsTransport::ActionsTransport(ForgeSession& session, RemoteSettings remote)
    : session_(session), remote_(std::move(remote)),
      dispatcher_(session), retriever_(session) {
}

std::vector<std::string> ActionsTransport::merged_denylist(
        const std::vector<std::string>& extra) const {
    std::vector<std::string> out;
    auto add = [&](const std::string& item) {
        if (!item.empty() && std::find(out.begin(), out.end(), item) == out.end()) {
            out.push_back(item);
        }
    };
    for (const auto& d : remote_.denylist) add(d);
    for (const auto& d : extra) add(d);
    return out;
}

void ActionsTransport::fetch_log(const std::string& job_id, const std::string& remote_path,
                                 std::uintmax_t start_offset, const std::filesystem::path& dest) {
    std::string request_id = make_request_id();
    dispatcher_.trigger(session_.workflow_file(WorkflowKind::Log), {
        {"job_id", job_id},
        {"remote_log_path", remote_path},
        {"request_id", request_id},
        {"start_offset", std::to_string(start_offset)},
    });
    bridge_log(fmt::format("log fetch: {} from offset {} (request {})",
                           job_id, start_offset, request_id));
    retriever_.wait_for_log(job_id, request_id, dest, remote_.remote_timeout);
}

ExecOutcome ActionsTransport::exec(const ExecRequest& request, const StatusCallback& notice) {
    const auto& env = request.env ? *request.env : remote_.env;
    std::string command = build_env_exports(env) + request.command;

    auto denylist = merged_denylist(request.denylist);
    if (denylist.empty() && notice) notice("Warning: no denylist provided; proceeding");

    ExecOutcome outcome;
    outcome.transport = "workflow";
    outcome.request_id = make_request_id();

    dispatcher_.trigger(session_.workflow_file(WorkflowKind::Bridge), {
        {"raw_command", command},
        {"denylist", join(denylist, "\n")},
        {"target_dir", remote_.target_dir},
        {"artifact_paths", join(request.artifact_paths, "\n")},
        {"request_id", outcome.request_id},
    });
    if (notice) notice(fmt::format("Triggered bridge exec (request {})", outcome.request_id));

    if (!request.wait) {
        outcome.triggered_only = true;
        return outcome;
    }

    int timeout = request.timeout_secs > 0 ? request.timeout_secs : remote_.bridge_action_timeout;
    if (notice) notice(fmt::format("Waiting for completion (timeout {}s)...", timeout));
    RunOutcome run = dispatcher_.wait_for_request(outcome.request_id, timeout);

    outcome.run_id = run.run_id;
    outcome.status = run.status;
    outcome.conclusion = run.conclusion;
    outcome.html_url = run.html_url;
    outcome.exit_code = run.succeeded() ? 0 : 1;

    if (auto log = retriever_.fetch_output_log(outcome.request_id)) {
        outcome.output = *log;
    }

    if (run.succeeded() && !request.download_dir.empty()) {
        if (notice) notice("Downloading artifact to " + request.download_dir.string() + "...");
        outcome.downloaded = retriever_.download_bundle(outcome.request_id, request.download_dir);
    }
    return outcome;
}

SyncOutcome ActionsTransport::sync(const SyncRequest& request, const StatusCallback& notice) {
    SyncOutcome outcome;
    outcome.transport = "workflow";

    WorkflowInputs inputs{
        {"branch", request.branch},
        {"commit_sha", request.commit_sha},
        {"force", request.force ? "true" : "false"},
        {"target_dir", remote_.target_dir},
    };
    if (notice) notice("Triggering sync workflow...");
    outcome.run_id = dispatcher_.trigger_and_correlate(
        session_.workflow_file(WorkflowKind::Sync), inputs);

    if (!request.wait || outcome.run_id.empty()) {
        outcome.triggered_only = true;
        outcome.success = true;
        return outcome;
    }

    int timeout = request.timeout_secs > 0 ? request.timeout_secs : remote_.remote_timeout;
    if (notice) notice("Waiting for sync to complete...");
    RunOutcome run = dispatcher_.wait_for_completion(outcome.run_id, timeout);

    outcome.status = run.status;
    outcome.conclusion = run.conclusion;
    outcome.html_url = run.html_url;
    outcome.success = run.succeeded();
    if (outcome.success) {
        outcome.synced_sha = request.commit_sha;
    } else {
        outcome.error = "Sync failed: " + (run.conclusion.empty() ? "unknown" : run.conclusion);
    }
    return outcome;
}
