#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/transport.hpp>
#include <forge/forge_session.hpp>
#include <forge/workflow_dispatcher.hpp>
#include <forge/artifact_retriever.hpp>

// Mediated transport: every operation is a workflow dispatch whose result
// comes back as an artifact or a file on the logs branch.
class ActionsTransport : public MediatedTransport {
public:
    ActionsTransport(ForgeSession& session, RemoteSettings remote);

    // Dispatch the log workflow with start_offset and wait for the artifact.
    void fetch_log(const std::string& job_id, const std::string& remote_path,
                   std::uintmax_t start_offset, const std::filesystem::path& dest) override;

    // Dispatch the bridge workflow and, unless wait is false, poll by
    // request_id until terminal. output.log is fetched best-effort; the
    // bundle is extracted into download_dir on success.
    ExecOutcome exec(const ExecRequest& request, const StatusCallback& notice) override;

    // Dispatch the sync workflow, correlate the run, optionally wait.
    SyncOutcome sync(const SyncRequest& request, const StatusCallback& notice) override;

    // Config denylist followed by the caller's, duplicates dropped.
    std::vector<std::string> merged_denylist(const std::vector<std::string>& extra) const;

private:
    ForgeSession& session_;
    RemoteSettings remote_;
    WorkflowDispatcher dispatcher_;
    ArtifactRetriever retriever_;
};
