#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "forge_session.hpp"

struct ArtifactInfo {
    std::string id;
    std::string name;
    bool expired = false;
};

// Fetches what a workflow run produced: a zip artifact through the Actions
// artifact API, or a file the runner committed to the logs branch. Both
// are keyed by the same deterministic name.
class ArtifactRetriever {
public:
    explicit ArtifactRetriever(ForgeSession& session);

    static std::string log_artifact_name(const std::string& job_id, const std::string& request_id);
    static std::string bridge_artifact_name(const std::string& request_id);

    // Non-expired artifact with this exact name, if listed.
    std::optional<ArtifactInfo> find_artifact(const std::string& name);

    // First non-directory member of the named artifact's zip. nullopt when
    // the artifact is missing or unreadable.
    std::optional<std::string> try_artifact_api(const std::string& name);

    // Raw file from the logs branch. nullopt on 404 or an empty body.
    std::optional<std::string> try_raw_file(const std::string& filename);

    // Poll both strategies every tick until one yields the log, then write
    // it to dest. An artifact whose member is empty counts as delivered
    // (nothing new since the requested offset). TimeoutError once elapsed
    // exceeds timeout_secs, naming the missing artifact.
    void wait_for_log(const std::string& job_id, const std::string& request_id,
                      const std::filesystem::path& dest, int timeout_secs);

    // Extract the bridge-action bundle into dest_dir and return the written
    // paths. ForgeError if absent.
    std::vector<std::filesystem::path> download_bundle(const std::string& request_id,
                                                       const std::filesystem::path& dest_dir);

    // output.log from the bridge-action bundle. Best effort.
    std::optional<std::string> fetch_output_log(const std::string& request_id);

private:
    std::optional<std::string> fetch_bundle(const std::string& request_id);

    ForgeSession& session_;
};
