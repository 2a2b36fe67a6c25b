#include "artifact_retriever.hpp"
#include <core/errors.hpp>
#include <core/json_util.hpp>
#include <core/log.hpp>
#include <platform/archive.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;

ArtifactRetriever::ArtifactRetriever(ForgeSession& session) : session_(session) {}

std::string ArtifactRetriever::log_artifact_name(const std::string& job_id,
                                                 const std::string& request_id) {
    return fmt::format("job-{}-log-{}", job_id, request_id);
}

std::string ArtifactRetriever::bridge_artifact_name(const std::string& request_id) {
    return fmt::format("bridge-action-{}", request_id);
}

std::optional<ArtifactInfo> ArtifactRetriever::find_artifact(const std::string& name) {
    std::string url = fmt::format("{}/artifacts?{}", session_.api_base(),
                                  session_.client().pagination_params(ARTIFACT_LIST_LIMIT, 1));
    Json::Value response;
    try {
        response = session_.client().request_json("GET", url);
    } catch (const ForgeError& e) {
        bridge_log(fmt::format("Artifact list failed: {}", e.what()));
        return std::nullopt;
    }

    if (!response.isObject()) return std::nullopt;
    const Json::Value& artifacts = response["artifacts"];
    if (!artifacts.isArray()) return std::nullopt;
    for (const auto& a : artifacts) {
        if (!a.isObject() || !a["name"].isString() || a["name"].asString() != name) continue;
        if (a["expired"].isBool() && a["expired"].asBool()) continue;
        ArtifactInfo info;
        info.name = name;
        info.id = json_scalar_string(a["id"]);
        if (info.id.empty()) continue;
        return info;
    }
    return std::nullopt;
}

std::optional<std::string> ArtifactRetriever::try_artifact_api(const std::string& name) {
    auto artifact = find_artifact(name);
    if (!artifact) return std::nullopt;

    std::string url = fmt::format("{}/artifacts/{}/zip", session_.api_base(), artifact->id);
    try {
        std::string zip = session_.client().request_bytes("GET", url);
        return platform::read_first_file(zip);
    } catch (const ForgeError& e) {
        bridge_log(fmt::format("Artifact {} download failed: {}", name, e.what()));
    } catch (const std::runtime_error& e) {
        bridge_log(fmt::format("Artifact {} unreadable: {}", name, e.what()));
    }
    return std::nullopt;
}

std::optional<std::string> ArtifactRetriever::try_raw_file(const std::string& filename) {
    std::string url = session_.client().raw_file_url(session_.repo(), session_.logs_branch(),
                                                     filename);
    try {
        std::string data = session_.client().request_bytes("GET", url);
        if (data.empty()) return std::nullopt;
        return data;
    } catch (const ForgeError&) {
        return std::nullopt;  // not committed yet
    }
}

void ArtifactRetriever::wait_for_log(const std::string& job_id, const std::string& request_id,
                                     const fs::path& dest, int timeout_secs) {
    const auto& clock = session_.clock();
    std::string name = log_artifact_name(job_id, request_id);
    auto limit = std::chrono::seconds(std::max(MIN_DEADLINE_SECS, timeout_secs));
    auto start = clock.now();

    auto deliver = [&](const std::string& content) {
        if (dest.has_parent_path()) fs::create_directories(dest.parent_path());
        std::ofstream out(dest, std::ios::binary | std::ios::trunc);
        if (!out) throw BridgeError("Cannot write " + dest.string());
        out << content;
        bridge_log(fmt::format("Log {} delivered: {} bytes", name, content.size()));
    };

    while (true) {
        if (clock.now() - start > limit) {
            throw TimeoutError(fmt::format(
                "Remote log retrieval timed out after {} seconds waiting for artifact {}",
                limit.count(), name));
        }

        if (auto content = try_artifact_api(name)) {
            deliver(*content);
            return;
        }
        if (auto content = try_raw_file(name + ".log")) {
            deliver(*content);
            return;
        }
        clock.sleep(std::chrono::milliseconds(ARTIFACT_POLL_INTERVAL_MS));
    }
}

std::optional<std::string> ArtifactRetriever::fetch_bundle(const std::string& request_id) {
    std::string name = bridge_artifact_name(request_id);
    if (auto zip = try_raw_file(name + ".zip")) return zip;

    // Artifact API fallback: the artifact zip wraps the bundle's files directly.
    auto artifact = find_artifact(name);
    if (!artifact) return std::nullopt;
    std::string url = fmt::format("{}/artifacts/{}/zip", session_.api_base(), artifact->id);
    try {
        return session_.client().request_bytes("GET", url);
    } catch (const ForgeError& e) {
        bridge_log(fmt::format("Bundle {} download failed: {}", name, e.what()));
        return std::nullopt;
    }
}

std::vector<fs::path> ArtifactRetriever::download_bundle(const std::string& request_id,
                                                         const fs::path& dest_dir) {
    std::string name = bridge_artifact_name(request_id);
    auto zip = fetch_bundle(request_id);
    if (!zip) {
        throw ForgeError("Artifact not found: " + name, 404);
    }
    try {
        auto written = platform::extract_all(*zip, dest_dir);
        bridge_log(fmt::format("Bundle {} extracted: {} files to {}", name, written.size(),
                               dest_dir.string()));
        return written;
    } catch (const std::runtime_error& e) {
        throw ForgeError(fmt::format("Artifact {} is not a readable archive: {}", name, e.what()));
    }
}

std::optional<std::string> ArtifactRetriever::fetch_output_log(const std::string& request_id) {
    auto zip = fetch_bundle(request_id);
    if (!zip) return std::nullopt;
    try {
        return platform::read_member(*zip, "output.log");
    } catch (const std::runtime_error& e) {
        bridge_log(fmt::format("output.log unreadable for {}: {}", request_id, e.what()));
        return std::nullopt;
    }
}
