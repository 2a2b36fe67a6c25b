#include "job_store.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <core/errors.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>

JobStore::JobStore(fs::path path) : path_(std::move(path)) {
}

fs::path default_job_store_path() {
    return get_global_config_dir() / "jobs.yaml";
}

std::vector<JobRecord> JobStore::load() const {
    std::vector<JobRecord> jobs;
    if (!fs::exists(path_)) return jobs;

    try {
        YAML::Node root = YAML::LoadFile(path_.string());
        if (!root["jobs"] || !root["jobs"].IsSequence()) return jobs;

        for (const auto& n : root["jobs"]) {
            JobRecord j;
            j.job_id = n["job_id"].as<std::string>("");
            if (j.job_id.empty()) continue;
            j.name = n["name"].as<std::string>("");
            j.status = n["status"].as<std::string>("");
            j.log_path = n["log_path"].as<std::string>("");
            j.created_at = n["created_at"].as<std::string>("");
            j.updated_at = n["updated_at"].as<std::string>("");
            j.log_byte_offset = n["log_byte_offset"].as<std::uint64_t>(0);
            j.log_cached_at = n["log_cached_at"].as<std::string>("");
            jobs.push_back(j);
        }
    } catch (const YAML::Exception& e) {
        // Corrupted cache: start fresh
        bridge_log("job store: ignoring unreadable " + path_.string() + ": " + e.what());
        return {};
    }
    return jobs;
}

void JobStore::save(const std::vector<JobRecord>& jobs) const {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "jobs" << YAML::Value << YAML::BeginSeq;
    for (const auto& j : jobs) {
        out << YAML::BeginMap;
        out << YAML::Key << "job_id" << YAML::Value << j.job_id;
        out << YAML::Key << "name" << YAML::Value << j.name;
        out << YAML::Key << "status" << YAML::Value << j.status;
        out << YAML::Key << "log_path" << YAML::Value << j.log_path;
        out << YAML::Key << "created_at" << YAML::Value << j.created_at;
        out << YAML::Key << "updated_at" << YAML::Value << j.updated_at;
        out << YAML::Key << "log_byte_offset" << YAML::Value << j.log_byte_offset;
        out << YAML::Key << "log_cached_at" << YAML::Value << j.log_cached_at;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    fs::create_directories(path_.parent_path());
    platform::atomic_write(path_, std::string(out.c_str()) + "\n");
}

std::optional<JobRecord> JobStore::get_job(const std::string& job_id) const {
    for (auto& j : load()) {
        if (j.job_id == job_id) return j;
    }
    return std::nullopt;
}

void JobStore::upsert(JobRecord job) {
    auto jobs = load();
    std::string now = now_iso();
    job.updated_at = now;

    auto it = std::find_if(jobs.begin(), jobs.end(),
                           [&](const JobRecord& j) { return j.job_id == job.job_id; });
    if (it != jobs.end()) {
        if (job.created_at.empty()) job.created_at = it->created_at;
        *it = job;
    } else {
        if (job.created_at.empty()) job.created_at = now;
        jobs.push_back(job);
    }
    save(jobs);
}

bool JobStore::update_status(const std::string& job_id, const std::string& status) {
    auto jobs = load();
    for (auto& j : jobs) {
        if (j.job_id != job_id) continue;
        if (j.status != status) {
            j.status = status;
            j.updated_at = now_iso();
            save(jobs);
        }
        return true;
    }
    return false;
}

std::uint64_t JobStore::get_log_offset(const std::string& job_id) const {
    auto job = get_job(job_id);
    return job ? job->log_byte_offset : 0;
}

void JobStore::set_log_offset(const std::string& job_id, std::uint64_t offset) {
    auto jobs = load();
    auto it = std::find_if(jobs.begin(), jobs.end(),
                           [&](const JobRecord& j) { return j.job_id == job_id; });
    if (it == jobs.end()) {
        JobRecord j;
        j.job_id = job_id;
        j.created_at = now_iso();
        j.updated_at = j.created_at;
        jobs.push_back(j);
        it = jobs.end() - 1;
    }
    it->log_byte_offset = offset;
    it->log_cached_at = now_iso();
    save(jobs);
}

void JobStore::reset_log_offset(const std::string& job_id) {
    auto jobs = load();
    for (auto& j : jobs) {
        if (j.job_id == job_id) {
            j.log_byte_offset = 0;
            save(jobs);
            return;
        }
    }
}

std::vector<JobRecord> JobStore::list_jobs(const std::set<std::string>& statuses,
                                           int limit) const {
    std::vector<JobRecord> out;
    for (auto& j : load()) {
        if (statuses.empty() || statuses.count(j.status)) out.push_back(j);
    }
    std::stable_sort(out.begin(), out.end(), [](const JobRecord& a, const JobRecord& b) {
        return a.created_at > b.created_at;
    });
    if (limit > 0 && static_cast<int>(out.size()) > limit) out.resize(limit);
    return out;
}

std::string StoredJobStatus::current_status(const std::string& job_id) {
    auto job = store_.get_job(job_id);
    if (!job) throw BridgeError("Job not found in local cache: " + job_id);
    return job->status;
}
