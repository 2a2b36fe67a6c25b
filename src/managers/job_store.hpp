#pragma once

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <core/transport.hpp>

namespace fs = std::filesystem;

struct JobRecord {
    std::string job_id;
    std::string name;
    std::string status;             // as last reported by the scheduler
    std::string log_path;           // remote log path on the Bridge host
    std::string created_at;         // ISO timestamp
    std::string updated_at;
    std::uint64_t log_byte_offset = 0;   // bytes of the remote log held locally
    std::string log_cached_at;      // "" if never fetched
};

// Local job cache, one YAML document rewritten whole on every change.
// Single writer in practice; concurrent invocations race (last writer wins).
class JobStore {
public:
    explicit JobStore(fs::path path);

    std::vector<JobRecord> load() const;
    void save(const std::vector<JobRecord>& jobs) const;

    std::optional<JobRecord> get_job(const std::string& job_id) const;

    // Insert or replace by job_id. Fills created_at / updated_at.
    void upsert(JobRecord job);

    // Returns false if the job is unknown.
    bool update_status(const std::string& job_id, const std::string& status);

    std::uint64_t get_log_offset(const std::string& job_id) const;
    void set_log_offset(const std::string& job_id, std::uint64_t offset);
    void reset_log_offset(const std::string& job_id);

    // Newest first. An empty status set matches every job; limit <= 0 means all.
    std::vector<JobRecord> list_jobs(const std::set<std::string>& statuses = {},
                                     int limit = 0) const;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

// Job status as last recorded in the store. The store is re-read on every
// call so updates written by other tools are seen while following.
class StoredJobStatus : public JobStatusProvider {
public:
    explicit StoredJobStatus(const JobStore& store) : store_(store) {}

    std::string current_status(const std::string& job_id) override;

private:
    const JobStore& store_;
};

// ~/.bridgectl/jobs.yaml
fs::path default_job_store_path();
