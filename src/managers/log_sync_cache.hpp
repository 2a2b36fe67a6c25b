#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <core/constants.hpp>
#include <core/transport.hpp>
#include "job_store.hpp"

namespace fs = std::filesystem;

struct LogFetchResult {
    fs::path path;
    std::uintmax_t start_offset = 0;    // offset requested from the remote side
    std::uintmax_t bytes_fetched = 0;
    std::uintmax_t size = 0;            // local file size afterwards (= new offset)
    bool incremental = false;           // appended rather than replaced

    bool no_new_content() const { return incremental && bytes_fetched == 0; }
};

// Local copy of each job's remote log plus the byte offset already held.
// The stored offset always equals the cache file's actual size; any
// mismatch is repaired by fetching from zero.
class LogSyncCache {
public:
    LogSyncCache(JobStore& store, fs::path cache_dir);

    std::uintmax_t get_offset(const std::string& job_id) const;
    void set_offset(const std::string& job_id, std::uintmax_t offset);
    void reset_offset(const std::string& job_id);

    // <cache_dir>/<job_id>.log. A legacy job-<job_id>.log is renamed into
    // place when only the legacy file exists.
    fs::path cache_path(const std::string& job_id) const;

    // Bring the cache file up to date. With a non-zero offset that matches
    // the file, only bytes past it are requested and appended; otherwise the
    // whole log is fetched and replaces the file. refresh forces the latter.
    // An incremental fetch of zero bytes writes nothing. Prunes stale logs
    // afterwards.
    LogFetchResult fetch(const std::string& job_id, const std::string& remote_path,
                         bool refresh, LogFetcher& fetcher);

    // Delete *.log files older than max_age.
    void prune(std::chrono::hours max_age = std::chrono::hours(24 * LOG_RETENTION_DAYS));

    const fs::path& cache_dir() const { return cache_dir_; }

private:
    JobStore& store_;
    fs::path cache_dir_;
};

// Read [offset, end) of a file. "" when missing or offset is past the end.
std::string read_file_from(const fs::path& path, std::uintmax_t offset);
