#pragma once

#include <string>
#include <vector>
#include <set>
#include <filesystem>
#include <core/transport.hpp>
#include "job_store.hpp"
#include "log_sync_cache.hpp"

struct RefreshedLog {
    std::string job_id;
    std::filesystem::path log_path;
};

struct RefreshFailure {
    std::string job_id;
    std::string error;
};

struct BulkRefreshReport {
    std::vector<RefreshedLog> updated;
    std::vector<RefreshFailure> errors;
    std::vector<std::string> skipped_no_log_path;
    size_t processed = 0;

    bool ok() const { return errors.empty(); }
};

// Refresh cached logs for every stored job whose status is in `statuses`
// (already alias-expanded; empty = every job), newest first, up to limit. One job's
// failure is recorded and the batch continues; ForgeAuthError aborts it.
// actions_url, when given, is quoted in the hint attached to forge errors.
BulkRefreshReport refresh_logs(JobStore& store, LogSyncCache& cache, LogFetcher& fetcher,
                               const std::set<std::string>& statuses, int limit,
                               bool refresh, const std::string& actions_url = "");
