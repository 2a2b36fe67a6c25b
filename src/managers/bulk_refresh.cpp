#include "bulk_refresh.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

BulkRefreshReport refresh_logs(JobStore& store, LogSyncCache& cache, LogFetcher& fetcher,
                               const std::set<std::string>& statuses, int limit,
                               bool refresh, const std::string& actions_url) {
    BulkRefreshReport report;
    auto jobs = store.list_jobs(statuses, limit);
    report.processed = jobs.size();

    for (const auto& job : jobs) {
        if (job.log_path.empty()) {
            report.skipped_no_log_path.push_back(job.job_id);
            continue;
        }

        try {
            auto result = cache.fetch(job.job_id, job.log_path, refresh, fetcher);
            report.updated.push_back({job.job_id, result.path});
        } catch (const ForgeAuthError&) {
            throw;
        } catch (const TimeoutError& e) {
            report.errors.push_back({job.job_id, e.what()});
        } catch (const ForgeError& e) {
            std::string msg = fmt::format(
                "{}\n\nHints:\n"
                "- Check that the job created a log file at: {}\n"
                "- Verify the Bridge workflow exists and can access the shared filesystem",
                e.what(), job.log_path);
            if (!actions_url.empty()) msg += "\n- View Actions runs at: " + actions_url;
            report.errors.push_back({job.job_id, msg});
        } catch (const std::exception& e) {
            report.errors.push_back({job.job_id, e.what()});
        }
    }

    bridge_log(fmt::format("bulk refresh: {} processed, {} updated, {} errors, {} skipped",
                           report.processed, report.updated.size(), report.errors.size(),
                           report.skipped_no_log_path.size()));
    return report;
}
