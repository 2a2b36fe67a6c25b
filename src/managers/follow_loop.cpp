#include "follow_loop.hpp"
#include <core/errors.hpp>
#include <core/job_status.hpp>
#include <core/log.hpp>
#include <platform/interrupt.hpp>
#include <fmt/format.h>
#include <algorithm>

FollowLoop::FollowLoop(LogSyncCache& cache, LogFetcher& fetcher, JobStatusProvider& status,
                       PollClock clock, std::chrono::seconds interval)
    : cache_(cache), fetcher_(fetcher), status_(status), clock_(std::move(clock)),
      interval_(interval) {
}

bool FollowLoop::pause(std::chrono::milliseconds total) {
    auto slice = std::chrono::milliseconds(CANCEL_SLICE_MS);
    for (auto slept = std::chrono::milliseconds(0); slept < total; slept += slice) {
        if (platform::interrupted()) return false;
        clock_.sleep(std::min(slice, total - slept));
    }
    return !platform::interrupted();
}

bool FollowLoop::refetch_and_emit(const std::string& job_id, const std::string& remote_path,
                                  FollowEvent::Kind kind, const FollowSink& sink) {
    try {
        auto result = cache_.fetch(job_id, remote_path, true, fetcher_);
        if (result.size < last_displayed_) {
            // Rotated or truncated: show it again from the start
            sink({FollowEvent::Kind::Warning, "",
                  "Log shrank since the last fetch, showing it from the start", "", 0});
            last_displayed_ = 0;
        }
        if (result.size > last_displayed_) {
            std::string delta = read_file_from(result.path, last_displayed_);
            last_displayed_ = result.size;
            sink({kind, delta, "", "", last_displayed_});
        }
        return true;
    } catch (const ForgeAuthError&) {
        throw;
    } catch (const std::exception& e) {
        sink({FollowEvent::Kind::Warning, "", std::string("Fetch failed: ") + e.what(), "", 0});
    }
    return false;
}

std::string FollowLoop::run(const std::string& job_id, const std::string& remote_path,
                            bool refresh, const FollowSink& sink) {
    platform::InterruptGuard guard;

    fs::path path = cache_.cache_path(job_id);
    if (refresh || !fs::exists(path)) {
        // Errors on the first fetch are fatal to the command
        cache_.fetch(job_id, remote_path, refresh, fetcher_);
        path = cache_.cache_path(job_id);
    }

    last_displayed_ = 0;
    if (fs::exists(path)) {
        std::string content = read_file_from(path, 0);
        last_displayed_ = content.size();
        cache_.set_offset(job_id, last_displayed_);
        sink({FollowEvent::Kind::InitialContent, content, "", "", last_displayed_});
    }

    std::string final_status;
    while (final_status.empty()) {
        if (!pause(interval_)) {
            sink({FollowEvent::Kind::Interrupted, "", "Stopped following.", "", last_displayed_});
            return "";
        }

        refetch_and_emit(job_id, remote_path, FollowEvent::Kind::NewContent, sink);

        try {
            std::string current = status_.current_status(job_id);
            if (is_terminal_job_status(current)) final_status = current;
        } catch (const std::exception& e) {
            sink({FollowEvent::Kind::Warning, "",
                  std::string("Status check failed: ") + e.what(), "", 0});
        }
    }

    bridge_log(fmt::format("follow: {} reached {}", job_id, final_status));
    if (!pause(std::chrono::milliseconds(FOLLOW_MEDIATED_GRACE_MS))) {
        sink({FollowEvent::Kind::Interrupted, "", "Stopped following.", "", last_displayed_});
        return "";
    }
    refetch_and_emit(job_id, remote_path, FollowEvent::Kind::FinalContent, sink);
    sink({FollowEvent::Kind::Completed, "", "", final_status, last_displayed_});
    return final_status;
}
