#pragma once

#include <string>
#include <chrono>
#include <core/constants.hpp>
#include <core/poll_clock.hpp>
#include <core/transport.hpp>
#include "log_sync_cache.hpp"

// Follow a job's log through the mediated transport: every interval,
// re-fetch the whole log (never incremental, so a rotated log is picked up),
// emit the bytes past what was already shown, then check the job status.
// On a terminal status, wait a grace period, emit one final delta and stop.
// Per-iteration fetch / status failures become Warning events; an auth
// failure still ends the follow.
class FollowLoop {
public:
    FollowLoop(LogSyncCache& cache, LogFetcher& fetcher, JobStatusProvider& status,
               PollClock clock = PollClock::system(),
               std::chrono::seconds interval = std::chrono::seconds(FOLLOW_INTERVAL_SECS));

    // Returns the terminal status, or "" when interrupted.
    std::string run(const std::string& job_id, const std::string& remote_path,
                    bool refresh, const FollowSink& sink);

private:
    // Sleep in short slices. False if interrupted.
    bool pause(std::chrono::milliseconds total);

    // Full re-fetch and delta emit. Returns false if the fetch failed.
    bool refetch_and_emit(const std::string& job_id, const std::string& remote_path,
                          FollowEvent::Kind kind, const FollowSink& sink);

    LogSyncCache& cache_;
    LogFetcher& fetcher_;
    JobStatusProvider& status_;
    PollClock clock_;
    std::chrono::seconds interval_;
    std::uintmax_t last_displayed_ = 0;
};
