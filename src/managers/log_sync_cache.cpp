#include "log_sync_cache.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <unistd.h>

LogSyncCache::LogSyncCache(JobStore& store, fs::path cache_dir)
    : store_(store), cache_dir_(std::move(cache_dir)) {
}

std::uintmax_t LogSyncCache::get_offset(const std::string& job_id) const {
    return store_.get_log_offset(job_id);
}

void LogSyncCache::set_offset(const std::string& job_id, std::uintmax_t offset) {
    store_.set_log_offset(job_id, offset);
}

void LogSyncCache::reset_offset(const std::string& job_id) {
    store_.reset_log_offset(job_id);
}

fs::path LogSyncCache::cache_path(const std::string& job_id) const {
    fs::path path = cache_dir_ / (job_id + ".log");
    fs::path legacy = cache_dir_ / ("job-" + job_id + ".log");

    if (!fs::exists(path) && fs::exists(legacy)) {
        std::error_code ec;
        fs::rename(legacy, path, ec);
        if (ec) {
            bridge_log("log cache: legacy rename failed, using " + legacy.string());
            return legacy;
        }
    }
    return path;
}

namespace {

// Removes the temp download on scope exit.
struct TempFile {
    fs::path path;
    ~TempFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }
};

std::uintmax_t size_or_zero(const fs::path& p) {
    std::error_code ec;
    auto n = fs::file_size(p, ec);
    return ec ? 0 : n;
}

} // namespace

LogFetchResult LogSyncCache::fetch(const std::string& job_id, const std::string& remote_path,
                                   bool refresh, LogFetcher& fetcher) {
    fs::create_directories(cache_dir_);
    fs::path path = cache_path(job_id);

    if (refresh) reset_offset(job_id);
    std::uintmax_t offset = get_offset(job_id);

    if (offset > 0) {
        bool present = fs::exists(path);
        std::uintmax_t actual = present ? size_or_zero(path) : 0;
        if (!present || actual != offset) {
            bridge_log(fmt::format("log cache: {} offset {} != file size {}, refetching",
                                   job_id, offset, present ? std::to_string(actual) : "missing"));
            reset_offset(job_id);
            offset = 0;
        }
    }

    LogFetchResult result;
    result.path = path;
    result.start_offset = offset;
    result.incremental = offset > 0;

    TempFile tmp{cache_dir_ / fmt::format("{}.tmp.{}", job_id, getpid())};
    fetcher.fetch_log(job_id, remote_path, offset, tmp.path);
    result.bytes_fetched = size_or_zero(tmp.path);

    if (result.incremental) {
        if (result.bytes_fetched > 0) {
            std::ifstream in(tmp.path, std::ios::binary);
            std::ofstream out(path, std::ios::binary | std::ios::app);
            out << in.rdbuf();
            if (!out) throw std::runtime_error("Failed to append to " + path.string());
        }
    } else {
        // A full fetch always carries the whole file
        if (!fs::exists(tmp.path)) std::ofstream(tmp.path, std::ios::binary).flush();
        fs::rename(tmp.path, path);
    }

    result.size = size_or_zero(path);
    set_offset(job_id, result.size);
    bridge_log(fmt::format("log cache: {} {} {} bytes from offset {}, size now {}", job_id,
                           result.incremental ? "appended" : "replaced with",
                           result.bytes_fetched, offset, result.size));

    prune();
    return result;
}

void LogSyncCache::prune(std::chrono::hours max_age) {
    std::error_code ec;
    if (!fs::is_directory(cache_dir_, ec)) return;

    auto cutoff = fs::file_time_type::clock::now() - max_age;
    for (const auto& entry : fs::directory_iterator(cache_dir_, ec)) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".log") continue;
        auto mtime = entry.last_write_time(ec);
        if (ec) continue;
        if (mtime < cutoff) {
            fs::remove(entry.path(), ec);
            if (!ec) bridge_log("log cache: pruned " + entry.path().string());
        }
    }
}

std::string read_file_from(const fs::path& path, std::uintmax_t offset) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return "";
    in.seekg(0, std::ios::end);
    auto end = static_cast<std::uintmax_t>(in.tellg());
    if (offset >= end) return "";
    in.seekg(static_cast<std::streamoff>(offset));
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}
