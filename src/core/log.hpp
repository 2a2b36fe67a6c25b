#pragma once

#include <string>
#include <fstream>
#include <chrono>
#include <ctime>
#include <core/types.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

inline std::string bridge_log_path() {
    static std::string path = (platform::temp_dir() / "bridgectl_debug.log").string();
    return path;
}

inline void bridge_log(const std::string& msg) {
    std::ofstream out(bridge_log_path(), std::ios::app);
    if (!out) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    out << fmt::format("[{:02}:{:02}:{:02}.{:03}] {}\n",
                       tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                       static_cast<int>(ms.count()), msg);
}

inline void bridge_log_remote(const std::string& label, const std::string& cmd,
                              const RemoteResult& r) {
    bridge_log(fmt::format("{} CMD: {}", label, cmd));
    bridge_log(fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                           r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        bridge_log(fmt::format("{} stderr={}", label, r.stderr_data.substr(0, 500)));
}
