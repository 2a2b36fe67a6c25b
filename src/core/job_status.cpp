#include "job_status.hpp"
#include <algorithm>
#include <cctype>
#include <map>

static const std::map<std::string, std::set<std::string>>& alias_map() {
    static const std::map<std::string, std::set<std::string>> aliases{
        {"PENDING",   {"PENDING", "job_pending", "job_creating"}},
        {"RUNNING",   {"RUNNING", "job_running"}},
        {"QUEUING",   {"QUEUING", "job_queuing"}},
        {"SUCCEEDED", {"SUCCEEDED", "job_succeeded"}},
        {"FAILED",    {"FAILED", "job_failed"}},
        {"CANCELLED", {"CANCELLED", "job_cancelled"}},
    };
    return aliases;
}

bool is_terminal_job_status(const std::string& status) {
    static const std::set<std::string> terminal{
        "SUCCEEDED", "FAILED", "CANCELLED",
        "job_succeeded", "job_failed", "job_cancelled", "job_stopped",
    };
    return terminal.count(status) > 0;
}

bool is_succeeded_job_status(const std::string& status) {
    return status == "SUCCEEDED" || status == "job_succeeded";
}

std::set<std::string> expand_status_aliases(const std::vector<std::string>& statuses) {
    std::vector<std::string> wanted = statuses;
    if (wanted.empty()) wanted = {"PENDING", "RUNNING", "QUEUING"};

    std::set<std::string> out;
    for (const auto& s : wanted) {
        std::string key = s;
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        auto it = alias_map().find(key);
        if (it != alias_map().end()) {
            out.insert(it->second.begin(), it->second.end());
        } else {
            out.insert(s);
        }
    }
    return out;
}
