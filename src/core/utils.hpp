#pragma once

#include <string>
#include <vector>
#include <map>
#include <ctime>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Parse an ISO 8601 timestamp to time_t. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Correlation id for a dispatch: "<unix_epoch>-<pid>".
std::string make_request_id();

// Single-quote a string for a POSIX shell.
std::string shell_quote(const std::string& s);

// Double-quote a string for a POSIX shell, escaping \ " $ and `.
std::string shell_double_quote(const std::string& s);

// "export K=\"V\" && export K2=\"V2\" && " (empty string for an empty map),
// ready to prefix a command.
std::string build_env_exports(const std::map<std::string, std::string>& env);

// Split on any of the given delimiter characters, trimming and dropping empties.
std::vector<std::string> split_list(const std::string& s, const std::string& delims = ",\n");

std::string join(const std::vector<std::string>& items, const std::string& sep);

// Last non-empty line of a block of text (trimmed).
std::string last_line(const std::string& text);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
