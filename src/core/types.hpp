#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Remote command execution result (exit_code -1 means the command never ran
// to completion: channel failure, timeout, spawn failure)
struct RemoteResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// Configuration structures
struct ForgeSettings {
    std::string platform;                       // "gitea", "github" or "" (auto-detect)
    std::string gitea_server = "https://codeberg.org";
    std::string gitea_repo;
    std::string gitea_token;
    std::string github_server = "https://github.com";
    std::string github_repo;
    std::string github_token;
    std::string log_workflow = "retrieve_job_log.yml";
    std::string sync_workflow = "sync_code.yml";
    std::string bridge_workflow = "run_bridge_action.yml";
    std::string logs_branch = "logs";
    std::string ref = "main";
};

struct RemoteSettings {
    std::string target_dir;
    int remote_timeout = DEFAULT_REMOTE_TIMEOUT;      // log retrieval / sync wait (seconds)
    int bridge_action_timeout = DEFAULT_BRIDGE_TIMEOUT;  // bridge exec wait (seconds)
    std::vector<std::string> denylist;
    std::map<std::string, std::string> env;     // exported before every remote command
    std::string log_cache_dir;                  // "" = ~/.bridgectl/logs
    std::string default_remote = "origin";      // git remote pushed by sync
};

struct TunnelSettings {
    std::string helper_download_url;
    bool disabled = false;                      // force the Actions transport
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
