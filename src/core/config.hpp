#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Environment lookup seam; the default reads getenv().
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;
EnvLookup process_env();

class Config {
public:
    // Global, then project (project overrides), then BRIDGECTL_* environment.
    static Result<Config> load(const fs::path& project_dir = fs::current_path());

    // Same layering with explicit sources.
    static Result<Config> load_from(const fs::path& global_path,
                                    const fs::path& project_dir,
                                    const EnvLookup& env);

    // Accessors
    const ForgeSettings& forge() const { return forge_; }
    const RemoteSettings& remote() const { return remote_; }
    const TunnelSettings& tunnel() const { return tunnel_; }
    const fs::path& project_dir() const { return project_dir_; }

    // Directory holding cached job logs.
    fs::path log_cache_dir() const;

public:
    Config() = default;

private:
    void overlay_yaml(const fs::path& path);
    void overlay_env(const EnvLookup& env);

    ForgeSettings forge_;
    RemoteSettings remote_;
    TunnelSettings tunnel_;
    fs::path project_dir_;
};

// ── Forge resolution ─────────────────────────────────────────
// These throw ForgeAuthError (with a remediation hint) when the active
// platform lacks a token or an "owner/repo" repository.

enum class ForgePlatform { Gitea, GitHub };

// Explicit platform wins, else any GitHub repo/token selects GitHub, else Gitea.
// Throws ConfigError for an unknown explicit platform name.
ForgePlatform resolve_platform(const ForgeSettings& forge);
const char* platform_name(ForgePlatform p);

// Strip a leading "Bearer " or "token " and surrounding whitespace.
std::string sanitize_token(const std::string& token);

std::string active_repo(const ForgeSettings& forge);
std::string active_token(const ForgeSettings& forge);
std::string active_server(const ForgeSettings& forge);

// Paths
fs::path get_global_config_dir();
fs::path get_global_config_path();
fs::path get_project_config_path(const fs::path& dir = fs::current_path());
