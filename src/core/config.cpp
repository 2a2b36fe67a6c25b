#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace fs = std::filesystem;

EnvLookup process_env() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (!v) return std::nullopt;
        return std::string(v);
    };
}

fs::path get_global_config_dir() {
    return platform::home_dir() / ".bridgectl";
}

fs::path get_global_config_path() {
    return get_global_config_dir() / "config.yaml";
}

fs::path get_project_config_path(const fs::path& dir) {
    return dir / "bridgectl.yaml";
}

// ── YAML overlay ─────────────────────────────────────────────
// Only keys present in the document override the current value.

static void overlay_string(const YAML::Node& node, const char* key, std::string& out) {
    if (node[key] && node[key].IsScalar()) out = node[key].as<std::string>();
}

static void overlay_int(const YAML::Node& node, const char* key, int& out) {
    if (node[key] && node[key].IsScalar()) out = node[key].as<int>(out);
}

static std::vector<std::string> parse_string_list(const YAML::Node& node) {
    if (node.IsSequence()) {
        return node.as<std::vector<std::string>>(std::vector<std::string>());
    }
    if (node.IsScalar()) {
        return split_list(node.as<std::string>());
    }
    return {};
}

static void overlay_forge(const YAML::Node& node, ForgeSettings& f) {
    overlay_string(node, "platform", f.platform);
    overlay_string(node, "gitea_server", f.gitea_server);
    overlay_string(node, "gitea_repo", f.gitea_repo);
    overlay_string(node, "gitea_token", f.gitea_token);
    overlay_string(node, "github_server", f.github_server);
    overlay_string(node, "github_repo", f.github_repo);
    overlay_string(node, "github_token", f.github_token);
    overlay_string(node, "log_workflow", f.log_workflow);
    overlay_string(node, "sync_workflow", f.sync_workflow);
    overlay_string(node, "bridge_workflow", f.bridge_workflow);
    overlay_string(node, "logs_branch", f.logs_branch);
    overlay_string(node, "ref", f.ref);
}

static void overlay_remote(const YAML::Node& node, RemoteSettings& r) {
    overlay_string(node, "target_dir", r.target_dir);
    overlay_int(node, "remote_timeout", r.remote_timeout);
    overlay_int(node, "bridge_action_timeout", r.bridge_action_timeout);
    overlay_string(node, "log_cache_dir", r.log_cache_dir);
    overlay_string(node, "default_remote", r.default_remote);
    if (node["denylist"]) {
        r.denylist = parse_string_list(node["denylist"]);
    }
    if (node["env"] && node["env"].IsMap()) {
        for (const auto& kv : node["env"]) {
            r.env[kv.first.as<std::string>()] = kv.second.as<std::string>("");
        }
    }
}

static void overlay_tunnel(const YAML::Node& node, TunnelSettings& t) {
    overlay_string(node, "helper_download_url", t.helper_download_url);
    if (node["disabled"] && node["disabled"].IsScalar()) {
        t.disabled = node["disabled"].as<bool>(t.disabled);
    }
}

void Config::overlay_yaml(const fs::path& path) {
    YAML::Node root = YAML::LoadFile(path.string());
    if (!root.IsMap()) return;
    if (root["forge"]) overlay_forge(root["forge"], forge_);
    if (root["remote"]) overlay_remote(root["remote"], remote_);
    if (root["tunnel"]) overlay_tunnel(root["tunnel"], tunnel_);
}

// ── Environment overlay ──────────────────────────────────────

static bool truthy(const std::string& v) {
    std::string s = v;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s == "1" || s == "true" || s == "yes" || s == "on";
}

void Config::overlay_env(const EnvLookup& env) {
    auto str = [&](const char* name, std::string& out) {
        if (auto v = env(name); v && !v->empty()) out = *v;
    };
    auto num = [&](const char* name, int& out) {
        if (auto v = env(name); v && !v->empty()) {
            int parsed = safe_stoi(*v, -1);
            if (parsed <= 0) {
                throw ConfigError(fmt::format("{} must be a positive integer, got '{}'", name, *v));
            }
            out = parsed;
        }
    };

    str("BRIDGECTL_GIT_PLATFORM", forge_.platform);
    str("BRIDGECTL_GITEA_SERVER", forge_.gitea_server);
    str("BRIDGECTL_GITEA_REPO", forge_.gitea_repo);
    str("BRIDGECTL_GITEA_TOKEN", forge_.gitea_token);
    str("BRIDGECTL_GITHUB_SERVER", forge_.github_server);
    str("BRIDGECTL_GITHUB_REPO", forge_.github_repo);
    str("BRIDGECTL_GITHUB_TOKEN", forge_.github_token);
    str("BRIDGECTL_TARGET_DIR", remote_.target_dir);
    str("BRIDGECTL_DEFAULT_REMOTE", remote_.default_remote);
    num("BRIDGECTL_REMOTE_TIMEOUT", remote_.remote_timeout);
    num("BRIDGECTL_BRIDGE_TIMEOUT", remote_.bridge_action_timeout);
    str("BRIDGECTL_HELPER_URL", tunnel_.helper_download_url);

    if (auto v = env("BRIDGECTL_DENYLIST"); v && !v->empty()) {
        remote_.denylist = split_list(*v);
    }
    if (auto v = env("BRIDGECTL_NO_TUNNEL"); v && !v->empty()) {
        tunnel_.disabled = truthy(*v);
    }
}

fs::path Config::log_cache_dir() const {
    if (!remote_.log_cache_dir.empty()) return fs::path(remote_.log_cache_dir);
    return get_global_config_dir() / "logs";
}

// ── Loading ──────────────────────────────────────────────────

Result<Config> Config::load_from(const fs::path& global_path,
                                 const fs::path& project_dir,
                                 const EnvLookup& env) {
    Config config;
    config.project_dir_ = project_dir;

    if (!global_path.empty() && fs::exists(global_path)) {
        try {
            config.overlay_yaml(global_path);
        } catch (const std::exception& e) {
            return Result<Config>::Err(std::string("Failed to parse global config: ") + e.what());
        }
    }

    fs::path project_path = get_project_config_path(project_dir);
    if (fs::exists(project_path)) {
        try {
            config.overlay_yaml(project_path);
        } catch (const std::exception& e) {
            return Result<Config>::Err(std::string("Failed to parse project config: ") + e.what());
        }
    }

    try {
        config.overlay_env(env);
    } catch (const ConfigError& e) {
        return Result<Config>::Err(e.what());
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const fs::path& project_dir) {
    return load_from(get_global_config_path(), project_dir, process_env());
}

// ── Forge resolution ─────────────────────────────────────────

ForgePlatform resolve_platform(const ForgeSettings& forge) {
    std::string p = forge.platform;
    trim(p);
    std::transform(p.begin(), p.end(), p.begin(), [](unsigned char c) { return std::tolower(c); });

    if (p == "github") return ForgePlatform::GitHub;
    if (p == "gitea") return ForgePlatform::Gitea;
    if (!p.empty()) {
        throw ConfigError(fmt::format("Unknown git platform '{}' (expected gitea or github)", p));
    }

    if (!forge.github_repo.empty() || !forge.github_token.empty()) {
        return ForgePlatform::GitHub;
    }
    return ForgePlatform::Gitea;
}

const char* platform_name(ForgePlatform p) {
    return p == ForgePlatform::GitHub ? "GitHub" : "Gitea";
}

std::string sanitize_token(const std::string& token) {
    std::string t = token;
    trim(t);
    std::string lower = t;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower.rfind("bearer ", 0) == 0) {
        t = t.substr(7);
    } else if (lower.rfind("token ", 0) == 0) {
        t = t.substr(6);
    }
    trim(t);
    return t;
}

std::string active_repo(const ForgeSettings& forge) {
    ForgePlatform p = resolve_platform(forge);
    std::string repo = (p == ForgePlatform::GitHub) ? forge.github_repo : forge.gitea_repo;
    trim(repo);
    const char* var = (p == ForgePlatform::GitHub) ? "BRIDGECTL_GITHUB_REPO" : "BRIDGECTL_GITEA_REPO";

    if (repo.empty()) {
        throw ForgeAuthError(
            fmt::format("{} operations require {} to be set", platform_name(p), var),
            fmt::format("Use 'owner/repo' format, e.g. export {}='my-org/my-repo'", var));
    }
    auto slash = repo.find('/');
    if (slash == std::string::npos || slash == 0 || slash == repo.size() - 1 ||
        repo.find('/', slash + 1) != std::string::npos) {
        throw ForgeAuthError(
            fmt::format("Invalid {} format '{}'", var, repo),
            "Expected 'owner/repo'");
    }
    return repo;
}

std::string active_token(const ForgeSettings& forge) {
    ForgePlatform p = resolve_platform(forge);
    std::string token = sanitize_token(
        p == ForgePlatform::GitHub ? forge.github_token : forge.gitea_token);
    if (token.empty()) {
        const char* var = (p == ForgePlatform::GitHub) ? "BRIDGECTL_GITHUB_TOKEN"
                                                       : "BRIDGECTL_GITEA_TOKEN";
        throw ForgeAuthError(
            fmt::format("{} operations require an API token", platform_name(p)),
            fmt::format("Set it with: export {}='...'", var));
    }
    return token;
}

std::string active_server(const ForgeSettings& forge) {
    ForgePlatform p = resolve_platform(forge);
    std::string server = (p == ForgePlatform::GitHub) ? forge.github_server : forge.gitea_server;
    trim(server);
    if (server.empty()) {
        server = (p == ForgePlatform::GitHub) ? "https://github.com" : "https://codeberg.org";
    }
    while (!server.empty() && server.back() == '/') server.pop_back();
    return server;
}
