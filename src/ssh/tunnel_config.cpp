#include "tunnel_config.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>

fs::path default_tunnel_config_dir() {
    return platform::home_dir() / ".bridgectl";
}

fs::path default_helper_path() {
    return platform::home_dir() / ".local" / "bin" / HELPER_BINARY_NAME;
}

const BridgeProfile* TunnelConfig::get_bridge(const std::string& name) const {
    auto find = [&](const std::string& n) -> const BridgeProfile* {
        auto it = std::find_if(bridges.begin(), bridges.end(),
                               [&](const BridgeProfile& p) { return p.name == n; });
        return it == bridges.end() ? nullptr : &*it;
    };
    if (!name.empty()) return find(name);
    if (!default_bridge.empty()) return find(default_bridge);
    if (bridges.size() == 1) return &bridges.front();
    return nullptr;
}

void TunnelConfig::add_bridge(const BridgeProfile& profile) {
    auto it = std::find_if(bridges.begin(), bridges.end(),
                           [&](const BridgeProfile& p) { return p.name == profile.name; });
    if (it != bridges.end()) {
        *it = profile;
    } else {
        bridges.push_back(profile);
    }
    if (default_bridge.empty()) default_bridge = profile.name;
}

bool TunnelConfig::remove_bridge(const std::string& name) {
    auto it = std::find_if(bridges.begin(), bridges.end(),
                           [&](const BridgeProfile& p) { return p.name == name; });
    if (it == bridges.end()) return false;
    bridges.erase(it);
    if (default_bridge == name) {
        default_bridge = bridges.empty() ? "" : bridges.front().name;
    }
    return true;
}

bool TunnelConfig::set_default(const std::string& name) {
    if (!get_bridge(name)) return false;
    default_bridge = name;
    return true;
}

std::string websocket_url(const std::string& proxy_url) {
    if (proxy_url.rfind("https://", 0) == 0) return "wss://" + proxy_url.substr(8);
    if (proxy_url.rfind("http://", 0) == 0) return "ws://" + proxy_url.substr(7);
    return proxy_url;
}

// Strip one layer of matching quotes.
static std::string unquote(std::string v) {
    trim(v);
    if (v.size() >= 2 && (v.front() == '"' || v.front() == '\'') && v.back() == v.front()) {
        v = v.substr(1, v.size() - 2);
    }
    return v;
}

static void migrate_legacy(TunnelConfig& config) {
    std::ifstream in(config.legacy_file());
    if (!in) return;

    std::string proxy_url;
    std::string ssh_user = DEFAULT_SSH_USER;
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        trim(key);
        std::string value = unquote(line.substr(eq + 1));
        if (key == "PROXY_URL") proxy_url = value;
        else if (key == "SSH_USER") ssh_user = value;
    }
    if (proxy_url.empty()) return;

    BridgeProfile profile;
    profile.name = "default";
    profile.proxy_url = proxy_url;
    profile.ssh_user = ssh_user;
    config.add_bridge(profile);

    auto saved = save_tunnel_config(config);
    if (saved.is_err()) {
        bridge_log("Legacy tunnel.conf migration not saved: " + saved.error);
    } else {
        bridge_log("Migrated legacy tunnel.conf into bridges.yaml");
    }
}

TunnelConfig load_tunnel_config(const fs::path& config_dir) {
    TunnelConfig config;
    config.config_dir = config_dir;
    config.helper_path = default_helper_path();

    if (fs::exists(config.config_file())) {
        try {
            YAML::Node root = YAML::LoadFile(config.config_file().string());
            config.default_bridge = root["default"].as<std::string>("");
            if (root["bridges"] && root["bridges"].IsSequence()) {
                for (const auto& n : root["bridges"]) {
                    BridgeProfile p;
                    p.name = n["name"].as<std::string>("");
                    p.proxy_url = n["proxy_url"].as<std::string>("");
                    p.ssh_user = n["ssh_user"].as<std::string>(DEFAULT_SSH_USER);
                    p.ssh_port = n["ssh_port"].as<int>(DEFAULT_SSH_PORT);
                    if (p.name.empty() || p.proxy_url.empty()) continue;
                    config.bridges.push_back(p);
                }
            }
            if (!config.default_bridge.empty() && !config.get_bridge(config.default_bridge)) {
                config.default_bridge.clear();
            }
        } catch (const std::exception& e) {
            // Corrupted profile store: start fresh
            bridge_log(std::string("bridges.yaml unreadable: ") + e.what());
            config.bridges.clear();
            config.default_bridge.clear();
        }
    }

    if (config.bridges.empty()) migrate_legacy(config);
    return config;
}

Result<void> save_tunnel_config(const TunnelConfig& config) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "default" << YAML::Value << config.default_bridge;
    out << YAML::Key << "bridges" << YAML::Value << YAML::BeginSeq;
    for (const auto& p : config.bridges) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << p.name;
        out << YAML::Key << "proxy_url" << YAML::Value << p.proxy_url;
        out << YAML::Key << "ssh_user" << YAML::Value << p.ssh_user;
        out << YAML::Key << "ssh_port" << YAML::Value << p.ssh_port;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    try {
        platform::atomic_write(config.config_file(), std::string(out.c_str()) + "\n");
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(std::string("Failed to save tunnel config: ") + e.what());
    }
}

bool valid_bridge_name(const std::string& name) {
    if (name.empty()) return false;
    return std::all_of(name.begin(), name.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '-' || c == '_';
    });
}
