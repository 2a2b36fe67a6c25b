#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>

namespace fs = std::filesystem;

// One endpoint reachable through the WebSocket-to-stdio helper.
struct BridgeProfile {
    std::string name;
    std::string proxy_url;
    std::string ssh_user = DEFAULT_SSH_USER;
    int ssh_port = DEFAULT_SSH_PORT;
};

// Ordered profile collection plus the default pointer. Single writer in
// practice: load, mutate, save (atomic replace, no locking).
struct TunnelConfig {
    std::vector<BridgeProfile> bridges;
    std::string default_bridge;           // "" = none
    fs::path config_dir;                  // holds bridges.yaml
    fs::path helper_path;                 // local rtunnel binary

    fs::path config_file() const { return config_dir / "bridges.yaml"; }
    fs::path legacy_file() const { return config_dir / "tunnel.conf"; }

    // Explicit name, else the default, else the only profile. nullptr if none.
    const BridgeProfile* get_bridge(const std::string& name = "") const;

    // Add or replace by name. The first profile becomes the default.
    void add_bridge(const BridgeProfile& profile);

    // Returns false if absent. A removed default moves to the first remaining.
    bool remove_bridge(const std::string& name);

    // Returns false if no such profile.
    bool set_default(const std::string& name);

    const std::vector<BridgeProfile>& list_bridges() const { return bridges; }
};

fs::path default_tunnel_config_dir();
fs::path default_helper_path();

// Load bridges.yaml (a corrupt file loads as empty). When empty, a legacy
// tunnel.conf (PROXY_URL= / SSH_USER= lines) is migrated into a "default"
// profile and written back.
TunnelConfig load_tunnel_config(const fs::path& config_dir = default_tunnel_config_dir());

Result<void> save_tunnel_config(const TunnelConfig& config);

// Non-empty; letters, digits, '-' and '_' only (also used as a Host alias).
bool valid_bridge_name(const std::string& name);

// https:// -> wss://, http:// -> ws://, anything else unchanged.
std::string websocket_url(const std::string& proxy_url);
