#include "ssh_config.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

std::string generate_ssh_config(const BridgeProfile& profile, const fs::path& helper_path,
                                const std::string& host_alias) {
    const std::string alias = host_alias.empty() ? profile.name : host_alias;
    return fmt::format(
        "Host {}\n"
        "    HostName localhost\n"
        "    User {}\n"
        "    Port {}\n"
        "    ProxyCommand {} {} stdio://%h:%p\n"
        "    StrictHostKeyChecking no\n"
        "    UserKnownHostsFile /dev/null\n"
        "    LogLevel ERROR",
        alias, profile.ssh_user, profile.ssh_port,
        helper_path.string(), websocket_url(profile.proxy_url));
}

std::string generate_all_ssh_configs(const TunnelConfig& config) {
    std::vector<std::string> blocks;
    for (const auto& b : config.list_bridges()) {
        blocks.push_back(generate_ssh_config(b, config.helper_path));
    }
    return join(blocks, "\n\n");
}

fs::path default_ssh_config_path() {
    return platform::home_dir() / ".ssh" / "config";
}

// "Host a b c" names alias as one of its whitespace-separated patterns.
static bool host_line_names(const std::string& line, const std::string& alias) {
    std::istringstream ss(line);
    std::string word;
    if (!(ss >> word) || word != "Host") return false;
    while (ss >> word) {
        if (word == alias) return true;
    }
    return false;
}

static bool is_host_line(const std::string& line) {
    return line.compare(0, 5, "Host ") == 0 || line.compare(0, 5, "Host\t") == 0;
}

Result<bool> install_ssh_config(const std::string& block, const std::string& host_alias,
                                const fs::path& ssh_config_path) {
    std::error_code ec;
    fs::create_directories(ssh_config_path.parent_path(), ec);
    if (ec) {
        return Result<bool>::Err("Cannot create " + ssh_config_path.parent_path().string() +
                                 ": " + ec.message());
    }
    fs::permissions(ssh_config_path.parent_path(), fs::perms::owner_all,
                    fs::perm_options::replace, ec);

    std::string existing;
    if (fs::exists(ssh_config_path)) {
        std::ifstream in(ssh_config_path);
        std::ostringstream ss;
        ss << in.rdbuf();
        existing = ss.str();
    }

    std::vector<std::string> lines;
    {
        std::istringstream ss(existing);
        std::string line;
        while (std::getline(ss, line)) lines.push_back(line);
    }

    bool updated = false;
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (!updated && host_line_names(lines[i], host_alias)) {
            out += block + "\n";
            // Skip the old block body, keeping blank lines before the next Host
            size_t end = i;
            while (end + 1 < lines.size() && !is_host_line(lines[end + 1])) ++end;
            while (end > i && lines[end].find_first_not_of(" \t") == std::string::npos) --end;
            i = end;
            updated = true;
            continue;
        }
        out += lines[i] + "\n";
    }

    if (!updated) {
        out = existing;
        if (!out.empty() && out.back() != '\n') out += "\n";
        if (!out.empty()) out += "\n";
        out += block + "\n";
    }

    try {
        platform::atomic_write(ssh_config_path, out);
    } catch (const std::runtime_error& e) {
        return Result<bool>::Err(e.what());
    }
    bridge_log(fmt::format("ssh-config: {} Host {} in {}", updated ? "updated" : "added",
                           host_alias, ssh_config_path.string()));
    return Result<bool>::Ok(updated);
}
