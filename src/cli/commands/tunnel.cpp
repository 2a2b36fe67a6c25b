#include "../bridge_cli.hpp"
#include "../theme.hpp"
#include <core/errors.hpp>
#include <core/json_util.hpp>
#include <core/utils.hpp>
#include <ssh/helper_binary.hpp>
#include <ssh/ssh_config.hpp>
#include <chrono>
#include <functional>
#include <map>
#include <iostream>
#include <fmt/format.h>

namespace {

const char* NO_BRIDGES_MSG = "No bridges configured. Run 'bridgectl tunnel add <name> <url>' first.";

void save_or_throw(const TunnelConfig& config) {
    auto saved = save_tunnel_config(config);
    if (saved.is_err()) throw ConfigError(saved.error);
}

std::string helper_url(BaseCLI& cli) {
    return cli.config().tunnel().helper_download_url;
}

Json::Value default_or_null(const TunnelConfig& config) {
    if (config.default_bridge.empty()) return Json::Value();
    return Json::Value(config.default_bridge);
}

// ── Subcommands ─────────────────────────────────────────────

int tunnel_list(BaseCLI& cli, ArgReader& args) {
    args.positionals();
    TunnelConfig config = load_tunnel_config();

    if (cli.json_output) {
        Json::Value bridges(Json::arrayValue);
        for (const auto& b : config.bridges) {
            Json::Value item(Json::objectValue);
            item["name"] = b.name;
            item["proxy_url"] = b.proxy_url;
            item["ssh_user"] = b.ssh_user;
            item["ssh_port"] = b.ssh_port;
            item["is_default"] = b.name == config.default_bridge;
            bridges.append(item);
        }
        Json::Value data(Json::objectValue);
        data["bridges"] = bridges;
        data["default"] = default_or_null(config);
        cli.print_json(data);
        return EXIT_OK;
    }

    if (config.bridges.empty()) {
        std::cout << theme::info("No bridges configured.");
        std::cout << theme::step("Add one with: bridgectl tunnel add <name> <url>");
        return EXIT_OK;
    }

    std::cout << theme::section("Configured bridges");
    for (const auto& b : config.bridges) {
        bool is_default = b.name == config.default_bridge;
        std::cout << "  " << (is_default ? theme::green("*") : std::string(" ")) << " "
                  << theme::bold(b.name) << "\n";
        std::cout << theme::kv("URL", b.proxy_url);
        std::cout << theme::kv("SSH", fmt::format("{}@localhost:{}", b.ssh_user, b.ssh_port));
    }
    std::cout << "\n" << theme::dim("  * = default bridge") << "\n";
    return EXIT_OK;
}

int tunnel_add(BaseCLI& cli, ArgReader& args) {
    std::string user = args.option({"--ssh-user", "--user"}).value_or(DEFAULT_SSH_USER);
    int port = args.int_option({"--ssh-port", "--port"}).value_or(DEFAULT_SSH_PORT);
    bool set_default = args.flag({"--set-default"});

    auto pos = args.positionals();
    if (pos.size() != 2) {
        throw std::invalid_argument(
            "Usage: bridgectl tunnel add <name> <url> [--ssh-user U] [--ssh-port P] [--set-default]");
    }
    const std::string& name = pos[0];
    const std::string& url = pos[1];

    if (!valid_bridge_name(name)) {
        return cli.report_error("ValidationError",
                                "Invalid bridge name. Use alphanumeric, dash, underscore.",
                                EXIT_VALIDATION_ERROR);
    }
    if (port <= 0 || port > 65535) {
        return cli.report_error("ValidationError", fmt::format("Invalid SSH port: {}", port),
                                EXIT_VALIDATION_ERROR);
    }

    TunnelConfig config = load_tunnel_config();
    config.add_bridge({name, url, user, port});
    if (set_default) config.set_default(name);
    save_or_throw(config);

    bool is_default = config.default_bridge == name;
    if (cli.json_output) {
        Json::Value data(Json::objectValue);
        data["status"] = "added";
        data["name"] = name;
        data["proxy_url"] = url;
        data["ssh_user"] = user;
        data["ssh_port"] = port;
        data["is_default"] = is_default;
        cli.print_json(data);
        return EXIT_OK;
    }

    std::cout << theme::ok("Added bridge: " + name);
    std::cout << theme::kv("Proxy URL", url);
    std::cout << theme::kv("SSH", fmt::format("{}@localhost:{}", user, port));
    if (is_default) {
        std::cout << theme::info("Default bridge");
    } else {
        std::cout << theme::step("Set as default: bridgectl tunnel set-default " + name);
    }
    std::cout << theme::step("Test connection: bridgectl tunnel status -b " + name);
    return EXIT_OK;
}

int tunnel_remove(BaseCLI& cli, ArgReader& args) {
    auto pos = args.positionals();
    if (pos.size() != 1) throw std::invalid_argument("Usage: bridgectl tunnel remove <name>");
    const std::string& name = pos[0];

    TunnelConfig config = load_tunnel_config();
    if (!config.remove_bridge(name)) {
        return cli.report_error("ConfigError", "Bridge '" + name + "' not found",
                                EXIT_CONFIG_ERROR);
    }
    save_or_throw(config);

    if (cli.json_output) {
        Json::Value data(Json::objectValue);
        data["status"] = "removed";
        data["name"] = name;
        data["new_default"] = default_or_null(config);
        cli.print_json(data);
        return EXIT_OK;
    }

    std::cout << theme::ok("Removed bridge: " + name);
    if (!config.default_bridge.empty()) {
        std::cout << theme::kv("Default", config.default_bridge);
    } else {
        std::cout << theme::step("No default bridge set. Use: bridgectl tunnel set-default <name>");
    }
    return EXIT_OK;
}

int tunnel_set_default(BaseCLI& cli, ArgReader& args) {
    auto pos = args.positionals();
    if (pos.size() != 1) throw std::invalid_argument("Usage: bridgectl tunnel set-default <name>");
    const std::string& name = pos[0];

    TunnelConfig config = load_tunnel_config();
    if (!config.set_default(name)) {
        return cli.report_error("ConfigError", "Bridge '" + name + "' not found",
                                EXIT_CONFIG_ERROR);
    }
    save_or_throw(config);

    if (cli.json_output) {
        Json::Value data(Json::objectValue);
        data["status"] = "updated";
        data["default"] = name;
        cli.print_json(data);
    } else {
        std::cout << theme::ok("Default bridge set to: " + name);
    }
    return EXIT_OK;
}

int tunnel_status(BaseCLI& cli, ArgReader& args) {
    std::string bridge = args.option({"--bridge", "-b"}).value_or("");
    args.positionals();

    SshTunnelTransport transport(load_tunnel_config(), bridge, helper_url(cli));
    TunnelStatus st = transport.status();

    if (cli.json_output) {
        Json::Value data(Json::objectValue);
        data["configured"] = st.configured;
        data["bridge_name"] = st.bridge_name;
        data["ssh_works"] = st.ssh_works;
        data["proxy_url"] = st.proxy_url;
        data["rtunnel_path"] = st.helper_path;
        data["bridges"] = json_string_array(st.bridges);
        data["default_bridge"] = st.default_bridge;
        data["error"] = st.error;
        cli.print_json(data);
        return EXIT_OK;
    }

    std::cout << theme::section("Tunnel status");
    std::cout << theme::kv("Bridges", st.bridges.empty() ? "(none configured)"
                                                         : join(st.bridges, ", "));
    std::cout << theme::kv("Default", st.default_bridge.empty() ? "(none)" : st.default_bridge);
    std::cout << theme::kv("rtunnel", st.helper_path.empty() ? "(not installed)" : st.helper_path);

    if (!st.configured) {
        std::cout << "\n" << theme::fail(st.error);
        return EXIT_OK;
    }

    std::cout << theme::kv("Bridge", st.bridge_name);
    std::cout << theme::kv("Proxy URL", st.proxy_url);
    std::cout << "\n";
    if (st.ssh_works) {
        std::cout << theme::ok("SSH: Connected");
    } else {
        std::cout << theme::warn("SSH: Not responding");
        if (!st.error.empty()) std::cout << theme::kv("Error", st.error);
        std::cout << theme::step("Ensure the Bridge notebook is open and its rtunnel server is running");
        std::cout << theme::step("Check that the proxied port is forwarded");
    }
    return EXIT_OK;
}

int tunnel_test(BaseCLI& cli, ArgReader& args) {
    std::string bridge = args.option({"--bridge", "-b"}).value_or("");
    args.positionals();

    SshTunnelTransport transport(load_tunnel_config(), bridge, helper_url(cli));
    const BridgeProfile& profile = transport.profile();

    auto start = std::chrono::steady_clock::now();
    RemoteResult r = transport.run_remote_command("hostname", 30);
    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (r.failed()) {
        return cli.report_error("TunnelError", "Connection failed: " + r.get_output(),
                                EXIT_GENERAL_ERROR);
    }

    std::string hostname = r.stdout_data;
    trim(hostname);
    if (cli.json_output) {
        Json::Value data(Json::objectValue);
        data["bridge"] = profile.name;
        data["hostname"] = hostname;
        data["elapsed_ms"] = static_cast<Json::Int64>(elapsed_ms);
        cli.print_json(data);
    } else {
        std::cout << theme::ok(fmt::format("Bridge '{}': Connected to {}", profile.name, hostname));
        std::cout << theme::kv("Response", fmt::format("{:.2f}s", elapsed_ms / 1000.0));
    }
    return EXIT_OK;
}

int tunnel_ssh_config(BaseCLI& cli, ArgReader& args) {
    std::string bridge = args.option({"--bridge", "-b"}).value_or("");
    bool install = args.flag({"--install"});
    args.positionals();

    TunnelConfig config = load_tunnel_config();
    if (config.bridges.empty()) {
        return cli.report_error("ConfigError", NO_BRIDGES_MSG, EXIT_CONFIG_ERROR);
    }

    std::vector<const BridgeProfile*> selected;
    if (!bridge.empty()) {
        const BridgeProfile* p = config.get_bridge(bridge);
        if (!p) {
            return cli.report_error("ConfigError", "Bridge '" + bridge + "' not found",
                                    EXIT_CONFIG_ERROR);
        }
        selected.push_back(p);
    } else {
        for (const auto& b : config.bridges) selected.push_back(&b);
    }

    auto helper = ensure_helper_binary(config.helper_path, helper_url(cli),
                                       cli.notice_callback());

    std::string text = bridge.empty() ? generate_all_ssh_configs(config)
                                      : generate_ssh_config(*selected[0], helper, bridge);

    Json::Value installed(Json::arrayValue);
    if (install) {
        fs::path ssh_config = default_ssh_config_path();
        for (const BridgeProfile* p : selected) {
            auto result = install_ssh_config(generate_ssh_config(*p, helper, p->name),
                                             p->name, ssh_config);
            if (result.is_err()) throw TunnelError(result.error);
            Json::Value item(Json::objectValue);
            item["bridge"] = p->name;
            item["replaced"] = result.value;
            installed.append(item);
            if (!cli.json_output) {
                std::cout << theme::ok(fmt::format("{} SSH config for '{}' in {}",
                                                   result.value ? "Updated" : "Added",
                                                   p->name, ssh_config.string()));
            }
        }
    }

    if (cli.json_output) {
        Json::Value data(Json::objectValue);
        data["config"] = text;
        data["rtunnel_path"] = helper.string();
        if (!bridge.empty()) data["bridge"] = bridge;
        if (install) data["installed"] = installed;
        cli.print_json(data);
        return EXIT_OK;
    }

    if (install) {
        std::cout << "\n" << theme::step("You can now use:");
        for (const BridgeProfile* p : selected) std::cout << "      ssh " << p->name << "\n";
        return EXIT_OK;
    }

    std::cout << theme::rule() << text << "\n" << theme::rule();
    std::cout << theme::step("Or run with --install to add it to ~/.ssh/config");
    return EXIT_OK;
}

} // namespace

int do_tunnel(BaseCLI& cli, ArgReader& args) {
    static const std::map<std::string, std::function<int(BaseCLI&, ArgReader&)>> subcommands = {
        {"list", tunnel_list},
        {"add", tunnel_add},
        {"remove", tunnel_remove},
        {"set-default", tunnel_set_default},
        {"default", tunnel_set_default},
        {"status", tunnel_status},
        {"test", tunnel_test},
        {"ssh-config", tunnel_ssh_config},
    };

    std::string sub = args.take_command().value_or("status");
    auto it = subcommands.find(sub);
    if (it == subcommands.end()) {
        throw std::invalid_argument(
            "Usage: bridgectl tunnel {list|add|remove|set-default|status|test|ssh-config}");
    }
    return it->second(cli, args);
}

void register_tunnel_commands(BaseCLI& cli) {
    cli.add_command("tunnel", do_tunnel, "Manage Bridge tunnel profiles");
}
