#include "base_cli.hpp"
#include "theme.hpp"
#include <core/errors.hpp>
#include <core/json_util.hpp>
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

namespace {

// Workflow side of the router, resolved on first use so that a command
// served over the tunnel never needs forge credentials.
class DeferredActions : public MediatedTransport {
public:
    explicit DeferredActions(BaseCLI& cli) : cli_(cli) {}

    ExecOutcome exec(const ExecRequest& request, const StatusCallback& notice) override {
        return cli_.actions().exec(request, notice);
    }

    SyncOutcome sync(const SyncRequest& request, const StatusCallback& notice) override {
        return cli_.actions().sync(request, notice);
    }

    void fetch_log(const std::string& job_id, const std::string& remote_path,
                   std::uintmax_t start_offset, const std::filesystem::path& dest) override {
        cli_.actions().fetch_log(job_id, remote_path, start_offset, dest);
    }

private:
    BaseCLI& cli_;
};

} // namespace

BaseCLI::BaseCLI() = default;
BaseCLI::~BaseCLI() = default;

void BaseCLI::add_command(const std::string& name,
                          CommandHandler handler,
                          const std::string& help) {
    commands_[name] = {handler, help};
}

// ── Context ─────────────────────────────────────────────────

const Config& BaseCLI::config() {
    if (!config_) {
        auto result = Config::load();
        if (result.is_err()) throw ConfigError(result.error);
        config_ = result.value;
    }
    return *config_;
}

ForgeSession& BaseCLI::forge() {
    if (!session_) {
        const auto& forge_settings = config().forge();
        if (!http_) http_ = std::make_unique<CurlTransport>();
        session_ = make_forge_session(forge_settings, *http_);
    }
    return *session_;
}

ActionsTransport& BaseCLI::actions() {
    if (!actions_) {
        actions_ = std::make_unique<ActionsTransport>(forge(), config().remote());
    }
    return *actions_;
}

SshTunnelTransport* BaseCLI::tunnel() {
    if (!tunnel_checked_) {
        tunnel_checked_ = true;
        const auto& settings = config().tunnel();
        if (settings.disabled) {
            bridge_log("cli: tunnel disabled by configuration");
            return nullptr;
        }
        TunnelConfig tc = load_tunnel_config();
        if (tc.bridges.empty()) {
            bridge_log("cli: no tunnel profiles configured");
            return nullptr;
        }
        tunnel_ = std::make_unique<SshTunnelTransport>(std::move(tc), "",
                                                       settings.helper_download_url);
    }
    return tunnel_.get();
}

TransportRouter& BaseCLI::router(bool no_tunnel) {
    if (!router_) {
        bool disabled = no_tunnel || config().tunnel().disabled;
        deferred_ = std::make_unique<DeferredActions>(*this);
        router_ = std::make_unique<TransportRouter>(disabled ? nullptr : tunnel(), *deferred_,
                                                    config().remote(), disabled,
                                                    notice_callback());
    }
    return *router_;
}

JobStore& BaseCLI::job_store() {
    if (!job_store_) job_store_ = std::make_unique<JobStore>(default_job_store_path());
    return *job_store_;
}

LogSyncCache& BaseCLI::log_cache() {
    if (!log_cache_) {
        log_cache_ = std::make_unique<LogSyncCache>(job_store(), config().log_cache_dir());
    }
    return *log_cache_;
}

std::string BaseCLI::actions_url() {
    try {
        const auto& forge_settings = config().forge();
        return fmt::format("{}/{}/actions", active_server(forge_settings),
                           active_repo(forge_settings));
    } catch (const ConfigError& e) {
        bridge_log(std::string("cli: no actions url: ") + e.what());
        return "";
    }
}

// ── Output ──────────────────────────────────────────────────

void BaseCLI::notice(const std::string& msg) const {
    if (json_output) return;
    std::cerr << theme::info(msg);
}

StatusCallback BaseCLI::notice_callback() const {
    return [this](const std::string& msg) { notice(msg); };
}

void BaseCLI::print_json(const Json::Value& data) const {
    Json::Value out(Json::objectValue);
    out["success"] = true;
    out["data"] = data;
    std::cout << write_json(out, "  ") << "\n";
}

int BaseCLI::report_error(const std::string& type, const std::string& message, int code,
                          const std::string& hint) const {
    if (json_output) {
        Json::Value err(Json::objectValue);
        err["type"] = type;
        err["code"] = code;
        err["message"] = message;
        if (!hint.empty()) err["hint"] = hint;
        Json::Value out(Json::objectValue);
        out["success"] = false;
        out["error"] = err;
        std::cerr << write_json(out, "  ") << "\n";
    } else {
        std::cerr << theme::fail(message);
        if (!hint.empty()) std::cerr << theme::step(hint);
    }
    return code;
}

// ── Dispatch ────────────────────────────────────────────────

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        return report_error("ValidationError", "Unknown command: " + command,
                            EXIT_VALIDATION_ERROR, "Run 'bridgectl --help' for available commands.");
    }

    ArgReader reader(args);
    try {
        return it->second.first(*this, reader);
    } catch (const ForgeAuthError& e) {
        return report_error(error_type_name(e), e.what(), exit_code_for(e), e.hint());
    } catch (const TimeoutError& e) {
        return report_error(error_type_name(e), e.what(), exit_code_for(e),
                            "The remote side may still be working; try again or raise --timeout.");
    } catch (const ConfigError& e) {
        return report_error(error_type_name(e), std::string("Configuration error: ") + e.what(),
                            exit_code_for(e));
    } catch (const std::exception& e) {
        return report_error(error_type_name(e), e.what(), exit_code_for(e));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Remote",  {"exec", "sync"}},
        {"Logs",    {"logs", "logs-refresh"}},
        {"Tunnel",  {"tunnel"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}
