#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <vector>
#include <json/json.h>
#include <core/config.hpp>
#include <forge/http_transport.hpp>
#include <forge/forge_session.hpp>
#include <ssh/ssh_tunnel_transport.hpp>
#include <managers/actions_transport.hpp>
#include <managers/transport_router.hpp>
#include <managers/job_store.hpp>
#include <managers/log_sync_cache.hpp>
#include "arg_reader.hpp"

// Command registry plus the per-invocation context. Every service is built
// on first use so that commands which never touch the forge (tunnel list,
// logs --path) work without credentials.
class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI();

    // Returns the process exit code.
    using CommandHandler = std::function<int(BaseCLI&, ArgReader&)>;

    void add_command(const std::string& name,
                     CommandHandler handler,
                     const std::string& help);

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // ── Context (throws ConfigError / ForgeAuthError) ───────────
    const Config& config();
    ForgeSession& forge();
    ActionsTransport& actions();

    // nullptr when the tunnel is disabled or no profile is configured.
    SshTunnelTransport* tunnel();

    TransportRouter& router(bool no_tunnel);
    JobStore& job_store();
    LogSyncCache& log_cache();

    // Web page listing workflow runs, "" when the forge is not configured.
    std::string actions_url();

    // ── Output ──────────────────────────────────────────────────
    bool json_output = false;

    // Progress and fallback notices. stderr, so stdout stays parseable.
    void notice(const std::string& msg) const;
    StatusCallback notice_callback() const;

    // {"success": true, "data": ...}
    void print_json(const Json::Value& data) const;

    // Report in the active output mode; returns `code` for the caller.
    int report_error(const std::string& type, const std::string& message, int code,
                     const std::string& hint = "") const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;

private:
    std::optional<Config> config_;
    std::unique_ptr<CurlTransport> http_;
    std::unique_ptr<ForgeSession> session_;
    std::unique_ptr<ActionsTransport> actions_;
    std::unique_ptr<SshTunnelTransport> tunnel_;
    bool tunnel_checked_ = false;
    std::unique_ptr<MediatedTransport> deferred_;
    std::unique_ptr<TransportRouter> router_;
    std::unique_ptr<JobStore> job_store_;
    std::unique_ptr<LogSyncCache> log_cache_;
};
