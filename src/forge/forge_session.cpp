#include "forge_session.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

ForgeSession::ForgeSession(std::unique_ptr<ForgeClient> client, std::string repo,
                           ForgeSettings settings, PollClock clock,
                           std::optional<std::chrono::steady_clock::time_point> expires_at)
    : client_(std::move(client)), repo_(std::move(repo)),
      settings_(std::move(settings)), clock_(std::move(clock)),
      expires_at_(expires_at) {}

bool ForgeSession::expired() const {
    return expires_at_ && clock_.now() >= *expires_at_;
}

ForgeClient& ForgeSession::client() {
    if (expired()) {
        throw ForgeAuthError("Forge session has expired",
                             "Start a new command to create a fresh session");
    }
    return *client_;
}

const std::string& ForgeSession::workflow_file(WorkflowKind kind) const {
    switch (kind) {
        case WorkflowKind::Log:    return settings_.log_workflow;
        case WorkflowKind::Sync:   return settings_.sync_workflow;
        case WorkflowKind::Bridge: return settings_.bridge_workflow;
    }
    return settings_.log_workflow;
}

std::string ForgeSession::api_base() {
    return client().api_base(repo_);
}

std::unique_ptr<ForgeSession> make_forge_session(const ForgeSettings& settings,
                                                 HttpTransport& http,
                                                 PollClock clock,
                                                 std::optional<std::chrono::seconds> ttl) {
    ForgePlatform platform = resolve_platform(settings);
    std::string repo = active_repo(settings);
    std::string token = active_token(settings);
    std::string server = active_server(settings);

    bridge_log(fmt::format("Forge session: {} {} repo={}", platform_name(platform), server, repo));

    std::optional<std::chrono::steady_clock::time_point> expires_at;
    if (ttl) expires_at = clock.now() + *ttl;

    auto client = make_forge_client(platform, token, server, http, clock);
    return std::make_unique<ForgeSession>(std::move(client), std::move(repo), settings,
                                          std::move(clock), expires_at);
}
