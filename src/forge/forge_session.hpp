#pragma once

#include <string>
#include <memory>
#include <optional>
#include <chrono>
#include <core/types.hpp>
#include <core/poll_clock.hpp>
#include "forge_client.hpp"

enum class WorkflowKind { Log, Sync, Bridge };

// Explicitly-lifetimed forge context: one client bound to one repository,
// plus the workflow names and branch it dispatches against. Passed by
// reference to the dispatcher and retriever; there is no global client.
class ForgeSession {
public:
    ForgeSession(std::unique_ptr<ForgeClient> client, std::string repo,
                 ForgeSettings settings, PollClock clock,
                 std::optional<std::chrono::steady_clock::time_point> expires_at = std::nullopt);

    // Throws ForgeAuthError once the session has expired.
    ForgeClient& client();

    bool expired() const;

    const std::string& repo() const { return repo_; }
    const std::string& ref() const { return settings_.ref; }
    const std::string& logs_branch() const { return settings_.logs_branch; }
    const std::string& workflow_file(WorkflowKind kind) const;
    const PollClock& clock() const { return clock_; }

    // Shorthand for client().api_base(repo()).
    std::string api_base();

private:
    std::unique_ptr<ForgeClient> client_;
    std::string repo_;
    ForgeSettings settings_;
    PollClock clock_;
    std::optional<std::chrono::steady_clock::time_point> expires_at_;
};

// Resolve platform, token, server and repo from settings (throws
// ForgeAuthError / ConfigError) and build a session over `http`.
std::unique_ptr<ForgeSession> make_forge_session(
    const ForgeSettings& settings, HttpTransport& http,
    PollClock clock = PollClock::system(),
    std::optional<std::chrono::seconds> ttl = std::nullopt);
