#pragma once

#include <string>
#include <memory>
#include <optional>
#include <json/json.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/poll_clock.hpp>
#include "http_transport.hpp"

// Speaks the Actions REST dialect of one forge. Subclasses supply only the
// four URL/header primitives; request/retry logic is shared.
class ForgeClient {
public:
    ForgeClient(std::string token, std::string server_url, HttpTransport& http,
                PollClock clock = PollClock::system());
    virtual ~ForgeClient() = default;

    ForgeClient(const ForgeClient&) = delete;
    ForgeClient& operator=(const ForgeClient&) = delete;

    virtual std::string auth_header() const = 0;
    virtual std::string api_base(const std::string& repo) const = 0;
    virtual std::string raw_file_url(const std::string& repo, const std::string& ref,
                                     const std::string& path) const = 0;
    virtual std::string pagination_params(int limit, int page) const = 0;

    // JSON request. An empty 2xx body (e.g. 204 from a dispatch) yields an
    // empty object. 5xx and transport failures are retried with linear
    // backoff; 4xx and application error payloads throw immediately.
    // Throws ForgeAuthError on 401, ForgeError otherwise.
    Json::Value request_json(const std::string& method, const std::string& url,
                             const std::optional<Json::Value>& body = std::nullopt);

    // Binary request with the same retry policy.
    std::string request_bytes(const std::string& method, const std::string& url);

    void set_retry_policy(int max_retries, int delay_ms) {
        max_retries_ = max_retries;
        retry_delay_ms_ = delay_ms;
    }

    const std::string& server_url() const { return server_url_; }

protected:
    std::string token_;
    std::string server_url_;

private:
    HttpResponse perform_with_retry(HttpRequest request);

    HttpTransport& http_;
    PollClock clock_;
    int max_retries_ = FORGE_MAX_RETRIES;
    int retry_delay_ms_ = FORGE_RETRY_DELAY_MS;
};

// Gitea / Forgejo / Codeberg
class GiteaClient : public ForgeClient {
public:
    using ForgeClient::ForgeClient;

    std::string auth_header() const override;
    std::string api_base(const std::string& repo) const override;
    std::string raw_file_url(const std::string& repo, const std::string& ref,
                             const std::string& path) const override;
    std::string pagination_params(int limit, int page) const override;
};

// github.com or GitHub Enterprise
class GitHubClient : public ForgeClient {
public:
    using ForgeClient::ForgeClient;

    std::string auth_header() const override;
    std::string api_base(const std::string& repo) const override;
    std::string raw_file_url(const std::string& repo, const std::string& ref,
                             const std::string& path) const override;
    std::string pagination_params(int limit, int page) const override;
};

std::unique_ptr<ForgeClient> make_forge_client(ForgePlatform platform,
                                               const std::string& token,
                                               const std::string& server_url,
                                               HttpTransport& http,
                                               PollClock clock = PollClock::system());
