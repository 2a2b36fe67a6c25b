#include "forge_client.hpp"
#include <core/errors.hpp>
#include <core/json_util.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

ForgeClient::ForgeClient(std::string token, std::string server_url, HttpTransport& http,
                         PollClock clock)
    : token_(std::move(token)), server_url_(std::move(server_url)),
      http_(http), clock_(std::move(clock)) {
    while (!server_url_.empty() && server_url_.back() == '/') server_url_.pop_back();
}

HttpResponse ForgeClient::perform_with_retry(HttpRequest request) {
    HttpResponse resp;
    for (int attempt = 0; attempt <= max_retries_; attempt++) {
        resp = http_.perform(request);
        bool retryable = resp.status == 0 || resp.status >= 500;
        if (!retryable || attempt == max_retries_) break;

        int delay = retry_delay_ms_ * (attempt + 1);
        bridge_log(fmt::format("Forge {} {} -> {} (attempt {}), retrying in {}ms",
                               request.method, request.url,
                               resp.status ? std::to_string(resp.status) : resp.error,
                               attempt + 1, delay));
        clock_.sleep(std::chrono::milliseconds(delay));
    }
    return resp;
}

// Pull "message" or "error" out of a JSON error body, if there is one.
static std::string error_detail(const std::string& body) {
    Json::Value parsed;
    if (!parse_json(body, parsed) || !parsed.isObject()) return "";
    for (const char* key : {"message", "error"}) {
        const Json::Value& v = parsed.get(key, Json::Value());
        if (v.isString()) return v.asString();
    }
    return "";
}

static void raise_for_status(const HttpResponse& resp, const std::string& url) {
    if (resp.status == 0) {
        throw ForgeError(fmt::format("API request failed for {}: {}", url, resp.error));
    }
    std::string msg = fmt::format("API error {} for {}", resp.status, url);
    std::string detail = error_detail(resp.body);
    if (!detail.empty()) msg += ": " + detail;

    if (resp.status == 401) {
        throw ForgeAuthError(msg, "Check that the forge token is valid and has Actions access");
    }
    throw ForgeError(msg, static_cast<int>(resp.status));
}

Json::Value ForgeClient::request_json(const std::string& method, const std::string& url,
                                      const std::optional<Json::Value>& body) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.headers = {"Authorization: " + auth_header(), "Accept: application/json"};
    req.timeout_secs = HTTP_JSON_TIMEOUT_SECS;
    if (body) {
        req.body = write_json(*body);
        req.has_body = true;
    }

    HttpResponse resp = perform_with_retry(std::move(req));
    if (!resp.ok()) raise_for_status(resp, url);

    if (resp.body.empty()) return Json::Value(Json::objectValue);

    Json::Value parsed;
    if (!parse_json(resp.body, parsed)) {
        throw ForgeError(fmt::format("Invalid JSON response from {}", url),
                         static_cast<int>(resp.status));
    }

    // Some forges report failures in a 200 body: {"code": N, "message": ...}
    if (parsed.isObject()) {
        Json::Value code = parsed.get("code", Json::Value());
        if (code.isInt() && code.asInt() != 0) {
            std::string message = parsed.get("message", "unknown error").asString();
            throw ForgeError(fmt::format("API error {} for {}: {}", code.asInt(), url, message),
                             static_cast<int>(resp.status));
        }
    }
    return parsed;
}

std::string ForgeClient::request_bytes(const std::string& method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    req.headers = {"Authorization: " + auth_header(), "Accept: application/octet-stream"};
    req.timeout_secs = HTTP_BYTES_TIMEOUT_SECS;

    HttpResponse resp = perform_with_retry(std::move(req));
    if (!resp.ok()) {
        bridge_log(fmt::format("Forge bytes {} -> {} body={}", url, resp.status,
                               resp.body.substr(0, 500)));
        raise_for_status(resp, url);
    }
    return resp.body;
}

// ── Gitea ────────────────────────────────────────────────────

std::string GiteaClient::auth_header() const {
    return "token " + token_;
}

std::string GiteaClient::api_base(const std::string& repo) const {
    return fmt::format("{}/api/v1/repos/{}/actions", server_url_, repo);
}

std::string GiteaClient::raw_file_url(const std::string& repo, const std::string& ref,
                                      const std::string& path) const {
    return fmt::format("{}/api/v1/repos/{}/raw/{}/{}", server_url_, repo, ref, path);
}

std::string GiteaClient::pagination_params(int limit, int page) const {
    return fmt::format("limit={}&page={}", limit, page);
}

// ── GitHub ───────────────────────────────────────────────────

static constexpr const char* GITHUB_PUBLIC = "https://github.com";

std::string GitHubClient::auth_header() const {
    return "Bearer " + token_;
}

std::string GitHubClient::api_base(const std::string& repo) const {
    if (server_url_ == GITHUB_PUBLIC) {
        return fmt::format("https://api.github.com/repos/{}/actions", repo);
    }
    // GitHub Enterprise
    return fmt::format("{}/api/v3/repos/{}/actions", server_url_, repo);
}

std::string GitHubClient::raw_file_url(const std::string& repo, const std::string& ref,
                                       const std::string& path) const {
    std::string raw_base;
    if (server_url_ == GITHUB_PUBLIC) {
        raw_base = "https://raw.githubusercontent.com";
    } else {
        raw_base = server_url_;
        if (raw_base.rfind("https://", 0) == 0) {
            raw_base.replace(0, 8, "https://raw.");
        }
    }
    return fmt::format("{}/{}/{}/{}", raw_base, repo, ref, path);
}

std::string GitHubClient::pagination_params(int limit, int page) const {
    return fmt::format("per_page={}&page={}", limit, page);
}

std::unique_ptr<ForgeClient> make_forge_client(ForgePlatform platform,
                                               const std::string& token,
                                               const std::string& server_url,
                                               HttpTransport& http,
                                               PollClock clock) {
    if (platform == ForgePlatform::GitHub) {
        return std::make_unique<GitHubClient>(token, server_url, http, std::move(clock));
    }
    return std::make_unique<GiteaClient>(token, server_url, http, std::move(clock));
}
