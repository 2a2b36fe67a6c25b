#include <gtest/gtest.h>
#include <forge/forge_client.hpp>
#include <forge/forge_session.hpp>
#include <core/config.hpp>
#include <core/errors.hpp>
#include "test_support.hpp"
#include <algorithm>


class ForgeClientTest : public ::testing::Test {
protected:
    FakeHttp http;
    FakeClock clock;
};

TEST_F(ForgeClientTest, GiteaUrlsAndAuth) {
    GiteaClient client("secret", "https://gitea.test/", http, clock.clock());

    EXPECT_EQ(client.auth_header(), "token secret");
    EXPECT_EQ(client.api_base("acme/bridge"), "https://gitea.test/api/v1/repos/acme/bridge/actions");
    EXPECT_EQ(client.raw_file_url("acme/bridge", "logs", "job_1.log"),
              "https://gitea.test/api/v1/repos/acme/bridge/raw/logs/job_1.log");
    EXPECT_EQ(client.pagination_params(20, 3), "limit=20&page=3");
}

TEST_F(ForgeClientTest, GitHubPublicAndEnterpriseUrls) {
    GitHubClient pub("secret", "https://github.com", http, clock.clock());
    EXPECT_EQ(pub.auth_header(), "Bearer secret");
    EXPECT_EQ(pub.api_base("acme/bridge"), "https://api.github.com/repos/acme/bridge/actions");
    EXPECT_EQ(pub.raw_file_url("acme/bridge", "logs", "a.log"),
              "https://raw.githubusercontent.com/acme/bridge/logs/a.log");
    EXPECT_EQ(pub.pagination_params(20, 1), "per_page=20&page=1");

    GitHubClient ghe("secret", "https://ghe.corp", http, clock.clock());
    EXPECT_EQ(ghe.api_base("acme/bridge"), "https://ghe.corp/api/v3/repos/acme/bridge/actions");
}

TEST_F(ForgeClientTest, SendsAuthorizationHeader) {
    http.on_json("GET", "/runs/1", R"({"id": 1})");
    GiteaClient client("secret", "https://gitea.test", http, clock.clock());

    Json::Value j = client.request_json("GET", "https://gitea.test/api/v1/repos/a/b/actions/runs/1");
    EXPECT_EQ(j["id"].asInt(), 1);
    ASSERT_EQ(http.requests.size(), 1u);
    const auto& headers = http.requests[0].headers;
    EXPECT_NE(std::find(headers.begin(), headers.end(), "Authorization: token secret"),
              headers.end());
    EXPECT_FALSE(http.requests[0].has_body);
}

TEST_F(ForgeClientTest, EmptySuccessBodyIsEmptyObject) {
    http.on("POST", "/dispatches", {HttpResponse{204, "", ""}});
    GiteaClient client("secret", "https://gitea.test", http, clock.clock());

    Json::Value j = client.request_json("POST", "https://gitea.test/x/dispatches",
                                        json_of(R"({"ref": "main"})"));
    EXPECT_TRUE(j.isObject());
    EXPECT_TRUE(j.empty());
    EXPECT_TRUE(http.requests[0].has_body);
    EXPECT_EQ(json_of(http.requests[0].body)["ref"].asString(), "main");
}

TEST_F(ForgeClientTest, RetriesServerErrorsWithGrowingDelay) {
    http.on("GET", "/runs", {HttpResponse{502, "", ""}, HttpResponse{500, "", ""},
                             HttpResponse{200, "{\"ok\":true}", ""}});
    GiteaClient client("secret", "https://gitea.test", http, clock.clock());
    client.set_retry_policy(3, 100);

    Json::Value j = client.request_json("GET", "https://gitea.test/runs");
    EXPECT_TRUE(j["ok"].asBool());
    EXPECT_EQ(http.requests.size(), 3u);
    EXPECT_EQ(clock.slept, std::chrono::milliseconds(100 + 200));
}

TEST_F(ForgeClientTest, GivesUpAfterMaxRetries) {
    http.on("GET", "/runs", {HttpResponse{0, "", "Could not resolve host"}});
    GiteaClient client("secret", "https://gitea.test", http, clock.clock());
    client.set_retry_policy(2, 10);

    EXPECT_THROW(client.request_json("GET", "https://gitea.test/runs"), ForgeError);
    EXPECT_EQ(http.requests.size(), 3u);
}

TEST_F(ForgeClientTest, UnauthorizedIsAuthErrorWithoutRetry) {
    http.on("GET", "/runs", {HttpResponse{401, "{\"message\":\"bad token\"}", ""}});
    GiteaClient client("secret", "https://gitea.test", http, clock.clock());

    try {
        client.request_json("GET", "https://gitea.test/runs");
        FAIL() << "expected ForgeAuthError";
    } catch (const ForgeAuthError& e) {
        EXPECT_NE(std::string(e.what()).find("bad token"), std::string::npos);
        EXPECT_FALSE(e.hint().empty());
    }
    EXPECT_EQ(http.requests.size(), 1u);
}

TEST_F(ForgeClientTest, ClientErrorCarriesStatus) {
    GiteaClient client("secret", "https://gitea.test", http, clock.clock());

    try {
        client.request_json("GET", "https://gitea.test/missing");
        FAIL() << "expected ForgeError";
    } catch (const ForgeError& e) {
        EXPECT_EQ(e.status(), 404);
    }
    EXPECT_EQ(http.requests.size(), 1u);
}

TEST_F(ForgeClientTest, ErrorCodeInsideOkBody) {
    http.on_json("GET", "/runs", R"({"code": 7, "message": "workflow disabled"})");
    GiteaClient client("secret", "https://gitea.test", http, clock.clock());

    try {
        client.request_json("GET", "https://gitea.test/runs");
        FAIL() << "expected ForgeError";
    } catch (const ForgeError& e) {
        EXPECT_NE(std::string(e.what()).find("workflow disabled"), std::string::npos);
    }
}

TEST_F(ForgeClientTest, ZeroCodeIsNotAnError) {
    http.on_json("GET", "/runs", R"({"code": 0, "workflow_runs": []})");
    GiteaClient client("secret", "https://gitea.test", http, clock.clock());

    EXPECT_NO_THROW(client.request_json("GET", "https://gitea.test/runs"));
}

TEST_F(ForgeClientTest, RequestBytesReturnsRawBody) {
    http.on("GET", "/zip", {HttpResponse{200, std::string("PK\x03\x04", 4), ""}});
    GiteaClient client("secret", "https://gitea.test", http, clock.clock());

    EXPECT_EQ(client.request_bytes("GET", "https://gitea.test/zip").size(), 4u);
}

// ── Session ─────────────────────────────────────────────────

TEST_F(ForgeClientTest, SessionSelectsPlatformFromSettings) {
    ForgeSettings settings;
    settings.github_repo = "acme/bridge";
    settings.github_token = "Bearer ghp_x";

    auto session = make_forge_session(settings, http, clock.clock());
    EXPECT_EQ(session->repo(), "acme/bridge");
    EXPECT_EQ(session->client().auth_header(), "Bearer ghp_x");
    EXPECT_EQ(session->api_base(), "https://api.github.com/repos/acme/bridge/actions");
}

TEST_F(ForgeClientTest, SessionRequiresToken) {
    ForgeSettings settings;
    settings.gitea_repo = "acme/bridge";

    EXPECT_THROW(make_forge_session(settings, http, clock.clock()), ForgeAuthError);
}

TEST_F(ForgeClientTest, SessionRejectsMalformedRepo) {
    ForgeSettings settings;
    settings.gitea_repo = "not-a-repo";
    settings.gitea_token = "t";

    EXPECT_THROW(make_forge_session(settings, http, clock.clock()), ForgeAuthError);
}

TEST_F(ForgeClientTest, SessionExpires) {
    ForgeSettings settings;
    settings.gitea_repo = "acme/bridge";
    settings.gitea_token = "t";

    auto session = make_forge_session(settings, http, clock.clock(), std::chrono::seconds(60));
    EXPECT_NO_THROW(session->client());
    clock.advance(std::chrono::seconds(61));
    EXPECT_TRUE(session->expired());
    EXPECT_THROW(session->client(), ForgeAuthError);
}
