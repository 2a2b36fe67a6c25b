#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/errors.hpp>
#include <filesystem>
#include <fstream>
#include <map>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::map<std::string, std::string> env_vars;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "bridgectl_config_test";
        fs::remove_all(test_dir);
        fs::create_directories(test_dir / "project");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    EnvLookup env() {
        return [this](const std::string& name) -> std::optional<std::string> {
            auto it = env_vars.find(name);
            if (it == env_vars.end()) return std::nullopt;
            return it->second;
        };
    }

    void write_global(const std::string& yaml) {
        std::ofstream(test_dir / "config.yaml") << yaml;
    }

    void write_project(const std::string& yaml) {
        std::ofstream(test_dir / "project" / "bridgectl.yaml") << yaml;
    }

    Result<Config> load() {
        return Config::load_from(test_dir / "config.yaml", test_dir / "project", env());
    }
};

TEST_F(ConfigTest, MissingFilesMeanDefaults) {
    auto result = load();
    ASSERT_TRUE(result.is_ok()) << result.error;
    const Config& c = result.value;
    EXPECT_EQ(c.forge().gitea_server, "https://codeberg.org");
    EXPECT_EQ(c.forge().log_workflow, "retrieve_job_log.yml");
    EXPECT_EQ(c.forge().logs_branch, "logs");
    EXPECT_EQ(c.remote().remote_timeout, 90);
    EXPECT_EQ(c.remote().bridge_action_timeout, 300);
    EXPECT_EQ(c.remote().default_remote, "origin");
    EXPECT_FALSE(c.tunnel().disabled);
}

TEST_F(ConfigTest, ProjectOverridesGlobal) {
    write_global(
        "forge:\n  gitea_repo: acme/global\n  gitea_token: g\n"
        "remote:\n  target_dir: /srv/global\n  remote_timeout: 60\n");
    write_project("remote:\n  target_dir: /srv/project\n  denylist: [rm, shutdown]\n");

    auto result = load();
    ASSERT_TRUE(result.is_ok()) << result.error;
    const Config& c = result.value;
    EXPECT_EQ(c.forge().gitea_repo, "acme/global");
    EXPECT_EQ(c.remote().target_dir, "/srv/project");
    EXPECT_EQ(c.remote().remote_timeout, 60);
    EXPECT_EQ(c.remote().denylist, (std::vector<std::string>{"rm", "shutdown"}));
}

TEST_F(ConfigTest, EnvironmentWins) {
    write_global("remote:\n  target_dir: /srv/yaml\n  env:\n    A: \"1\"\n");
    env_vars = {
        {"BRIDGECTL_TARGET_DIR", "/srv/env"},
        {"BRIDGECTL_REMOTE_TIMEOUT", "120"},
        {"BRIDGECTL_DENYLIST", "rm -rf, reboot"},
        {"BRIDGECTL_NO_TUNNEL", "yes"},
        {"BRIDGECTL_DEFAULT_REMOTE", "upstream"},
        {"BRIDGECTL_GITHUB_REPO", "acme/gh"},
    };

    auto result = load();
    ASSERT_TRUE(result.is_ok()) << result.error;
    const Config& c = result.value;
    EXPECT_EQ(c.remote().target_dir, "/srv/env");
    EXPECT_EQ(c.remote().remote_timeout, 120);
    EXPECT_EQ(c.remote().denylist, (std::vector<std::string>{"rm -rf", "reboot"}));
    EXPECT_EQ(c.remote().env.at("A"), "1");
    EXPECT_EQ(c.remote().default_remote, "upstream");
    EXPECT_TRUE(c.tunnel().disabled);
    EXPECT_EQ(resolve_platform(c.forge()), ForgePlatform::GitHub);
}

TEST_F(ConfigTest, BadTimeoutIsConfigError) {
    env_vars = {{"BRIDGECTL_BRIDGE_TIMEOUT", "soon"}};
    auto result = load();
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("BRIDGECTL_BRIDGE_TIMEOUT"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYamlIsError) {
    write_project("remote: [unclosed\n");
    auto result = load();
    EXPECT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("project config"), std::string::npos);
}

TEST_F(ConfigTest, LogCacheDir) {
    write_global("remote:\n  log_cache_dir: /tmp/bridgectl-logs\n");
    auto result = load();
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.log_cache_dir(), fs::path("/tmp/bridgectl-logs"));
}

// ── Forge resolution ─────────────────────────────────────────

TEST(ForgeResolution, PlatformSelection) {
    ForgeSettings f;
    EXPECT_EQ(resolve_platform(f), ForgePlatform::Gitea);
    f.github_token = "x";
    EXPECT_EQ(resolve_platform(f), ForgePlatform::GitHub);
    f.platform = " Gitea ";
    EXPECT_EQ(resolve_platform(f), ForgePlatform::Gitea);
    f.platform = "gitlab";
    EXPECT_THROW(resolve_platform(f), ConfigError);
}

TEST(ForgeResolution, TokenSanitizing) {
    EXPECT_EQ(sanitize_token("  Bearer abc  "), "abc");
    EXPECT_EQ(sanitize_token("token xyz"), "xyz");
    EXPECT_EQ(sanitize_token("plain"), "plain");
}

TEST(ForgeResolution, RepoAndServer) {
    ForgeSettings f;
    f.gitea_repo = "acme/bridge";
    f.gitea_server = "https://git.example/";
    EXPECT_EQ(active_repo(f), "acme/bridge");
    EXPECT_EQ(active_server(f), "https://git.example");

    f.gitea_repo = "acme/bridge/extra";
    EXPECT_THROW(active_repo(f), ForgeAuthError);
    f.gitea_repo = "";
    try {
        active_repo(f);
        FAIL() << "expected ForgeAuthError";
    } catch (const ForgeAuthError& e) {
        EXPECT_NE(e.hint().find("BRIDGECTL_GITEA_REPO"), std::string::npos);
    }
    EXPECT_THROW(active_token(f), ForgeAuthError);
}
