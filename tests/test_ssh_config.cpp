#include <gtest/gtest.h>
#include <ssh/ssh_config.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class SshConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path config_path;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "bridgectl_ssh_config_test";
        fs::remove_all(test_dir);
        config_path = test_dir / ".ssh" / "config";
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string read_config() {
        std::ifstream in(config_path);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static BridgeProfile profile(const std::string& name, const std::string& url) {
        BridgeProfile p;
        p.name = name;
        p.proxy_url = url;
        return p;
    }
};

TEST_F(SshConfigTest, GeneratesHostBlock) {
    BridgeProfile p = profile("gpu", "https://gpu.example/t");
    std::string block = generate_ssh_config(p, "/home/u/.local/bin/rtunnel");

    EXPECT_EQ(block.rfind("Host gpu\n", 0), 0u);
    EXPECT_NE(block.find("    User root\n"), std::string::npos);
    EXPECT_NE(block.find("    Port 22222\n"), std::string::npos);
    EXPECT_NE(block.find("ProxyCommand /home/u/.local/bin/rtunnel wss://gpu.example/t stdio://%h:%p"),
              std::string::npos);
    EXPECT_EQ(generate_ssh_config(p, "/r", "alias").rfind("Host alias\n", 0), 0u);
}

TEST_F(SshConfigTest, AllProfiles) {
    TunnelConfig config;
    EXPECT_EQ(generate_all_ssh_configs(config), "");
    config.add_bridge(profile("a", "https://a"));
    config.add_bridge(profile("b", "https://b"));
    std::string all = generate_all_ssh_configs(config);
    EXPECT_NE(all.find("Host a\n"), std::string::npos);
    EXPECT_NE(all.find("\n\nHost b\n"), std::string::npos);
}

TEST_F(SshConfigTest, InstallAppendsToExistingFile) {
    fs::create_directories(config_path.parent_path());
    std::ofstream(config_path) << "Host work\n    User me";

    auto result = install_ssh_config("Host gpu\n    Port 1", "gpu", config_path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value);
    EXPECT_EQ(read_config(), "Host work\n    User me\n\nHost gpu\n    Port 1\n");
}

TEST_F(SshConfigTest, InstallCreatesMissingFile) {
    auto result = install_ssh_config("Host gpu\n    Port 1", "gpu", config_path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(read_config(), "Host gpu\n    Port 1\n");
}

TEST_F(SshConfigTest, InstallReplacesExistingBlockOnly) {
    fs::create_directories(config_path.parent_path());
    std::ofstream(config_path)
        << "Host work\n    User me\n\nHost gpu\n    Port 1\n    User old\n\nHost other\n    Port 9\n";

    auto result = install_ssh_config("Host gpu\n    Port 2", "gpu", config_path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value);
    EXPECT_EQ(read_config(),
              "Host work\n    User me\n\nHost gpu\n    Port 2\n\nHost other\n    Port 9\n");
}

TEST_F(SshConfigTest, HostLineWithSeveralPatterns) {
    fs::create_directories(config_path.parent_path());
    std::ofstream(config_path) << "Host gpu gpu.alt\n    Port 1\n";

    auto result = install_ssh_config("Host gpu\n    Port 3", "gpu", config_path);
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value);
    EXPECT_EQ(read_config(), "Host gpu\n    Port 3\n");

    // "gpu2" is a different alias
    auto again = install_ssh_config("Host gpu2\n    Port 4", "gpu2", config_path);
    EXPECT_FALSE(again.value);
}
