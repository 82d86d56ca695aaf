#include <gtest/gtest.h>
#include "core/config.hpp"
#include "core/orchestrator.hpp"

#include <filesystem>
#include <fstream>
#include <vector>
#include <cstdlib>
#include <unistd.h>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    std::string test_dir;
    std::string original_home;
    bool had_home = false;

    void SetUp() override {
        // Create a temp directory for test config
        test_dir = fs::temp_directory_path() / ("selfupdate-test-config-" + std::to_string(::getpid()));
        fs::create_directories(test_dir);

        // Save and override HOME
        const char* home = std::getenv("HOME");
        if (home) {
            had_home = true;
            original_home = home;
        }
        setenv("HOME", test_dir.c_str(), 1);
    }

    void TearDown() override {
        // Restore HOME
        if (had_home) {
            setenv("HOME", original_home.c_str(), 1);
        }
        // Cleanup
        fs::remove_all(test_dir);
    }

    void write_yaml(const std::string& path, const std::string& text) {
        std::ofstream out(path);
        out << text;
    }
};

TEST_F(ConfigTest, DefaultValues) {
    Config cfg;
    const auto& u = cfg.data().update;
    EXPECT_NE(u.endpoint.find("/releases/latest"), std::string::npos);
    EXPECT_EQ(u.asset_suffix, Config::default_asset_suffix());
    EXPECT_TRUE(u.check_on_startup);
    EXPECT_EQ(u.check_interval_hours, 24);
    EXPECT_EQ(u.lookup_timeout_ms, 2000);
    EXPECT_EQ(u.handoff_grace_ms, 1000);
    EXPECT_TRUE(u.verify_checksum);
    EXPECT_EQ(u.expected_files, (std::vector<std::string>{"selfupdate", "selfupdate-updater"}));
    EXPECT_EQ(cfg.data().updater.wait_timeout_ms, 10000);
    EXPECT_EQ(cfg.data().updater.poll_interval_ms, 200);
    EXPECT_EQ(cfg.data().logging.level, "info");
}

TEST_F(ConfigTest, DefaultAssetSuffixNamesPlatform) {
    std::string suffix = Config::default_asset_suffix();
    EXPECT_EQ(suffix.front(), '-');
    EXPECT_NE(suffix.find(".tar.gz"), std::string::npos);
}

TEST_F(ConfigTest, ConfigDirPath) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    std::string dir = Config::config_dir();
    EXPECT_FALSE(dir.empty());
    EXPECT_NE(dir.find(".config/selfupdate"), std::string::npos);
}

TEST_F(ConfigTest, ConfigFilePath) {
    std::string path = Config::config_path();
    EXPECT_FALSE(path.empty());
    EXPECT_NE(path.find("config.yaml"), std::string::npos);
}

TEST_F(ConfigTest, LoadNonExistentReturnsFalse) {
    if (geteuid() == 0) GTEST_SKIP() << "Skipped: runs as root, config_dir ignores HOME";
    Config cfg;
    EXPECT_FALSE(cfg.load());
    EXPECT_EQ(cfg.data().update.lookup_timeout_ms, 2000);
}

TEST_F(ConfigTest, SaveAndLoad) {
    std::string path = test_dir + "/roundtrip/config.yaml";

    Config cfg1;
    cfg1.data().update.endpoint = "http://127.0.0.1:8080/releases/latest";
    cfg1.data().update.asset_suffix = "-linux-riscv64.tar.gz";
    cfg1.data().update.check_interval_hours = 6;
    cfg1.data().update.verify_checksum = false;
    cfg1.data().updater.wait_timeout_ms = 5000;
    cfg1.data().logging.level = "debug";
    ASSERT_TRUE(cfg1.save_to(path));
    ASSERT_TRUE(fs::exists(path));

    Config cfg2;
    ASSERT_TRUE(cfg2.load_from(path));
    EXPECT_EQ(cfg2.data().update.endpoint, "http://127.0.0.1:8080/releases/latest");
    EXPECT_EQ(cfg2.data().update.asset_suffix, "-linux-riscv64.tar.gz");
    EXPECT_EQ(cfg2.data().update.check_interval_hours, 6);
    EXPECT_FALSE(cfg2.data().update.verify_checksum);
    EXPECT_EQ(cfg2.data().updater.wait_timeout_ms, 5000);
    EXPECT_EQ(cfg2.data().logging.level, "debug");
}

TEST_F(ConfigTest, PartialFileKeepsDefaults) {
    std::string path = test_dir + "/partial.yaml";
    write_yaml(path, "update:\n  lookup_timeout_ms: 500\n");

    Config cfg;
    ASSERT_TRUE(cfg.load_from(path));
    EXPECT_EQ(cfg.data().update.lookup_timeout_ms, 500);
    EXPECT_EQ(cfg.data().update.read_timeout_ms, 30000);
    EXPECT_EQ(cfg.data().updater.poll_interval_ms, 200);
}

TEST_F(ConfigTest, HandoffGraceIsClamped) {
    std::string path = test_dir + "/grace.yaml";
    write_yaml(path, "update:\n  handoff_grace_ms: 60000\nupdater:\n  poll_interval_ms: 0\n");

    Config cfg;
    ASSERT_TRUE(cfg.load_from(path));
    EXPECT_EQ(cfg.data().update.handoff_grace_ms, Config::kMaxHandoffGraceMs);
    EXPECT_EQ(cfg.data().updater.poll_interval_ms, 1);

    write_yaml(path, "update:\n  handoff_grace_ms: -5\n");
    Config cfg2;
    ASSERT_TRUE(cfg2.load_from(path));
    EXPECT_EQ(cfg2.data().update.handoff_grace_ms, 0);
}

TEST_F(ConfigTest, MalformedYamlKeepsDefaults) {
    std::string path = test_dir + "/bad.yaml";
    write_yaml(path, "update: [unclosed\n");

    Config cfg;
    EXPECT_FALSE(cfg.load_from(path));
    EXPECT_EQ(cfg.data().update.lookup_timeout_ms, 2000);
}

TEST_F(ConfigTest, ExpandHome) {
    EXPECT_EQ(Config::expand_home("~/logs/a.log"), test_dir + "/logs/a.log");
    EXPECT_EQ(Config::expand_home("/var/log/a.log"), "/var/log/a.log");
}

TEST_F(ConfigTest, OrchestratorOptionsFromConfig) {
    Config cfg;
    cfg.data().update.lookup_timeout_ms = 750;
    cfg.data().update.check_interval_hours = 2;
    cfg.data().update.handoff_grace_ms = 300;
    cfg.data().updater.wait_timeout_ms = 4000;

    auto opts = OrchestratorOptions::from_config(cfg.data());
    EXPECT_EQ(opts.endpoint, cfg.data().update.endpoint);
    EXPECT_EQ(opts.lookup_timeout, std::chrono::milliseconds(750));
    EXPECT_EQ(opts.check_interval, std::chrono::hours(2));
    EXPECT_EQ(opts.handoff_grace, std::chrono::milliseconds(300));
    EXPECT_EQ(opts.updater_wait_timeout_ms, 4000);
    EXPECT_NE(opts.user_agent.find("selfupdate/"), std::string::npos);
    EXPECT_EQ(opts.expected_files, cfg.data().update.expected_files);
}

TEST_F(ConfigTest, ExpectedFilesFromYaml) {
    std::string path = test_dir + "/files.yaml";
    write_yaml(path, "update:\n  expected_files:\n    - selfupdate\n    - \"\"\n"
                     "    - share/selfupdate/LICENSE\n");

    Config cfg;
    ASSERT_TRUE(cfg.load_from(path));
    EXPECT_EQ(cfg.data().update.expected_files,
              (std::vector<std::string>{"selfupdate", "share/selfupdate/LICENSE"}));

    ASSERT_TRUE(cfg.save_to(path));
    Config reloaded;
    ASSERT_TRUE(reloaded.load_from(path));
    EXPECT_EQ(reloaded.data().update.expected_files, cfg.data().update.expected_files);
}
