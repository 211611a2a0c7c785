#include <gtest/gtest.h>

#include "config/Config.hpp"
#include "config/util.hpp"
#include "sync/model/SyncItem.hpp"
#include "support/TempDir.hpp"
#include "util/errors.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>

using namespace ts;
using namespace ts::config;
using ts::test::TempDir;
using ts::test::readText;
using ts::test::writeText;

class ConfigTest : public ::testing::Test {
protected:
    TempDir dir;
    std::filesystem::path file = dir / "termsync.yaml";

    void SetUp() override { unsetenv("TERMSYNC_TOKEN"); }
    void TearDown() override { unsetenv("TERMSYNC_TOKEN"); }
};

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    const auto cfg = loadConfig(file);
    EXPECT_TRUE(cfg.source.empty());
    EXPECT_EQ(cfg.cloud.api_base, DEFAULT_API_BASE);
    EXPECT_EQ(cfg.sync.primary, "config.yaml");
    EXPECT_EQ(cfg.sync.conflict_strategy, "newest");
    EXPECT_EQ(cfg.sync.max_backups, 10u);
    EXPECT_EQ(cfg.cloud.mechanisms, (std::vector<std::string>{"libcurl", "curl-cli", "socket"}));
    EXPECT_EQ(cfg.backupDir(), cfg.sync.config_root / "backups");
}

TEST_F(ConfigTest, LoadsYamlSections) {
    writeText(file,
              "cloud:\n"
              "  token: abc\n"
              "  record_id: rec9\n"
              "  timeout: 2m\n"
              "  mechanisms: [socket]\n"
              "sync:\n"
              "  config_root: " + (dir / "root").string() + "\n"
              "  conflict_strategy: merge\n"
              "  items:\n"
              "    - themes/\n"
              "    - path: plugins/\n"
              "      exclude: ['*.map']\n"
              "  max_backups: 3\n"
              "monitoring:\n"
              "  process_name: wezterm\n"
              "  interval: 10s\n");

    const auto cfg = loadConfig(file);
    EXPECT_EQ(cfg.source, file);
    EXPECT_EQ(cfg.cloud.token, "abc");
    EXPECT_EQ(cfg.cloud.record_id, "rec9");
    EXPECT_EQ(cfg.cloud.timeout, std::chrono::seconds(120));
    EXPECT_EQ(cfg.cloud.mechanisms, std::vector<std::string>{"socket"});
    EXPECT_EQ(cfg.sync.config_root, dir / "root");
    EXPECT_EQ(cfg.sync.conflict_strategy, "merge");
    EXPECT_EQ(cfg.sync.max_backups, 3u);
    ASSERT_EQ(cfg.sync.items.size(), 2u);
    EXPECT_EQ(cfg.sync.items[1].path, "plugins/");
    EXPECT_EQ(cfg.sync.items[1].exclude, std::vector<std::string>{"*.map"});
    EXPECT_EQ(cfg.monitoring.process_name, "wezterm");
    EXPECT_EQ(cfg.monitoring.interval, std::chrono::seconds(10));
    EXPECT_EQ(cfg.metadataPath(), dir / "root" / ".sync_metadata.json");
}

TEST_F(ConfigTest, MalformedFilesThrowConfigError) {
    writeText(file, "cloud: [unclosed\n");
    EXPECT_THROW((void)loadConfig(file), ConfigError);

    writeText(file, "- a\n- list\n");
    EXPECT_THROW((void)loadConfig(file), ConfigError);

    writeText(file, "sync: 5\n");
    EXPECT_THROW((void)loadConfig(file), ConfigError);

    writeText(file, "sync:\n  max_backups: 0\n");
    EXPECT_THROW((void)loadConfig(file), ConfigError);

    writeText(file, "cloud:\n  timeout: soon\n");
    EXPECT_THROW((void)loadConfig(file), ConfigError);
}

TEST_F(ConfigTest, EnvironmentTokenOverridesFile) {
    writeText(file, "cloud:\n  token: from-file\n");
    setenv("TERMSYNC_TOKEN", "from-env", 1);
    EXPECT_EQ(loadConfig(file).cloud.token, "from-env");
}

TEST_F(ConfigTest, SaveRoundTrips) {
    auto cfg = loadConfig(file);
    cfg.cloud.record_id = "rec3";
    cfg.sync.config_root = dir / "root";
    cfg.sync.items = {{"themes/", {"*.bak"}}};
    cfg.save(file);

    const auto back = loadConfig(file);
    EXPECT_EQ(back.cloud.record_id, "rec3");
    EXPECT_EQ(back.sync.config_root, dir / "root");
    ASSERT_EQ(back.sync.items.size(), 1u);
    EXPECT_EQ(back.sync.items[0].exclude, std::vector<std::string>{"*.bak"});
}

TEST_F(ConfigTest, PersistRecordIdKeepsOtherKeys) {
    writeText(file, "cloud:\n  token: keep-me\nsync:\n  conflict_strategy: local\ncustom: value\n");
    persistRecordId(file, "rec77");

    const auto doc = YAML::LoadFile(file.string());
    EXPECT_EQ(doc["cloud"]["record_id"].as<std::string>(), "rec77");
    EXPECT_EQ(doc["cloud"]["token"].as<std::string>(), "keep-me");
    EXPECT_EQ(doc["sync"]["conflict_strategy"].as<std::string>(), "local");
    EXPECT_EQ(doc["custom"].as<std::string>(), "value");

    const auto fresh = dir / "fresh.yaml";
    persistRecordId(fresh, "rec1");
    EXPECT_EQ(loadConfig(fresh).cloud.record_id, "rec1");
}

TEST(ConfigUtilTest, ParsesDurations) {
    EXPECT_EQ(parseSeconds("30"), std::chrono::seconds(30));
    EXPECT_EQ(parseSeconds("45s"), std::chrono::seconds(45));
    EXPECT_EQ(parseSeconds("5m"), std::chrono::seconds(300));
    EXPECT_EQ(parseSeconds("1h"), std::chrono::seconds(3600));
    EXPECT_THROW(parseSeconds(""), std::invalid_argument);
    EXPECT_THROW(parseSeconds("5x"), std::invalid_argument);
    EXPECT_EQ(secondsToString(std::chrono::seconds(300)), "5m");
}

TEST(SyncItemsTest, PrimaryFirstThenConfiguredOrder) {
    SyncConfig cfg;
    cfg.items = {{"./keymaps.yaml", {}}, {"profiles/", {"*.bak"}}};

    const auto items = sync::model::itemsFromConfig(cfg);
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].name, "config.yaml");
    EXPECT_TRUE(items[0].structured);
    EXPECT_EQ(items[1].name, "keymaps.yaml");
    EXPECT_FALSE(items[1].isDirectory());
    EXPECT_EQ(items[2].name, "profiles");
    EXPECT_TRUE(items[2].isDirectory());
    EXPECT_EQ(items[2].exclude.back(), "*.bak");
    EXPECT_EQ(items[2].exclude.front(), cfg.exclude.front());
}

TEST(SyncItemsTest, RejectsBadPaths) {
    SyncConfig cfg;

    cfg.items = {{"../outside/", {}}};
    EXPECT_THROW((void)sync::model::itemsFromConfig(cfg), ConfigError);

    cfg.items = {{"/etc/passwd", {}}};
    EXPECT_THROW((void)sync::model::itemsFromConfig(cfg), ConfigError);

    cfg.items = {{"themes/", {}}, {"themes", {}}};
    EXPECT_THROW((void)sync::model::itemsFromConfig(cfg), ConfigError);

    cfg.items = {{"config.yaml", {}}};
    EXPECT_THROW((void)sync::model::itemsFromConfig(cfg), ConfigError);
}
