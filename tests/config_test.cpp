#include "disk_analyzer/common/config.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>

using namespace disk_analyzer;

class ConfigTest : public test::TempTreeTest {
protected:
    void TearDown() override {
        common::Config::instance().global() = common::Config::createDefaultConfig();
        test::TempTreeTest::TearDown();
    }
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    auto defaults = common::Config::createDefaultConfig();
    EXPECT_EQ(defaults.defaults.level, 1);
    EXPECT_EQ(defaults.defaults.min_size, "0");
    EXPECT_EQ(defaults.defaults.sort, "size");
    EXPECT_EQ(defaults.defaults.path_format, "relative");
    EXPECT_FALSE(defaults.defaults.reverse);
    EXPECT_EQ(defaults.log_level, common::LogLevel::WARN);
    EXPECT_FALSE(defaults.scan.progress);
}

TEST_F(ConfigTest, LoadsSectionsFromToml) {
    auto file = writeText("config.toml",
        "[global]\n"
        "log_level = \"DEBUG\"\n"
        "\n"
        "[defaults]\n"
        "level = 3\n"
        "min_size = \"10M\"\n"
        "sort = \"name\"\n"
        "reverse = true\n"
        "tree = true\n"
        "\n"
        "[scan]\n"
        "threads = 8\n"
        "progress = true\n"
        "\n"
        "[logging]\n"
        "format = \"json\"\n");
    
    auto& config = common::Config::instance();
    ASSERT_TRUE(config.load(file));
    
    const auto& global = config.global();
    EXPECT_EQ(global.log_level, common::LogLevel::DEBUG);
    EXPECT_EQ(global.defaults.level, 3);
    EXPECT_EQ(global.defaults.min_size, "10M");
    EXPECT_EQ(global.defaults.sort, "name");
    EXPECT_TRUE(global.defaults.reverse);
    EXPECT_TRUE(global.defaults.tree);
    EXPECT_FALSE(global.defaults.dereference);
    EXPECT_EQ(global.scan.threads, 8);
    EXPECT_TRUE(global.scan.progress);
    EXPECT_EQ(global.logging.format, common::LogFormat::JSON);
    EXPECT_EQ(config.getConfigPath(), file);
}

TEST_F(ConfigTest, MalformedTomlFailsToLoad) {
    auto file = writeText("broken.toml", "[defaults\nlevel = \n");
    EXPECT_FALSE(common::Config::instance().load(file));
}

TEST(ConfigParseTest, LogLevels) {
    EXPECT_EQ(common::Config::parseLogLevel("INFO"), common::LogLevel::INFO);
    EXPECT_FALSE(common::Config::parseLogLevel("verbose"));
}
