#include "disk_analyzer/scan/pattern_sources.hpp"
#include "disk_analyzer/core/error_codes.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>

using namespace disk_analyzer;

class PatternSourcesTest : public test::TempTreeTest {};

TEST_F(PatternSourcesTest, LoadSkipsCommentsAndBlankLines) {
    auto file = writeText("patterns.txt", "# header\n\n  build  \n*.log\n   # indented comment\n");
    auto items = scan::loadPatternFile(file);
    
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0], "build");
    EXPECT_EQ(items[1], "*.log");
}

TEST_F(PatternSourcesTest, MissingExplicitFileIsConfigError) {
    try {
        scan::loadPatternFile(path("does-not-exist"));
        FAIL() << "expected ConfigError";
    } catch (const core::ConfigError& e) {
        EXPECT_EQ(e.code(), core::AnalyzerErrorCode::PATTERN_FILE_UNREADABLE);
    }
}

TEST(PatternListTest, SplitsAndTrims) {
    auto items = scan::splitPatternList(" a , b,,c ");
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0], "a");
    EXPECT_EQ(items[1], "b");
    EXPECT_EQ(items[2], "c");
    EXPECT_TRUE(scan::splitPatternList("").empty());
}

TEST_F(PatternSourcesTest, LocalFileBeforeHomeFileFirstSeenWins) {
    makeDir("target");
    makeDir("home");
    writeText("target/.disk_analyzer_ignore", "local_only\nshared\n");
    writeText("home/.disk_analyzer_ignore", "shared\nhome_only\n");
    
    scan::PatternSourceOptions options;
    options.inline_items = {"inline", "shared"};
    options.default_file_name = ".disk_analyzer_ignore";
    options.root = path("target");
    options.home_dir = path("home");
    
    auto items = scan::collectPatterns(options);
    std::vector<std::string> expected = {"inline", "shared", "local_only", "home_only"};
    EXPECT_EQ(items, expected);
}

TEST_F(PatternSourcesTest, ExplicitFileReplacesDiscoveredFiles) {
    makeDir("target");
    writeText("target/.disk_analyzer_include", "discovered\n");
    auto explicit_file = writeText("explicit.txt", "chosen\n");
    
    scan::PatternSourceOptions options;
    options.explicit_file = explicit_file;
    options.default_file_name = ".disk_analyzer_include";
    options.root = path("target");
    
    auto items = scan::collectPatterns(options);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0], "chosen");
}

TEST_F(PatternSourcesTest, HomeEqualToRootIsReadOnce) {
    writeText(".disk_analyzer_ignore", "one\n");
    
    scan::PatternSourceOptions options;
    options.default_file_name = ".disk_analyzer_ignore";
    options.root = root_;
    options.home_dir = root_;
    
    auto items = scan::collectPatterns(options);
    ASSERT_EQ(items.size(), 1u);
}

TEST(ClassifyWhitelistTest, SplitsPathsFromPatterns) {
    auto spec = scan::classifyWhitelist({"/R/x/y/", "/R/*/tmp", "cache", "regex:^/R/a", "/R/x/y"});
    
    ASSERT_EQ(spec.paths.size(), 1u);
    EXPECT_EQ(spec.paths[0], "/R/x/y");
    
    ASSERT_EQ(spec.patterns.size(), 3u);
    EXPECT_EQ(spec.patterns.patterns()[0].text(), "/R/*/tmp");
    EXPECT_EQ(spec.patterns.patterns()[1].text(), "cache");
    EXPECT_EQ(spec.patterns.patterns()[2].text(), "regex:^/R/a");
}
