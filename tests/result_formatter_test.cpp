#include "disk_analyzer/scan/result_formatter.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace disk_analyzer;

namespace {

scan::ResultRow row(const std::string& path, uint64_t size, int depth, int level, bool last,
                    std::vector<bool> ancestors_last = {}) {
    scan::ResultRow r;
    r.entry.path = path;
    r.entry.size_bytes = size;
    r.entry.depth = depth;
    r.level = level;
    r.last_sibling = last;
    r.ancestors_last = std::move(ancestors_last);
    return r;
}

scan::AnalysisResult sampleTree() {
    scan::AnalysisResult result;
    result.root = "/R";
    result.tree = true;
    result.rows = {
        row("/R", 3072, 0, 0, true),
        row("/R/a", 2048, 1, 1, false, {true}),
        row("/R/a/x", 1024, 2, 2, true, {true, false}),
        row("/R/b", 1024, 1, 1, true, {true})
    };
    return result;
}

}

TEST(ResultFormatterTest, FlatTextPadsSizeColumn) {
    scan::AnalysisResult result;
    result.root = "/R";
    result.rows = {row("/R/a", 2048, 1, 1, false), row("/R", 4096, 0, 0, false)};
    
    scan::ResultFormatter formatter(scan::OutputFormat::TEXT);
    formatter.setColorsEnabled(false);
    std::ostringstream out;
    formatter.formatResult(result, out);
    
    EXPECT_EQ(out.str(), "2.00 KB       a\n4.00 KB       .\n");
}

TEST(ResultFormatterTest, PathFormats) {
    scan::ResultFormatter formatter;
    
    formatter.setPathFormat(common::PathFormat::ABSOLUTE);
    EXPECT_EQ(formatter.displayPath("/R/a/b", "/R"), "/R/a/b");
    
    formatter.setPathFormat(common::PathFormat::RELATIVE);
    EXPECT_EQ(formatter.displayPath("/R/a/b", "/R"), "a/b");
    EXPECT_EQ(formatter.displayPath("/R", "/R"), ".");
    EXPECT_EQ(formatter.displayPath("/a", "/"), "a");
    
    formatter.setPathFormat(common::PathFormat::BASENAME);
    EXPECT_EQ(formatter.displayPath("/R/a/b", "/R"), "b");
}

TEST(ResultFormatterTest, TreeTextUsesBranchGlyphs) {
    scan::ResultFormatter formatter(scan::OutputFormat::TEXT);
    formatter.setColorsEnabled(false);
    std::ostringstream out;
    formatter.formatResult(sampleTree(), out);
    
    std::string expected =
        "3.00 KB       .\n"
        "2.00 KB       ├─ a\n"
        "1.00 KB       │  └─ x\n"
        "1.00 KB       └─ b\n";
    EXPECT_EQ(out.str(), expected);
}

TEST(ResultFormatterTest, JsonDocument) {
    auto result = sampleTree();
    result.warnings.push_back({core::AnalyzerErrorCode::SYMLINK_LOOP, "/R/loop", ""});
    
    scan::ResultFormatter formatter(scan::OutputFormat::JSON);
    std::ostringstream out;
    formatter.formatResult(result, out);
    
    auto json = nlohmann::json::parse(out.str());
    EXPECT_EQ(json["root"], "/R");
    ASSERT_EQ(json["entries"].size(), 4u);
    EXPECT_EQ(json["entries"][1]["path"], "/R/a");
    EXPECT_EQ(json["entries"][1]["size"], 2048);
    EXPECT_EQ(json["entries"][2]["level"], 2);
    EXPECT_EQ(json["entries"][2]["depth"], 2);
    ASSERT_EQ(json["warnings"].size(), 1u);
    EXPECT_EQ(json["warnings"][0]["code"], "SYMLINK_LOOP");
    EXPECT_EQ(json["warnings"][0]["path"], "/R/loop");
}

TEST(ResultFormatterTest, WarningsGoToDiagnosticStream) {
    scan::ResultFormatter formatter;
    formatter.setColorsEnabled(false);
    std::ostringstream err;
    formatter.formatWarnings({{core::AnalyzerErrorCode::PERMISSION_DENIED, "/R/secret", ""}}, err);
    
    EXPECT_EQ(err.str(), "Warning: Permission denied: /R/secret\n");
}
