#include "disk_analyzer/scan/analyzer.hpp"
#include "disk_analyzer/core/error_codes.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>

using namespace disk_analyzer;

namespace {

class FailingSizeService : public scan::SizeService {
public:
    scan::SizeMeasurement measure(const std::string&, const scan::MeasureOptions&) const override {
        scan::SizeMeasurement measurement;
        measurement.error = std::make_error_code(std::errc::permission_denied);
        return measurement;
    }
};

std::vector<std::string> rowPaths(const scan::AnalysisResult& result) {
    std::vector<std::string> paths;
    for (const auto& row : result.rows) {
        paths.push_back(row.entry.path);
    }
    return paths;
}

const scan::ResultRow* findRow(const scan::AnalysisResult& result, const std::string& path) {
    auto it = std::find_if(result.rows.begin(), result.rows.end(),
                           [&path](const scan::ResultRow& row) { return row.entry.path == path; });
    return it == result.rows.end() ? nullptr : &*it;
}

}

class AnalyzerTest : public test::TempTreeTest {
protected:
    scan::ScanConfig configFor(int depth) const {
        scan::ScanConfig config;
        config.root = root_;
        config.max_depth = depth;
        return config;
    }
    
    scan::AnalysisResult run(const scan::ScanConfig& config) const {
        scan::DiskAnalyzer analyzer(fs_, sizes_);
        return analyzer.run(config);
    }
    
    scan::PosixFileSystem fs_;
    scan::DiskUsageSizeService sizes_{fs_};
};

TEST_F(AnalyzerTest, MinSizeKeepsOnlyLargeDirectories) {
    makeFile("a/data.bin", 2 * 1024 * 1024);
    makeFile("b/data.bin", 512 * 1024);
    
    auto config = configFor(1);
    config.min_size = 1024 * 1024;
    auto result = run(config);
    
    std::vector<std::string> expected = {path("a"), root_};
    EXPECT_EQ(rowPaths(result), expected);
    EXPECT_EQ(result.pruned_count, 1u);
    EXPECT_FALSE(result.allFailed());
    EXPECT_GE(result.rows[0].entry.size_bytes, 2u * 1024 * 1024);
    EXPECT_GE(result.rows[1].entry.size_bytes, result.rows[0].entry.size_bytes);
}

TEST_F(AnalyzerTest, WhitelistPathBeyondDepthIsConnected) {
    makeFile("x/y/deep/payload", 4096);
    makeDir("z");
    
    auto config = configFor(1);
    config.whitelist_paths.push_back(path("x/y/deep"));
    auto result = run(config);
    
    for (const auto& p : {root_, path("x"), path("x/y"), path("x/y/deep")}) {
        const auto* row = findRow(result, p);
        ASSERT_NE(row, nullptr) << p;
        EXPECT_TRUE(row->entry.measured);
        EXPECT_GE(row->entry.size_bytes, 4096u) << p;
    }
    EXPECT_EQ(findRow(result, path("z")), nullptr);
    EXPECT_EQ(findRow(result, path("x/y/deep"))->entry.depth, 3);
}

TEST_F(AnalyzerTest, CutAppliesEvenWithAll) {
    makeFile("small/data.bin", 100 * 1024);
    makeFile("big/data.bin", 2 * 1024 * 1024);
    
    auto config = configFor(1);
    config.all = true;
    config.min_size = 1024 * 1024;
    config.cut_size = 1024 * 1024;
    auto result = run(config);
    
    EXPECT_EQ(result.pruned_count, 0u);
    EXPECT_EQ(result.cut_count, 1u);
    EXPECT_EQ(findRow(result, path("small")), nullptr);
    EXPECT_NE(findRow(result, path("big")), nullptr);
}

TEST_F(AnalyzerTest, CutSparesWhitelistedEntries) {
    makeFile("small/data.bin", 100 * 1024);
    makeFile("big/data.bin", 2 * 1024 * 1024);
    
    auto config = configFor(1);
    config.cut_size = 1024 * 1024;
    config.whitelist.add("small");
    auto result = run(config);
    
    const auto* row = findRow(result, path("small"));
    ASSERT_NE(row, nullptr);
    EXPECT_TRUE(row->entry.exempt);
}

TEST_F(AnalyzerTest, CutRemovesSmallAncestorsOfWhitelistPath) {
    makeFile("x/y/deep/payload", 4096);
    makeFile("x/y/deep/more", 4096);
    
    auto config = configFor(1);
    config.cut_size = 1024 * 1024;
    config.tree = true;
    config.whitelist_paths.push_back(path("x/y/deep"));
    auto result = run(config);
    
    EXPECT_EQ(findRow(result, root_), nullptr);
    EXPECT_EQ(findRow(result, path("x")), nullptr);
    EXPECT_EQ(findRow(result, path("x/y")), nullptr);
    EXPECT_EQ(result.cut_count, 3u);
    
    ASSERT_EQ(result.rows.size(), 1u);
    const auto& row = result.rows[0];
    EXPECT_EQ(row.entry.path, path("x/y/deep"));
    EXPECT_TRUE(row.entry.exempt);
    EXPECT_TRUE(row.reparented);
    EXPECT_EQ(row.level, 0);
}

TEST_F(AnalyzerTest, BlacklistRemovesMatchingEntries) {
    makeDir("keep");
    makeDir("node_modules");
    
    auto config = configFor(1);
    config.blacklist.add("node_modules");
    auto result = run(config);
    
    EXPECT_EQ(result.excluded_count, 1u);
    EXPECT_EQ(findRow(result, path("node_modules")), nullptr);
    EXPECT_NE(findRow(result, path("keep")), nullptr);
}

TEST_F(AnalyzerTest, SymlinkLoopWarnsOnceAndSucceeds) {
    makeFile("ok/data.bin", 1024);
    makeSymlink(path("B"), "A");
    makeSymlink(path("A"), "B");
    
    auto config = configFor(scan::UNBOUNDED_DEPTH);
    config.follow_symlinks = true;
    auto result = run(config);
    
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].code, core::AnalyzerErrorCode::SYMLINK_LOOP);
    EXPECT_FALSE(result.allFailed());
    EXPECT_NE(findRow(result, path("ok")), nullptr);
}

TEST_F(AnalyzerTest, RunsAreIdempotent) {
    makeFile("a/one", 1000);
    makeFile("b/two", 3000);
    makeFile("b/c/three", 200);
    
    auto config = configFor(2);
    config.tree = true;
    auto first = run(config);
    auto second = run(config);
    
    ASSERT_EQ(first.rows.size(), second.rows.size());
    for (size_t i = 0; i < first.rows.size(); ++i) {
        EXPECT_EQ(first.rows[i].entry.path, second.rows[i].entry.path);
        EXPECT_EQ(first.rows[i].entry.size_bytes, second.rows[i].entry.size_bytes);
        EXPECT_EQ(first.rows[i].level, second.rows[i].level);
    }
}

TEST_F(AnalyzerTest, ParallelLookupMatchesSequential) {
    for (int i = 0; i < 12; ++i) {
        makeFile("d" + std::to_string(i) + "/f", 1000 * (i + 1));
    }
    
    auto config = configFor(1);
    auto sequential = run(config);
    config.threads = 4;
    auto parallel = run(config);
    
    EXPECT_EQ(rowPaths(sequential), rowPaths(parallel));
}

TEST_F(AnalyzerTest, ProgressReportsEveryLookupUnderParallelMeasurement) {
    for (int i = 0; i < 10; ++i) {
        makeFile("d" + std::to_string(i) + "/f", 100);
    }
    
    std::atomic<size_t> calls{0};
    std::atomic<size_t> highest{0};
    std::atomic<size_t> reported_total{0};
    
    scan::DiskAnalyzer analyzer(fs_, sizes_);
    analyzer.setProgressCallback([&](size_t done, size_t total) {
        calls++;
        reported_total = total;
        size_t seen = highest.load();
        while (done > seen && !highest.compare_exchange_weak(seen, done)) {
        }
    });
    
    auto config = configFor(1);
    config.threads = 4;
    auto result = analyzer.run(config);
    
    EXPECT_EQ(calls.load(), 11u);
    EXPECT_EQ(highest.load(), 11u);
    EXPECT_EQ(reported_total.load(), 11u);
    EXPECT_EQ(result.measured_count, 11u);
}

TEST_F(AnalyzerTest, HardLinksCountedOnce) {
    auto original = makeFile("h/data.bin", 64 * 1024);
    std::filesystem::create_hard_link(original, path("h/alias.bin"));
    
    scan::MeasureOptions options;
    auto measurement = sizes_.measure(path("h"), options);
    ASSERT_TRUE(measurement.ok());
    EXPECT_LT(measurement.bytes, 2u * 64 * 1024);
    EXPECT_GE(measurement.bytes, 64u * 1024);
}

TEST_F(AnalyzerTest, MissingTargetIsTargetError) {
    auto config = configFor(1);
    config.root = path("missing");
    
    try {
        run(config);
        FAIL() << "expected TargetError";
    } catch (const core::TargetError& e) {
        EXPECT_EQ(e.code(), core::AnalyzerErrorCode::TARGET_NOT_FOUND);
        EXPECT_EQ(e.exitCode(), 2);
    }
}

TEST_F(AnalyzerTest, FileTargetIsTargetError) {
    auto config = configFor(1);
    config.root = makeFile("plain.txt", 10);
    
    try {
        run(config);
        FAIL() << "expected TargetError";
    } catch (const core::TargetError& e) {
        EXPECT_EQ(e.code(), core::AnalyzerErrorCode::TARGET_NOT_DIRECTORY);
    }
}

TEST_F(AnalyzerTest, EveryLookupFailingIsAllFailed) {
    makeDir("a");
    makeDir("b");
    
    FailingSizeService failing;
    scan::DiskAnalyzer analyzer(fs_, failing);
    auto result = analyzer.run(configFor(1));
    
    EXPECT_TRUE(result.rows.empty());
    EXPECT_EQ(result.failed_count, 3u);
    EXPECT_EQ(result.warnings.size(), 3u);
    EXPECT_TRUE(result.allFailed());
}

TEST_F(AnalyzerTest, FailedExemptEntryIsKeptUnmeasured) {
    makeDir("keep");
    
    FailingSizeService failing;
    scan::DiskAnalyzer analyzer(fs_, failing);
    auto config = configFor(1);
    config.whitelist_paths.push_back(path("keep"));
    auto result = analyzer.run(config);
    
    const auto* row = findRow(result, path("keep"));
    ASSERT_NE(row, nullptr);
    EXPECT_FALSE(row->entry.measured);
    EXPECT_EQ(row->entry.size_bytes, 0u);
    EXPECT_TRUE(result.allFailed());
}
