#include "disk_analyzer/core/error_codes.hpp"
#include "disk_analyzer/common/constants.hpp"
#include <gtest/gtest.h>
#include <cerrno>

using namespace disk_analyzer;
using core::AnalyzerErrorCode;
using core::AnalyzerErrorCodeHelper;

TEST(ErrorCodesTest, RegistryNamesAndSeverity) {
    EXPECT_STREQ(AnalyzerErrorCodeHelper::toString(AnalyzerErrorCode::SYMLINK_LOOP), "SYMLINK_LOOP");
    EXPECT_FALSE(AnalyzerErrorCodeHelper::isFatal(AnalyzerErrorCode::PERMISSION_DENIED));
    EXPECT_TRUE(AnalyzerErrorCodeHelper::isFatal(AnalyzerErrorCode::TARGET_NOT_FOUND));
    EXPECT_EQ(AnalyzerErrorCodeHelper::describe(AnalyzerErrorCode::PATH_VANISHED),
              "PATH_VANISHED (Path no longer exists)");
}

TEST(ErrorCodesTest, UnknownCodeFallsBack) {
    auto bogus = static_cast<AnalyzerErrorCode>(999);
    EXPECT_STREQ(AnalyzerErrorCodeHelper::toString(bogus), "UNKNOWN");
    EXPECT_TRUE(AnalyzerErrorCodeHelper::isFatal(bogus));
}

TEST(ErrorCodesTest, DiagnosticUsesDefaultMessageAndPath) {
    core::Diagnostic diagnostic{AnalyzerErrorCode::PERMISSION_DENIED, "/data/private", ""};
    EXPECT_EQ(core::formatDiagnostic(diagnostic), "Permission denied: /data/private");
    
    diagnostic.message = "Cannot list directory";
    EXPECT_EQ(core::formatDiagnostic(diagnostic), "Cannot list directory: /data/private");
    
    diagnostic.path.clear();
    EXPECT_EQ(core::formatDiagnostic(diagnostic), "Cannot list directory");
}

TEST(ErrorCodesTest, ClassifiesErrno) {
    auto classify = [](int value) {
        return core::classifyFilesystemError(std::error_code(value, std::generic_category()));
    };
    EXPECT_EQ(classify(EACCES), AnalyzerErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(classify(EPERM), AnalyzerErrorCode::PERMISSION_DENIED);
    EXPECT_EQ(classify(ENOENT), AnalyzerErrorCode::PATH_VANISHED);
    EXPECT_EQ(classify(ELOOP), AnalyzerErrorCode::SYMLINK_LOOP);
    EXPECT_EQ(classify(EIO), AnalyzerErrorCode::SIZE_LOOKUP_FAILED);
}

TEST(ErrorCodesTest, ExitCodesPerErrorKind) {
    core::ConfigError config_error(AnalyzerErrorCode::INVALID_SIZE_FORMAT, "bad size");
    core::TargetError target_error(AnalyzerErrorCode::TARGET_NOT_FOUND, "missing");
    core::AllFailedError all_failed("nothing measured");
    
    EXPECT_EQ(config_error.exitCode(), constants::exit_codes::ARGUMENT_ERROR);
    EXPECT_EQ(target_error.exitCode(), constants::exit_codes::TARGET_ERROR);
    EXPECT_EQ(all_failed.exitCode(), constants::exit_codes::IO_ERROR);
    EXPECT_EQ(all_failed.code(), AnalyzerErrorCode::ALL_FAILED);
}
