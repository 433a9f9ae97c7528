#include "disk_analyzer/common/logger.hpp"
#include "test_utils.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

using namespace disk_analyzer;

class LoggerTest : public test::TempTreeTest {
protected:
    void TearDown() override {
        common::Logger::instance().shutdown();
        test::TempTreeTest::TearDown();
    }

    std::string readAll(const std::string& file) const {
        std::ifstream in(file);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }
};

TEST_F(LoggerTest, StderrWhenNoLogFile) {
    auto global = common::Config::createDefaultConfig();
    auto options = common::LoggerOptions::fromConfig(global, path("logs"));
    EXPECT_EQ(options.sink, common::LogSink::STDERR);
    EXPECT_TRUE(options.file_path.empty());
    EXPECT_EQ(options.level, common::LogLevel::WARN);
}

TEST_F(LoggerTest, BareFileNameGoesUnderLogDir) {
    auto global = common::Config::createDefaultConfig();
    global.logging.log_file = "analyzer.log";
    auto options = common::LoggerOptions::fromConfig(global, path("logs"));
    EXPECT_EQ(options.sink, common::LogSink::ROTATING_FILE);
    EXPECT_EQ(options.file_path, path("logs") + "/analyzer.log");
}

TEST_F(LoggerTest, PathWithDirectoryIsKept) {
    auto global = common::Config::createDefaultConfig();
    global.logging.log_file = path("elsewhere/run.log");
    auto options = common::LoggerOptions::fromConfig(global, path("logs"));
    EXPECT_EQ(options.file_path, path("elsewhere/run.log"));
}

TEST_F(LoggerTest, FileSinkReceivesMessagesAtLevel) {
    common::LoggerOptions options;
    options.sink = common::LogSink::ROTATING_FILE;
    options.file_path = path("nested/dir/run.log");
    options.level = common::LogLevel::INFO;

    auto& logger = common::Logger::instance();
    logger.configure(options);
    ASSERT_EQ(logger.activeSink(), common::LogSink::ROTATING_FILE);

    logger.info("[Test] Visible | value={}", 42);
    logger.debug("[Test] Hidden");
    logger.flush();

    auto content = readAll(options.file_path);
    EXPECT_NE(content.find("[Test] Visible | value=42"), std::string::npos);
    EXPECT_EQ(content.find("[Test] Hidden"), std::string::npos);
}

TEST_F(LoggerTest, SetLevelRaisesVerbosity) {
    common::LoggerOptions options;
    options.sink = common::LogSink::ROTATING_FILE;
    options.file_path = path("run.log");

    auto& logger = common::Logger::instance();
    logger.configure(options);
    logger.setLevel(common::LogLevel::DEBUG);
    EXPECT_EQ(logger.level(), common::LogLevel::DEBUG);

    logger.debug("[Test] Now visible");
    logger.flush();
    EXPECT_NE(readAll(options.file_path).find("[Test] Now visible"), std::string::npos);
}

TEST_F(LoggerTest, MessagesBeforeConfigureAreDropped) {
    auto& logger = common::Logger::instance();
    logger.shutdown();
    logger.warn("[Test] Nowhere | path={}", "/x");
    EXPECT_EQ(logger.activeSink(), common::LogSink::STDERR);
}
