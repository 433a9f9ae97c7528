#include "disk_analyzer/common/logger.hpp"
#include "disk_analyzer/common/constants.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <iostream>

namespace disk_analyzer {
namespace common {

LoggerOptions LoggerOptions::fromConfig(const GlobalConfig& global, const std::string& log_dir) {
    LoggerOptions options;
    options.level = global.log_level;
    options.format = global.logging.format;
    options.rotation_size_mb = global.logging.rotation_size_mb;
    options.max_files = global.logging.max_files;

    if (global.logging.log_file.empty()) {
        return options;
    }

    options.sink = LogSink::ROTATING_FILE;
    options.file_path = global.logging.log_file;
    if (options.file_path.find('/') == std::string::npos && !log_dir.empty()) {
        options.file_path = log_dir + "/" + options.file_path;
    }
    return options;
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::configure(const LoggerOptions& options) {
    if (logger_) {
        shutdown();
    }

    spdlog::sink_ptr sink;
    if (options.sink == LogSink::ROTATING_FILE) {
        sink = openFileSink(options);
    }

    active_sink_ = sink ? LogSink::ROTATING_FILE : LogSink::STDERR;
    if (!sink) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }

    logger_ = std::make_shared<spdlog::logger>(constants::system::LOGGER_NAME, sink);
    logger_->set_pattern(active_sink_ == LogSink::ROTATING_FILE
                         ? patternFor(options.format)
                         : patternFor(LogFormat::TEXT));

    if (active_sink_ == LogSink::ROTATING_FILE) {
        logger_->flush_on(spdlog::level::info);
    } else {
        logger_->flush_on(spdlog::level::warn);
    }

    setLevel(options.level);
}

spdlog::sink_ptr Logger::openFileSink(const LoggerOptions& options) {
    std::filesystem::path parent = std::filesystem::path(options.file_path).parent_path();
    std::error_code ec;
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    size_t rotation_mb = options.rotation_size_mb > 0
        ? options.rotation_size_mb : constants::limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    size_t max_files = options.max_files > 0
        ? options.max_files : constants::limits::DEFAULT_LOG_MAX_FILES;

    try {
        return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            options.file_path, rotation_mb * 1024 * 1024, max_files);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "[Logger] Cannot open log file " << options.file_path
                  << " (" << ex.what() << "), logging to stderr" << std::endl;
        return nullptr;
    }
}

void Logger::setLevel(LogLevel level) {
    level_ = level;
    if (logger_) {
        logger_->set_level(toSpdlogLevel(level));
    }
}

void Logger::flush() {
    if (logger_) {
        logger_->flush();
    }
}

void Logger::shutdown() {
    flush();
    logger_.reset();
    active_sink_ = LogSink::STDERR;
}

spdlog::level::level_enum Logger::toSpdlogLevel(LogLevel level) {
    switch (level) {
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::WARN:
        default: return spdlog::level::warn;
    }
}

const char* Logger::patternFor(LogFormat format) {
    if (format == LogFormat::JSON) {
        return R"({"time":"%Y-%m-%dT%H:%M:%S.%e","level":"%l","thread":%t,"message":"%v"})";
    }
    return "[%H:%M:%S.%e] [%^%l%$] %v";
}

}}
