#pragma once

#include "config.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <memory>
#include <string>

namespace disk_analyzer {
namespace common {

enum class LogSink {
    STDERR,
    ROTATING_FILE
};

// Resolved logging setup for one run. Diagnostics never go to stdout,
// which carries the report.
struct LoggerOptions {
    LogSink sink = LogSink::STDERR;
    std::string file_path;
    LogLevel level = LogLevel::WARN;
    LogFormat format = LogFormat::TEXT;
    size_t rotation_size_mb = 0;
    size_t max_files = 0;

    // A bare file name in [logging].log_file is placed under log_dir.
    static LoggerOptions fromConfig(const GlobalConfig& global, const std::string& log_dir);
};

class Logger {
public:
    static Logger& instance();

    void configure(const LoggerOptions& options);
    void setLevel(LogLevel level);
    LogLevel level() const { return level_; }
    LogSink activeSink() const { return active_sink_; }
    void flush();
    void shutdown();

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        write(spdlog::level::err, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& format, Args&&... args) {
        write(spdlog::level::warn, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        write(spdlog::level::info, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        write(spdlog::level::debug, format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    template<typename... Args>
    void write(spdlog::level::level_enum severity, const std::string& format, Args&&... args) {
        if (logger_) logger_->log(severity, fmt::runtime(format), std::forward<Args>(args)...);
    }

    spdlog::sink_ptr openFileSink(const LoggerOptions& options);

    static spdlog::level::level_enum toSpdlogLevel(LogLevel level);
    static const char* patternFor(LogFormat format);

    std::shared_ptr<spdlog::logger> logger_;
    LogLevel level_ = LogLevel::WARN;
    LogSink active_sink_ = LogSink::STDERR;
};

}}
