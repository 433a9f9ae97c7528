#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace disk_analyzer {
namespace common {

enum class LogLevel {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3
};

enum class LogFormat {
    TEXT,
    JSON
};

struct DefaultsConfig {
    int level;
    std::string min_size;
    std::string cut;
    std::string sort;
    bool reverse;
    bool tree;
    std::string path_format;
    bool one_file_system;
    bool dereference;
    bool exclude_hidden;
    bool include_files;
};

struct ScanSettings {
    int threads;
    bool progress;
};

struct LoggingConfig {
    std::string log_file;
    size_t rotation_size_mb;
    size_t max_files;
    LogFormat format;
};

struct GlobalConfig {
    LogLevel log_level;
    DefaultsConfig defaults;
    ScanSettings scan;
    LoggingConfig logging;
};

class Config {
public:
    static Config& instance();
    
    bool load(const std::string& config_file = "");
    std::optional<std::string> findBestConfig() const;
    
    const GlobalConfig& global() const { return global_; }
    GlobalConfig& global() { return global_; }
    
    std::string getConfigPath() const { return current_config_path_; }
    
    static GlobalConfig createDefaultConfig();
    static std::optional<LogLevel> parseLogLevel(const std::string& text);

private:
    Config();
    GlobalConfig global_;
    std::string current_config_path_;
    
    bool tryLoadTomlFile(const std::string& path);
};

}}
