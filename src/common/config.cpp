#include "disk_analyzer/common/config.hpp"
#include "disk_analyzer/common/constants.hpp"
#include "disk_analyzer/common/paths.hpp"
#include "disk_analyzer/common/logger.hpp"
#include <toml.hpp>
#include <filesystem>
#include <unistd.h>

namespace disk_analyzer {
namespace common {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Config::Config() {
    global_ = createDefaultConfig();
}

GlobalConfig Config::createDefaultConfig() {
    using namespace constants::config_defaults;
    
    GlobalConfig config;
    
    config.log_level = LogLevel::WARN;
    
    config.defaults.level = LEVEL;
    config.defaults.min_size = MIN_SIZE;
    config.defaults.cut = CUT;
    config.defaults.sort = SORT;
    config.defaults.reverse = REVERSE;
    config.defaults.tree = TREE;
    config.defaults.path_format = PATH_FORMAT;
    config.defaults.one_file_system = ONE_FILE_SYSTEM;
    config.defaults.dereference = DEREFERENCE;
    config.defaults.exclude_hidden = EXCLUDE_HIDDEN;
    config.defaults.include_files = INCLUDE_FILES;
    
    config.scan.threads = SCAN_THREADS;
    config.scan.progress = SCAN_PROGRESS;
    
    config.logging.log_file = "";
    config.logging.rotation_size_mb = LOG_ROTATION_SIZE_MB;
    config.logging.max_files = LOG_MAX_FILES;
    config.logging.format = LogFormat::TEXT;
    
    return config;
}

std::optional<LogLevel> Config::parseLogLevel(const std::string& text) {
    if (text == "DEBUG") return LogLevel::DEBUG;
    if (text == "INFO") return LogLevel::INFO;
    if (text == "WARN") return LogLevel::WARN;
    if (text == "ERROR") return LogLevel::ERROR;
    return std::nullopt;
}

std::optional<std::string> Config::findBestConfig() const {
    auto paths = PathManager::instance().getConfigSearchPaths();
    
    for (const auto& path : paths) {
        if (std::filesystem::exists(path) && access(path.c_str(), R_OK) == 0) {
            return path;
        }
    }
    
    return std::nullopt;
}

bool Config::load(const std::string& config_file) {
    global_ = createDefaultConfig();
    
    std::string effective_config_file = config_file;
    if (effective_config_file.empty()) {
        auto best = findBestConfig();
        if (!best) {
            current_config_path_.clear();
            Logger::instance().debug("[Config] No config file found, using defaults");
            return true;
        }
        effective_config_file = *best;
    }
    
    current_config_path_ = effective_config_file;
    
    try {
        bool loaded = tryLoadTomlFile(effective_config_file);
        Logger::instance().info("[Config] Loaded | path={} | from_file={}", 
                               effective_config_file, loaded);
        return true;
    } catch (const std::exception& e) {
        Logger::instance().error("[Config] Parse failed | path={} | error={}", 
                                effective_config_file, e.what());
        return false;
    }
}

bool Config::tryLoadTomlFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::instance().debug("[Config] File not found | path={}", path);
        return false;
    }
    
    if (access(path.c_str(), R_OK) != 0) {
        Logger::instance().debug("[Config] File not readable | path={}", path);
        return false;
    }
    
    auto data = toml::parse(path);
    
    if (data.contains("global")) {
        auto global_section = data.at("global");
        
        if (global_section.contains("log_level")) {
            std::string level = toml::find<std::string>(global_section, "log_level");
            auto parsed = parseLogLevel(level);
            if (parsed) {
                global_.log_level = *parsed;
            } else {
                Logger::instance().warn("[Config] Unknown log level | value={}", level);
            }
        }
    }
    
    if (data.contains("defaults")) {
        auto defaults_section = data.at("defaults");
        auto& defaults = global_.defaults;
        
        if (defaults_section.contains("level")) {
            defaults.level = toml::find<int>(defaults_section, "level");
        }
        if (defaults_section.contains("min_size")) {
            defaults.min_size = toml::find<std::string>(defaults_section, "min_size");
        }
        if (defaults_section.contains("cut")) {
            defaults.cut = toml::find<std::string>(defaults_section, "cut");
        }
        if (defaults_section.contains("sort")) {
            defaults.sort = toml::find<std::string>(defaults_section, "sort");
        }
        if (defaults_section.contains("reverse")) {
            defaults.reverse = toml::find<bool>(defaults_section, "reverse");
        }
        if (defaults_section.contains("tree")) {
            defaults.tree = toml::find<bool>(defaults_section, "tree");
        }
        if (defaults_section.contains("path_format")) {
            defaults.path_format = toml::find<std::string>(defaults_section, "path_format");
        }
        if (defaults_section.contains("one_file_system")) {
            defaults.one_file_system = toml::find<bool>(defaults_section, "one_file_system");
        }
        if (defaults_section.contains("dereference")) {
            defaults.dereference = toml::find<bool>(defaults_section, "dereference");
        }
        if (defaults_section.contains("exclude_hidden")) {
            defaults.exclude_hidden = toml::find<bool>(defaults_section, "exclude_hidden");
        }
        if (defaults_section.contains("include_files")) {
            defaults.include_files = toml::find<bool>(defaults_section, "include_files");
        }
    }
    
    if (data.contains("scan")) {
        auto scan_section = data.at("scan");
        
        if (scan_section.contains("threads")) {
            global_.scan.threads = toml::find<int>(scan_section, "threads");
        }
        if (scan_section.contains("progress")) {
            global_.scan.progress = toml::find<bool>(scan_section, "progress");
        }
    }
    
    if (data.contains("logging")) {
        auto logging_section = data.at("logging");
        
        if (logging_section.contains("log_file")) {
            global_.logging.log_file = toml::find<std::string>(logging_section, "log_file");
        }
        if (logging_section.contains("rotation_size_mb")) {
            global_.logging.rotation_size_mb = toml::find<size_t>(logging_section, "rotation_size_mb");
        }
        if (logging_section.contains("max_files")) {
            global_.logging.max_files = toml::find<size_t>(logging_section, "max_files");
        }
        if (logging_section.contains("format")) {
            std::string format_str = toml::find<std::string>(logging_section, "format");
            if (format_str == "json") {
                global_.logging.format = LogFormat::JSON;
            } else {
                global_.logging.format = LogFormat::TEXT;
            }
        }
    }
    
    return true;
}

}}
