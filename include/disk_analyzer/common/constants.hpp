#pragma once

#include <string>
#include <cstddef>
#include <cstdint>

namespace disk_analyzer {
namespace constants {

namespace version {
    constexpr const char* CLI_VERSION = "1.0.0";
    
    inline std::string getFullVersion() {
        return std::string("disk-analyzer v") + CLI_VERSION;
    }
}

namespace system {
    constexpr const char* APPLICATION_NAME = "DiskAnalyzer";
    constexpr const char* EXECUTABLE_NAME = "disk-analyzer";
    constexpr const char* LOGGER_NAME = "disk-analyzer";
    constexpr const char* CONFIG_DIR_NAME = "disk-analyzer";
    constexpr const char* CONFIG_FILE_NAME = "config.toml";
    constexpr const char* CONFIG_ENV = "DISK_ANALYZER_CONFIG";
}

namespace patterns {
    constexpr const char* WHITELIST_FILE = ".disk_analyzer_include";
    constexpr const char* BLACKLIST_FILE = ".disk_analyzer_ignore";
    constexpr const char* REGEX_PREFIX = "regex:";
    constexpr char LIST_SEPARATOR = ',';
    constexpr char COMMENT_MARKER = '#';
}

namespace exit_codes {
    constexpr int SUCCESS = 0;
    constexpr int ARGUMENT_ERROR = 1;
    constexpr int TARGET_ERROR = 2;
    constexpr int IO_ERROR = 3;
}

namespace limits {
    constexpr int DEFAULT_LEVEL = 1;
    constexpr const char* DEFAULT_MIN_SIZE = "0";
    constexpr const char* DEFAULT_SORT = "size";
    constexpr const char* DEFAULT_PATH_FORMAT = "relative";
    constexpr int DEFAULT_THREADS = 4;
    constexpr int MAX_THREADS = 64;
    constexpr int MAX_SYMLINK_HOPS = 40;
    constexpr size_t SIZE_COLUMN_WIDTH = 12;
    constexpr int PROGRESS_REFRESH_MS = 100;
    constexpr int PROGRESS_BAR_WIDTH = 30;
    
    constexpr size_t DEFAULT_LOG_ROTATION_SIZE_MB = 10;
    constexpr size_t DEFAULT_LOG_MAX_FILES = 3;
}

namespace config_defaults {
    constexpr int LEVEL = limits::DEFAULT_LEVEL;
    constexpr const char* MIN_SIZE = limits::DEFAULT_MIN_SIZE;
    constexpr const char* CUT = "";
    constexpr const char* SORT = limits::DEFAULT_SORT;
    constexpr bool REVERSE = false;
    constexpr bool TREE = false;
    constexpr const char* PATH_FORMAT = limits::DEFAULT_PATH_FORMAT;
    constexpr bool ONE_FILE_SYSTEM = false;
    constexpr bool DEREFERENCE = false;
    constexpr bool EXCLUDE_HIDDEN = false;
    constexpr bool INCLUDE_FILES = false;
    
    constexpr int SCAN_THREADS = limits::DEFAULT_THREADS;
    constexpr bool SCAN_PROGRESS = false;
    
    constexpr size_t LOG_ROTATION_SIZE_MB = limits::DEFAULT_LOG_ROTATION_SIZE_MB;
    constexpr size_t LOG_MAX_FILES = limits::DEFAULT_LOG_MAX_FILES;
}

}
}
