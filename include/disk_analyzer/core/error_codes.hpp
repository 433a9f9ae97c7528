#pragma once

#include "../common/error_framework.hpp"
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_map>

namespace disk_analyzer {
namespace core {

enum class AnalyzerErrorCode {
    INVALID_ARGUMENT = 100,
    INVALID_SIZE_FORMAT = 101,
    INVALID_SORT_KEY = 102,
    INVALID_PATTERN = 103,
    PATTERN_FILE_UNREADABLE = 104,
    CONFIG_PARSE_FAILED = 105,
    WHITELIST_OUTSIDE_ROOT = 106,
    
    TARGET_NOT_FOUND = 200,
    TARGET_NOT_DIRECTORY = 201,
    TARGET_NOT_READABLE = 202,
    
    PERMISSION_DENIED = 300,
    SYMLINK_LOOP = 301,
    PATH_VANISHED = 302,
    SIZE_LOOKUP_FAILED = 303,
    
    ALL_FAILED = 400
};

using AnalyzerErrorCodeHelper = common::ErrorRegistry<AnalyzerErrorCode>;

class AnalyzerError : public std::runtime_error {
public:
    AnalyzerError(AnalyzerErrorCode code, const std::string& message);
    virtual ~AnalyzerError() = default;
    
    AnalyzerErrorCode code() const { return code_; }
    virtual int exitCode() const = 0;

private:
    AnalyzerErrorCode code_;
};

class ConfigError : public AnalyzerError {
public:
    using AnalyzerError::AnalyzerError;
    int exitCode() const override;
};

class TargetError : public AnalyzerError {
public:
    using AnalyzerError::AnalyzerError;
    int exitCode() const override;
};

class AllFailedError : public AnalyzerError {
public:
    explicit AllFailedError(const std::string& message);
    int exitCode() const override;
};

// Non-fatal finding recorded during configuration or traversal.
struct Diagnostic {
    AnalyzerErrorCode code;
    std::string path;
    std::string message;
};

std::string formatDiagnostic(const Diagnostic& diagnostic);

AnalyzerErrorCode classifyFilesystemError(const std::error_code& ec);

}
}

namespace disk_analyzer {
namespace common {

template<>
inline const std::unordered_map<core::AnalyzerErrorCode, ErrorInfo>&
ErrorRegistry<core::AnalyzerErrorCode>::entries() {
    using Code = core::AnalyzerErrorCode;
    static const std::unordered_map<Code, ErrorInfo> table = {
        {Code::INVALID_ARGUMENT, {"INVALID_ARGUMENT", "Invalid argument", ErrorSeverity::FATAL}},
        {Code::INVALID_SIZE_FORMAT, {"INVALID_SIZE_FORMAT", "Invalid size format", ErrorSeverity::FATAL}},
        {Code::INVALID_SORT_KEY, {"INVALID_SORT_KEY", "Sort key must be 'size' or 'name'", ErrorSeverity::FATAL}},
        {Code::INVALID_PATTERN, {"INVALID_PATTERN", "Invalid pattern", ErrorSeverity::WARNING}},
        {Code::PATTERN_FILE_UNREADABLE, {"PATTERN_FILE_UNREADABLE", "Pattern file could not be read", ErrorSeverity::WARNING}},
        {Code::CONFIG_PARSE_FAILED, {"CONFIG_PARSE_FAILED", "Configuration file could not be parsed", ErrorSeverity::FATAL}},
        {Code::WHITELIST_OUTSIDE_ROOT, {"WHITELIST_OUTSIDE_ROOT", "Whitelist path is outside the target directory", ErrorSeverity::WARNING}},
        {Code::TARGET_NOT_FOUND, {"TARGET_NOT_FOUND", "Target directory does not exist", ErrorSeverity::FATAL}},
        {Code::TARGET_NOT_DIRECTORY, {"TARGET_NOT_DIRECTORY", "Target is not a directory", ErrorSeverity::FATAL}},
        {Code::TARGET_NOT_READABLE, {"TARGET_NOT_READABLE", "Target directory is not readable", ErrorSeverity::FATAL}},
        {Code::PERMISSION_DENIED, {"PERMISSION_DENIED", "Permission denied", ErrorSeverity::WARNING}},
        {Code::SYMLINK_LOOP, {"SYMLINK_LOOP", "Symbolic link loop detected", ErrorSeverity::WARNING}},
        {Code::PATH_VANISHED, {"PATH_VANISHED", "Path no longer exists", ErrorSeverity::WARNING}},
        {Code::SIZE_LOOKUP_FAILED, {"SIZE_LOOKUP_FAILED", "Could not determine size", ErrorSeverity::WARNING}},
        {Code::ALL_FAILED, {"ALL_FAILED", "All paths failed with I/O errors", ErrorSeverity::FATAL}}
    };
    return table;
}

}
}
