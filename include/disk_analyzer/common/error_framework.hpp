#pragma once

#include <string>
#include <unordered_map>

namespace disk_analyzer {
namespace common {

enum class ErrorSeverity {
    WARNING,
    FATAL
};

struct ErrorInfo {
    const char* code_str;
    const char* default_message;
    ErrorSeverity severity;
};

// Per-enum table of stable code names and default messages. Each error
// enum supplies its table by specializing entries().
template<typename EnumType>
class ErrorRegistry {
public:
    static const ErrorInfo& lookup(EnumType code) {
        static const ErrorInfo unknown{"UNKNOWN", "Unknown error", ErrorSeverity::FATAL};
        const auto& table = entries();
        auto it = table.find(code);
        return it != table.end() ? it->second : unknown;
    }
    
    static const char* toString(EnumType code) { return lookup(code).code_str; }
    static const char* getMessage(EnumType code) { return lookup(code).default_message; }
    static bool isFatal(EnumType code) { return lookup(code).severity == ErrorSeverity::FATAL; }
    
    static std::string describe(EnumType code) {
        const auto& info = lookup(code);
        return std::string(info.code_str) + " (" + info.default_message + ")";
    }

private:
    static const std::unordered_map<EnumType, ErrorInfo>& entries();
};

}}
