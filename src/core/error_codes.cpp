#include "disk_analyzer/core/error_codes.hpp"
#include "disk_analyzer/common/constants.hpp"
#include <cerrno>

namespace disk_analyzer {
namespace core {

AnalyzerError::AnalyzerError(AnalyzerErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

int ConfigError::exitCode() const {
    return constants::exit_codes::ARGUMENT_ERROR;
}

int TargetError::exitCode() const {
    return constants::exit_codes::TARGET_ERROR;
}

AllFailedError::AllFailedError(const std::string& message)
    : AnalyzerError(AnalyzerErrorCode::ALL_FAILED, message) {}

int AllFailedError::exitCode() const {
    return constants::exit_codes::IO_ERROR;
}

std::string formatDiagnostic(const Diagnostic& diagnostic) {
    std::string text = diagnostic.message.empty() 
        ? AnalyzerErrorCodeHelper::getMessage(diagnostic.code)
        : diagnostic.message;
    
    if (!diagnostic.path.empty()) {
        text += ": " + diagnostic.path;
    }
    
    return text;
}

AnalyzerErrorCode classifyFilesystemError(const std::error_code& ec) {
    switch (ec.value()) {
        case EACCES:
        case EPERM:
            return AnalyzerErrorCode::PERMISSION_DENIED;
        case ENOENT:
        case ENOTDIR:
            return AnalyzerErrorCode::PATH_VANISHED;
        case ELOOP:
            return AnalyzerErrorCode::SYMLINK_LOOP;
        default:
            return AnalyzerErrorCode::SIZE_LOOKUP_FAILED;
    }
}

}}
