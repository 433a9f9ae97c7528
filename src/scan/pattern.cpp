#include "disk_analyzer/scan/pattern.hpp"
#include "disk_analyzer/scan/path_utils.hpp"
#include "disk_analyzer/core/error_codes.hpp"
#include "disk_analyzer/common/constants.hpp"
#include "disk_analyzer/common/logger.hpp"
#include <fnmatch.h>

namespace disk_analyzer {
namespace scan {

namespace {

bool globMatch(const std::string& pattern, const std::string& text, int flags) {
    return fnmatch(pattern.c_str(), text.c_str(), flags) == 0;
}

std::string joinRun(const std::vector<std::string>& components, size_t first, size_t count) {
    std::string joined;
    for (size_t i = first; i < first + count; ++i) {
        if (!joined.empty()) {
            joined.push_back('/');
        }
        joined += components[i];
    }
    return joined;
}

}

Pattern::Pattern(PatternKind kind, std::string text, std::string body)
    : kind_(kind), text_(std::move(text)), body_(std::move(body)) {}

Pattern Pattern::parse(const std::string& text) {
    if (text.empty()) {
        throw core::ConfigError(core::AnalyzerErrorCode::INVALID_PATTERN, "Empty pattern");
    }
    
    const std::string prefix = constants::patterns::REGEX_PREFIX;
    
    if (text.compare(0, prefix.size(), prefix) == 0) {
        std::string body = text.substr(prefix.size());
        if (body.empty()) {
            throw core::ConfigError(core::AnalyzerErrorCode::INVALID_PATTERN,
                                    "Empty regex pattern: " + text);
        }
        
        Pattern pattern(PatternKind::REGEX, text, body);
        try {
            pattern.regex_ = std::make_shared<const std::regex>(body, std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw core::ConfigError(core::AnalyzerErrorCode::INVALID_PATTERN,
                                    "Invalid regex pattern '" + body + "': " + e.what());
        }
        return pattern;
    }
    
    std::string body = text;
    while (body.size() > 1 && body.back() == '/') {
        body.pop_back();
    }
    if (body.compare(0, 2, "./") == 0) {
        body = body.substr(2);
    }
    if (body.empty()) {
        throw core::ConfigError(core::AnalyzerErrorCode::INVALID_PATTERN,
                                "Empty glob pattern: " + text);
    }
    
    Pattern pattern(PatternKind::GLOB, text, body);
    pattern.body_components_ = splitComponents(body);
    return pattern;
}

bool Pattern::isAbsolute() const {
    return kind_ == PatternKind::GLOB && !body_.empty() && body_[0] == '/';
}

bool Pattern::matches(const std::string& path) const {
    if (kind_ == PatternKind::REGEX) {
        return std::regex_search(path, *regex_);
    }
    
    if (isAbsolute()) {
        return matchesAbsoluteGlob(path);
    }
    
    if (body_.find('/') != std::string::npos) {
        return matchesComponentRun(path);
    }
    
    return matchesAnyComponent(path);
}

bool Pattern::matchesAbsoluteGlob(const std::string& path) const {
    if (body_ == "/") {
        return !path.empty() && path[0] == '/';
    }
    
    if (globMatch(body_, path, FNM_PATHNAME)) {
        return true;
    }
    
    // Descendants match when any separator-bounded prefix matches.
    for (size_t pos = path.find('/', 1); pos != std::string::npos; pos = path.find('/', pos + 1)) {
        if (globMatch(body_, path.substr(0, pos), FNM_PATHNAME)) {
            return true;
        }
    }
    
    return false;
}

bool Pattern::matchesComponentRun(const std::string& path) const {
    auto components = splitComponents(path);
    size_t run = body_components_.size();
    if (run == 0 || components.size() < run) {
        return false;
    }
    
    for (size_t first = 0; first + run <= components.size(); ++first) {
        if (globMatch(body_, joinRun(components, first, run), FNM_PATHNAME)) {
            return true;
        }
    }
    
    return false;
}

bool Pattern::matchesAnyComponent(const std::string& path) const {
    for (const auto& component : splitComponents(path)) {
        if (globMatch(body_, component, 0)) {
            return true;
        }
    }
    return false;
}

bool matches(const std::string& path, const Pattern& pattern) {
    return pattern.matches(path);
}

bool hasGlobMetacharacters(const std::string& text) {
    return text.find_first_of("*?[") != std::string::npos;
}

bool PatternSet::add(const std::string& text) {
    if (text.empty() || seen_.count(text) > 0) {
        return false;
    }
    return add(Pattern::parse(text));
}

bool PatternSet::add(const Pattern& pattern) {
    if (pattern.text().empty() || !seen_.insert(pattern.text()).second) {
        return false;
    }
    patterns_.push_back(pattern);
    common::Logger::instance().debug("[Pattern] Added | pattern={} | kind={}", 
                                    pattern.text(),
                                    pattern.kind() == PatternKind::REGEX ? "regex" : "glob");
    return true;
}

bool PatternSet::matchesAny(const std::string& path) const {
    for (const auto& pattern : patterns_) {
        if (pattern.matches(path)) {
            return true;
        }
    }
    return false;
}

}}
