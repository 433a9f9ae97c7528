#pragma once

#include <memory>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace disk_analyzer {
namespace scan {

enum class PatternKind {
    GLOB,
    REGEX
};

// A single whitelist/blacklist rule. Regex rules carry the "regex:" prefix in
// their text; everything else is a glob evaluated with fnmatch(3).
class Pattern {
public:
    static Pattern parse(const std::string& text);
    
    PatternKind kind() const { return kind_; }
    const std::string& text() const { return text_; }
    const std::string& body() const { return body_; }
    bool isAbsolute() const;
    
    bool matches(const std::string& path) const;

private:
    Pattern(PatternKind kind, std::string text, std::string body);
    
    PatternKind kind_;
    std::string text_;
    std::string body_;
    std::shared_ptr<const std::regex> regex_;
    std::vector<std::string> body_components_;
    
    bool matchesAbsoluteGlob(const std::string& path) const;
    bool matchesComponentRun(const std::string& path) const;
    bool matchesAnyComponent(const std::string& path) const;
};

bool matches(const std::string& path, const Pattern& pattern);

bool hasGlobMetacharacters(const std::string& text);

class PatternSet {
public:
    // Empty strings and texts already present are ignored; returns true when added.
    bool add(const std::string& text);
    bool add(const Pattern& pattern);
    
    bool matchesAny(const std::string& path) const;
    
    bool empty() const { return patterns_.empty(); }
    size_t size() const { return patterns_.size(); }
    const std::vector<Pattern>& patterns() const { return patterns_; }
    
    std::vector<Pattern>::const_iterator begin() const { return patterns_.begin(); }
    std::vector<Pattern>::const_iterator end() const { return patterns_.end(); }

private:
    std::vector<Pattern> patterns_;
    std::unordered_set<std::string> seen_;
};

}}
