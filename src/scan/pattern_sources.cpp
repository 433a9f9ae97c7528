#include "disk_analyzer/scan/pattern_sources.hpp"
#include "disk_analyzer/scan/path_utils.hpp"
#include "disk_analyzer/common/constants.hpp"
#include "disk_analyzer/common/logger.hpp"
#include "disk_analyzer/core/error_codes.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unordered_set>

namespace disk_analyzer {
namespace scan {

namespace {

std::string trim(const std::string& text) {
    const char* whitespace = " \t\r\n";
    auto begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

bool sameFile(const std::string& a, const std::string& b) {
    std::error_code ec;
    bool same = std::filesystem::equivalent(a, b, ec);
    return !ec && same;
}

void appendUnique(std::vector<std::string>& out, std::unordered_set<std::string>& seen,
                  const std::vector<std::string>& items) {
    for (const auto& item : items) {
        if (item.empty()) {
            continue;
        }
        if (seen.insert(item).second) {
            out.push_back(item);
        }
    }
}

std::vector<std::string> loadDiscoveredFile(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return {};
    }
    
    try {
        auto items = loadPatternFile(path);
        common::Logger::instance().debug("[Patterns] Loaded pattern file | path={} | count={}", 
                                        path, items.size());
        return items;
    } catch (const core::ConfigError& e) {
        common::Logger::instance().debug("[Patterns] Skipping unreadable pattern file | path={} | error={}", 
                                        path, e.what());
        return {};
    }
}

}

std::vector<std::string> loadPatternFile(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw core::ConfigError(core::AnalyzerErrorCode::PATTERN_FILE_UNREADABLE,
                                "Cannot read pattern file: " + path);
    }
    
    std::vector<std::string> items;
    std::string line;
    while (std::getline(file, line)) {
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == constants::patterns::COMMENT_MARKER) {
            continue;
        }
        items.push_back(trimmed);
    }
    
    return items;
}

std::vector<std::string> splitPatternList(const std::string& list) {
    std::vector<std::string> items;
    std::string current;
    
    for (char c : list) {
        if (c == constants::patterns::LIST_SEPARATOR) {
            std::string trimmed = trim(current);
            if (!trimmed.empty()) {
                items.push_back(trimmed);
            }
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    
    std::string trimmed = trim(current);
    if (!trimmed.empty()) {
        items.push_back(trimmed);
    }
    
    return items;
}

std::vector<std::string> collectPatterns(const PatternSourceOptions& options) {
    std::vector<std::string> result;
    std::unordered_set<std::string> seen;
    
    appendUnique(result, seen, options.inline_items);
    
    if (options.explicit_file) {
        appendUnique(result, seen, loadPatternFile(*options.explicit_file));
        return result;
    }
    
    if (options.default_file_name.empty()) {
        return result;
    }
    
    std::string local_file;
    if (!options.root.empty()) {
        local_file = joinPath(options.root, options.default_file_name);
        appendUnique(result, seen, loadDiscoveredFile(local_file));
    }
    
    if (!options.home_dir.empty()) {
        std::string home_file = joinPath(options.home_dir, options.default_file_name);
        if (local_file.empty() || !sameFile(local_file, home_file)) {
            appendUnique(result, seen, loadDiscoveredFile(home_file));
        }
    }
    
    return result;
}

WhitelistSpec classifyWhitelist(const std::vector<std::string>& entries) {
    WhitelistSpec spec;
    
    for (const auto& entry : entries) {
        if (entry.empty()) {
            continue;
        }
        
        bool is_regex = entry.rfind(constants::patterns::REGEX_PREFIX, 0) == 0;
        if (!is_regex && entry[0] == '/' && !hasGlobMetacharacters(entry)) {
            std::string path = normalizePath(entry);
            if (std::find(spec.paths.begin(), spec.paths.end(), path) == spec.paths.end()) {
                spec.paths.push_back(path);
            }
            continue;
        }
        
        spec.patterns.add(entry);
    }
    
    return spec;
}

PatternSet buildPatternSet(const std::vector<std::string>& entries) {
    PatternSet set;
    for (const auto& entry : entries) {
        set.add(entry);
    }
    return set;
}

}}
