#pragma once

#include "pattern.hpp"
#include <optional>
#include <string>
#include <vector>

namespace disk_analyzer {
namespace scan {

// Non-blank, non-comment lines, trimmed. Throws ConfigError when the file
// cannot be opened.
std::vector<std::string> loadPatternFile(const std::string& path);

std::vector<std::string> splitPatternList(const std::string& list);

struct PatternSourceOptions {
    std::vector<std::string> inline_items;
    std::optional<std::string> explicit_file;
    std::string default_file_name;
    std::string root;
    std::string home_dir;
};

// Inline items first, then the explicit file or, without one, the local
// file under the root followed by the one in the home directory.
// First occurrence wins.
std::vector<std::string> collectPatterns(const PatternSourceOptions& options);

struct WhitelistSpec {
    PatternSet patterns;
    std::vector<std::string> paths;
};

// Absolute entries without glob metacharacters become whitelist paths.
WhitelistSpec classifyWhitelist(const std::vector<std::string>& entries);

PatternSet buildPatternSet(const std::vector<std::string>& entries);

}}
