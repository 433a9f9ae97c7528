#pragma once

#include "scan_config.hpp"
#include "../core/error_codes.hpp"
#include <string>
#include <vector>

namespace disk_analyzer {
namespace scan {

struct WhitelistValidation {
    std::vector<std::string> active;
    std::vector<core::Diagnostic> warnings;
};

// Drops whitelist paths that are not the root or below it, one warning each.
WhitelistValidation validateWhitelistPaths(const std::vector<std::string>& paths,
                                           const std::string& root);

struct WhitelistPatternValidation {
    PatternSet active;
    std::vector<core::Diagnostic> warnings;
};

// Drops absolute glob patterns whose literal leading components lie outside
// the root. Relative globs and regex patterns are kept as given.
WhitelistPatternValidation validateWhitelistPatterns(const PatternSet& patterns,
                                                     const std::string& root);

class InclusionResolver {
public:
    explicit InclusionResolver(const ScanConfig& config);
    
    bool shouldInclude(const std::string& path) const;
    
    // Exempt paths bypass both the min-size prune and the cut filter. Only
    // whitelist pattern matches and paths at or below a whitelist path are exempt.
    bool isExempt(const std::string& path) const;
    
    bool isUnderWhitelistPath(const std::string& path) const;
    bool isWhitelistAncestor(const std::string& path) const;

private:
    const ScanConfig& config_;
    
    bool whitelistSelects(const std::string& path) const;
};

bool shouldInclude(const std::string& path, const ScanConfig& config);

}}
