#include "disk_analyzer/scan/inclusion.hpp"
#include "disk_analyzer/scan/path_utils.hpp"
#include "disk_analyzer/common/logger.hpp"
#include <algorithm>

namespace disk_analyzer {
namespace scan {

WhitelistValidation validateWhitelistPaths(const std::vector<std::string>& paths,
                                           const std::string& root) {
    WhitelistValidation validation;
    std::string normalized_root = normalizePath(root);
    
    for (const auto& raw : paths) {
        std::string path = normalizePath(raw);
        if (path.empty()) {
            continue;
        }
        
        if (!isSameOrDescendant(path, normalized_root)) {
            std::string message = "Whitelist path '" + path + "' is outside the target directory '" +
                                  normalized_root + "'; ignoring whitelist entry";
            common::Logger::instance().debug("[Inclusion] Whitelist path dropped | path={} | root={}", 
                                            path, normalized_root);
            validation.warnings.push_back({core::AnalyzerErrorCode::WHITELIST_OUTSIDE_ROOT, "", message});
            continue;
        }
        
        if (std::find(validation.active.begin(), validation.active.end(), path) == validation.active.end()) {
            validation.active.push_back(path);
        }
    }
    
    return validation;
}

namespace {

std::string literalPrefix(const std::string& glob) {
    std::string prefix;
    for (const auto& component : splitComponents(glob)) {
        if (hasGlobMetacharacters(component)) {
            break;
        }
        prefix = joinPath(prefix.empty() ? "/" : prefix, component);
    }
    return prefix.empty() ? "/" : prefix;
}

}

WhitelistPatternValidation validateWhitelistPatterns(const PatternSet& patterns,
                                                     const std::string& root) {
    WhitelistPatternValidation validation;
    std::string normalized_root = normalizePath(root);
    
    for (const auto& pattern : patterns) {
        if (pattern.kind() == PatternKind::GLOB && pattern.isAbsolute()) {
            std::string prefix = literalPrefix(pattern.body());
            if (!isSameOrDescendant(prefix, normalized_root) &&
                !isSameOrDescendant(normalized_root, prefix)) {
                common::Logger::instance().debug("[Inclusion] Whitelist pattern dropped | pattern={} | root={}",
                                                pattern.text(), normalized_root);
                validation.warnings.push_back({core::AnalyzerErrorCode::WHITELIST_OUTSIDE_ROOT, "",
                    "Whitelist pattern '" + pattern.text() + "' is outside the target directory '" +
                    normalized_root + "'; ignoring whitelist entry"});
                continue;
            }
        }
        validation.active.add(pattern);
    }
    
    return validation;
}

InclusionResolver::InclusionResolver(const ScanConfig& config) : config_(config) {}

bool InclusionResolver::shouldInclude(const std::string& path) const {
    if (config_.hasWhitelist()) {
        return whitelistSelects(path);
    }
    
    if (!config_.blacklist.empty()) {
        return !config_.blacklist.matchesAny(path);
    }
    
    return true;
}

bool InclusionResolver::isExempt(const std::string& path) const {
    // Ancestors kept for connectivity are not exempt; the assembler reparents
    // their children when they are cut.
    return isUnderWhitelistPath(path) || config_.whitelist.matchesAny(path);
}

bool InclusionResolver::isUnderWhitelistPath(const std::string& path) const {
    for (const auto& whitelisted : config_.whitelist_paths) {
        if (isSameOrDescendant(path, whitelisted)) {
            return true;
        }
    }
    return false;
}

bool InclusionResolver::isWhitelistAncestor(const std::string& path) const {
    for (const auto& whitelisted : config_.whitelist_paths) {
        if (isStrictDescendant(whitelisted, path)) {
            return true;
        }
    }
    return false;
}

bool InclusionResolver::whitelistSelects(const std::string& path) const {
    // Ancestors of a whitelist path keep the chain from the root to it connected.
    return isUnderWhitelistPath(path) || 
           config_.whitelist.matchesAny(path) ||
           isWhitelistAncestor(path);
}

bool shouldInclude(const std::string& path, const ScanConfig& config) {
    return InclusionResolver(config).shouldInclude(path);
}

}}
