#include "disk_analyzer/scan/planner.hpp"
#include "disk_analyzer/scan/path_utils.hpp"
#include "disk_analyzer/common/constants.hpp"
#include "disk_analyzer/common/logger.hpp"
#include <algorithm>
#include <cerrno>

namespace disk_analyzer {
namespace scan {

std::string to_string(CandidateOrigin origin) {
    switch (origin) {
        case CandidateOrigin::BOUNDED: return "bounded";
        case CandidateOrigin::WHITELIST_PATH: return "whitelist_path";
        case CandidateOrigin::WHITELIST_ANCESTOR: return "whitelist_ancestor";
        default: return "unknown";
    }
}

bool RunContext::markVisited(const FileIdentity& identity) {
    return visited_.insert(identity).second;
}

bool RunContext::isVisited(const FileIdentity& identity) const {
    return visited_.find(identity) != visited_.end();
}

void RunContext::addWarning(const core::Diagnostic& diagnostic) {
    if (!warned_.insert({diagnostic.code, diagnostic.path}).second) {
        return;
    }
    common::Logger::instance().debug("[Planner] Warning recorded | code={} | path={}",
                                     core::AnalyzerErrorCodeHelper::toString(diagnostic.code),
                                     diagnostic.path);
    warnings_.push_back(diagnostic);
}

TraversalPlanner::TraversalPlanner(const FileSystem& fs, const ScanConfig& config)
    : fs_(fs), config_(config) {}

std::vector<Candidate> TraversalPlanner::plan(RunContext& context) const {
    std::vector<Candidate> candidates;
    std::unordered_set<std::string> emitted;
    
    std::error_code ec;
    auto root_stat = fs_.lookup(config_.root, true, ec);
    if (!root_stat) {
        context.addWarning({core::classifyFilesystemError(ec), config_.root, ""});
        context.recordSkipped();
        return candidates;
    }
    
    boundedPass(context, *root_stat, candidates, emitted);
    size_t bounded_count = candidates.size();
    
    extensionPass(context, candidates, emitted);
    
    common::Logger::instance().debug("[Planner] Plan complete | root={} | bounded={} | extension={} | skipped={}",
                                    config_.root, bounded_count, candidates.size() - bounded_count,
                                    context.skippedCount());
    
    return candidates;
}

void TraversalPlanner::boundedPass(RunContext& context, const FileStat& root_stat,
                                   std::vector<Candidate>& candidates,
                                   std::unordered_set<std::string>& emitted) const {
    Candidate root;
    root.path = config_.root;
    root.depth = 0;
    root.type = common::EntryType::DIRECTORY;
    root.origin = CandidateOrigin::BOUNDED;
    candidates.push_back(root);
    emitted.insert(root.path);
    
    if (config_.follow_symlinks) {
        context.markVisited(root_stat.identity);
    }
    
    if (!config_.withinDepth(1)) {
        return;
    }
    
    std::vector<PendingEntry> stack;
    expandDirectory(context, config_.root, 0, stack);
    
    while (!stack.empty()) {
        PendingEntry pending = std::move(stack.back());
        stack.pop_back();
        
        Candidate candidate;
        bool descend = false;
        if (!resolveEntry(context, pending, root_stat.identity.device, candidate, descend)) {
            continue;
        }
        
        if (!emitted.insert(candidate.path).second) {
            continue;
        }
        candidates.push_back(candidate);
        
        if (descend) {
            expandDirectory(context, candidate.path, candidate.depth, stack);
        }
    }
}

void TraversalPlanner::expandDirectory(RunContext& context, const std::string& directory, int depth,
                                       std::vector<PendingEntry>& stack) const {
    std::error_code ec;
    auto names = fs_.list(directory, ec);
    if (ec) {
        common::Logger::instance().debug("[Planner] Listing failed | path={} | error={}", 
                                        directory, ec.message());
        context.addWarning({core::classifyFilesystemError(ec), directory, ""});
        return;
    }
    
    std::sort(names.begin(), names.end());
    
    // Reverse push keeps the pre-order walk in ascending name order.
    for (auto it = names.rbegin(); it != names.rend(); ++it) {
        if (config_.exclude_hidden && isHidden(*it)) {
            continue;
        }
        stack.push_back({joinPath(directory, *it), depth + 1});
    }
}

bool TraversalPlanner::resolveEntry(RunContext& context, const PendingEntry& pending, 
                                    uint64_t root_device, Candidate& candidate, bool& descend) const {
    std::error_code ec;
    auto st = fs_.lookup(pending.path, false, ec);
    if (!st) {
        context.addWarning({core::classifyFilesystemError(ec), pending.path, ""});
        context.recordSkipped();
        return false;
    }
    
    candidate.path = pending.path;
    candidate.depth = pending.depth;
    candidate.origin = CandidateOrigin::BOUNDED;
    candidate.type = st->type;
    descend = false;
    
    const bool can_descend = config_.withinDepth(pending.depth + 1);
    
    if (st->type == common::EntryType::DIRECTORY) {
        if (config_.one_filesystem && st->identity.device != root_device) {
            common::Logger::instance().debug("[Planner] Mount boundary | path={}", pending.path);
            return true;
        }
        if (config_.follow_symlinks && !context.markVisited(st->identity)) {
            common::Logger::instance().debug("[Planner] Directory already expanded through a symlink | path={}",
                                            pending.path);
            return true;
        }
        descend = can_descend;
        return true;
    }
    
    if (st->type != common::EntryType::SYMLINK) {
        return config_.include_files;
    }
    
    auto target = fs_.lookup(pending.path, true, ec);
    if (!target) {
        if (config_.follow_symlinks && ec.value() == ELOOP) {
            handleSymlinkLoop(context, pending.path);
            return false;
        }
        common::Logger::instance().debug("[Planner] Unresolvable symlink | path={} | error={}", 
                                        pending.path, ec.message());
        return config_.include_files;
    }
    
    const bool target_is_directory = target->type == common::EntryType::DIRECTORY;
    
    if (!config_.follow_symlinks) {
        return target_is_directory || config_.include_files;
    }
    
    if (config_.one_filesystem && target->identity.device != root_device) {
        common::Logger::instance().debug("[Planner] Symlink crosses mount boundary, not followed | path={}", 
                                        pending.path);
        return target_is_directory || config_.include_files;
    }
    
    if (!target_is_directory) {
        candidate.type = target->type;
        return config_.include_files;
    }
    
    if (context.isVisited(target->identity)) {
        context.addWarning({core::AnalyzerErrorCode::SYMLINK_LOOP, pending.path,
                            "Symbolic link leads to an already visited directory, not followed"});
        context.recordSkipped();
        return false;
    }
    
    context.markVisited(target->identity);
    candidate.type = common::EntryType::DIRECTORY;
    descend = can_descend;
    return true;
}

void TraversalPlanner::handleSymlinkLoop(RunContext& context, const std::string& path) const {
    std::vector<FileIdentity> chain;
    std::unordered_set<std::string> seen;
    std::string current = path;
    std::error_code ec;
    
    for (int hop = 0; hop < constants::limits::MAX_SYMLINK_HOPS; ++hop) {
        if (!seen.insert(current).second) {
            break;
        }
        
        auto st = fs_.lookup(current, false, ec);
        if (!st || st->type != common::EntryType::SYMLINK) {
            break;
        }
        chain.push_back(st->identity);
        
        std::string target = fs_.readLink(current, ec);
        if (ec) {
            break;
        }
        current = (!target.empty() && target[0] == '/') 
            ? normalizePath(target) 
            : normalizePath(joinPath(parentPath(current), target));
    }
    
    bool already_reported = std::any_of(chain.begin(), chain.end(), 
        [&context](const FileIdentity& id) { return context.isVisited(id); });
    
    for (const auto& id : chain) {
        context.markVisited(id);
    }
    context.recordSkipped();
    
    if (already_reported) {
        common::Logger::instance().debug("[Planner] Symlink loop already reported | path={}", path);
        return;
    }
    
    context.addWarning({core::AnalyzerErrorCode::SYMLINK_LOOP, path, ""});
}

void TraversalPlanner::extensionPass(RunContext& context,
                                     std::vector<Candidate>& candidates,
                                     std::unordered_set<std::string>& emitted) const {
    for (const auto& whitelisted : config_.whitelist_paths) {
        int target_depth = depthBelow(whitelisted, config_.root);
        if (target_depth <= 0) {
            continue;
        }
        
        auto components = splitComponents(whitelisted.substr(config_.root.size()));
        std::string current = config_.root;
        
        for (int depth = 1; depth <= target_depth; ++depth) {
            current = joinPath(current, components[depth - 1]);
            if (emitted.count(current)) {
                continue;
            }
            
            auto st = lookupForExtension(context, current);
            if (!st) {
                break;
            }
            
            Candidate candidate;
            candidate.path = current;
            candidate.depth = depth;
            candidate.type = st->type;
            candidate.origin = depth == target_depth 
                ? CandidateOrigin::WHITELIST_PATH 
                : CandidateOrigin::WHITELIST_ANCESTOR;
            
            emitted.insert(current);
            candidates.push_back(candidate);
            
            common::Logger::instance().debug("[Planner] Whitelist extension | path={} | depth={} | origin={}",
                                            current, depth, to_string(candidate.origin));
        }
    }
}

std::optional<FileStat> TraversalPlanner::lookupForExtension(RunContext& context, 
                                                             const std::string& path) const {
    std::error_code ec;
    auto st = fs_.lookup(path, config_.follow_symlinks, ec);
    if (!st) {
        context.addWarning({core::classifyFilesystemError(ec), path, ""});
        context.recordSkipped();
        return std::nullopt;
    }
    return st;
}

bool TraversalPlanner::isHidden(const std::string& name) const {
    return !name.empty() && name[0] == '.';
}

}}
