#pragma once

#include "filesystem.hpp"
#include "scan_config.hpp"
#include "../core/error_codes.hpp"
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace disk_analyzer {
namespace scan {

enum class CandidateOrigin {
    BOUNDED,
    WHITELIST_PATH,
    WHITELIST_ANCESTOR
};

std::string to_string(CandidateOrigin origin);

// A SYMLINK candidate is the link itself; followed links carry the target type.
struct Candidate {
    std::string path;
    int depth = 0;
    common::EntryType type = common::EntryType::OTHER;
    CandidateOrigin origin = CandidateOrigin::BOUNDED;
};

// State owned by a single analysis run. Not shared across runs or threads.
class RunContext {
public:
    bool markVisited(const FileIdentity& identity);
    bool isVisited(const FileIdentity& identity) const;
    
    // Repeated (code, path) pairs are recorded once.
    void addWarning(const core::Diagnostic& diagnostic);
    const std::vector<core::Diagnostic>& warnings() const { return warnings_; }
    
    void recordSkipped() { skipped_++; }
    size_t skippedCount() const { return skipped_; }

private:
    std::unordered_set<FileIdentity, FileIdentityHash> visited_;
    std::vector<core::Diagnostic> warnings_;
    std::set<std::pair<core::AnalyzerErrorCode, std::string>> warned_;
    size_t skipped_ = 0;
};

class TraversalPlanner {
public:
    TraversalPlanner(const FileSystem& fs, const ScanConfig& config);
    
    // Bounded pre-order pass followed by the whitelist extension pass,
    // deduplicated by path.
    std::vector<Candidate> plan(RunContext& context) const;

private:
    const FileSystem& fs_;
    const ScanConfig& config_;
    
    struct PendingEntry {
        std::string path;
        int depth;
    };
    
    void boundedPass(RunContext& context, const FileStat& root_stat,
                     std::vector<Candidate>& candidates,
                     std::unordered_set<std::string>& emitted) const;
    void extensionPass(RunContext& context,
                       std::vector<Candidate>& candidates,
                       std::unordered_set<std::string>& emitted) const;
    
    void expandDirectory(RunContext& context, const std::string& directory, int depth,
                         std::vector<PendingEntry>& stack) const;
    bool resolveEntry(RunContext& context, const PendingEntry& pending, uint64_t root_device,
                      Candidate& candidate, bool& descend) const;
    // Marks every link of the loop so that the loop is reported once.
    void handleSymlinkLoop(RunContext& context, const std::string& path) const;
    std::optional<FileStat> lookupForExtension(RunContext& context, const std::string& path) const;
    
    bool isHidden(const std::string& name) const;
};

}}
