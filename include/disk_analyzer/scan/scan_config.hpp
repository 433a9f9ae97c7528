#pragma once

#include "pattern.hpp"
#include "../common/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace disk_analyzer {
namespace scan {

constexpr int UNBOUNDED_DEPTH = -1;

// Built once from command line and config file, then only read by the core.
struct ScanConfig {
    std::string root;
    int max_depth = 1;
    uint64_t min_size = 0;
    uint64_t cut_size = 0;
    bool all = false;
    common::SortKey sort_key = common::SortKey::SIZE;
    bool reverse = false;
    bool tree = false;
    bool follow_symlinks = false;
    bool one_filesystem = false;
    bool exclude_hidden = false;
    bool include_files = false;
    int threads = 1;
    
    PatternSet whitelist;
    PatternSet blacklist;
    std::vector<std::string> whitelist_paths;
    
    bool hasWhitelist() const { return !whitelist.empty() || !whitelist_paths.empty(); }
    bool isUnbounded() const { return max_depth == UNBOUNDED_DEPTH; }
    bool withinDepth(int depth) const { return isUnbounded() || depth <= max_depth; }
};

}}
