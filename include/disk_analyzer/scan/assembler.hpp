#pragma once

#include "entry.hpp"
#include "../common/types.hpp"
#include <string>
#include <vector>

namespace disk_analyzer {
namespace scan {

// Group key for the scan root and for entries whose parent was filtered out.
extern const char* const ROOT_SENTINEL;

struct ResultRow {
    SizedEntry entry;
    std::string parent_path;
    // Nesting level in the rendered tree; equals entry.depth in flat mode.
    int level = 0;
    bool last_sibling = false;
    bool reparented = false;
    // For each ancestor level, whether that ancestor was the last of its siblings.
    std::vector<bool> ancestors_last;
};

class ResultAssembler {
public:
    ResultAssembler(std::string root, common::SortKey key, bool reverse);
    
    std::vector<ResultRow> assembleFlat(const std::vector<SizedEntry>& sorted_entries) const;
    
    // Pre-order walk over a parent to children adjacency. Each sibling group is
    // sorted on its own and the scan root leads the root group.
    std::vector<ResultRow> assembleTree(const std::vector<SizedEntry>& entries) const;

private:
    std::string root_;
    common::SortKey key_;
    bool reverse_;
};

}}
