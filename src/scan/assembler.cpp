#include "disk_analyzer/scan/assembler.hpp"
#include "disk_analyzer/scan/path_utils.hpp"
#include "disk_analyzer/scan/sorter.hpp"
#include "disk_analyzer/common/logger.hpp"
#include <algorithm>
#include <unordered_map>
#include <unordered_set>

namespace disk_analyzer {
namespace scan {

const char* const ROOT_SENTINEL = "<root>";

ResultAssembler::ResultAssembler(std::string root, common::SortKey key, bool reverse)
    : root_(std::move(root)), key_(key), reverse_(reverse) {}

std::vector<ResultRow> ResultAssembler::assembleFlat(const std::vector<SizedEntry>& sorted_entries) const {
    std::vector<ResultRow> rows;
    rows.reserve(sorted_entries.size());
    
    for (const auto& entry : sorted_entries) {
        ResultRow row;
        row.entry = entry;
        row.parent_path = entry.path == root_ ? ROOT_SENTINEL : parentPath(entry.path);
        row.level = entry.depth;
        rows.push_back(std::move(row));
    }
    
    return rows;
}

std::vector<ResultRow> ResultAssembler::assembleTree(const std::vector<SizedEntry>& entries) const {
    std::unordered_set<std::string> present;
    for (const auto& entry : entries) {
        present.insert(entry.path);
    }
    
    struct GroupMember {
        SizedEntry entry;
        bool reparented;
    };
    std::unordered_map<std::string, std::vector<GroupMember>> groups;
    size_t reparented_count = 0;
    
    for (const auto& entry : entries) {
        if (entry.path == root_) {
            groups[ROOT_SENTINEL].push_back({entry, false});
            continue;
        }
        
        std::string parent = parentPath(entry.path);
        if (present.count(parent)) {
            groups[parent].push_back({entry, false});
        } else {
            groups[ROOT_SENTINEL].push_back({entry, true});
            reparented_count++;
        }
    }
    
    for (auto& group : groups) {
        std::stable_sort(group.second.begin(), group.second.end(),
                         [this](const GroupMember& a, const GroupMember& b) {
                             bool a_root = a.entry.path == root_;
                             bool b_root = b.entry.path == root_;
                             if (a_root != b_root) {
                                 return a_root;
                             }
                             return entryLess(a.entry, b.entry, key_, reverse_);
                         });
    }
    
    struct Frame {
        const GroupMember* member;
        std::string parent_key;
        int level;
        bool last_sibling;
        std::vector<bool> ancestors_last;
    };
    
    std::vector<ResultRow> rows;
    rows.reserve(entries.size());
    std::vector<Frame> stack;
    
    auto pushGroup = [&groups, &stack](const std::string& key, int level, 
                                       const std::vector<bool>& ancestors_last) {
        auto it = groups.find(key);
        if (it == groups.end()) {
            return;
        }
        const auto& members = it->second;
        for (size_t i = members.size(); i > 0; --i) {
            stack.push_back({&members[i - 1], key, level, i == members.size(), ancestors_last});
        }
    };
    
    pushGroup(ROOT_SENTINEL, 0, {});
    
    while (!stack.empty()) {
        Frame frame = std::move(stack.back());
        stack.pop_back();
        
        ResultRow row;
        row.entry = frame.member->entry;
        row.parent_path = frame.parent_key;
        row.level = frame.level;
        row.last_sibling = frame.last_sibling;
        row.reparented = frame.member->reparented;
        row.ancestors_last = frame.ancestors_last;
        
        std::vector<bool> child_ancestors = frame.ancestors_last;
        child_ancestors.push_back(frame.last_sibling);
        std::string child_key = row.entry.path;
        int child_level = frame.level + 1;
        
        rows.push_back(std::move(row));
        pushGroup(child_key, child_level, child_ancestors);
    }
    
    if (reparented_count > 0) {
        common::Logger::instance().debug("[Assembler] Orphans reparented to root group | count={}", 
                                        reparented_count);
    }
    
    return rows;
}

}}
