#include "disk_analyzer/scan/sorter.hpp"
#include <algorithm>

namespace disk_analyzer {
namespace scan {

bool entryLess(const SizedEntry& a, const SizedEntry& b, common::SortKey key, bool reverse) {
    if (key == common::SortKey::SIZE) {
        if (a.size_bytes != b.size_bytes) {
            return reverse ? a.size_bytes > b.size_bytes : a.size_bytes < b.size_bytes;
        }
        return a.path < b.path;
    }
    
    if (a.path != b.path) {
        return reverse ? a.path > b.path : a.path < b.path;
    }
    return false;
}

void sortEntries(std::vector<SizedEntry>& entries, common::SortKey key, bool reverse) {
    std::stable_sort(entries.begin(), entries.end(),
                     [key, reverse](const SizedEntry& a, const SizedEntry& b) {
                         return entryLess(a, b, key, reverse);
                     });
}

}}
