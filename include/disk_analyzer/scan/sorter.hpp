#pragma once

#include "entry.hpp"
#include "../common/types.hpp"
#include <vector>

namespace disk_analyzer {
namespace scan {

// SIZE: ascending bytes, ties by path ascending. NAME: ascending full path.
// reverse flips the primary key only; the size tie-break stays ascending.
bool entryLess(const SizedEntry& a, const SizedEntry& b, common::SortKey key, bool reverse);

void sortEntries(std::vector<SizedEntry>& entries, common::SortKey key, bool reverse);

}}
