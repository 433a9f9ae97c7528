#pragma once

#include "../common/types.hpp"
#include <cstdint>
#include <string>

namespace disk_analyzer {
namespace scan {

struct SizedEntry {
    std::string path;
    uint64_t size_bytes = 0;
    int depth = 0;
    common::EntryType type = common::EntryType::DIRECTORY;
    bool exempt = false;
    // False when the size lookup failed and the entry is kept only because it is exempt.
    bool measured = true;
};

}}
