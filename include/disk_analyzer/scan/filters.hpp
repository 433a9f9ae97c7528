#pragma once

#include "entry.hpp"
#include "scan_config.hpp"
#include <cstddef>
#include <vector>

namespace disk_analyzer {
namespace scan {

class FilterPipeline {
public:
    explicit FilterPipeline(const ScanConfig& config);
    
    // Directories below the min-size threshold are pruned unless --all is set
    // or the entry is exempt. Files are never pruned here.
    bool passesMinSize(const SizedEntry& entry) const;
    
    // Applied regardless of --all; only exemption bypasses it.
    bool passesCut(const SizedEntry& entry) const;
    
    size_t applyMinSize(std::vector<SizedEntry>& entries) const;
    size_t applyCut(std::vector<SizedEntry>& entries) const;

private:
    const ScanConfig& config_;
};

}}
