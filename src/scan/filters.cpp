#include "disk_analyzer/scan/filters.hpp"
#include "disk_analyzer/common/logger.hpp"
#include <algorithm>

namespace disk_analyzer {
namespace scan {

FilterPipeline::FilterPipeline(const ScanConfig& config) : config_(config) {}

bool FilterPipeline::passesMinSize(const SizedEntry& entry) const {
    if (config_.all || entry.exempt) {
        return true;
    }
    if (entry.type != common::EntryType::DIRECTORY) {
        return true;
    }
    return entry.size_bytes >= config_.min_size;
}

bool FilterPipeline::passesCut(const SizedEntry& entry) const {
    if (config_.cut_size == 0 || entry.exempt) {
        return true;
    }
    return entry.size_bytes >= config_.cut_size;
}

size_t FilterPipeline::applyMinSize(std::vector<SizedEntry>& entries) const {
    size_t before = entries.size();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [this](const SizedEntry& e) { return !passesMinSize(e); }),
                  entries.end());
    
    size_t pruned = before - entries.size();
    if (pruned > 0) {
        common::Logger::instance().debug("[Filter] Min-size prune | threshold={} | pruned={}", 
                                        config_.min_size, pruned);
    }
    return pruned;
}

size_t FilterPipeline::applyCut(std::vector<SizedEntry>& entries) const {
    size_t before = entries.size();
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [this](const SizedEntry& e) { return !passesCut(e); }),
                  entries.end());
    
    size_t cut = before - entries.size();
    if (cut > 0) {
        common::Logger::instance().debug("[Filter] Cut applied | threshold={} | removed={}", 
                                        config_.cut_size, cut);
    }
    return cut;
}

}}
