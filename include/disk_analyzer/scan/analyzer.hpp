#pragma once

#include "assembler.hpp"
#include "entry.hpp"
#include "filesystem.hpp"
#include "planner.hpp"
#include "scan_config.hpp"
#include "../core/error_codes.hpp"
#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace disk_analyzer {
namespace scan {

struct AnalysisResult {
    std::string root;
    bool tree = false;
    std::vector<ResultRow> rows;
    std::vector<core::Diagnostic> warnings;
    
    size_t candidate_count = 0;
    size_t excluded_count = 0;
    size_t measured_count = 0;
    size_t failed_count = 0;
    size_t skipped_count = 0;
    size_t pruned_count = 0;
    size_t cut_count = 0;
    std::chrono::milliseconds total_time{0};
    
    // Every attempted path failed and nothing was measured.
    bool allFailed() const;
};

// Called with (measured so far, total) after each size lookup, possibly
// from several worker threads at once.
using ProgressCallback = std::function<void(size_t, size_t)>;

class DiskAnalyzer {
public:
    DiskAnalyzer(const FileSystem& fs, const SizeService& sizes);
    
    void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }
    
    // Throws TargetError when the root is missing, not a directory or unreadable.
    void validateTarget(const std::string& root) const;
    
    AnalysisResult run(const ScanConfig& config) const;

private:
    const FileSystem& fs_;
    const SizeService& sizes_;
    ProgressCallback progress_;
    
    std::vector<SizeMeasurement> measureAll(const std::vector<Candidate>& candidates,
                                            const ScanConfig& config) const;
};

}}
