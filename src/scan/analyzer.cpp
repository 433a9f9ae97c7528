#include "disk_analyzer/scan/analyzer.hpp"
#include "disk_analyzer/scan/filters.hpp"
#include "disk_analyzer/scan/inclusion.hpp"
#include "disk_analyzer/scan/sorter.hpp"
#include "disk_analyzer/common/logger.hpp"
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>
#include <atomic>
#include <cerrno>

namespace disk_analyzer {
namespace scan {

bool AnalysisResult::allFailed() const {
    size_t attempted = candidate_count - excluded_count + skipped_count;
    return attempted > 0 && measured_count == 0 && failed_count + skipped_count == attempted;
}

DiskAnalyzer::DiskAnalyzer(const FileSystem& fs, const SizeService& sizes) 
    : fs_(fs), sizes_(sizes) {}

void DiskAnalyzer::validateTarget(const std::string& root) const {
    std::error_code ec;
    auto st = fs_.lookup(root, true, ec);
    if (!st) {
        if (ec.value() == EACCES || ec.value() == EPERM) {
            throw core::TargetError(core::AnalyzerErrorCode::TARGET_NOT_READABLE,
                                    "Target directory is not accessible: " + root);
        }
        throw core::TargetError(core::AnalyzerErrorCode::TARGET_NOT_FOUND,
                                "Target directory does not exist: " + root);
    }
    
    if (st->type != common::EntryType::DIRECTORY) {
        throw core::TargetError(core::AnalyzerErrorCode::TARGET_NOT_DIRECTORY,
                                "Target is not a directory: " + root);
    }
    
    fs_.list(root, ec);
    if (ec) {
        throw core::TargetError(core::AnalyzerErrorCode::TARGET_NOT_READABLE,
                                "Target directory is not readable: " + root + " (" + ec.message() + ")");
    }
}

AnalysisResult DiskAnalyzer::run(const ScanConfig& config) const {
    auto start_time = std::chrono::steady_clock::now();
    
    validateTarget(config.root);
    
    AnalysisResult result;
    result.root = config.root;
    result.tree = config.tree;
    
    common::Logger::instance().info("[Analyzer] Starting | root={} | max_depth={} | threads={}",
                                   config.root, config.max_depth, config.threads);
    
    RunContext context;
    TraversalPlanner planner(fs_, config);
    auto planned = planner.plan(context);
    result.candidate_count = planned.size();
    result.skipped_count = context.skippedCount();
    
    InclusionResolver resolver(config);
    std::vector<Candidate> candidates;
    candidates.reserve(planned.size());
    for (auto& candidate : planned) {
        if (resolver.shouldInclude(candidate.path)) {
            candidates.push_back(std::move(candidate));
        } else {
            result.excluded_count++;
        }
    }
    
    common::Logger::instance().debug("[Analyzer] Candidates resolved | planned={} | included={} | excluded={}",
                                    result.candidate_count, candidates.size(), result.excluded_count);
    
    auto measurements = measureAll(candidates, config);
    
    std::vector<SizedEntry> entries;
    entries.reserve(candidates.size());
    
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& candidate = candidates[i];
        const auto& measurement = measurements[i];
        
        SizedEntry entry;
        entry.path = candidate.path;
        entry.depth = candidate.depth;
        entry.type = candidate.type;
        entry.exempt = resolver.isExempt(candidate.path);
        
        if (!measurement.ok()) {
            result.failed_count++;
            context.addWarning({core::classifyFilesystemError(measurement.error), candidate.path, ""});
            
            if (!entry.exempt) {
                continue;
            }
            entry.size_bytes = 0;
            entry.measured = false;
        } else {
            result.measured_count++;
            entry.size_bytes = measurement.bytes;
        }
        
        entries.push_back(std::move(entry));
    }
    
    FilterPipeline filters(config);
    result.pruned_count = filters.applyMinSize(entries);
    
    sortEntries(entries, config.sort_key, config.reverse);
    
    result.cut_count = filters.applyCut(entries);
    
    ResultAssembler assembler(config.root, config.sort_key, config.reverse);
    result.rows = config.tree ? assembler.assembleTree(entries) : assembler.assembleFlat(entries);
    result.warnings = context.warnings();
    
    auto end_time = std::chrono::steady_clock::now();
    result.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    
    common::Logger::instance().info("[Analyzer] Completed | rows={} | measured={} | failed={} | pruned={} | cut={} | warnings={} | time={}ms",
                                   result.rows.size(), result.measured_count, result.failed_count,
                                   result.pruned_count, result.cut_count, result.warnings.size(),
                                   result.total_time.count());
    
    return result;
}

std::vector<SizeMeasurement> DiskAnalyzer::measureAll(const std::vector<Candidate>& candidates,
                                                      const ScanConfig& config) const {
    std::vector<SizeMeasurement> measurements(candidates.size());
    std::atomic<size_t> completed{0};
    
    auto measureOne = [&](size_t i) {
        MeasureOptions options;
        options.follow_symlinks = config.follow_symlinks && 
                                  candidates[i].type != common::EntryType::SYMLINK;
        options.one_filesystem = config.one_filesystem;
        measurements[i] = sizes_.measure(candidates[i].path, options);
        
        size_t done = completed.fetch_add(1) + 1;
        if (progress_) {
            progress_(done, candidates.size());
        }
    };
    
    if (config.threads <= 1 || candidates.size() < 2) {
        for (size_t i = 0; i < candidates.size(); ++i) {
            measureOne(i);
        }
        return measurements;
    }
    
    common::Logger::instance().debug("[Analyzer] Parallel size lookup | threads={} | paths={}", 
                                    config.threads, candidates.size());
    
    // Each index is written by exactly one task.
    tbb::task_arena arena(config.threads);
    arena.execute([&] {
        tbb::parallel_for(size_t(0), candidates.size(), [&](size_t i) {
            measureOne(i);
        });
    });
    
    return measurements;
}

}}
