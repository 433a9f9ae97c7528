#include "analyze_command.hpp"
#include "disk_analyzer/common/config.hpp"
#include "disk_analyzer/common/constants.hpp"
#include "disk_analyzer/common/logger.hpp"
#include "disk_analyzer/common/paths.hpp"
#include "disk_analyzer/common/progress_bar.hpp"
#include "disk_analyzer/common/size_utils.hpp"
#include "disk_analyzer/scan/analyzer.hpp"
#include "disk_analyzer/scan/filesystem.hpp"
#include "disk_analyzer/scan/inclusion.hpp"
#include "disk_analyzer/scan/path_utils.hpp"
#include "disk_analyzer/scan/pattern_sources.hpp"
#include "disk_analyzer/scan/result_formatter.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <memory>

namespace disk_analyzer {
namespace cli {

AnalyzeCommand::AnalyzeCommand() = default;

void AnalyzeCommand::setup(CLI::App* app) {
    app_ = app;
    
    app->add_option("target", target_path_, "Target directory to analyze (default: current directory)");
    
    app->add_option("-l,--level", level_, 
                   "Maximum depth below the target, or 'inf' for no limit (default: 1)");
    auto* min_size = app->add_option("-m,--min-size", min_size_, 
                                    "Hide directories smaller than SIZE, e.g. 10M (default: 0)");
    auto* all = app->add_flag("-a,--all", all_, 
                             "Disable the min-size filter");
    all->excludes(min_size);
    
    app->add_option("-s,--sort", sort_, "Sort key: size or name (default: size)");
    app->add_flag("-r,--reverse", reverse_, "Reverse the sort order");
    app->add_option("-c,--cut", cut_, "Drop entries smaller than SIZE after sorting");
    
    app->add_option("-w,--whitelist", whitelist_, 
                   "Comma separated paths or patterns to include exclusively");
    app->add_option("--whitelist-file", whitelist_file_, "File with whitelist entries, one per line");
    app->add_option("-b,--blacklist", blacklist_, 
                   "Comma separated patterns to exclude");
    app->add_option("--blacklist-file", blacklist_file_, "File with blacklist entries, one per line");
    
    app->add_flag("-t,--tree", tree_, "Display results as a tree");
    app->add_flag("-x,--one-file-system", one_file_system_, "Stay on the target's file system");
    app->add_flag("-L,--dereference", dereference_, "Follow symbolic links");
    app->add_option("-f,--format", path_format_, 
                   "Path format: absolute, relative or basename (default: relative)");
    app->add_flag("--json", json_output_, "Output as JSON");
    app->add_flag("--exclude-hidden", exclude_hidden_, "Skip entries whose name starts with '.'");
    app->add_flag("-F,--files", include_files_, "List files as well as directories");
    app->add_option("-j,--threads", threads_, "Number of size lookup threads (default: from config)")
       ->check(CLI::Range(1, constants::limits::MAX_THREADS));
    app->add_flag("--summary", summary_, "Print run statistics after the results");
    app->add_flag("-p,--progress", progress_, "Show size lookup progress on stderr");
    app->add_flag("-D,--debug", debug_, "Enable debug logging");
    app->add_flag("--no-color", no_color_, "Disable colored output");
}

void AnalyzeCommand::validateArguments() const {
    if (!whitelist_file_.empty() && !blacklist_file_.empty()) {
        std::error_code ec;
        if (std::filesystem::equivalent(whitelist_file_, blacklist_file_, ec)) {
            throw core::ConfigError(core::AnalyzerErrorCode::INVALID_ARGUMENT,
                                    "--whitelist-file and --blacklist-file name the same file: " + 
                                    whitelist_file_);
        }
    }
}

int AnalyzeCommand::parseLevel(const std::string& text) const {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    
    if (lowered == "inf" || lowered == "infinity" || lowered == "unlimited") {
        return scan::UNBOUNDED_DEPTH;
    }
    
    if (text.empty() || !std::all_of(text.begin(), text.end(), 
                                     [](unsigned char c) { return std::isdigit(c); })) {
        throw core::ConfigError(core::AnalyzerErrorCode::INVALID_ARGUMENT,
                                "Invalid level '" + text + "': expected a non-negative integer or 'inf'");
    }
    
    try {
        return std::stoi(text);
    } catch (const std::out_of_range&) {
        throw core::ConfigError(core::AnalyzerErrorCode::INVALID_ARGUMENT,
                                "Level out of range: " + text);
    }
}

uint64_t AnalyzeCommand::parseSizeOption(const std::string& text, const std::string& option) const {
    auto bytes = common::parseSize(text);
    if (!bytes) {
        throw core::ConfigError(core::AnalyzerErrorCode::INVALID_SIZE_FORMAT,
                                "Invalid size for " + option + ": '" + text + "'");
    }
    return *bytes;
}

scan::ScanConfig AnalyzeCommand::buildScanConfig(std::vector<core::Diagnostic>& warnings) const {
    const auto& defaults = common::Config::instance().global().defaults;
    const auto& scan_settings = common::Config::instance().global().scan;
    
    scan::ScanConfig config;
    
    std::error_code ec;
    auto absolute = std::filesystem::absolute(target_path_, ec);
    if (ec) {
        throw core::TargetError(core::AnalyzerErrorCode::TARGET_NOT_FOUND,
                                "Cannot resolve target path: " + target_path_);
    }
    config.root = scan::normalizePath(absolute.string());
    
    if (!level_.empty()) {
        config.max_depth = parseLevel(level_);
    } else {
        config.max_depth = defaults.level < 0 ? scan::UNBOUNDED_DEPTH : defaults.level;
    }
    
    config.min_size = parseSizeOption(min_size_.empty() ? defaults.min_size : min_size_, "--min-size");
    
    std::string cut = cut_.empty() ? defaults.cut : cut_;
    config.cut_size = cut.empty() ? 0 : parseSizeOption(cut, "--cut");
    
    std::string sort = sort_.empty() ? defaults.sort : sort_;
    auto sort_key = common::parseSortKey(sort);
    if (!sort_key) {
        throw core::ConfigError(core::AnalyzerErrorCode::INVALID_SORT_KEY,
                                "Invalid sort key '" + sort + "': expected 'size' or 'name'");
    }
    config.sort_key = *sort_key;
    
    config.all = all_;
    config.reverse = reverse_ || defaults.reverse;
    config.tree = tree_ || defaults.tree;
    config.one_filesystem = one_file_system_ || defaults.one_file_system;
    config.follow_symlinks = dereference_ || defaults.dereference;
    config.exclude_hidden = exclude_hidden_ || defaults.exclude_hidden;
    config.include_files = include_files_ || defaults.include_files;
    config.threads = threads_ > 0 ? threads_ : std::clamp(scan_settings.threads, 1, constants::limits::MAX_THREADS);
    
    std::string home = common::PathManager::instance().getHomeDir();
    
    scan::PatternSourceOptions whitelist_sources;
    for (const auto& item : whitelist_) {
        auto split = scan::splitPatternList(item);
        whitelist_sources.inline_items.insert(whitelist_sources.inline_items.end(), split.begin(), split.end());
    }
    if (!whitelist_file_.empty()) {
        whitelist_sources.explicit_file = whitelist_file_;
    }
    whitelist_sources.default_file_name = constants::patterns::WHITELIST_FILE;
    whitelist_sources.root = config.root;
    whitelist_sources.home_dir = home;
    
    auto whitelist = scan::classifyWhitelist(scan::collectPatterns(whitelist_sources));
    auto pattern_validation = scan::validateWhitelistPatterns(whitelist.patterns, config.root);
    config.whitelist = std::move(pattern_validation.active);
    warnings.insert(warnings.end(), pattern_validation.warnings.begin(), pattern_validation.warnings.end());
    
    auto validation = scan::validateWhitelistPaths(whitelist.paths, config.root);
    config.whitelist_paths = std::move(validation.active);
    warnings.insert(warnings.end(), validation.warnings.begin(), validation.warnings.end());
    
    scan::PatternSourceOptions blacklist_sources;
    for (const auto& item : blacklist_) {
        auto split = scan::splitPatternList(item);
        blacklist_sources.inline_items.insert(blacklist_sources.inline_items.end(), split.begin(), split.end());
    }
    if (!blacklist_file_.empty()) {
        blacklist_sources.explicit_file = blacklist_file_;
    }
    blacklist_sources.default_file_name = constants::patterns::BLACKLIST_FILE;
    blacklist_sources.root = config.root;
    blacklist_sources.home_dir = home;
    
    config.blacklist = scan::buildPatternSet(scan::collectPatterns(blacklist_sources));
    
    return config;
}

void AnalyzeCommand::logScanConfig(const scan::ScanConfig& config) const {
    auto& logger = common::Logger::instance();
    logger.debug("[CLI] Scan config | root={} | level={} | min_size={} | cut={} | all={}",
                config.root, config.isUnbounded() ? "inf" : std::to_string(config.max_depth),
                config.min_size, config.cut_size, config.all);
    logger.debug("[CLI] Scan config | sort={} | reverse={} | tree={} | dereference={} | one_fs={} | threads={}",
                common::to_string(config.sort_key), config.reverse, config.tree,
                config.follow_symlinks, config.one_filesystem, config.threads);
    logger.debug("[CLI] Patterns | whitelist={} | whitelist_paths={} | blacklist={}",
                config.whitelist.size(), config.whitelist_paths.size(), config.blacklist.size());
}

int AnalyzeCommand::execute() {
    if (debug_) {
        enableDebugLogging();
    }
    
    validateArguments();
    
    std::vector<core::Diagnostic> config_warnings;
    auto config = buildScanConfig(config_warnings);
    logScanConfig(config);
    
    const auto& defaults = common::Config::instance().global().defaults;
    std::string format_text = path_format_.empty() ? defaults.path_format : path_format_;
    auto path_format = common::parsePathFormat(format_text);
    if (!path_format) {
        throw core::ConfigError(core::AnalyzerErrorCode::INVALID_ARGUMENT,
                                "Invalid path format '" + format_text + 
                                "': expected 'absolute', 'relative' or 'basename'");
    }
    
    common::Logger::instance().debug("[CLI] Output | format={} | path_format={} | summary={}",
                                    json_output_ ? "json" : "text", 
                                    common::to_string(*path_format), summary_);
    
    scan::PosixFileSystem fs;
    scan::DiskUsageSizeService sizes(fs);
    scan::DiskAnalyzer analyzer(fs, sizes);
    
    std::unique_ptr<common::ProgressBarRenderer> progress;
    if (progress_ || common::Config::instance().global().scan.progress) {
        progress = std::make_unique<common::ProgressBarRenderer>(
            "Measuring", std::cerr, !no_color_ && isInteractiveOutput(),
            std::chrono::milliseconds(constants::limits::PROGRESS_REFRESH_MS));
        analyzer.setProgressCallback([&progress](size_t done, size_t total) {
            progress->update(done, total);
        });
    }
    
    auto result = analyzer.run(config);
    if (progress) {
        progress->complete();
    }
    result.warnings.insert(result.warnings.begin(), config_warnings.begin(), config_warnings.end());
    
    scan::ResultFormatter formatter(json_output_ ? scan::OutputFormat::JSON : scan::OutputFormat::TEXT);
    formatter.setColorsEnabled(!no_color_ && !json_output_ && isInteractiveOutput());
    formatter.setPathFormat(*path_format);
    formatter.setSummaryEnabled(summary_);
    
    formatter.formatResult(result, std::cout);
    std::cout.flush();
    formatter.formatWarnings(result.warnings, std::cerr);
    
    if (result.allFailed()) {
        throw core::AllFailedError("Every path under " + config.root + " failed with an I/O error");
    }
    
    return constants::exit_codes::SUCCESS;
}

}}
