#pragma once

#include "main_command.hpp"
#include "disk_analyzer/core/error_codes.hpp"
#include "disk_analyzer/scan/scan_config.hpp"
#include <CLI/CLI.hpp>
#include <string>
#include <vector>

namespace disk_analyzer {
namespace cli {

class AnalyzeCommand : public MainCommand {
public:
    AnalyzeCommand();
    
    void setup(CLI::App* app) override;
    int execute() override;
    void validateArguments() const override;
    
    // Resolves command line values against the [defaults] section of the
    // config file. Throws ConfigError on invalid input.
    scan::ScanConfig buildScanConfig(std::vector<core::Diagnostic>& warnings) const;

private:
    std::string target_path_ = ".";
    std::string level_;
    std::string min_size_;
    std::string cut_;
    std::string sort_;
    std::string path_format_;
    std::vector<std::string> whitelist_;
    std::vector<std::string> blacklist_;
    std::string whitelist_file_;
    std::string blacklist_file_;
    int threads_ = 0;
    
    bool all_ = false;
    bool reverse_ = false;
    bool tree_ = false;
    bool one_file_system_ = false;
    bool dereference_ = false;
    bool exclude_hidden_ = false;
    bool include_files_ = false;
    bool json_output_ = false;
    bool debug_ = false;
    bool no_color_ = false;
    bool summary_ = false;
    bool progress_ = false;
    
    int parseLevel(const std::string& text) const;
    uint64_t parseSizeOption(const std::string& text, const std::string& option) const;
    void logScanConfig(const scan::ScanConfig& config) const;
};

}}
