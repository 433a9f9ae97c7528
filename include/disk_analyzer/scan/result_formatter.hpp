#pragma once

#include "analyzer.hpp"
#include "../common/types.hpp"
#include <chrono>
#include <ostream>
#include <string>
#include <vector>

namespace disk_analyzer {
namespace scan {

enum class OutputFormat {
    TEXT,
    JSON
};

class ResultFormatter {
public:
    explicit ResultFormatter(OutputFormat format = OutputFormat::TEXT);
    
    void formatResult(const AnalysisResult& result, std::ostream& out);
    void formatWarnings(const std::vector<core::Diagnostic>& warnings, std::ostream& err);
    
    void setColorsEnabled(bool enabled) { colors_enabled_ = enabled; }
    void setPathFormat(common::PathFormat format) { path_format_ = format; }
    void setSummaryEnabled(bool enabled) { summary_enabled_ = enabled; }
    
    std::string displayPath(const std::string& path, const std::string& root) const;

private:
    OutputFormat format_;
    common::PathFormat path_format_ = common::PathFormat::RELATIVE;
    bool colors_enabled_ = true;
    bool summary_enabled_ = false;
    
    void formatTextFlat(const AnalysisResult& result, std::ostream& out);
    void formatTextTree(const AnalysisResult& result, std::ostream& out);
    void formatTextSummary(const AnalysisResult& result, std::ostream& out);
    void formatJsonResult(const AnalysisResult& result, std::ostream& out);
    
    std::string sizeColumn(uint64_t bytes);
    std::string treePrefix(const ResultRow& row) const;
    std::string colorize(const std::string& text, const std::string& color);
    std::string formatDuration(std::chrono::milliseconds ms);
};

}}
