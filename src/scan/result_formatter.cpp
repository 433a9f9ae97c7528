#include "disk_analyzer/scan/result_formatter.hpp"
#include "disk_analyzer/scan/path_utils.hpp"
#include "disk_analyzer/common/constants.hpp"
#include "disk_analyzer/common/size_utils.hpp"
#include <nlohmann/json.hpp>
#include <iomanip>
#include <sstream>

namespace disk_analyzer {
namespace scan {

ResultFormatter::ResultFormatter(OutputFormat format) : format_(format) {}

void ResultFormatter::formatResult(const AnalysisResult& result, std::ostream& out) {
    if (format_ == OutputFormat::JSON) {
        formatJsonResult(result, out);
        return;
    }
    
    if (result.tree) {
        formatTextTree(result, out);
    } else {
        formatTextFlat(result, out);
    }
    
    if (summary_enabled_) {
        formatTextSummary(result, out);
    }
}

void ResultFormatter::formatWarnings(const std::vector<core::Diagnostic>& warnings, std::ostream& err) {
    for (const auto& warning : warnings) {
        err << colorize("Warning:", "\033[33m") << " " << core::formatDiagnostic(warning) << "\n";
    }
}

std::string ResultFormatter::displayPath(const std::string& path, const std::string& root) const {
    switch (path_format_) {
        case common::PathFormat::ABSOLUTE:
            return path;
        case common::PathFormat::BASENAME:
            return baseName(path);
        case common::PathFormat::RELATIVE:
        default:
            if (path == root) {
                return ".";
            }
            if (isStrictDescendant(path, root)) {
                size_t offset = root.back() == '/' ? root.size() : root.size() + 1;
                return path.substr(offset);
            }
            return path;
    }
}

void ResultFormatter::formatTextFlat(const AnalysisResult& result, std::ostream& out) {
    for (const auto& row : result.rows) {
        out << sizeColumn(row.entry.size_bytes) << "  " 
            << displayPath(row.entry.path, result.root) << "\n";
    }
}

void ResultFormatter::formatTextTree(const AnalysisResult& result, std::ostream& out) {
    for (const auto& row : result.rows) {
        std::string name = row.level == 0 
            ? displayPath(row.entry.path, result.root) 
            : baseName(row.entry.path);
        out << sizeColumn(row.entry.size_bytes) << "  " << treePrefix(row) << name << "\n";
    }
}

void ResultFormatter::formatTextSummary(const AnalysisResult& result, std::ostream& out) {
    out << "\n" << colorize("----------- SUMMARY -----------", "\033[1m") << "\n";
    out << "Entries shown: " << result.rows.size() << "\n";
    out << "Paths measured: " << result.measured_count << "\n";
    
    if (result.excluded_count > 0) {
        out << "Excluded by pattern: " << result.excluded_count << "\n";
    }
    if (result.pruned_count > 0) {
        out << "Below min-size: " << result.pruned_count << "\n";
    }
    if (result.cut_count > 0) {
        out << "Below cut: " << result.cut_count << "\n";
    }
    if (result.failed_count + result.skipped_count > 0) {
        out << "Paths with errors: " << result.failed_count + result.skipped_count << "\n";
    }
    
    out << "Analysis time: " << formatDuration(result.total_time) << "\n";
}

void ResultFormatter::formatJsonResult(const AnalysisResult& result, std::ostream& out) {
    nlohmann::json json;
    
    json["root"] = result.root;
    json["entries"] = nlohmann::json::array();
    
    for (const auto& row : result.rows) {
        nlohmann::json entry_json;
        entry_json["path"] = row.entry.path;
        entry_json["size"] = row.entry.size_bytes;
        entry_json["depth"] = row.entry.depth;
        entry_json["type"] = common::to_string(row.entry.type);
        if (result.tree) {
            entry_json["level"] = row.level;
        }
        entry_json["exempt"] = row.entry.exempt;
        entry_json["measured"] = row.entry.measured;
        json["entries"].push_back(entry_json);
    }
    
    json["warnings"] = nlohmann::json::array();
    for (const auto& warning : result.warnings) {
        nlohmann::json warning_json;
        warning_json["code"] = core::AnalyzerErrorCodeHelper::toString(warning.code);
        warning_json["path"] = warning.path;
        warning_json["message"] = core::formatDiagnostic(warning);
        json["warnings"].push_back(warning_json);
    }
    
    if (summary_enabled_) {
        json["summary"] = {
            {"candidates", result.candidate_count},
            {"excluded", result.excluded_count},
            {"measured", result.measured_count},
            {"failed", result.failed_count + result.skipped_count},
            {"pruned", result.pruned_count},
            {"cut", result.cut_count},
            {"total_time_ms", result.total_time.count()}
        };
    }
    
    out << json.dump(2) << "\n";
}

std::string ResultFormatter::sizeColumn(uint64_t bytes) {
    std::ostringstream oss;
    oss << std::left << std::setw(static_cast<int>(constants::limits::SIZE_COLUMN_WIDTH)) << common::formatSize(bytes);
    return colorize(oss.str(), "\033[1m");
}

std::string ResultFormatter::treePrefix(const ResultRow& row) const {
    if (row.level == 0) {
        return "";
    }
    
    std::string prefix;
    for (int level = 1; level < row.level; ++level) {
        bool ancestor_last = static_cast<size_t>(level) < row.ancestors_last.size() && 
                             row.ancestors_last[level];
        prefix += ancestor_last ? "   " : "│  ";
    }
    prefix += row.last_sibling ? "└─ " : "├─ ";
    return prefix;
}

std::string ResultFormatter::colorize(const std::string& text, const std::string& color) {
    if (colors_enabled_) {
        return color + text + "\033[0m";
    }
    return text;
}

std::string ResultFormatter::formatDuration(std::chrono::milliseconds ms) {
    auto count = ms.count();
    
    if (count < 1000) {
        return std::to_string(count) + "ms";
    } else if (count < 60000) {
        return std::to_string(count / 1000) + "." + std::to_string((count % 1000) / 100) + "s";
    } else {
        auto minutes = count / 60000;
        auto seconds = (count % 60000) / 1000;
        return std::to_string(minutes) + "m " + std::to_string(seconds) + "s";
    }
}

}}
