#include "disk_analyzer/common/size_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace disk_analyzer {
namespace common {

namespace {

std::string trim(const std::string& text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && std::isspace(static_cast<unsigned char>(text[start]))) ++start;
    while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(start, end - start);
}

std::optional<uint64_t> unitMultiplier(std::string unit) {
    std::transform(unit.begin(), unit.end(), unit.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    
    if (unit.empty() || unit == "B") {
        return 1;
    }
    
    if (unit.size() == 3 && unit[1] == 'I' && unit[2] == 'B') {
        unit = unit.substr(0, 1);
    } else if (unit.size() == 2 && unit[1] == 'B') {
        unit = unit.substr(0, 1);
    }
    
    if (unit.size() != 1) {
        return std::nullopt;
    }
    
    static const std::string order = "KMGTP";
    auto pos = order.find(unit[0]);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    
    uint64_t multiplier = 1;
    for (size_t i = 0; i <= pos; ++i) {
        multiplier *= 1024;
    }
    return multiplier;
}

}

std::optional<uint64_t> parseSize(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) {
        return std::nullopt;
    }
    
    size_t idx = 0;
    bool seen_dot = false;
    bool seen_digit = false;
    while (idx < value.size()) {
        char c = value[idx];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            seen_digit = true;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
        } else {
            break;
        }
        ++idx;
    }
    
    if (!seen_digit) {
        return std::nullopt;
    }
    
    std::string number_part = value.substr(0, idx);
    std::string unit_part = trim(value.substr(idx));
    
    auto multiplier = unitMultiplier(unit_part);
    if (!multiplier) {
        return std::nullopt;
    }
    
    if (!seen_dot) {
        uint64_t number = 0;
        for (char c : number_part) {
            uint64_t digit = static_cast<uint64_t>(c - '0');
            if (number > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
                return std::nullopt;
            }
            number = number * 10 + digit;
        }
        if (number > std::numeric_limits<uint64_t>::max() / *multiplier) {
            return std::nullopt;
        }
        return number * *multiplier;
    }
    
    double number = 0.0;
    try {
        number = std::stod(number_part);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    
    double bytes = number * static_cast<double>(*multiplier);
    if (!std::isfinite(bytes) || bytes >= static_cast<double>(std::numeric_limits<uint64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(bytes);
}

std::string formatSize(uint64_t bytes) {
    if (bytes == 0) {
        return "0 B";
    }
    
    static const std::array<const char*, 6> units = {"B", "KB", "MB", "GB", "TB", "PB"};
    size_t unit_index = 0;
    double size = static_cast<double>(bytes);
    
    while (size >= 1024.0 && unit_index + 1 < units.size()) {
        size /= 1024.0;
        unit_index++;
    }
    
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

}}
