#pragma once

#include <string>
#include <optional>

namespace disk_analyzer {
namespace common {

enum class EntryType {
    DIRECTORY,
    FILE,
    SYMLINK,
    OTHER
};

enum class SortKey {
    SIZE,
    NAME
};

enum class PathFormat {
    ABSOLUTE,
    RELATIVE,
    BASENAME
};

std::string to_string(EntryType type);
std::string to_string(SortKey key);
std::string to_string(PathFormat format);

std::optional<SortKey> parseSortKey(const std::string& text);
std::optional<PathFormat> parsePathFormat(const std::string& text);

}}
