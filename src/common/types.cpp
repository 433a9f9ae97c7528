#include "disk_analyzer/common/types.hpp"

namespace disk_analyzer {
namespace common {

std::string to_string(EntryType type) {
    switch (type) {
        case EntryType::DIRECTORY: return "directory";
        case EntryType::FILE: return "file";
        case EntryType::SYMLINK: return "symlink";
        case EntryType::OTHER: return "other";
        default: return "unknown";
    }
}

std::string to_string(SortKey key) {
    switch (key) {
        case SortKey::SIZE: return "size";
        case SortKey::NAME: return "name";
        default: return "unknown";
    }
}

std::string to_string(PathFormat format) {
    switch (format) {
        case PathFormat::ABSOLUTE: return "absolute";
        case PathFormat::RELATIVE: return "relative";
        case PathFormat::BASENAME: return "basename";
        default: return "unknown";
    }
}

std::optional<SortKey> parseSortKey(const std::string& text) {
    if (text == "size") return SortKey::SIZE;
    if (text == "name") return SortKey::NAME;
    return std::nullopt;
}

std::optional<PathFormat> parsePathFormat(const std::string& text) {
    if (text == "absolute") return PathFormat::ABSOLUTE;
    if (text == "relative") return PathFormat::RELATIVE;
    if (text == "basename") return PathFormat::BASENAME;
    return std::nullopt;
}

}}
