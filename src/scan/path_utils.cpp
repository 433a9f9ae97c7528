#include "disk_analyzer/scan/path_utils.hpp"
#include <filesystem>

namespace disk_analyzer {
namespace scan {

std::string normalizePath(const std::string& path) {
    if (path.empty()) {
        return path;
    }
    
    std::string normalized = std::filesystem::path(path).lexically_normal().string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

bool isSameOrDescendant(const std::string& path, const std::string& ancestor) {
    if (path == ancestor) {
        return true;
    }
    return isStrictDescendant(path, ancestor);
}

bool isStrictDescendant(const std::string& path, const std::string& ancestor) {
    if (ancestor.empty() || path.size() <= ancestor.size()) {
        return false;
    }
    if (path.compare(0, ancestor.size(), ancestor) != 0) {
        return false;
    }
    if (ancestor.back() == '/') {
        return true;
    }
    return path[ancestor.size()] == '/';
}

std::string parentPath(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return "";
    }
    if (pos == 0) {
        return path.size() > 1 ? "/" : "";
    }
    return path.substr(0, pos);
}

std::string baseName(const std::string& path) {
    if (path == "/") {
        return path;
    }
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos) {
        return path;
    }
    return path.substr(pos + 1);
}

std::string joinPath(const std::string& directory, const std::string& name) {
    if (directory.empty()) {
        return name;
    }
    if (directory.back() == '/') {
        return directory + name;
    }
    return directory + "/" + name;
}

int depthBelow(const std::string& path, const std::string& root) {
    if (path == root) {
        return 0;
    }
    if (!isStrictDescendant(path, root)) {
        return -1;
    }
    
    size_t start = root.back() == '/' ? root.size() : root.size() + 1;
    int depth = 1;
    for (size_t i = start; i < path.size(); ++i) {
        if (path[i] == '/') {
            ++depth;
        }
    }
    return depth;
}

std::vector<std::string> splitComponents(const std::string& path) {
    std::vector<std::string> components;
    std::string current;
    
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                components.push_back(current);
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        components.push_back(current);
    }
    
    return components;
}

}}
