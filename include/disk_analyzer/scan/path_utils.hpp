#pragma once

#include <string>
#include <vector>

namespace disk_analyzer {
namespace scan {

// Lexically normalised absolute form without a trailing separator ("/" stays "/").
std::string normalizePath(const std::string& path);

// Separator-aware: "/data2/x" is not under "/data".
bool isSameOrDescendant(const std::string& path, const std::string& ancestor);
bool isStrictDescendant(const std::string& path, const std::string& ancestor);

std::string parentPath(const std::string& path);
std::string baseName(const std::string& path);
std::string joinPath(const std::string& directory, const std::string& name);

// Number of separators between root and path; -1 when path is not under root.
int depthBelow(const std::string& path, const std::string& root);

std::vector<std::string> splitComponents(const std::string& path);

}}
