#pragma once

#include <string>
#include <optional>
#include <cstdint>

namespace disk_analyzer {
namespace common {

// Accepts plain byte counts ("4096") or a decimal number with a binary unit
// suffix ("10K", "1.5G", "2MiB", "3mb"). Units are powers of 1024.
std::optional<uint64_t> parseSize(const std::string& text);

std::string formatSize(uint64_t bytes);

}}
