#pragma once

#include "../common/types.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace disk_analyzer {
namespace scan {

struct FileIdentity {
    uint64_t device = 0;
    uint64_t inode = 0;
    
    bool operator==(const FileIdentity& other) const {
        return device == other.device && inode == other.inode;
    }
};

struct FileIdentityHash {
    size_t operator()(const FileIdentity& id) const noexcept {
        size_t h1 = std::hash<uint64_t>{}(id.device);
        size_t h2 = std::hash<uint64_t>{}(id.inode);
        return h1 ^ (h2 << 1);
    }
};

struct FileStat {
    common::EntryType type = common::EntryType::OTHER;
    FileIdentity identity;
    uint64_t size = 0;
};

// Filesystem enumeration seam. Implementations must be safe to call
// concurrently from several threads.
class FileSystem {
public:
    virtual ~FileSystem() = default;
    
    virtual std::optional<FileStat> lookup(const std::string& path, bool follow_symlinks,
                                           std::error_code& ec) const = 0;
    virtual std::vector<std::string> list(const std::string& directory, std::error_code& ec) const = 0;
    virtual std::string readLink(const std::string& path, std::error_code& ec) const = 0;
};

class PosixFileSystem : public FileSystem {
public:
    std::optional<FileStat> lookup(const std::string& path, bool follow_symlinks,
                                   std::error_code& ec) const override;
    std::vector<std::string> list(const std::string& directory, std::error_code& ec) const override;
    std::string readLink(const std::string& path, std::error_code& ec) const override;
};

struct MeasureOptions {
    bool follow_symlinks = false;
    bool one_filesystem = false;
};

struct SizeMeasurement {
    uint64_t bytes = 0;
    size_t skipped_entries = 0;
    std::error_code error;
    
    bool ok() const { return !error; }
};

class SizeService {
public:
    virtual ~SizeService() = default;
    
    virtual SizeMeasurement measure(const std::string& path, const MeasureOptions& options) const = 0;
};

// Apparent size in bytes, the way "du -sb" reports it: every inode counted once,
// directories included, symlinks counted as themselves unless followed.
class DiskUsageSizeService : public SizeService {
public:
    explicit DiskUsageSizeService(const FileSystem& fs);
    
    SizeMeasurement measure(const std::string& path, const MeasureOptions& options) const override;

private:
    const FileSystem& fs_;
};

}}
