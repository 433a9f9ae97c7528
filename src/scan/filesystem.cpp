#include "disk_analyzer/scan/filesystem.hpp"
#include "disk_analyzer/scan/path_utils.hpp"
#include "disk_analyzer/common/logger.hpp"
#include <cerrno>
#include <filesystem>
#include <limits.h>
#include <sys/stat.h>
#include <unistd.h>
#include <unordered_set>

namespace disk_analyzer {
namespace scan {

namespace {

common::EntryType entryTypeFromMode(mode_t mode) {
    if (S_ISDIR(mode)) return common::EntryType::DIRECTORY;
    if (S_ISREG(mode)) return common::EntryType::FILE;
    if (S_ISLNK(mode)) return common::EntryType::SYMLINK;
    return common::EntryType::OTHER;
}

}

std::optional<FileStat> PosixFileSystem::lookup(const std::string& path, bool follow_symlinks,
                                                std::error_code& ec) const {
    struct stat st;
    int rc = follow_symlinks ? ::stat(path.c_str(), &st) : ::lstat(path.c_str(), &st);
    if (rc != 0) {
        ec.assign(errno, std::generic_category());
        return std::nullopt;
    }
    
    ec.clear();
    FileStat result;
    result.type = entryTypeFromMode(st.st_mode);
    result.identity.device = static_cast<uint64_t>(st.st_dev);
    result.identity.inode = static_cast<uint64_t>(st.st_ino);
    result.size = static_cast<uint64_t>(st.st_size);
    return result;
}

std::vector<std::string> PosixFileSystem::list(const std::string& directory, std::error_code& ec) const {
    std::vector<std::string> names;
    
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return names;
    }
    
    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        names.push_back(it->path().filename().string());
    }
    
    return names;
}

std::string PosixFileSystem::readLink(const std::string& path, std::error_code& ec) const {
    char buffer[PATH_MAX];
    ssize_t length = ::readlink(path.c_str(), buffer, sizeof(buffer) - 1);
    if (length < 0) {
        ec.assign(errno, std::generic_category());
        return "";
    }
    
    ec.clear();
    return std::string(buffer, static_cast<size_t>(length));
}

DiskUsageSizeService::DiskUsageSizeService(const FileSystem& fs) : fs_(fs) {}

SizeMeasurement DiskUsageSizeService::measure(const std::string& path, 
                                              const MeasureOptions& options) const {
    SizeMeasurement measurement;
    
    std::error_code ec;
    auto top = fs_.lookup(path, options.follow_symlinks, ec);
    if (!top) {
        measurement.error = ec;
        return measurement;
    }
    
    measurement.bytes = top->size;
    if (top->type != common::EntryType::DIRECTORY) {
        return measurement;
    }
    
    std::unordered_set<FileIdentity, FileIdentityHash> seen;
    seen.insert(top->identity);
    const uint64_t root_device = top->identity.device;
    
    std::vector<std::string> pending;
    
    auto top_entries = fs_.list(path, ec);
    if (ec) {
        measurement.error = ec;
        return measurement;
    }
    for (const auto& name : top_entries) {
        pending.push_back(joinPath(path, name));
    }
    
    while (!pending.empty()) {
        std::string current = std::move(pending.back());
        pending.pop_back();
        
        auto st = fs_.lookup(current, options.follow_symlinks, ec);
        if (!st) {
            measurement.skipped_entries++;
            continue;
        }
        
        if (options.one_filesystem && st->identity.device != root_device) {
            continue;
        }
        
        if (!seen.insert(st->identity).second) {
            continue;
        }
        
        measurement.bytes += st->size;
        
        if (st->type == common::EntryType::DIRECTORY) {
            auto names = fs_.list(current, ec);
            if (ec) {
                measurement.skipped_entries++;
                continue;
            }
            for (const auto& name : names) {
                pending.push_back(joinPath(current, name));
            }
        }
    }
    
    if (measurement.skipped_entries > 0) {
        common::Logger::instance().debug("[Size] Entries skipped | path={} | skipped={}", 
                                        path, measurement.skipped_entries);
    }
    
    return measurement;
}

}}
