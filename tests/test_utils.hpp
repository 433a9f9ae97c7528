#pragma once

#include "disk_analyzer/scan/path_utils.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace disk_analyzer {
namespace test {

// Fixture owning a unique directory under the system temp dir.
class TempTreeTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        auto base = std::filesystem::temp_directory_path();
        for (int attempt = 0; attempt < 16; ++attempt) {
            auto candidate = base / ("disk_analyzer_test_" + std::to_string(gen()));
            std::error_code ec;
            if (std::filesystem::create_directory(candidate, ec)) {
                root_ = scan::normalizePath(std::filesystem::canonical(candidate).string());
                return;
            }
        }
        FAIL() << "could not create temporary directory";
    }
    
    void TearDown() override {
        if (!root_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(root_, ec);
        }
    }
    
    std::string path(const std::string& relative) const {
        return relative.empty() ? root_ : root_ + "/" + relative;
    }
    
    std::string makeDir(const std::string& relative) const {
        std::filesystem::create_directories(path(relative));
        return path(relative);
    }
    
    std::string makeFile(const std::string& relative, uintmax_t size) const {
        auto full = std::filesystem::path(path(relative));
        std::filesystem::create_directories(full.parent_path());
        {
            std::ofstream out(full, std::ios::binary);
        }
        std::filesystem::resize_file(full, size);
        return full.string();
    }
    
    std::string makeSymlink(const std::string& target, const std::string& relative) const {
        std::filesystem::create_symlink(target, path(relative));
        return path(relative);
    }
    
    std::string writeText(const std::string& relative, const std::string& content) const {
        auto full = std::filesystem::path(path(relative));
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full);
        out << content;
        return full.string();
    }
    
    std::string root_;
};

}}
