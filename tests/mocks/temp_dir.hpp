#pragma once

#include "core/utils.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace ledgerstore::testing {

/// Scratch directory removed on destruction
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() / ("ledgerstore-test-" + utils::generate_uuid())) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    void write(const std::string& filename, const std::string& content) const {
        std::ofstream out(path_ / filename, std::ios::binary);
        out << content;
    }

    std::string read(const std::string& filename) const {
        std::ifstream in(path_ / filename, std::ios::binary);
        std::ostringstream buf;
        buf << in.rdbuf();
        return buf.str();
    }

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace ledgerstore::testing
