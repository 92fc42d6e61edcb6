#include "vconf/platform.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>

namespace fs = std::filesystem;

namespace vconf {

namespace {

std::string random_suffix() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(dis(gen)));
    return buf;
}

} // namespace

// ============================================================================
// File Operations
// ============================================================================

Result<std::vector<uint8_t>> read_binary_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Result<std::vector<uint8_t>>::err(
            Error(ErrorCode::FILE_NOT_FOUND, "failed to open " + path));
    }
    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        return Result<std::vector<uint8_t>>::err(
            Error(ErrorCode::IO_ERROR, "failed to read " + path));
    }
    return Result<std::vector<uint8_t>>::ok(std::move(data));
}

Result<std::string> read_text_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        return Result<std::string>::err(Error(ErrorCode::FILE_NOT_FOUND, "failed to open " + path));
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return Result<std::string>::ok(ss.str());
}

Result<void> write_binary_file(const std::string& path, const std::vector<uint8_t>& content) {
    std::string temp_path = path + ".tmp." + random_suffix();
    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to create " + temp_path));
        }
        file.write(reinterpret_cast<const char*>(content.data()),
                   static_cast<std::streamsize>(content.size()));
        if (!file) {
            std::error_code ec;
            fs::remove(temp_path, ec);
            return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to write " + temp_path));
        }
    }

    std::error_code ec;
    fs::rename(temp_path, path, ec);
    if (ec) {
        fs::remove(temp_path, ec);
        return Result<void>::err(Error(ErrorCode::IO_ERROR, "failed to rename into " + path));
    }
    return Result<void>::ok();
}

// ============================================================================
// Path Utilities
// ============================================================================

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string get_filename(const std::string& path) {
    return fs::path(path).filename().string();
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return p.string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::string make_temp_path(const std::string& stem, const std::string& extension) {
    return (fs::temp_directory_path() / (stem + "-" + random_suffix() + extension)).string();
}

bool remove_file(const std::string& path) {
    std::error_code ec;
    return fs::remove(path, ec);
}

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name) {
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
}

} // namespace vconf
