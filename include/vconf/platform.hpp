#pragma once

#include "vconf/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace vconf {

// ============================================================================
// File Operations
// ============================================================================

Result<std::vector<uint8_t>> read_binary_file(const std::string& path);
Result<std::string> read_text_file(const std::string& path);

// Write content using temp file + rename so readers never see a partial file
Result<void> write_binary_file(const std::string& path, const std::vector<uint8_t>& content);

// ============================================================================
// Path Utilities
// ============================================================================

std::string get_parent_directory(const std::string& path);
std::string get_filename(const std::string& path);
std::string join_path(const std::string& base, const std::string& rel);
bool path_exists(const std::string& path);
bool is_directory(const std::string& path);

// Unique path under the system temp directory
std::string make_temp_path(const std::string& stem, const std::string& extension);
bool remove_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// ============================================================================
// Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

// Compute SHA-256 of data
HashResult compute_sha256(const std::vector<uint8_t>& data);

} // namespace vconf
