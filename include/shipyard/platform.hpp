#pragma once

#include "shipyard/result.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace shipyard {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// "<path>.tmp.<8 hex>", in the same directory so the final rename is atomic
std::string make_temp_path(const std::string& path);

// fsync temp_path, rename it over path, then fsync the directory.
// The temp file is removed when any step fails.
AtomicWriteResult commit_temp_file(const std::string& temp_path, const std::string& path);

// ============================================================================
// File Reading
// ============================================================================

Result<std::vector<uint8_t>> read_file_bytes(const std::string& path);
Result<std::string> read_file_text(const std::string& path);

// ============================================================================
// Misc Utilities
// ============================================================================

std::string get_parent_directory(const std::string& path);

// Portable getenv, returns empty string when unset
std::string safe_getenv(const char* name);

// Random version 4 UUID, lowercase
std::string generate_uuid();

} // namespace shipyard
