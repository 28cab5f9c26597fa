#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace imgkit {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// The final file carries exactly `mode`.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned int mode = 0644);

// ============================================================================
// Temporary Files
// ============================================================================

struct TempPathResult {
    bool ok = false;
    std::string error;
    std::string path;
};

// Create an empty, uniquely named file in the system temp directory.
TempPathResult create_temp_file(const std::string& prefix);

// Create a uniquely named directory in the system temp directory.
TempPathResult create_temp_directory(const std::string& prefix);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format).
// Tar entry names and lock file references always use forward slashes.
std::string to_portable_path(const std::string& path);

std::string get_parent_directory(const std::string& path);

std::string get_filename(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);

bool is_directory(const std::string& path);

bool create_directories(const std::string& path);

bool remove_directory(const std::string& path);

bool remove_file(const std::string& path);

// Read a whole file; nullopt if it cannot be opened or read
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

std::string generate_uuid();

} // namespace imgkit
