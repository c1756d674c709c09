#pragma once

#include "steward/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace steward {

// ============================================================================
// Atomic File Operations
// ============================================================================
//
// Every store steward owns is rewritten through atomic_write_file. There is
// no locking: steward assumes it is the only writer while a command runs.
// Two concurrent invocations, or an editor saving the same file, race on
// read-modify-rename and the last rename wins.

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// Creates the parent directory when missing.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// Archive
// ============================================================================

// Timestamp used in archive names: YYYYmmdd_HHMMSS (local time)
std::string get_archive_timestamp();

// Move a file or directory into archive_dir as
// <basename>_<YYYYmmdd_HHMMSS>_<reason>. Returns the archive path.
Result<std::string> archive_path(const std::string& path,
                                 const std::string& archive_dir,
                                 const std::string& reason);

// Write content into archive_dir as <name>_<YYYYmmdd_HHMMSS>_<reason>
Result<std::string> archive_content(const std::string& name,
                                    const std::string& content,
                                    const std::string& archive_dir,
                                    const std::string& reason);

// ============================================================================
// Path Utilities
// ============================================================================

std::string get_parent_directory(const std::string& path);
std::string get_filename(const std::string& path);

// Filename without its last extension
std::string get_stem(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Entry names (not full paths), sorted
std::vector<std::string> list_directory(const std::string& path);

bool create_directories(const std::string& path);

std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

std::unordered_map<std::string, std::string> get_all_env();

// $HOME, falling back to the passwd entry
std::string get_home_directory();

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace steward
