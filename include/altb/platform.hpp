#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>

namespace altb {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// The file is created with the given permission bits.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned mode = 0644);

// Create a symlink at a temporary name next to link_path, then rename it over
// link_path. Readers see either the previous entry or the new link.
AtomicWriteResult atomic_update_symlink(const std::string& link_path, const std::string& target);

// Copy src next to dst under a temporary name, then rename it over dst.
// Permission bits of src are preserved; extra_mode bits are OR-ed in.
AtomicWriteResult atomic_copy_file(const std::string& src, const std::string& dst,
                                   unsigned extra_mode = 0);

// ============================================================================
// Path Utilities
// ============================================================================

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Replace a leading "~" or "~/" with the home directory
std::string expand_user(const std::string& path, const std::string& home);

// Make a path absolute against the current directory without resolving symlinks
std::string make_absolute(const std::string& path);

// True if path lies strictly below root (lexically, after normalization)
bool is_path_under(const std::string& path, const std::string& root);

// Check if a path exists (follows symlinks)
bool path_exists(const std::string& path);

// Check if a path is a directory
bool is_directory(const std::string& path);

// Check if a path is a regular file (follows symlinks)
bool is_regular_file(const std::string& path);

// Check if a path is a symlink
bool is_symlink(const std::string& path);

// True if a directory entry exists at path, including dangling symlinks
bool entry_exists(const std::string& path);

// Check read permission for the current user
bool is_readable(const std::string& path);

// Read symlink target
std::optional<std::string> read_symlink(const std::string& path);

// Read a whole file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Create directories recursively
bool create_directories(const std::string& path);

// Remove a file or symlink
bool remove_file(const std::string& path);

// Rename a file (same filesystem)
bool rename_file(const std::string& from, const std::string& to);

// Current working directory
std::string current_directory();

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

} // namespace altb
