#pragma once

#include <string>

/// fsync an existing file (opened read-only)
bool fsync_file(const std::string& path);

/// fsync a directory so a rename inside it survives a crash
bool fsync_directory(const std::string& dir);

/// Copy src over dst without ever exposing a partial dst:
/// copy to a sibling temp file, fsync it, rename it into place, fsync the directory.
/// Permissions of src are carried over.
bool durable_copy(const std::string& src, const std::string& dst, std::string& error);

/// Write text to path the same way (temp, fsync, rename, fsync dir)
bool durable_write(const std::string& path, const std::string& text, std::string& error);

/// Sibling temp name in the same directory as path, unique per process
std::string sibling_temp_path(const std::string& path, const std::string& tag);
