#pragma once
#include <string>
#include <vector>

namespace autoship {

// Trim whitespace
std::string trim(const std::string& s);

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_whitespace(const std::string& s);

// ASCII lowercase copy
std::string to_lower(const std::string& s);

// Cut to max_len bytes and append marker when longer
std::string truncate_with_marker(const std::string& s, size_t max_len,
                                 const std::string& marker);

// Indent every line after the first by prefix
std::string indent_lines(const std::string& s, const std::string& prefix);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Directory holding the running binary (/proc/self/exe, else argv0)
std::string executable_dir(const char* argv0);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace autoship
