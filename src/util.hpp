#pragma once
#include <string>
#include <vector>
#include <cstddef>

namespace execrelay {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Collapse all runs of whitespace (including newlines) into single spaces
std::string one_line(const std::string& s);

// Number of UTF-8 code points in s
size_t utf8_length(const std::string& s);

// First max_points code points of s, never splitting a multi-byte sequence
std::string utf8_prefix(const std::string& s, size_t max_points);

// Shorten s to at most width code points, ending in "…" when cut
std::string shorten(const std::string& s, size_t width);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename so readers never see a partial file
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace execrelay
