#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace npcmem {

// Lower-cases ASCII letters and the UTF-8 encoded Latin-1 capitals
// U+00C0..U+00DE (except U+00D7). Every other byte passes through untouched,
// so the result never depends on the host locale. Greek, Cyrillic and other
// scripts are not folded.
std::string to_lower(const std::string& s);

// Number of UTF-8 code points (continuation bytes are not counted).
size_t utf8_length(const std::string& s);

// Case-insensitive substring test, folding as to_lower does.
bool contains_ignore_case(const std::string& haystack, const std::string& needle);

// Case-insensitive equality, folding as to_lower does.
bool equals_ignore_case(const std::string& a, const std::string& b);

// Trim whitespace
std::string trim(const std::string& s);

// Split on any of the given delimiter characters, dropping empty pieces.
std::vector<std::string> split_any(const std::string& s, const std::string& delims);

// Simple string replace (all occurrences)
std::string replace_all(const std::string& str, const std::string& from, const std::string& to);

// Generate a simple unique ID (hex)
std::string generate_id();

// Lowercase hex of a byte buffer
std::string to_hex(const unsigned char* data, size_t len);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

} // namespace npcmem
