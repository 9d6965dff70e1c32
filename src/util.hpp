#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace clipmind {

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Split on runs of whitespace, dropping empty tokens
std::vector<std::string> split_whitespace(const std::string& s);

// Collapse runs of whitespace into a single space and trim
std::string collapse_whitespace(const std::string& s);

// Cut to at most max_len bytes, backing up to the last space when one exists.
// Never splits a UTF-8 sequence.
std::string truncate_at_word(const std::string& s, size_t max_len);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates the parent directory. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

} // namespace clipmind
