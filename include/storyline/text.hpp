#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace storyline {

// ─── String Helpers ─────────────────────────────────────────────────────────

bool is_space(char c);

std::string trim(std::string_view s);
std::string trim_end(std::string_view s);

// Replace every non-overlapping occurrence, scanning left to right once.
std::string replace_all(std::string_view s, std::string_view from,
                        std::string_view to);

// ASCII lower-casing; bytes outside ASCII pass through.
std::string to_lower(std::string_view s);

bool contains(std::string_view s, std::string_view needle);

// True if any byte is an ASCII letter/digit or part of a multi-byte
// UTF-8 sequence.
bool has_alphanumeric(std::string_view s);

std::vector<std::string> split(std::string_view s, char sep);

// Split on a multi-character separator, keeping empty pieces.
std::vector<std::string> split(std::string_view s, std::string_view sep);

// ─── File Helpers ───────────────────────────────────────────────────────────

// Whole file as bytes; throws std::runtime_error if it cannot be opened.
std::string read_file(const std::string &path);

// Lines without terminators, trailing CR stripped.
std::vector<std::string> read_lines(const std::string &path);

} // namespace storyline
