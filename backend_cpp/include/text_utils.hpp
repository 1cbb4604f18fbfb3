#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace code_extraction {

// Lines without their '\n'. A trailing '\n' does not produce an empty last line.
std::vector<std::string_view> split_lines(std::string_view text);

std::string_view trim(std::string_view text);
std::string to_lower(std::string_view text);
bool is_blank(std::string_view text);

// Leading indentation width; a tab counts as 4 columns.
size_t indent_width(std::string_view line);

// Weighted mix of technical-character ratio (0.7) and keyword ratio (0.3).
double technical_density(std::string_view text);

// Count of structural markers: definitions, control flow, types, bracket pairs.
int block_complexity(std::string_view text);

// True when ()[]{} close in order. String literals and line comments are skipped.
bool brackets_balanced(std::string_view text);

// 64-bit FNV-1a, rendered as 16 lowercase hex digits.
std::string fnv1a_hex(std::string_view data);

} // namespace code_extraction
