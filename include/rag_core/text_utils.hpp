#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace rag_core::text {

// Splits on \n, \r\n and \r; a trailing terminator does not add an empty line
std::vector<std::string> split_lines(std::string_view text);

// Splits on \n only, matching tree-sitter row numbering; a CR before the LF is dropped
std::vector<std::string> split_rows(std::string_view text);

// Number of UTF-8 code points, the unit window sizes are measured in
size_t code_point_length(std::string_view text);

// Drops bytes that are not part of a valid UTF-8 sequence
std::string sanitize_utf8(const std::string& raw);

size_t count_newlines(std::string_view text);

bool is_blank(std::string_view text);

std::string trim(std::string_view text);

// Lines [first_line, last_line] (1-based, inclusive) joined with '\n'
std::string join_lines(const std::vector<std::string>& lines, size_t first_line, size_t last_line);

}  // namespace rag_core::text
