#include "rag_core/text_utils.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>

namespace rag_core::text {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> lines;
  size_t start = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c != '\n' && c != '\r') {
      continue;
    }
    lines.emplace_back(text.substr(start, i - start));
    if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
      ++i;
    }
    start = i + 1;
  }
  if (start < text.size()) {
    lines.emplace_back(text.substr(start));
  }
  return lines;
}

std::vector<std::string> split_rows(std::string_view text) {
  std::vector<std::string> rows;
  size_t start = 0;
  while (start < text.size()) {
    size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      rows.emplace_back(text.substr(start));
      break;
    }
    size_t row_end = end;
    if (row_end > start && text[row_end - 1] == '\r') {
      --row_end;
    }
    rows.emplace_back(text.substr(start, row_end - start));
    start = end + 1;
  }
  return rows;
}

size_t code_point_length(std::string_view text) {
  if (!utf8::is_valid(text.begin(), text.end())) {
    return text.size();
  }
  return static_cast<size_t>(utf8::unchecked::distance(text.begin(), text.end()));
}

std::string sanitize_utf8(const std::string& raw) {
  std::string clean;
  clean.reserve(raw.size());
  auto it = raw.begin();
  while (it != raw.end()) {
    auto invalid = utf8::find_invalid(it, raw.end());
    clean.append(it, invalid);
    if (invalid == raw.end()) {
      break;
    }
    it = invalid + 1;
  }
  return clean;
}

size_t count_newlines(std::string_view text) {
  return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
}

bool is_blank(std::string_view text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

std::string trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::string join_lines(const std::vector<std::string>& lines, size_t first_line,
                       size_t last_line) {
  std::string joined;
  if (first_line == 0 || first_line > last_line) {
    return joined;
  }
  last_line = std::min(last_line, lines.size());
  for (size_t line = first_line; line <= last_line; ++line) {
    if (line > first_line) {
      joined += '\n';
    }
    joined += lines[line - 1];
  }
  return joined;
}

}  // namespace rag_core::text
