#include "rag_core/chunkers/window_chunker.hpp"

#include <deque>
#include <stdexcept>

#include "rag_core/text_utils.hpp"

namespace rag_core {

namespace {

Chunk make_window(const std::deque<std::string>& buffer, const std::string& file_path,
                  ContentCategory category, const std::string& language, size_t first_line,
                  size_t last_line) {
  std::string content;
  for (size_t i = 0; i < buffer.size(); ++i) {
    if (i > 0) {
      content += '\n';
    }
    content += buffer[i];
  }
  return Chunk({.content = std::move(content),
                .file_path = file_path,
                .category = category,
                .language = language,
                .start_line = static_cast<int>(first_line),
                .end_line = static_cast<int>(last_line),
                .metadata = {{"kind", "size_based_chunk"}}});
}

}  // namespace

std::vector<Chunk> chunk_by_size(const std::string& content, const std::string& file_path,
                                 ContentCategory category, const std::string& language,
                                 size_t chunk_size, size_t overlap) {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than 0");
  }
  if (overlap >= chunk_size) {
    throw std::invalid_argument("overlap must be smaller than chunk_size");
  }

  std::vector<Chunk> chunks;
  const std::vector<std::string> lines = text::split_lines(content);
  if (lines.empty()) {
    return chunks;
  }

  std::deque<std::string> buffer;
  std::deque<size_t> buffer_lengths;
  size_t buffer_length = 0;
  size_t buffer_start_line = 1;

  for (size_t line_number = 1; line_number <= lines.size(); ++line_number) {
    const std::string& line = lines[line_number - 1];
    const size_t line_length = text::code_point_length(line) + 1;
    buffer.push_back(line);
    buffer_lengths.push_back(line_length);
    buffer_length += line_length;

    if (buffer_length < chunk_size) {
      continue;
    }

    Chunk window =
        make_window(buffer, file_path, category, language, buffer_start_line, line_number);
    if (!window.content().empty()) {
      chunks.push_back(std::move(window));
    }

    // Carry whole trailing lines forward while they fit in the overlap
    size_t carried = 0;
    size_t carried_length = 0;
    for (auto it = buffer_lengths.rbegin(); it != buffer_lengths.rend(); ++it) {
      if (carried_length + *it > overlap) {
        break;
      }
      carried_length += *it;
      ++carried;
    }
    while (buffer.size() > carried) {
      buffer.pop_front();
      buffer_lengths.pop_front();
    }
    buffer_length = carried_length;
    buffer_start_line = line_number - carried + 1;
  }

  if (!buffer.empty()) {
    Chunk window =
        make_window(buffer, file_path, category, language, buffer_start_line, lines.size());
    // A lone empty line joins to nothing
    if (!window.content().empty()) {
      chunks.push_back(std::move(window));
    }
  }
  return chunks;
}

std::vector<Chunk> WindowChunker::chunk(const std::string& file_path, const std::string& content,
                                        const FileClassification& classification,
                                        SyntaxErrorTracker& /*errors*/) const {
  return fallback_windows(file_path, content, classification);
}

}  // namespace rag_core
