#include "rag_core/chunkers/markdown_chunker.hpp"

#include <cctype>
#include <iostream>
#include <string_view>

#include "rag_core/text_utils.hpp"

namespace rag_core {

int MarkdownChunker::last_line_of(int start_line, const std::string& slice) {
  int newlines = static_cast<int>(text::count_newlines(slice));
  if (newlines > 0 && slice.back() == '\n') {
    --newlines;
  }
  return start_line + newlines;
}

std::vector<MarkdownChunker::Heading> MarkdownChunker::find_headings(const std::string& content) {
  std::vector<Heading> headings;
  size_t line_start = 0;
  while (line_start < content.size()) {
    size_t line_end = content.find('\n', line_start);
    if (line_end == std::string::npos) {
      line_end = content.size();
    }
    const std::string_view line(content.data() + line_start, line_end - line_start);

    size_t level = 0;
    while (level < line.size() && line[level] == '#') {
      ++level;
    }
    if (level >= 1 && level <= 6 && level < line.size() &&
        std::isspace(static_cast<unsigned char>(line[level]))) {
      std::string heading_text = text::trim(line.substr(level));
      if (!heading_text.empty()) {
        headings.push_back({line_start, static_cast<int>(level), std::move(heading_text)});
      }
    }
    line_start = line_end + 1;
  }
  return headings;
}

std::vector<Chunk> MarkdownChunker::chunk(const std::string& file_path,
                                          const std::string& content,
                                          const FileClassification& classification,
                                          SyntaxErrorTracker& /*errors*/) const {
  if (content.empty()) {
    return {};
  }

  try {
    return split_sections(file_path, content, classification);
  } catch (const std::exception& e) {
    std::cerr << "[MarkdownChunker] Error processing " << file_path << ": " << e.what()
              << ", falling back to size windows" << std::endl;
  }
  return fallback_windows(file_path, content, classification);
}

std::vector<Chunk> MarkdownChunker::split_sections(const std::string& file_path,
                                                   const std::string& content,
                                                   const FileClassification& classification) const {
  const std::vector<Heading> headings = find_headings(content);
  if (headings.empty()) {
    return fallback_windows(file_path, content, classification);
  }

  std::vector<Chunk> chunks;

  const std::string prefix = content.substr(0, headings.front().position);
  if (!text::is_blank(prefix)) {
    chunks.emplace_back(ChunkFields{.content = prefix,
                                    .file_path = file_path,
                                    .category = classification.category,
                                    .language = classification.language,
                                    .start_line = 1,
                                    .end_line = last_line_of(1, prefix),
                                    .entity_name = "Introduction",
                                    .metadata = {{"kind", "markdown_intro"}}});
  }

  for (size_t i = 0; i < headings.size(); ++i) {
    const size_t start = headings[i].position;
    const size_t end = i + 1 < headings.size() ? headings[i + 1].position : content.size();
    std::string section = content.substr(start, end - start);

    const int start_line =
        static_cast<int>(text::count_newlines(std::string_view(content).substr(0, start))) + 1;
    const int end_line = last_line_of(start_line, section);

    chunks.emplace_back(ChunkFields{
        .content = std::move(section),
        .file_path = file_path,
        .category = classification.category,
        .language = classification.language,
        .start_line = start_line,
        .end_line = end_line,
        .entity_name = headings[i].text,
        .metadata = {{"kind", "markdown_section"}, {"heading_level", headings[i].level}}});
  }

  return chunks;
}

}  // namespace rag_core
