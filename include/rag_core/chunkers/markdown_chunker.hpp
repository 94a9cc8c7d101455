#pragma once

#include "rag_core/chunkers/content_chunker.hpp"

namespace rag_core {

/**
 * @class MarkdownChunker
 * @brief One chunk per heading section, plus an introduction for text before the first heading.
 *
 * A section runs from its heading line up to the next heading of any level.
 * Documents without headings are split into size windows.
 */
class MarkdownChunker : public ContentChunker {
 public:
  using ContentChunker::ContentChunker;

  ChunkerKind kind() const override { return ChunkerKind::MarkdownHeading; }

  std::vector<Chunk> chunk(const std::string& file_path, const std::string& content,
                           const FileClassification& classification,
                           SyntaxErrorTracker& errors) const override;

 private:
  struct Heading {
    size_t position;
    int level;
    std::string text;
  };

  // ATX headings: 1-6 '#' at the start of a line, whitespace, then text on that same line
  static std::vector<Heading> find_headings(const std::string& content);

  std::vector<Chunk> split_sections(const std::string& file_path, const std::string& content,
                                    const FileClassification& classification) const;

  // Last line a slice starting on start_line touches; a final newline does not open a new line
  static int last_line_of(int start_line, const std::string& slice);
};

}  // namespace rag_core
