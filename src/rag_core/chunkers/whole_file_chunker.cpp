#include "rag_core/chunkers/whole_file_chunker.hpp"

#include "rag_core/text_utils.hpp"

namespace rag_core {

WholeFileChunker::WholeFileChunker(ChunkingOptions options, bool line_addressable)
    : ContentChunker(options), line_addressable_(line_addressable) {}

std::vector<Chunk> WholeFileChunker::chunk(const std::string& file_path,
                                           const std::string& content,
                                           const FileClassification& classification,
                                           SyntaxErrorTracker& /*errors*/) const {
  if (content.empty()) {
    return {};
  }

  ChunkFields fields{.content = content,
                     .file_path = file_path,
                     .category = classification.category,
                     .language = classification.language,
                     .metadata = {{"kind", "whole_file"}, {"format", classification.language}}};
  if (line_addressable_) {
    fields.start_line = 1;
    fields.end_line = static_cast<int>(text::split_lines(content).size());
  }

  std::vector<Chunk> chunks;
  chunks.emplace_back(std::move(fields));
  return chunks;
}

}  // namespace rag_core
