#pragma once

#include "rag_core/chunkers/content_chunker.hpp"

namespace rag_core {

/**
 * @brief Splits content into line-aligned windows of at least @p chunk_size code points.
 *
 * Each line counts its length plus one for the terminator. A window closes on
 * the line that takes the running length to @p chunk_size or beyond. The next
 * window starts with the longest run of trailing lines from the closed window
 * whose combined length stays within @p overlap, keeping their line numbers.
 * Whatever is still buffered at end of input becomes the last window.
 */
std::vector<Chunk> chunk_by_size(const std::string& content, const std::string& file_path,
                                 ContentCategory category, const std::string& language,
                                 size_t chunk_size, size_t overlap);

class WindowChunker : public ContentChunker {
 public:
  using ContentChunker::ContentChunker;

  ChunkerKind kind() const override { return ChunkerKind::Windowed; }

  std::vector<Chunk> chunk(const std::string& file_path, const std::string& content,
                           const FileClassification& classification,
                           SyntaxErrorTracker& errors) const override;
};

}  // namespace rag_core
