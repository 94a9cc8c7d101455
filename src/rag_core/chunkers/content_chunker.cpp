#include "rag_core/chunkers/content_chunker.hpp"

#include <stdexcept>

#include "rag_core/chunkers/window_chunker.hpp"

namespace rag_core {

void ChunkingOptions::validate() const {
  if (chunk_size == 0) {
    throw std::invalid_argument("chunk_size must be greater than 0");
  }
  if (code_overlap >= chunk_size) {
    throw std::invalid_argument("code_overlap must be smaller than chunk_size");
  }
  if (documentation_overlap >= chunk_size) {
    throw std::invalid_argument("documentation_overlap must be smaller than chunk_size");
  }
}

ContentChunker::ContentChunker(ChunkingOptions options) : options_(options) {
  options_.validate();
}

/**
 * @brief Size-window fallback shared by every strategy.
 *
 * Uses the documentation overlap for documentation and the code overlap for
 * everything else.
 */
std::vector<Chunk> ContentChunker::fallback_windows(
    const std::string& file_path, const std::string& content,
    const FileClassification& classification) const {
  return chunk_by_size(content, file_path, classification.category, classification.language,
                       options_.chunk_size, options_.overlap_for(classification.category));
}

}  // namespace rag_core
