#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_core/file_classifier.hpp"
#include "rag_core/syntax_error_tracker.hpp"
#include "rag_core/types/chunk.hpp"
#include "rag_core/types/file.hpp"

namespace rag_core {

class ContentChunkerError : public std::exception {
 public:
  explicit ContentChunkerError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Window sizes are measured in UTF-8 code points
struct ChunkingOptions {
  size_t chunk_size = 1500;
  size_t code_overlap = 200;
  size_t documentation_overlap = 250;

  size_t overlap_for(ContentCategory category) const {
    return category == ContentCategory::Documentation ? documentation_overlap : code_overlap;
  }

  // Throws std::invalid_argument when the windows could never advance
  void validate() const;
};

/**
 * @class ContentChunker
 * @brief One chunking strategy, selected per file through its ChunkerKind.
 *
 * chunk() never throws. Parse problems go to @p errors and the chunker answers
 * with size windows over the same content instead.
 */
class ContentChunker {
 public:
  explicit ContentChunker(ChunkingOptions options);
  virtual ~ContentChunker() = default;

  virtual ChunkerKind kind() const = 0;

  virtual std::vector<Chunk> chunk(const std::string& file_path, const std::string& content,
                                   const FileClassification& classification,
                                   SyntaxErrorTracker& errors) const = 0;

  const ChunkingOptions& options() const { return options_; }

 protected:
  std::vector<Chunk> fallback_windows(const std::string& file_path, const std::string& content,
                                      const FileClassification& classification) const;

  ChunkingOptions options_;
};

using ContentChunkerPtr = std::unique_ptr<ContentChunker>;

}  // namespace rag_core
