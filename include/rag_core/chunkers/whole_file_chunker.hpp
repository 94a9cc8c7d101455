#pragma once

#include "rag_core/chunkers/content_chunker.hpp"

namespace rag_core {

// Keeps configuration files, unknown files and binary documents in one piece
class WholeFileChunker : public ContentChunker {
 public:
  // line_addressable is false for artifacts such as pdf/docx that have no real lines
  WholeFileChunker(ChunkingOptions options, bool line_addressable);

  ChunkerKind kind() const override {
    return line_addressable_ ? ChunkerKind::WholeFile : ChunkerKind::WholeArtifact;
  }

  std::vector<Chunk> chunk(const std::string& file_path, const std::string& content,
                           const FileClassification& classification,
                           SyntaxErrorTracker& errors) const override;

 private:
  bool line_addressable_;
};

}  // namespace rag_core
