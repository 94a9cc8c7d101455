#pragma once

#include "rag_core/chunkers/content_chunker.hpp"
#include "rag_core/parsing/structural_parser.hpp"

namespace rag_core {

/**
 * @class PythonChunker
 * @brief Chunks Python modules along their top-level classes and functions.
 *
 * Every top-level class yields a class chunk followed by one chunk per method
 * defined directly in its body, and every top-level function yields a function
 * chunk. Chunk text is the full source lines of the definition. A module with
 * neither is kept as a single whole_file chunk.
 *
 * Python has no error recovery worth trusting: any syntax error records one
 * ParseErrorRecord and the file is split into size windows instead.
 */
class PythonChunker : public ContentChunker {
 public:
  // parser may be null, in which case every file is windowed
  PythonChunker(ChunkingOptions options, const StructuralParser* parser);

  ChunkerKind kind() const override { return ChunkerKind::PythonAst; }

  std::vector<Chunk> chunk(const std::string& file_path, const std::string& content,
                           const FileClassification& classification,
                           SyntaxErrorTracker& errors) const override;

 private:
  std::vector<Chunk> extract_definitions(const SyntaxTree& tree, const std::string& file_path,
                                         const std::vector<std::string>& lines,
                                         const FileClassification& classification) const;

  const StructuralParser* parser_;
};

}  // namespace rag_core
