#pragma once

#include <string>
#include <vector>

#include "rag_core/chunkers/content_chunker.hpp"
#include "rag_core/parsing/structural_parser.hpp"

namespace rag_core {

struct SyntaxTreeGrammar {
  // Used in log lines and the generic error message, e.g. "Java"
  std::string display_name;
  // Declarations an error can be attributed to, innermost match wins
  std::vector<std::string> context_types;
};

/**
 * @class SyntaxTreeChunker
 * @brief Base for grammars parsed with error recovery (Java, Go).
 *
 * tree-sitter always produces a tree, so a file with syntax errors still gets
 * structural chunks. Each ERROR or missing node is recorded with its position,
 * a few lines of context and the declaration it sits in; the declarations are
 * then extracted from whatever the tree holds. Only a parser failure or an empty
 * extraction falls back to size windows.
 */
class SyntaxTreeChunker : public ContentChunker {
 public:
  SyntaxTreeChunker(ChunkingOptions options, const StructuralParser* parser,
                    SyntaxTreeGrammar grammar);

  std::vector<Chunk> chunk(const std::string& file_path, const std::string& content,
                           const FileClassification& classification,
                           SyntaxErrorTracker& errors) const final;

  static constexpr int CONTEXT_LINES = 3;

 protected:
  virtual std::vector<Chunk> extract_declarations(
      const SyntaxTree& tree, const std::string& file_path,
      const FileClassification& classification) const = 0;

  // Chunk over the exact byte span of node
  static Chunk make_node_chunk(const SyntaxTree& tree, TSNode node, const std::string& file_path,
                               const FileClassification& classification, const char* kind,
                               std::string name, std::optional<std::string> parent);

 private:
  void record_tree_errors(const SyntaxTree& tree, const std::string& file_path,
                          const std::string& content, const FileClassification& classification,
                          SyntaxErrorTracker& errors) const;

  std::string containing_element(TSNode node, TSNode root) const;

  const StructuralParser* parser_;
  SyntaxTreeGrammar grammar_;
};

// Classes, interfaces, enums and records with their methods and constructors
class JavaChunker final : public SyntaxTreeChunker {
 public:
  JavaChunker(ChunkingOptions options, const StructuralParser* parser);

  ChunkerKind kind() const override { return ChunkerKind::JavaSyntaxTree; }

 protected:
  std::vector<Chunk> extract_declarations(const SyntaxTree& tree, const std::string& file_path,
                                          const FileClassification& classification) const override;
};

// Top-level functions, methods (parented to their receiver type) and type declarations
class GoChunker final : public SyntaxTreeChunker {
 public:
  GoChunker(ChunkingOptions options, const StructuralParser* parser);

  ChunkerKind kind() const override { return ChunkerKind::GoSyntaxTree; }

 protected:
  std::vector<Chunk> extract_declarations(const SyntaxTree& tree, const std::string& file_path,
                                          const FileClassification& classification) const override;
};

}  // namespace rag_core
