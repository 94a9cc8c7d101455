#pragma once

#include <string>

#include "rag_core/types/file.hpp"

namespace rag_core {

class ParserRegistry;

// Closed set of chunking strategies; resolved once per file
enum class ChunkerKind {
  PythonAst,
  JavaSyntaxTree,
  GoSyntaxTree,
  MarkdownHeading,
  Windowed,
  WholeFile,
  WholeArtifact
};

std::string to_string(ChunkerKind kind);

/**
 * @class FileClassifier
 * @brief Maps a repository-relative path to a (category, language) pair.
 *
 * Rules are applied in order and later rules override earlier ones: the
 * extension tables first, then exact filenames, GitHub workflow paths,
 * package manifests and finally any path under .github/. A path that matches
 * nothing is Unknown/unknown.
 */
class FileClassifier {
 public:
  explicit FileClassifier(bool verbose = false) : verbose_(verbose) {}

  FileClassification classify(const std::string& file_path) const;

  /**
   * @brief Picks the chunking strategy for an already classified file.
   *
   * Code languages only get a structural chunker when @p parsers has a
   * grammar registered for them; everything else falls through to windows.
   */
  static ChunkerKind resolve_chunker_kind(const FileClassification& classification,
                                          const ParserRegistry& parsers);

 private:
  bool verbose_;
};

}  // namespace rag_core
