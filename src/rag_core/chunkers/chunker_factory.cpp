#include "rag_core/chunkers/chunker_factory.hpp"
#include "rag_core/chunkers/markdown_chunker.hpp"
#include "rag_core/chunkers/python_chunker.hpp"
#include "rag_core/chunkers/syntax_tree_chunker.hpp"
#include "rag_core/chunkers/whole_file_chunker.hpp"
#include "rag_core/chunkers/window_chunker.hpp"

namespace rag_core {
ChunkerFactory::ChunkerFactory(ChunkingOptions options, const ParserRegistry& parsers)
    : parsers_(parsers) {
  chunkers_[ChunkerKind::PythonAst] =
      std::make_unique<PythonChunker>(options, parsers_.find("python"));
  chunkers_[ChunkerKind::JavaSyntaxTree] =
      std::make_unique<JavaChunker>(options, parsers_.find("java"));
  chunkers_[ChunkerKind::GoSyntaxTree] = std::make_unique<GoChunker>(options, parsers_.find("go"));
  chunkers_[ChunkerKind::MarkdownHeading] = std::make_unique<MarkdownChunker>(options);
  chunkers_[ChunkerKind::Windowed] = std::make_unique<WindowChunker>(options);
  chunkers_[ChunkerKind::WholeFile] = std::make_unique<WholeFileChunker>(options, true);
  chunkers_[ChunkerKind::WholeArtifact] = std::make_unique<WholeFileChunker>(options, false);
}

const ContentChunker& ChunkerFactory::get_chunker_for(ChunkerKind kind) const {
  auto it = chunkers_.find(kind);
  if (it == chunkers_.end()) {
    throw ContentChunkerError("No chunker registered for kind " + to_string(kind));
  }
  return *it->second;
}

const ContentChunker& ChunkerFactory::get_chunker_for(
    const FileClassification& classification) const {
  return get_chunker_for(FileClassifier::resolve_chunker_kind(classification, parsers_));
}
}  // namespace rag_core
