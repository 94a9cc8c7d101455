#pragma once
#include <map>
#include <memory>

#include "rag_core/chunkers/content_chunker.hpp"
#include "rag_core/parsing/structural_parser.hpp"

/**
 * @class ChunkerFactory
 * @brief Owns one chunker per ChunkerKind and hands out the one a file needs.
 *
 * The classifier resolves a ChunkerKind once per file; the factory maps that
 * kind to its chunker. Chunkers are stateless, so the returned references can
 * be used from several worker threads at once. This class is non-copyable and
 * non-movable because the structural chunkers point into the parser registry.
 */
namespace rag_core {
class ChunkerFactory {
 public:
  /**
   * @brief Constructs the factory and every chunker.
   *
   * @param options Window size and overlaps shared by all chunkers.
   * @param parsers Structural parsers; must outlive the factory.
   */
  ChunkerFactory(ChunkingOptions options, const ParserRegistry& parsers);

  /**
   * @brief Returns the chunker registered for @p kind.
   * @throw ContentChunkerError if no chunker exists for the kind.
   */
  const ContentChunker& get_chunker_for(ChunkerKind kind) const;

  // Resolves the kind for an already classified file
  const ContentChunker& get_chunker_for(const FileClassification& classification) const;

  const ParserRegistry& parsers() const { return parsers_; }

  ChunkerFactory(const ChunkerFactory&) = delete;
  ChunkerFactory& operator=(const ChunkerFactory&) = delete;
  ChunkerFactory(ChunkerFactory&&) = delete;
  ChunkerFactory& operator=(ChunkerFactory&&) = delete;

 private:
  const ParserRegistry& parsers_;
  std::map<ChunkerKind, ContentChunkerPtr> chunkers_;
};
}  // namespace rag_core
