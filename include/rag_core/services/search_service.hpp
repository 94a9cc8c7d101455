#pragma once

#include <memory>
#include <string>
#include <vector>

#include "rag_core/llm/ollama_client.hpp"
#include "rag_core/retrieval/similarity_retriever.hpp"
#include "rag_core/types/chunk.hpp"

namespace rag_core {

class SearchServiceError : public std::exception {
 public:
  explicit SearchServiceError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct SearchHit {
  Chunk chunk;
  float score;
};

class SearchService {
 public:
  explicit SearchService(EmbeddingProvider &embedder, size_t embedding_batch_size = 32);

  // Embeds every chunk and publishes a fresh index. Searches in flight keep the old one.
  void build_index(const std::vector<Chunk> &chunks);

  // Natural-language semantic search. Returns top-k nearest chunks.
  std::vector<SearchHit> search(const std::string &query, int k = 5) const;

  bool has_index() const { return static_cast<bool>(index_.current()); }
  size_t indexed_chunks() const;

 private:
  struct SearchIndex {
    std::vector<Chunk> chunks;
    std::unique_ptr<SimilarityRetriever> retriever;
  };

  EmbeddingProvider &embedder_;
  size_t embedding_batch_size_;
  SwapHandle<SearchIndex> index_;
};

}  // namespace rag_core
