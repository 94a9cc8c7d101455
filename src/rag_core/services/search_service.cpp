#include "rag_core/services/search_service.hpp"

#include <algorithm>
#include <iostream>

namespace rag_core {

SearchService::SearchService(EmbeddingProvider &embedder, size_t embedding_batch_size)
    : embedder_(embedder), embedding_batch_size_(std::max<size_t>(1, embedding_batch_size)) {}

void SearchService::build_index(const std::vector<Chunk> &chunks) {
  std::vector<RetrievalCandidate> candidates;
  candidates.reserve(chunks.size());

  try {
    for (size_t start = 0; start < chunks.size(); start += embedding_batch_size_) {
      const size_t end = std::min(chunks.size(), start + embedding_batch_size_);
      std::vector<std::string> texts;
      texts.reserve(end - start);
      for (size_t i = start; i < end; ++i) {
        texts.push_back(chunks[i].content());
      }

      std::vector<std::vector<float>> vectors = embedder_.embed(texts);
      if (vectors.size() != texts.size()) {
        throw SearchServiceError("Embedding provider returned " + std::to_string(vectors.size()) +
                                 " vectors for " + std::to_string(texts.size()) + " chunks");
      }
      for (size_t i = 0; i < texts.size(); ++i) {
        candidates.push_back(RetrievalCandidate{std::move(texts[i]), std::move(vectors[i])});
      }
    }

    auto index = std::make_shared<SearchIndex>();
    index->chunks = chunks;
    index->retriever = std::make_unique<SimilarityRetriever>(candidates);
    index_.publish(std::move(index));
  } catch (const SearchServiceError &) {
    throw;
  } catch (const std::exception &e) {
    throw SearchServiceError("Index build failed: " + std::string(e.what()));
  }

  std::cout << "[SearchService] Indexed " << chunks.size() << " chunks" << std::endl;
}

std::vector<SearchHit> SearchService::search(const std::string &query, int k) const {
  const auto index = index_.current();
  if (!index) {
    throw SearchServiceError("Search index has not been built");
  }

  try {
    const std::vector<float> query_embedding = embedder_.get_embedding(query);
    const auto ranked = index->retriever->retrieve(query_embedding, k);

    std::vector<SearchHit> hits;
    hits.reserve(ranked.size());
    for (const auto &result : ranked) {
      hits.push_back(SearchHit{index->chunks[result.candidate_index], result.score});
    }
    return hits;
  } catch (const std::exception &e) {
    throw SearchServiceError("Search failed: " + std::string(e.what()));
  }
}

size_t SearchService::indexed_chunks() const {
  const auto index = index_.current();
  return index ? index->chunks.size() : 0;
}

}  // namespace rag_core
