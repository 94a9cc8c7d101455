#include "rag_core/retrieval/similarity_retriever.hpp"

#include <faiss/IndexFlat.h>
#include <faiss/utils/distances.h>

#include <algorithm>

namespace rag_core {

SimilarityRetriever::SimilarityRetriever(const std::vector<RetrievalCandidate>& candidates) {
  if (candidates.empty()) {
    return;
  }

  dimension_ = candidates.front().embedding.size();
  if (dimension_ == 0) {
    throw RetrieverError("Candidate embeddings must not be empty");
  }

  std::vector<float> all_vectors_flat;
  all_vectors_flat.reserve(candidates.size() * dimension_);
  texts_.reserve(candidates.size());
  for (size_t i = 0; i < candidates.size(); ++i) {
    const auto& candidate = candidates[i];
    if (candidate.embedding.size() != dimension_) {
      throw RetrieverError("Candidate " + std::to_string(i) + " has dimension " +
                           std::to_string(candidate.embedding.size()) + ", expected " +
                           std::to_string(dimension_));
    }
    texts_.push_back(candidate.chunk_text);
    all_vectors_flat.insert(all_vectors_flat.end(), candidate.embedding.begin(),
                            candidate.embedding.end());
  }

  // Rows with zero norm are left as they are
  faiss::fvec_renorm_L2(dimension_, candidates.size(), all_vectors_flat.data());

  index_ = std::make_unique<faiss::IndexFlatIP>(static_cast<faiss::idx_t>(dimension_));
  index_->add(static_cast<faiss::idx_t>(candidates.size()), all_vectors_flat.data());
}

SimilarityRetriever::~SimilarityRetriever() = default;

std::vector<RankedResult> SimilarityRetriever::retrieve(const std::vector<float>& query,
                                                        int top_k) const {
  if (top_k <= 0 || texts_.empty()) {
    return {};
  }
  if (query.size() != dimension_) {
    throw RetrieverError("Query has dimension " + std::to_string(query.size()) +
                         ", expected " + std::to_string(dimension_));
  }

  std::vector<float> normalized_query = query;
  faiss::fvec_renorm_L2(dimension_, 1, normalized_query.data());

  // Score the whole corpus so equal scores can be ordered by corpus position
  const auto n = static_cast<faiss::idx_t>(texts_.size());
  std::vector<float> distances(n);
  std::vector<faiss::idx_t> labels(n);
  index_->search(1, normalized_query.data(), n, distances.data(), labels.data());

  std::vector<std::pair<float, size_t>> scored;
  scored.reserve(texts_.size());
  for (faiss::idx_t i = 0; i < n; ++i) {
    if (labels[i] < 0) continue;
    scored.emplace_back(distances[i], static_cast<size_t>(labels[i]));
  }
  std::sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
    if (a.first != b.first) return a.first > b.first;
    return a.second < b.second;
  });

  const size_t actual_k = std::min(static_cast<size_t>(top_k), scored.size());
  std::vector<RankedResult> results;
  results.reserve(actual_k);
  for (size_t i = 0; i < actual_k; ++i) {
    results.push_back(RankedResult{texts_[scored[i].second], scored[i].first, scored[i].second});
  }
  return results;
}

std::vector<RankedResult> retrieve(const std::vector<float>& query,
                                   const std::vector<RetrievalCandidate>& candidates, int top_k) {
  if (top_k <= 0 || candidates.empty()) {
    return {};
  }
  return SimilarityRetriever(candidates).retrieve(query, top_k);
}

}  // namespace rag_core
