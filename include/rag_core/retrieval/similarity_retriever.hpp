#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace faiss {
struct IndexFlatIP;
}

namespace rag_core {

class RetrieverError : public std::exception {
 public:
  explicit RetrieverError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct RetrievalCandidate {
  std::string chunk_text;
  std::vector<float> embedding;
};

struct RankedResult {
  std::string chunk_text;
  float score;
  // Position of the candidate in the corpus it was ranked from
  size_t candidate_index;
};

/**
 * @class SimilarityRetriever
 * @brief Immutable top-K cosine ranking over a fixed corpus.
 *
 * The corpus is copied and L2-normalized into a flat inner-product index at
 * construction; the caller's vectors are left untouched. Zero vectors stay
 * zero and score 0 against everything. Equal scores keep corpus order.
 * retrieve() only reads, so one instance can serve concurrent queries.
 */
class SimilarityRetriever {
 public:
  /**
   * @throw RetrieverError if the candidates do not share one non-zero dimension.
   */
  explicit SimilarityRetriever(const std::vector<RetrievalCandidate>& candidates);
  ~SimilarityRetriever();

  SimilarityRetriever(const SimilarityRetriever&) = delete;
  SimilarityRetriever& operator=(const SimilarityRetriever&) = delete;

  /**
   * @brief Returns the min(top_k, size()) most similar candidates.
   *
   * Empty when top_k <= 0 or the corpus is empty.
   * @throw RetrieverError if the query dimension differs from the corpus.
   */
  std::vector<RankedResult> retrieve(const std::vector<float>& query, int top_k) const;

  size_t size() const { return texts_.size(); }
  size_t dimension() const { return dimension_; }

 private:
  std::vector<std::string> texts_;
  size_t dimension_ = 0;
  std::unique_ptr<faiss::IndexFlatIP> index_;
};

// One-shot ranking without keeping the index around
std::vector<RankedResult> retrieve(const std::vector<float>& query,
                                   const std::vector<RetrievalCandidate>& candidates, int top_k);

/**
 * @class SwapHandle
 * @brief Publishes immutable snapshots by pointer swap.
 *
 * Readers take a shared_ptr and keep using it while a newer snapshot is
 * published; a published snapshot is never modified.
 */
template <typename T>
class SwapHandle {
 public:
  void publish(std::shared_ptr<const T> snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    current_.swap(snapshot);
  }

  // nullptr until the first publish
  std::shared_ptr<const T> current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
  }

 private:
  mutable std::mutex mutex_;
  std::shared_ptr<const T> current_;
};

using RetrieverHandle = SwapHandle<SimilarityRetriever>;

}  // namespace rag_core
