#include "rag_core/run_context.hpp"

namespace rag_core {

RunContext::RunContext(std::string repository_name)
    : repository_name_(std::move(repository_name)) {}

size_t RunContext::reserve_sequences(size_t count) {
  std::lock_guard<std::mutex> lock(mutex_);
  const size_t first = next_sequence_;
  next_sequence_ += count;
  return first;
}

void RunContext::merge(FileOutcome outcome) {
  error_tracker_.append(outcome.errors);

  std::lock_guard<std::mutex> lock(mutex_);
  if (outcome.failed) {
    stats_.errors++;
    return;
  }
  if (!outcome.record) {
    return;
  }

  const std::string category = to_string(outcome.record->category);
  stats_.files_processed++;
  stats_.files_by_type[category]++;
  if (!outcome.chunks.empty()) {
    stats_.chunks_created += outcome.chunks.size();
    stats_.chunks_by_type[category] += outcome.chunks.size();
  }

  files_by_sequence_[outcome.sequence] = std::move(*outcome.record);
  if (!outcome.chunks.empty()) {
    auto& slot = chunks_by_sequence_[outcome.sequence];
    slot.insert(slot.end(), std::make_move_iterator(outcome.chunks.begin()),
                std::make_move_iterator(outcome.chunks.end()));
  }
}

void RunContext::set_processing_time(double seconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.processing_time = seconds;
}

std::vector<Chunk> RunContext::chunks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Chunk> all;
  for (const auto& [sequence, file_chunks] : chunks_by_sequence_) {
    all.insert(all.end(), file_chunks.begin(), file_chunks.end());
  }
  return all;
}

std::vector<FileRecord> RunContext::files() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<FileRecord> all;
  all.reserve(files_by_sequence_.size());
  for (const auto& [sequence, record] : files_by_sequence_) {
    all.push_back(record);
  }
  return all;
}

RunStatistics RunContext::statistics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

}  // namespace rag_core
