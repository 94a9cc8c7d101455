#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "rag_core/syntax_error_tracker.hpp"
#include "rag_core/types/chunk.hpp"
#include "rag_core/types/file.hpp"

namespace rag_core {

struct RunStatistics {
  size_t files_processed = 0;
  size_t chunks_created = 0;
  // Keyed by to_string(ContentCategory)
  std::map<std::string, size_t> files_by_type;
  std::map<std::string, size_t> chunks_by_type;
  double processing_time = 0.0;
  size_t errors = 0;
};

struct FileRecord {
  std::string file_path;
  ContentCategory category = ContentCategory::Unknown;
  std::string language;
  std::string content_hash;
  size_t chunk_count = 0;
};

// Everything one file contributed to a run, merged in a single step
struct FileOutcome {
  size_t sequence = 0;
  std::optional<FileRecord> record;
  std::vector<Chunk> chunks;
  std::vector<ParseErrorRecord> errors;
  bool failed = false;
};

/**
 * @class RunContext
 * @brief Chunk repository, statistics and syntax errors of one repository run.
 *
 * Passed by reference through the pipeline instead of living in globals, so
 * independent runs never share state. merge() takes the lock once per file;
 * chunks() returns them ordered by the sequence number each file was given,
 * which keeps the output independent of worker scheduling.
 */
class RunContext {
 public:
  explicit RunContext(std::string repository_name);

  RunContext(const RunContext&) = delete;
  RunContext& operator=(const RunContext&) = delete;

  const std::string& repository_name() const { return repository_name_; }

  // First of count consecutive sequence numbers for files about to be processed
  size_t reserve_sequences(size_t count);

  void merge(FileOutcome outcome);
  void set_processing_time(double seconds);

  std::vector<Chunk> chunks() const;
  std::vector<FileRecord> files() const;
  RunStatistics statistics() const;

  SyntaxErrorTracker& error_tracker() { return error_tracker_; }
  const SyntaxErrorTracker& error_tracker() const { return error_tracker_; }

 private:
  std::string repository_name_;
  mutable std::mutex mutex_;
  size_t next_sequence_ = 0;
  std::map<size_t, std::vector<Chunk>> chunks_by_sequence_;
  std::map<size_t, FileRecord> files_by_sequence_;
  RunStatistics stats_;
  SyntaxErrorTracker error_tracker_;
};

}  // namespace rag_core
