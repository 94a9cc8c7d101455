#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace rag_core {

struct ParseErrorRecord {
  std::string file_path;
  std::string language;
  std::string message;
  std::optional<int> line_number;
  std::optional<std::string> containing_entity;
  // column, context, error_node_type, containing_element when known
  nlohmann::json metadata;
};

struct SyntaxErrorReport {
  bool has_syntax_errors = false;
  size_t error_count = 0;
  std::string summary;
  std::vector<ParseErrorRecord> errors;
  // Languages in the order their first error was recorded
  std::vector<std::pair<std::string, std::vector<ParseErrorRecord>>> errors_by_language;
};

/**
 * @class SyntaxErrorTracker
 * @brief Append-only log of parse problems found while chunking.
 *
 * Chunkers record into a tracker they are handed. Workers keep a local tracker
 * per file and merge it into the run's tracker with a single append(), so a
 * file's records are never interleaved with another file's.
 */
class SyntaxErrorTracker {
 public:
  SyntaxErrorTracker() = default;

  SyntaxErrorTracker(const SyntaxErrorTracker&) = delete;
  SyntaxErrorTracker& operator=(const SyntaxErrorTracker&) = delete;

  void add_error(const std::string& file_path, const std::string& language,
                 const std::string& message, std::optional<int> line_number = std::nullopt,
                 std::optional<std::string> containing_entity = std::nullopt,
                 nlohmann::json metadata = nullptr);

  void append(const std::vector<ParseErrorRecord>& records);

  bool has_errors() const;
  size_t count() const;
  std::vector<ParseErrorRecord> errors() const;

  SyntaxErrorReport report() const;

  static constexpr const char* NO_ERRORS_SUMMARY =
      "No syntax errors were detected in the codebase.";

 private:
  mutable std::mutex mutex_;
  std::vector<ParseErrorRecord> errors_;
};

}  // namespace rag_core
