#include "rag_core/syntax_error_tracker.hpp"

#include <algorithm>
#include <sstream>

namespace rag_core {

void SyntaxErrorTracker::add_error(const std::string& file_path, const std::string& language,
                                   const std::string& message, std::optional<int> line_number,
                                   std::optional<std::string> containing_entity,
                                   nlohmann::json metadata) {
  ParseErrorRecord record{file_path,   language, message, line_number, std::move(containing_entity),
                          std::move(metadata)};
  std::lock_guard<std::mutex> lock(mutex_);
  errors_.push_back(std::move(record));
}

void SyntaxErrorTracker::append(const std::vector<ParseErrorRecord>& records) {
  if (records.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  errors_.insert(errors_.end(), records.begin(), records.end());
}

bool SyntaxErrorTracker::has_errors() const {
  return count() > 0;
}

size_t SyntaxErrorTracker::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return errors_.size();
}

std::vector<ParseErrorRecord> SyntaxErrorTracker::errors() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return errors_;
}

SyntaxErrorReport SyntaxErrorTracker::report() const {
  SyntaxErrorReport report;
  report.errors = errors();
  report.error_count = report.errors.size();

  if (report.errors.empty()) {
    report.summary = NO_ERRORS_SUMMARY;
    return report;
  }

  report.has_syntax_errors = true;
  for (const auto& error : report.errors) {
    auto group = std::find_if(report.errors_by_language.begin(), report.errors_by_language.end(),
                              [&](const auto& entry) { return entry.first == error.language; });
    if (group == report.errors_by_language.end()) {
      report.errors_by_language.push_back({error.language, {error}});
    } else {
      group->second.push_back(error);
    }
  }

  std::ostringstream summary;
  summary << "Found " << report.error_count << " syntax errors across "
          << report.errors_by_language.size() << " languages: ";
  for (size_t i = 0; i < report.errors_by_language.size(); ++i) {
    if (i > 0) {
      summary << ", ";
    }
    summary << report.errors_by_language[i].first;
  }
  report.summary = summary.str();
  return report;
}

}  // namespace rag_core
