#include "rag_core/run_report.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace rag_core {

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
  return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::filesystem::path write_json(const nlohmann::json& document,
                                 const std::filesystem::path& output_dir,
                                 const std::string& file_name) {
  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    throw std::runtime_error("Failed to create output directory " + output_dir.string() + ": " +
                             ec.message());
  }

  const std::filesystem::path path = output_dir / file_name;
  std::ofstream out(path);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to open report file for writing: " + path.string());
  }
  out << document.dump(2);
  if (!out) {
    throw std::runtime_error("Failed to write report file: " + path.string());
  }
  std::cout << "[RunReport] Wrote " << path.string() << std::endl;
  return path;
}

}  // namespace

void to_json(nlohmann::json& j, const Chunk& chunk) {
  j = nlohmann::json{{"content", chunk.content()},
                     {"file_path", chunk.file_path()},
                     {"chunk_type", to_string(chunk.category())},
                     {"start_line", optional_to_json(chunk.start_line())},
                     {"end_line", optional_to_json(chunk.end_line())},
                     {"language", optional_to_json(chunk.language())},
                     {"parent", optional_to_json(chunk.parent_name())},
                     {"name", optional_to_json(chunk.entity_name())},
                     {"token_count", chunk.token_estimate()},
                     {"metadata", chunk.metadata()}};
}

void to_json(nlohmann::json& j, const ParseErrorRecord& record) {
  j = nlohmann::json{{"file_path", record.file_path},
                     {"language", record.language},
                     {"error_msg", record.message},
                     {"line_number", optional_to_json(record.line_number)},
                     {"function_name", optional_to_json(record.containing_entity)},
                     {"metadata", record.metadata}};
}

void to_json(nlohmann::json& j, const SyntaxErrorReport& report) {
  nlohmann::json by_language = nlohmann::json::object();
  for (const auto& [language, records] : report.errors_by_language) {
    by_language[language] = records;
  }
  j = nlohmann::json{{"has_syntax_errors", report.has_syntax_errors},
                     {"error_count", report.error_count},
                     {"summary", report.summary},
                     {"errors", report.errors},
                     {"errors_by_language", by_language}};
}

void to_json(nlohmann::json& j, const RunStatistics& stats) {
  j = nlohmann::json{{"files_processed", stats.files_processed},
                     {"chunks_created", stats.chunks_created},
                     {"files_by_type", stats.files_by_type},
                     {"chunks_by_type", stats.chunks_by_type},
                     {"processing_time", stats.processing_time},
                     {"errors", stats.errors}};
}

void to_json(nlohmann::json& j, const FileRecord& record) {
  j = nlohmann::json{{"file_path", record.file_path},
                     {"category", to_string(record.category)},
                     {"language", record.language},
                     {"content_hash", record.content_hash},
                     {"chunk_count", record.chunk_count}};
}

nlohmann::json build_run_report(const RunContext& context) {
  return nlohmann::json{{"repository", context.repository_name()},
                        {"stats", context.statistics()},
                        {"files", context.files()},
                        {"chunks", context.chunks()}};
}

std::filesystem::path write_run_report(const RunContext& context,
                                       const std::filesystem::path& output_dir) {
  return write_json(build_run_report(context), output_dir,
                    context.repository_name() + "_chunks.json");
}

std::filesystem::path write_syntax_error_report(const RunContext& context,
                                                const std::filesystem::path& output_dir) {
  return write_json(nlohmann::json(context.error_tracker().report()), output_dir,
                    context.repository_name() + "_syntax_errors.json");
}

}  // namespace rag_core
