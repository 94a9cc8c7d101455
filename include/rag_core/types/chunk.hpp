#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "rag_core/types/file.hpp"

namespace rag_core {

// Constructor arguments for a Chunk; designated initializers keep call sites readable
struct ChunkFields {
  std::string content;
  std::string file_path;
  ContentCategory category = ContentCategory::Unknown;
  std::optional<std::string> language;
  std::optional<int> start_line;
  std::optional<int> end_line;
  std::optional<std::string> parent_name;
  std::optional<std::string> entity_name;
  nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @class Chunk
 * @brief An immutable unit of retrievable text with its source provenance.
 *
 * Line numbers are 1-based and inclusive. They are only absent when the chunk
 * covers a whole artifact that has no meaningful lines (pdf, docx).
 * token_estimate() is a whitespace word count, not a model tokenizer.
 */
class Chunk {
 public:
  explicit Chunk(ChunkFields fields);

  const std::string& content() const { return content_; }
  const std::string& file_path() const { return file_path_; }
  ContentCategory category() const { return category_; }
  const std::optional<std::string>& language() const { return language_; }
  std::optional<int> start_line() const { return start_line_; }
  std::optional<int> end_line() const { return end_line_; }
  const std::optional<std::string>& parent_name() const { return parent_name_; }
  const std::optional<std::string>& entity_name() const { return entity_name_; }
  const nlohmann::json& metadata() const { return metadata_; }
  size_t token_estimate() const { return token_estimate_; }

  // Producer tag stored under metadata["kind"]
  std::string kind() const;

  bool operator==(const Chunk& other) const = default;

  static size_t estimate_tokens(const std::string& text);

 private:
  std::string content_;
  std::string file_path_;
  ContentCategory category_;
  std::optional<std::string> language_;
  std::optional<int> start_line_;
  std::optional<int> end_line_;
  std::optional<std::string> parent_name_;
  std::optional<std::string> entity_name_;
  nlohmann::json metadata_;
  size_t token_estimate_;
};

}  // namespace rag_core
