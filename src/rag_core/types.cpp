#include "rag_core/types/chunk.hpp"
#include "rag_core/types/file.hpp"

#include <sstream>
#include <stdexcept>

namespace rag_core {

std::string to_string(ContentCategory category) {
  switch (category) {
    case ContentCategory::Code:
      return "code";
    case ContentCategory::Documentation:
      return "documentation";
    case ContentCategory::Configuration:
      return "configuration";
    default:
      return "unknown";
  }
}

ContentCategory content_category_from_string(const std::string& str) {
  if (str == "code")
    return ContentCategory::Code;
  if (str == "documentation")
    return ContentCategory::Documentation;
  if (str == "configuration")
    return ContentCategory::Configuration;
  return ContentCategory::Unknown;
}

Chunk::Chunk(ChunkFields fields)
    : content_(std::move(fields.content)),
      file_path_(std::move(fields.file_path)),
      category_(fields.category),
      language_(std::move(fields.language)),
      start_line_(fields.start_line),
      end_line_(fields.end_line),
      parent_name_(std::move(fields.parent_name)),
      entity_name_(std::move(fields.entity_name)),
      metadata_(fields.metadata.is_object() ? std::move(fields.metadata)
                                            : nlohmann::json::object()),
      token_estimate_(estimate_tokens(content_)) {
  if (start_line_ && end_line_ && *start_line_ > *end_line_) {
    throw std::invalid_argument("Chunk start_line " + std::to_string(*start_line_) +
                                " is after end_line " + std::to_string(*end_line_) +
                                " in " + file_path_);
  }
}

std::string Chunk::kind() const {
  return metadata_.value("kind", std::string());
}

// Whitespace-delimited word count, the same proxy str.split() gives
size_t Chunk::estimate_tokens(const std::string& text) {
  std::istringstream stream(text);
  size_t count = 0;
  std::string word;
  while (stream >> word) {
    ++count;
  }
  return count;
}

}  // namespace rag_core
