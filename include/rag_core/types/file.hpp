#pragma once

#include <string>

namespace rag_core {

// Broad content family a repository file belongs to
enum class ContentCategory { Code, Documentation, Configuration, Unknown };

// Conversion utilities
std::string to_string(ContentCategory category);
ContentCategory content_category_from_string(const std::string& str);

struct FileClassification {
  ContentCategory category = ContentCategory::Unknown;
  std::string language = "unknown";

  bool operator==(const FileClassification& other) const = default;
};

}  // namespace rag_core
