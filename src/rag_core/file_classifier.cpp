#include "rag_core/file_classifier.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <unordered_map>
#include <unordered_set>

#include "rag_core/parsing/structural_parser.hpp"

namespace rag_core {

namespace {

const std::unordered_set<std::string> kDocumentationExtensions = {".md", ".rst", ".txt",
                                                                  ".docx", ".pdf"};
const std::unordered_set<std::string> kConfigurationExtensions = {
    ".json", ".yaml", ".yml", ".toml", ".ini", ".cfg", ".conf"};

const std::unordered_map<std::string, std::string> kCodeExtensions = {
    {".py", "python"},   {".js", "javascript"}, {".ts", "typescript"}, {".tsx", "typescript"},
    {".java", "java"},   {".go", "go"},         {".rb", "ruby"},       {".rs", "rust"},
    {".cpp", "cpp"},     {".cc", "cpp"},        {".cxx", "cpp"},       {".c", "cpp"},
    {".h", "cpp"},       {".hpp", "cpp"},       {".cs", "csharp"}};

std::string lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

std::string to_string(ChunkerKind kind) {
  switch (kind) {
    case ChunkerKind::PythonAst:
      return "python_ast";
    case ChunkerKind::JavaSyntaxTree:
      return "java_syntax_tree";
    case ChunkerKind::GoSyntaxTree:
      return "go_syntax_tree";
    case ChunkerKind::MarkdownHeading:
      return "markdown_heading";
    case ChunkerKind::Windowed:
      return "windowed";
    case ChunkerKind::WholeFile:
      return "whole_file";
    case ChunkerKind::WholeArtifact:
      return "whole_artifact";
  }
  return "windowed";
}

FileClassification FileClassifier::classify(const std::string& file_path) const {
  std::string normalized = file_path;
  std::replace(normalized.begin(), normalized.end(), '\\', '/');

  const std::filesystem::path path(normalized);
  const std::string ext = lowercase(path.extension().string());
  const std::string filename = path.filename().string();

  FileClassification result;

  if (kDocumentationExtensions.count(ext)) {
    result = {ContentCategory::Documentation, ext.substr(1)};
  } else if (kConfigurationExtensions.count(ext)) {
    result = {ContentCategory::Configuration, ext.substr(1)};
  } else if (auto it = kCodeExtensions.find(ext); it != kCodeExtensions.end()) {
    result = {ContentCategory::Code, it->second};
  }

  if (filename == "Dockerfile") {
    result = {ContentCategory::Configuration, "dockerfile"};
  } else if (filename == ".gitignore" || filename == ".dockerignore") {
    result = {ContentCategory::Configuration, "ignore"};
  } else if (filename == "Makefile" || filename == "makefile") {
    result = {ContentCategory::Configuration, "makefile"};
  }

  if (contains(normalized, ".github/workflows") && (ext == ".yml" || ext == ".yaml")) {
    result = {ContentCategory::Configuration, "github_workflow"};
  }

  if (filename == "package.json" || filename == "package-lock.json" || filename == "yarn.lock") {
    result = {ContentCategory::Configuration, "npm"};
  } else if (filename == "requirements.txt" || filename == "Pipfile" ||
             filename == "Pipfile.lock" || filename == "pyproject.toml" ||
             filename == "setup.py") {
    result = {ContentCategory::Configuration, "python_package"};
  }

  // Anything under .github/ is treated as repository metadata, workflows included
  if (contains(normalized, ".github/")) {
    result = {ContentCategory::Configuration, "github"};
  }

  if (verbose_) {
    std::cout << "[Classifier] " << file_path << " -> " << to_string(result.category) << "/"
              << result.language << std::endl;
  }
  return result;
}

ChunkerKind FileClassifier::resolve_chunker_kind(const FileClassification& classification,
                                                 const ParserRegistry& parsers) {
  switch (classification.category) {
    case ContentCategory::Code: {
      const std::string& language = classification.language;
      if (!parsers.has_parser(language)) {
        return ChunkerKind::Windowed;
      }
      if (language == "python")
        return ChunkerKind::PythonAst;
      if (language == "java")
        return ChunkerKind::JavaSyntaxTree;
      if (language == "go")
        return ChunkerKind::GoSyntaxTree;
      return ChunkerKind::Windowed;
    }
    case ContentCategory::Documentation:
      if (classification.language == "md")
        return ChunkerKind::MarkdownHeading;
      if (classification.language == "pdf" || classification.language == "docx")
        return ChunkerKind::WholeArtifact;
      return ChunkerKind::Windowed;
    case ContentCategory::Configuration:
    case ContentCategory::Unknown:
      return ChunkerKind::WholeFile;
  }
  return ChunkerKind::Windowed;
}

}  // namespace rag_core
