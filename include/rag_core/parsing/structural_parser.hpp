#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <tree_sitter/api.h>

namespace rag_core {

class StructuralParseError : public std::exception {
 public:
  explicit StructuralParseError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class SyntaxTree
 * @brief Owns a tree-sitter tree together with a view of the source it was built from.
 *
 * The source must outlive the tree; chunkers parse and walk within one call so
 * the file content they were given is always still alive.
 */
class SyntaxTree {
 public:
  SyntaxTree(TSTree* tree, std::string_view source);
  ~SyntaxTree();

  SyntaxTree(const SyntaxTree&) = delete;
  SyntaxTree& operator=(const SyntaxTree&) = delete;
  SyntaxTree(SyntaxTree&& other) noexcept;
  SyntaxTree& operator=(SyntaxTree&& other) noexcept;

  TSNode root() const;
  bool has_error() const;
  std::string_view source() const { return source_; }

  // Exact byte span of a node
  std::string node_text(TSNode node) const;

 private:
  TSTree* tree_;
  std::string_view source_;
};

// Iterative helpers over tree-sitter nodes; no recursion, so deep trees cannot exhaust the stack
namespace ts {

bool is_error(TSNode node);

// ERROR and missing nodes in document order
std::vector<TSNode> collect_error_nodes(TSNode root);

// First ERROR or missing node in document order, a null node when there is none
TSNode first_error_node(TSNode root);

// 1-based lines; a node ending at column 0 ends on the previous line
int start_line(TSNode node);
int end_line(TSNode node);

TSNode field(TSNode node, const char* field_name);

// Every node of the given type inside node, outer ones first, in document order
std::vector<TSNode> find_descendants(TSNode node, const char* type);

}  // namespace ts

// Grammar-backed parser for one language
class StructuralParser {
 public:
  virtual ~StructuralParser() = default;

  virtual const std::string& language() const = 0;

  // Throws StructuralParseError when no tree could be produced at all
  virtual SyntaxTree parse(std::string_view source) const = 0;
};

class TreeSitterParser : public StructuralParser {
 public:
  TreeSitterParser(std::string language, const TSLanguage* grammar);

  const std::string& language() const override { return language_; }
  SyntaxTree parse(std::string_view source) const override;

 private:
  std::string language_;
  const TSLanguage* grammar_;
};

/**
 * @class ParserRegistry
 * @brief Structural parsers keyed by classifier language tag.
 *
 * A language with no entry here is chunked by size windows. Registering a
 * parser is how new languages gain structural chunking.
 */
class ParserRegistry {
 public:
  ParserRegistry() = default;

  ParserRegistry(const ParserRegistry&) = delete;
  ParserRegistry& operator=(const ParserRegistry&) = delete;
  ParserRegistry(ParserRegistry&&) = default;
  ParserRegistry& operator=(ParserRegistry&&) = default;

  void register_parser(std::unique_ptr<StructuralParser> parser);
  bool has_parser(const std::string& language) const;

  // nullptr when the language has no parser
  const StructuralParser* find(const std::string& language) const;

  // python, java and go tree-sitter grammars
  static ParserRegistry with_default_grammars();

 private:
  std::unordered_map<std::string, std::unique_ptr<StructuralParser>> parsers_;
};

}  // namespace rag_core
