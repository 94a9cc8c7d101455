#include "rag_core/parsing/structural_parser.hpp"

#include <cstdint>
#include <cstring>
#include <stdexcept>

extern "C" {
const TSLanguage* tree_sitter_python();
const TSLanguage* tree_sitter_java();
const TSLanguage* tree_sitter_go();
}

namespace rag_core {

namespace ts {

bool is_error(TSNode node) {
  return std::strcmp(ts_node_type(node), "ERROR") == 0;
}

std::vector<TSNode> collect_error_nodes(TSNode root) {
  std::vector<TSNode> found;
  if (ts_node_is_null(root) || !ts_node_has_error(root)) {
    return found;
  }

  std::vector<TSNode> stack{root};
  while (!stack.empty()) {
    TSNode node = stack.back();
    stack.pop_back();

    if (is_error(node) || ts_node_is_missing(node)) {
      found.push_back(node);
    }

    // Reverse push keeps the walk in document order
    const uint32_t count = ts_node_child_count(node);
    for (uint32_t i = count; i > 0; --i) {
      TSNode child = ts_node_child(node, i - 1);
      if (ts_node_has_error(child) || ts_node_is_missing(child)) {
        stack.push_back(child);
      }
    }
  }
  return found;
}

TSNode first_error_node(TSNode root) {
  std::vector<TSNode> errors = collect_error_nodes(root);
  return errors.empty() ? TSNode{} : errors.front();
}

int start_line(TSNode node) {
  return static_cast<int>(ts_node_start_point(node).row) + 1;
}

int end_line(TSNode node) {
  const TSPoint start = ts_node_start_point(node);
  const TSPoint end = ts_node_end_point(node);
  if (end.column == 0 && end.row > start.row) {
    return static_cast<int>(end.row);
  }
  return static_cast<int>(end.row) + 1;
}

TSNode field(TSNode node, const char* field_name) {
  return ts_node_child_by_field_name(node, field_name,
                                     static_cast<uint32_t>(std::strlen(field_name)));
}

std::vector<TSNode> find_descendants(TSNode node, const char* type) {
  std::vector<TSNode> found;
  std::vector<TSNode> stack{node};
  while (!stack.empty()) {
    TSNode current = stack.back();
    stack.pop_back();
    if (std::strcmp(ts_node_type(current), type) == 0) {
      found.push_back(current);
    }
    const uint32_t count = ts_node_named_child_count(current);
    for (uint32_t i = count; i > 0; --i) {
      stack.push_back(ts_node_named_child(current, i - 1));
    }
  }
  return found;
}

}  // namespace ts

SyntaxTree::SyntaxTree(TSTree* tree, std::string_view source) : tree_(tree), source_(source) {
  if (!tree_) {
    throw StructuralParseError("SyntaxTree requires a parsed tree");
  }
}

SyntaxTree::~SyntaxTree() {
  if (tree_) {
    ts_tree_delete(tree_);
  }
}

SyntaxTree::SyntaxTree(SyntaxTree&& other) noexcept
    : tree_(other.tree_), source_(other.source_) {
  other.tree_ = nullptr;
}

SyntaxTree& SyntaxTree::operator=(SyntaxTree&& other) noexcept {
  if (this != &other) {
    if (tree_) {
      ts_tree_delete(tree_);
    }
    tree_ = other.tree_;
    source_ = other.source_;
    other.tree_ = nullptr;
  }
  return *this;
}

TSNode SyntaxTree::root() const {
  return ts_tree_root_node(tree_);
}

bool SyntaxTree::has_error() const {
  return ts_node_has_error(root());
}

std::string SyntaxTree::node_text(TSNode node) const {
  if (ts_node_is_null(node)) {
    return {};
  }
  const uint32_t start = ts_node_start_byte(node);
  const uint32_t end = ts_node_end_byte(node);
  if (start >= source_.size() || end <= start) {
    return {};
  }
  return std::string(source_.substr(start, end - start));
}

TreeSitterParser::TreeSitterParser(std::string language, const TSLanguage* grammar)
    : language_(std::move(language)), grammar_(grammar) {
  if (!grammar_) {
    throw StructuralParseError("No tree-sitter grammar supplied for " + language_);
  }
}

SyntaxTree TreeSitterParser::parse(std::string_view source) const {
  // TSParser is not thread safe, so every parse gets its own
  TSParser* parser = ts_parser_new();
  if (!parser) {
    throw StructuralParseError("Failed to create tree-sitter parser for " + language_);
  }

  if (!ts_parser_set_language(parser, grammar_)) {
    ts_parser_delete(parser);
    throw StructuralParseError("Incompatible tree-sitter grammar version for " + language_);
  }

  TSTree* tree = ts_parser_parse_string(parser, nullptr, source.data(),
                                        static_cast<uint32_t>(source.size()));
  ts_parser_delete(parser);

  if (!tree) {
    throw StructuralParseError("tree-sitter returned no tree for " + language_ + " source");
  }
  return SyntaxTree(tree, source);
}

void ParserRegistry::register_parser(std::unique_ptr<StructuralParser> parser) {
  if (!parser) {
    throw std::invalid_argument("Cannot register a null structural parser");
  }
  const std::string language = parser->language();
  parsers_[language] = std::move(parser);
}

bool ParserRegistry::has_parser(const std::string& language) const {
  return parsers_.count(language) > 0;
}

const StructuralParser* ParserRegistry::find(const std::string& language) const {
  auto it = parsers_.find(language);
  return it == parsers_.end() ? nullptr : it->second.get();
}

ParserRegistry ParserRegistry::with_default_grammars() {
  ParserRegistry registry;
  registry.register_parser(std::make_unique<TreeSitterParser>("python", tree_sitter_python()));
  registry.register_parser(std::make_unique<TreeSitterParser>("java", tree_sitter_java()));
  registry.register_parser(std::make_unique<TreeSitterParser>("go", tree_sitter_go()));
  return registry;
}

}  // namespace rag_core
