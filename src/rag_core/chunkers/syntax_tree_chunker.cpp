#include "rag_core/chunkers/syntax_tree_chunker.hpp"

#include <algorithm>
#include <cstring>
#include <iostream>

#include "rag_core/text_utils.hpp"

namespace rag_core {

namespace {

bool has_type(TSNode node, const char* type) {
  return !ts_node_is_null(node) && std::strcmp(ts_node_type(node), type) == 0;
}

bool has_any_type(TSNode node, std::initializer_list<const char*> types) {
  return std::any_of(types.begin(), types.end(),
                     [&](const char* type) { return has_type(node, type); });
}

// Pre-order walk that hands matching nodes to visit and does not descend into them
template <typename Predicate, typename Visitor>
void visit_outermost(TSNode root, Predicate matches, Visitor visit) {
  std::vector<TSNode> stack{root};
  while (!stack.empty()) {
    TSNode node = stack.back();
    stack.pop_back();
    if (matches(node)) {
      visit(node);
      continue;
    }
    const uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = count; i > 0; --i) {
      stack.push_back(ts_node_named_child(node, i - 1));
    }
  }
}

}  // namespace

SyntaxTreeChunker::SyntaxTreeChunker(ChunkingOptions options, const StructuralParser* parser,
                                     SyntaxTreeGrammar grammar)
    : ContentChunker(options), parser_(parser), grammar_(std::move(grammar)) {}

std::vector<Chunk> SyntaxTreeChunker::chunk(const std::string& file_path,
                                            const std::string& content,
                                            const FileClassification& classification,
                                            SyntaxErrorTracker& errors) const {
  if (content.empty()) {
    return {};
  }
  if (!parser_) {
    return fallback_windows(file_path, content, classification);
  }

  try {
    SyntaxTree tree = parser_->parse(content);
    if (tree.has_error()) {
      record_tree_errors(tree, file_path, content, classification, errors);
    }

    std::vector<Chunk> chunks = extract_declarations(tree, file_path, classification);
    if (chunks.empty()) {
      return fallback_windows(file_path, content, classification);
    }
    return chunks;
  } catch (const StructuralParseError& e) {
    errors.add_error(file_path, classification.language,
                     std::string("Failed to parse: ") + e.what());
    std::cerr << "[" << grammar_.display_name << "Chunker] Parser failure for " << file_path
              << ": " << e.what() << std::endl;
  } catch (const std::exception& e) {
    errors.add_error(file_path, classification.language,
                     std::string("Failed to chunk: ") + e.what());
    std::cerr << "[" << grammar_.display_name << "Chunker] Error processing " << file_path
              << ": " << e.what() << std::endl;
  }
  return fallback_windows(file_path, content, classification);
}

void SyntaxTreeChunker::record_tree_errors(const SyntaxTree& tree, const std::string& file_path,
                                           const std::string& content,
                                           const FileClassification& classification,
                                           SyntaxErrorTracker& errors) const {
  TSNode root = tree.root();
  const std::vector<TSNode> error_nodes = ts::collect_error_nodes(root);

  if (error_nodes.empty()) {
    errors.add_error(file_path, classification.language,
                     grammar_.display_name + " syntax error detected by tree-sitter");
    std::cerr << "[" << grammar_.display_name << "Chunker] Syntax error in " << file_path
              << std::endl;
    return;
  }

  const std::vector<std::string> lines = text::split_rows(content);
  const int line_count = static_cast<int>(lines.size());

  for (TSNode node : error_nodes) {
    const TSPoint point = ts_node_start_point(node);
    const int line = static_cast<int>(point.row) + 1;
    const int column = static_cast<int>(point.column) + 1;

    const int context_first = std::max(0, line - CONTEXT_LINES - 1);
    const int context_last = std::min(line_count, line + CONTEXT_LINES);
    const std::string context = text::join_lines(lines, context_first + 1, context_last);

    const std::string error_kind = ts::is_error(node) ? "Syntax Error" : "Missing Element";
    const std::string container = containing_element(node, root);

    errors.add_error(file_path, classification.language, error_kind + " in " + container, line,
                     container,
                     {{"column", column},
                      {"context", context},
                      {"error_node_type", ts_node_type(node)},
                      {"containing_element", container}});

    std::cerr << "[" << grammar_.display_name << "Chunker] Syntax error in " << file_path
              << " at line " << line << ", column " << column << std::endl;
  }
}

std::string SyntaxTreeChunker::containing_element(TSNode node, TSNode root) const {
  for (TSNode parent = ts_node_parent(node);
       !ts_node_is_null(parent) && !ts_node_eq(parent, root); parent = ts_node_parent(parent)) {
    const char* type = ts_node_type(parent);
    if (std::find(grammar_.context_types.begin(), grammar_.context_types.end(), type) !=
        grammar_.context_types.end()) {
      return type;
    }
  }
  return "Unknown";
}

Chunk SyntaxTreeChunker::make_node_chunk(const SyntaxTree& tree, TSNode node,
                                         const std::string& file_path,
                                         const FileClassification& classification,
                                         const char* kind, std::string name,
                                         std::optional<std::string> parent) {
  return Chunk({.content = tree.node_text(node),
                .file_path = file_path,
                .category = classification.category,
                .language = classification.language,
                .start_line = ts::start_line(node),
                .end_line = ts::end_line(node),
                .parent_name = std::move(parent),
                .entity_name = std::move(name),
                .metadata = {{"kind", kind}, {"node_type", ts_node_type(node)}}});
}

JavaChunker::JavaChunker(ChunkingOptions options, const StructuralParser* parser)
    : SyntaxTreeChunker(options, parser,
                        {"Java", {"class_declaration", "method_declaration", "field_declaration"}}) {
}

std::vector<Chunk> JavaChunker::extract_declarations(
    const SyntaxTree& tree, const std::string& file_path,
    const FileClassification& classification) const {
  std::vector<Chunk> chunks;

  auto is_class_like = [](TSNode node) {
    return has_any_type(node, {"class_declaration", "interface_declaration", "enum_declaration",
                               "record_declaration"});
  };

  auto add_methods = [&](TSNode container, const std::string& class_name) {
    const uint32_t count = ts_node_named_child_count(container);
    for (uint32_t i = 0; i < count; ++i) {
      TSNode member = ts_node_named_child(container, i);
      if (has_any_type(member, {"method_declaration", "constructor_declaration"})) {
        TSNode name_node = ts::field(member, "name");
        std::string method_name =
            ts_node_is_null(name_node) ? "UnknownMethod" : tree.node_text(name_node);
        chunks.push_back(make_node_chunk(tree, member, file_path, classification, "method",
                                         std::move(method_name), class_name));
      }
    }
  };

  visit_outermost(tree.root(), is_class_like, [&](TSNode class_node) {
    TSNode name_node = ts::field(class_node, "name");
    const std::string class_name =
        ts_node_is_null(name_node) ? "UnknownClass" : tree.node_text(name_node);
    chunks.push_back(make_node_chunk(tree, class_node, file_path, classification, "class",
                                     class_name, std::nullopt));

    TSNode body = ts::field(class_node, "body");
    if (ts_node_is_null(body)) {
      return;
    }
    add_methods(body, class_name);

    // Enum methods live one level further down
    const uint32_t count = ts_node_named_child_count(body);
    for (uint32_t i = 0; i < count; ++i) {
      TSNode child = ts_node_named_child(body, i);
      if (has_type(child, "enum_body_declarations")) {
        add_methods(child, class_name);
      }
    }
  });

  return chunks;
}

GoChunker::GoChunker(ChunkingOptions options, const StructuralParser* parser)
    : SyntaxTreeChunker(
          options, parser,
          {"Go", {"function_declaration", "method_declaration", "type_declaration"}}) {}

std::vector<Chunk> GoChunker::extract_declarations(
    const SyntaxTree& tree, const std::string& file_path,
    const FileClassification& classification) const {
  std::vector<Chunk> chunks;

  auto is_declaration = [](TSNode node) {
    return has_any_type(node, {"function_declaration", "method_declaration", "type_declaration"});
  };

  auto name_of = [&](TSNode node) {
    TSNode name_node = ts::field(node, "name");
    return ts_node_is_null(name_node) ? std::string("unnamed") : tree.node_text(name_node);
  };

  visit_outermost(tree.root(), is_declaration, [&](TSNode node) {
    if (has_type(node, "function_declaration")) {
      chunks.push_back(
          make_node_chunk(tree, node, file_path, classification, "go_decl", name_of(node),
                          std::nullopt));
      return;
    }

    if (has_type(node, "method_declaration")) {
      std::optional<std::string> receiver_type;
      TSNode receiver = ts::field(node, "receiver");
      if (!ts_node_is_null(receiver)) {
        std::vector<TSNode> types = ts::find_descendants(receiver, "type_identifier");
        if (!types.empty()) {
          receiver_type = tree.node_text(types.front());
        }
      }
      chunks.push_back(make_node_chunk(tree, node, file_path, classification, "go_decl",
                                       name_of(node), std::move(receiver_type)));
      return;
    }

    // type_declaration: the whole declaration for one spec, one chunk per spec in a group
    std::vector<TSNode> specs;
    const uint32_t count = ts_node_named_child_count(node);
    for (uint32_t i = 0; i < count; ++i) {
      TSNode child = ts_node_named_child(node, i);
      if (has_any_type(child, {"type_spec", "type_alias"})) {
        specs.push_back(child);
      }
    }
    if (specs.size() == 1) {
      chunks.push_back(make_node_chunk(tree, node, file_path, classification, "go_decl",
                                       name_of(specs.front()), std::nullopt));
      return;
    }
    for (TSNode spec : specs) {
      chunks.push_back(make_node_chunk(tree, spec, file_path, classification, "go_decl",
                                       name_of(spec), std::nullopt));
    }
  });

  return chunks;
}

}  // namespace rag_core
