#include "rag_core/chunkers/python_chunker.hpp"

#include <cstring>
#include <iostream>
#include <iterator>

#include "rag_core/text_utils.hpp"

namespace rag_core {

namespace {

bool has_type(TSNode node, const char* type) {
  return !ts_node_is_null(node) && std::strcmp(ts_node_type(node), type) == 0;
}

// Looks through a decorator wrapper to the class or function it decorates
TSNode unwrap_decorated(TSNode node) {
  if (has_type(node, "decorated_definition")) {
    return ts::field(node, "definition");
  }
  return node;
}

}  // namespace

PythonChunker::PythonChunker(ChunkingOptions options, const StructuralParser* parser)
    : ContentChunker(options), parser_(parser) {}

std::vector<Chunk> PythonChunker::chunk(const std::string& file_path, const std::string& content,
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
      TSNode bad = ts::first_error_node(tree.root());
      std::optional<int> line;
      std::string message = "invalid syntax";
      if (!ts_node_is_null(bad)) {
        line = ts::start_line(bad);
        if (ts_node_is_missing(bad)) {
          message = std::string("missing ") + ts_node_type(bad);
        }
      }
      errors.add_error(file_path, classification.language, message, line);
      std::cerr << "[PythonChunker] Syntax error in " << file_path
                << (line ? " at line " + std::to_string(*line) : std::string())
                << ", falling back to size windows" << std::endl;
      return fallback_windows(file_path, content, classification);
    }

    const std::vector<std::string> lines = text::split_rows(content);
    std::vector<Chunk> chunks = extract_definitions(tree, file_path, lines, classification);

    if (chunks.empty()) {
      chunks.emplace_back(ChunkFields{.content = content,
                                      .file_path = file_path,
                                      .category = classification.category,
                                      .language = classification.language,
                                      .start_line = 1,
                                      .end_line = static_cast<int>(lines.size()),
                                      .metadata = {{"kind", "whole_file"}}});
    }
    return chunks;
  } catch (const StructuralParseError& e) {
    errors.add_error(file_path, classification.language,
                     std::string("Failed to parse: ") + e.what());
    std::cerr << "[PythonChunker] Parser failure for " << file_path << ": " << e.what()
              << std::endl;
  } catch (const std::exception& e) {
    errors.add_error(file_path, classification.language,
                     std::string("Failed to chunk: ") + e.what());
    std::cerr << "[PythonChunker] Error processing " << file_path << ": " << e.what()
              << std::endl;
  }
  return fallback_windows(file_path, content, classification);
}

std::vector<Chunk> PythonChunker::extract_definitions(
    const SyntaxTree& tree, const std::string& file_path, const std::vector<std::string>& lines,
    const FileClassification& classification) const {
  std::vector<Chunk> class_chunks;
  std::vector<Chunk> function_chunks;

  auto make_chunk = [&](TSNode node, const std::string& name, const char* kind,
                        std::optional<std::string> parent) {
    const int first = ts::start_line(node);
    const int last = ts::end_line(node);
    return Chunk({.content = text::join_lines(lines, first, last),
                  .file_path = file_path,
                  .category = classification.category,
                  .language = classification.language,
                  .start_line = first,
                  .end_line = last,
                  .parent_name = std::move(parent),
                  .entity_name = name,
                  .metadata = {{"kind", kind}}});
  };

  TSNode root = tree.root();
  const uint32_t count = ts_node_named_child_count(root);
  for (uint32_t i = 0; i < count; ++i) {
    TSNode definition = unwrap_decorated(ts_node_named_child(root, i));

    if (has_type(definition, "class_definition")) {
      const std::string class_name = tree.node_text(ts::field(definition, "name"));
      class_chunks.push_back(make_chunk(definition, class_name, "class", std::nullopt));

      TSNode body = ts::field(definition, "body");
      if (ts_node_is_null(body)) {
        continue;
      }
      const uint32_t members = ts_node_named_child_count(body);
      for (uint32_t m = 0; m < members; ++m) {
        TSNode method = unwrap_decorated(ts_node_named_child(body, m));
        if (!has_type(method, "function_definition")) {
          continue;
        }
        class_chunks.push_back(make_chunk(method, tree.node_text(ts::field(method, "name")),
                                          "method", class_name));
      }
    } else if (has_type(definition, "function_definition")) {
      function_chunks.push_back(make_chunk(definition, tree.node_text(ts::field(definition, "name")),
                                           "function", std::nullopt));
    }
  }

  class_chunks.insert(class_chunks.end(), std::make_move_iterator(function_chunks.begin()),
                      std::make_move_iterator(function_chunks.end()));
  return class_chunks;
}

}  // namespace rag_core
