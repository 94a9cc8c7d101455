#include <gtest/gtest.h>

#include "mocks_test.hpp"
#include "rag_core/chunkers/syntax_tree_chunker.hpp"

namespace rag_tests {

using rag_core::ContentCategory;
using rag_core::GoChunker;
using rag_core::JavaChunker;

namespace {

const char* kJavaSource = R"JAVA(package demo;

public class Greeter {
    private String name;

    public Greeter(String name) {
        this.name = name;
    }

    public String greet() {
        return "hi " + name;
    }
}

enum Color {
    RED, GREEN;

    public String lower() {
        return name().toLowerCase();
    }
}
)JAVA";

const char* kGoSource = R"GO(package main

type Server struct {
	addr string
}

type (
	ID   int
	Name string
)

func (s *Server) Start() error {
	return nil
}

func main() {
}
)GO";

}  // namespace

class SyntaxTreeChunkerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    parsers_ = rag_core::ParserRegistry::with_default_grammars();
  }

  std::vector<rag_core::Chunk> chunk_java(const std::string& content) {
    JavaChunker chunker(rag_core::ChunkingOptions{}, parsers_.find("java"));
    return chunker.chunk("src/Greeter.java", content, {ContentCategory::Code, "java"}, errors_);
  }

  std::vector<rag_core::Chunk> chunk_go(const std::string& content) {
    GoChunker chunker(rag_core::ChunkingOptions{}, parsers_.find("go"));
    return chunker.chunk("cmd/main.go", content, {ContentCategory::Code, "go"}, errors_);
  }

  rag_core::ParserRegistry parsers_;
  rag_core::SyntaxErrorTracker errors_;
};

TEST_F(SyntaxTreeChunkerTest, JavaClassesAndMembers) {
  auto chunks = chunk_java(kJavaSource);

  ASSERT_EQ(chunks.size(), 5u);
  EXPECT_EQ(chunks[0].kind(), "class");
  EXPECT_EQ(chunks[0].entity_name(), "Greeter");
  EXPECT_EQ(chunks[0].start_line(), 3);
  EXPECT_EQ(chunks[0].end_line(), 13);
  EXPECT_EQ(chunks[0].content().rfind("public class Greeter", 0), 0u);

  EXPECT_EQ(chunks[1].kind(), "method");
  EXPECT_EQ(chunks[1].entity_name(), "Greeter");
  EXPECT_EQ(chunks[1].parent_name(), "Greeter");
  EXPECT_EQ(chunks[1].metadata()["node_type"], "constructor_declaration");
  EXPECT_EQ(chunks[1].start_line(), 6);
  EXPECT_EQ(chunks[1].end_line(), 8);

  EXPECT_EQ(chunks[2].entity_name(), "greet");
  EXPECT_EQ(chunks[2].parent_name(), "Greeter");

  EXPECT_EQ(chunks[3].kind(), "class");
  EXPECT_EQ(chunks[3].entity_name(), "Color");
  EXPECT_EQ(chunks[3].metadata()["node_type"], "enum_declaration");

  EXPECT_EQ(chunks[4].entity_name(), "lower");
  EXPECT_EQ(chunks[4].parent_name(), "Color");
  EXPECT_EQ(chunks[4].start_line(), 18);
  EXPECT_EQ(chunks[4].end_line(), 20);

  EXPECT_FALSE(errors_.has_errors());
}

TEST_F(SyntaxTreeChunkerTest, JavaSyntaxErrorsAreRecordedWithContext) {
  auto chunks = chunk_java(
      "public class Broken {\n"
      "    void m() {\n"
      "        int x = ;\n"
      "    }\n"
      "}\n");

  EXPECT_FALSE(chunks.empty());
  ASSERT_TRUE(errors_.has_errors());
  for (const auto& error : errors_.errors()) {
    EXPECT_EQ(error.language, "java");
    EXPECT_EQ(error.file_path, "src/Greeter.java");
    ASSERT_TRUE(error.line_number.has_value());
    EXPECT_GE(*error.line_number, 1);
    EXPECT_LE(*error.line_number, 5);
    EXPECT_TRUE(error.message.rfind("Syntax Error in ", 0) == 0 ||
                error.message.rfind("Missing Element in ", 0) == 0)
        << error.message;
    EXPECT_TRUE(error.metadata.contains("column"));
    EXPECT_TRUE(error.metadata.contains("context"));
    EXPECT_TRUE(error.metadata.contains("error_node_type"));
    EXPECT_EQ(error.metadata["containing_element"], error.containing_entity.value());
  }
}

TEST_F(SyntaxTreeChunkerTest, JavaWithoutDeclarationsFallsBackToWindows) {
  auto chunks = chunk_java("// only a comment\n");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].kind(), "size_based_chunk");
  EXPECT_FALSE(errors_.has_errors());
}

TEST_F(SyntaxTreeChunkerTest, GoDeclarations) {
  auto chunks = chunk_go(kGoSource);

  ASSERT_EQ(chunks.size(), 5u);
  EXPECT_EQ(chunks[0].entity_name(), "Server");
  EXPECT_EQ(chunks[0].start_line(), 3);
  EXPECT_EQ(chunks[0].end_line(), 5);
  EXPECT_EQ(chunks[0].kind(), "go_decl");
  EXPECT_EQ(chunks[0].metadata()["node_type"], "type_declaration");

  EXPECT_EQ(chunks[1].entity_name(), "ID");
  EXPECT_EQ(chunks[1].metadata()["node_type"], "type_spec");
  EXPECT_EQ(chunks[2].entity_name(), "Name");

  EXPECT_EQ(chunks[3].entity_name(), "Start");
  EXPECT_EQ(chunks[3].parent_name(), "Server");
  EXPECT_EQ(chunks[3].start_line(), 12);
  EXPECT_EQ(chunks[3].end_line(), 14);

  EXPECT_EQ(chunks[4].entity_name(), "main");
  EXPECT_FALSE(chunks[4].parent_name().has_value());

  EXPECT_FALSE(errors_.has_errors());
}

TEST_F(SyntaxTreeChunkerTest, GoSyntaxErrorIsRecordedAndOutputIsNonEmpty) {
  auto chunks = chunk_go("package main\n\nfunc broken( {\n}\n");

  EXPECT_FALSE(chunks.empty());
  ASSERT_TRUE(errors_.has_errors());
  EXPECT_EQ(errors_.errors().front().language, "go");
}

TEST_F(SyntaxTreeChunkerTest, ParserFailureFallsBackToWindows) {
  FailingParser failing("go");
  GoChunker chunker(rag_core::ChunkingOptions{}, &failing);
  auto chunks = chunker.chunk("x.go", "package x\n", {ContentCategory::Code, "go"}, errors_);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].kind(), "size_based_chunk");
  ASSERT_EQ(errors_.count(), 1u);
  EXPECT_EQ(errors_.errors().front().message, "Failed to parse: parser exploded");
}

TEST_F(SyntaxTreeChunkerTest, KindsIdentifyTheLanguage) {
  JavaChunker java(rag_core::ChunkingOptions{}, nullptr);
  GoChunker go(rag_core::ChunkingOptions{}, nullptr);
  EXPECT_EQ(java.kind(), rag_core::ChunkerKind::JavaSyntaxTree);
  EXPECT_EQ(go.kind(), rag_core::ChunkerKind::GoSyntaxTree);
}

}  // namespace rag_tests
