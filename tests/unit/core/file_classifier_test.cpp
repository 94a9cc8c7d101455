#include <gtest/gtest.h>

#include "mocks_test.hpp"
#include "rag_core/file_classifier.hpp"
#include "rag_core/parsing/structural_parser.hpp"

namespace rag_tests {

using rag_core::ChunkerKind;
using rag_core::ContentCategory;
using rag_core::FileClassification;
using rag_core::FileClassifier;

class FileClassifierTest : public ::testing::Test {
 protected:
  FileClassification classify(const std::string& path) const {
    return classifier_.classify(path);
  }

  FileClassifier classifier_;
};

TEST_F(FileClassifierTest, ClassifiesByExtension) {
  EXPECT_EQ(classify("src/app.py"), (FileClassification{ContentCategory::Code, "python"}));
  EXPECT_EQ(classify("Main.java"), (FileClassification{ContentCategory::Code, "java"}));
  EXPECT_EQ(classify("cmd/server.go"), (FileClassification{ContentCategory::Code, "go"}));
  EXPECT_EQ(classify("web/index.tsx"), (FileClassification{ContentCategory::Code, "typescript"}));
  EXPECT_EQ(classify("lib/x.c"), (FileClassification{ContentCategory::Code, "cpp"}));
  EXPECT_EQ(classify("docs/guide.md"), (FileClassification{ContentCategory::Documentation, "md"}));
  EXPECT_EQ(classify("notes.txt"), (FileClassification{ContentCategory::Documentation, "txt"}));
  EXPECT_EQ(classify("settings.yaml"),
            (FileClassification{ContentCategory::Configuration, "yaml"}));
}

TEST_F(FileClassifierTest, ExtensionsAreCaseInsensitive) {
  EXPECT_EQ(classify("README.MD"), (FileClassification{ContentCategory::Documentation, "md"}));
  EXPECT_EQ(classify("Tool.PY"), (FileClassification{ContentCategory::Code, "python"}));
}

TEST_F(FileClassifierTest, NoExtensionIsUnknown) {
  EXPECT_EQ(classify("LICENSE"), (FileClassification{ContentCategory::Unknown, "unknown"}));
  EXPECT_EQ(classify("bin/run"), (FileClassification{ContentCategory::Unknown, "unknown"}));
}

TEST_F(FileClassifierTest, SpecialFilenamesOverrideExtensions) {
  EXPECT_EQ(classify("Dockerfile"),
            (FileClassification{ContentCategory::Configuration, "dockerfile"}));
  EXPECT_EQ(classify("sub/.gitignore"),
            (FileClassification{ContentCategory::Configuration, "ignore"}));
  EXPECT_EQ(classify("makefile"), (FileClassification{ContentCategory::Configuration, "makefile"}));
}

TEST_F(FileClassifierTest, PackageManifestsAreConfiguration) {
  EXPECT_EQ(classify("package.json"), (FileClassification{ContentCategory::Configuration, "npm"}));
  EXPECT_EQ(classify("requirements.txt"),
            (FileClassification{ContentCategory::Configuration, "python_package"}));
  EXPECT_EQ(classify("setup.py"),
            (FileClassification{ContentCategory::Configuration, "python_package"}));
  EXPECT_EQ(classify("pyproject.toml"),
            (FileClassification{ContentCategory::Configuration, "python_package"}));
}

TEST_F(FileClassifierTest, GithubDirectoryWinsOverWorkflowRule) {
  EXPECT_EQ(classify(".github/workflows/ci.yml"),
            (FileClassification{ContentCategory::Configuration, "github"}));
  EXPECT_EQ(classify(".github/ISSUE_TEMPLATE.md"),
            (FileClassification{ContentCategory::Configuration, "github"}));
}

TEST_F(FileClassifierTest, BackslashesAreNormalized) {
  EXPECT_EQ(classify(".github\\workflows\\ci.yml"),
            (FileClassification{ContentCategory::Configuration, "github"}));
  EXPECT_EQ(classify("src\\main.go"), (FileClassification{ContentCategory::Code, "go"}));
}

TEST_F(FileClassifierTest, ClassificationIsDeterministic) {
  for (const std::string path : {"a/b/c.py", "README.md", ".github/x.yml", "weird.name.tar"}) {
    EXPECT_EQ(classify(path), classify(path));
  }
}

TEST(ResolveChunkerKindTest, StructuralKindsNeedARegisteredParser) {
  rag_core::ParserRegistry empty;
  EXPECT_EQ(FileClassifier::resolve_chunker_kind({ContentCategory::Code, "python"}, empty),
            ChunkerKind::Windowed);

  rag_core::ParserRegistry registry;
  registry.register_parser(std::make_unique<FailingParser>("python"));
  registry.register_parser(std::make_unique<FailingParser>("java"));
  registry.register_parser(std::make_unique<FailingParser>("go"));
  EXPECT_EQ(FileClassifier::resolve_chunker_kind({ContentCategory::Code, "python"}, registry),
            ChunkerKind::PythonAst);
  EXPECT_EQ(FileClassifier::resolve_chunker_kind({ContentCategory::Code, "java"}, registry),
            ChunkerKind::JavaSyntaxTree);
  EXPECT_EQ(FileClassifier::resolve_chunker_kind({ContentCategory::Code, "go"}, registry),
            ChunkerKind::GoSyntaxTree);
  EXPECT_EQ(FileClassifier::resolve_chunker_kind({ContentCategory::Code, "rust"}, registry),
            ChunkerKind::Windowed);
}

TEST(ResolveChunkerKindTest, NonCodeCategories) {
  rag_core::ParserRegistry registry;
  EXPECT_EQ(FileClassifier::resolve_chunker_kind({ContentCategory::Documentation, "md"}, registry),
            ChunkerKind::MarkdownHeading);
  EXPECT_EQ(FileClassifier::resolve_chunker_kind({ContentCategory::Documentation, "pdf"}, registry),
            ChunkerKind::WholeArtifact);
  EXPECT_EQ(FileClassifier::resolve_chunker_kind({ContentCategory::Documentation, "txt"}, registry),
            ChunkerKind::Windowed);
  EXPECT_EQ(
      FileClassifier::resolve_chunker_kind({ContentCategory::Configuration, "json"}, registry),
      ChunkerKind::WholeFile);
  EXPECT_EQ(FileClassifier::resolve_chunker_kind({ContentCategory::Unknown, "unknown"}, registry),
            ChunkerKind::WholeFile);
}

}  // namespace rag_tests
