#include <gtest/gtest.h>

#include "rag_core/chunkers/markdown_chunker.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using rag_core::ContentCategory;
using rag_core::MarkdownChunker;

class MarkdownChunkerTest : public ::testing::Test {
 protected:
  std::vector<rag_core::Chunk> chunk(const std::string& content) {
    return chunker_.chunk("docs/guide.md", content, {ContentCategory::Documentation, "md"},
                          errors_);
  }

  MarkdownChunker chunker_{rag_core::ChunkingOptions{}};
  rag_core::SyntaxErrorTracker errors_;
};

TEST_F(MarkdownChunkerTest, SplitsAtHeadings) {
  auto chunks = chunk("# A\nx\n## B\ny");

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].entity_name(), "A");
  EXPECT_EQ(chunks[0].metadata()["heading_level"], 1);
  EXPECT_EQ(chunks[0].kind(), "markdown_section");
  EXPECT_EQ(chunks[0].content(), "# A\nx\n");
  EXPECT_EQ(chunks[0].start_line(), 1);
  EXPECT_EQ(chunks[0].end_line(), 2);

  EXPECT_EQ(chunks[1].entity_name(), "B");
  EXPECT_EQ(chunks[1].metadata()["heading_level"], 2);
  EXPECT_EQ(chunks[1].content(), "## B\ny");
  EXPECT_EQ(chunks[1].start_line(), 3);
  EXPECT_EQ(chunks[1].end_line(), 4);
}

TEST_F(MarkdownChunkerTest, TextBeforeFirstHeadingBecomesIntroduction) {
  auto chunks = chunk("Some preface\nmore preface\n\n# Title\nbody\n");

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].entity_name(), "Introduction");
  EXPECT_EQ(chunks[0].kind(), "markdown_intro");
  EXPECT_EQ(chunks[0].start_line(), 1);
  EXPECT_EQ(chunks[0].end_line(), 3);

  EXPECT_EQ(chunks[1].entity_name(), "Title");
  EXPECT_EQ(chunks[1].start_line(), 4);
  EXPECT_EQ(chunks[1].end_line(), 5);
}

TEST_F(MarkdownChunkerTest, BlankPrefixIsDropped) {
  auto chunks = chunk("\n\n# Only\ntext");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].entity_name(), "Only");
  EXPECT_EQ(chunks[0].start_line(), 3);
}

TEST_F(MarkdownChunkerTest, HeadingTextIsTrimmed) {
  auto chunks = chunk("###   Spaced out   \ncontent");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].entity_name(), "Spaced out");
  EXPECT_EQ(chunks[0].metadata()["heading_level"], 3);
}

TEST_F(MarkdownChunkerTest, SevenHashesIsNotAHeading) {
  auto chunks = chunk("####### not a heading\nplain text");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].kind(), "size_based_chunk");
}

TEST_F(MarkdownChunkerTest, NoHeadingsFallsBackToWindows) {
  const std::string content = TestUtilities::numbered_lines(5, "paragraph ");
  auto chunks = chunk(content);

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].kind(), "size_based_chunk");
  EXPECT_EQ(chunks[0].start_line(), 1);
  EXPECT_EQ(chunks[0].end_line(), 5);
  EXPECT_FALSE(errors_.has_errors());
}

TEST_F(MarkdownChunkerTest, SectionsCoverTheDocument) {
  const std::string content = "intro\n# One\na\nb\n## Two\nc\n# Three\nd\ne\n";
  auto chunks = chunk(content);

  ASSERT_EQ(chunks.size(), 4u);
  std::string reassembled;
  for (const auto& c : chunks) {
    reassembled += c.content();
  }
  EXPECT_EQ(reassembled, content);
  for (size_t i = 1; i < chunks.size(); ++i) {
    EXPECT_EQ(*chunks[i].start_line(), *chunks[i - 1].end_line() + 1);
  }
}

TEST_F(MarkdownChunkerTest, VeryLongHeadingLine) {
  const std::string title(100000, 'h');
  auto chunks = chunk("# " + title + "\nbody\n");

  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].entity_name(), title);
  EXPECT_EQ(chunks[0].start_line(), 1);
  EXPECT_EQ(chunks[0].end_line(), 2);
}

TEST_F(MarkdownChunkerTest, HeadingTextNeverSpansLines) {
  const std::string payload(60000, 'Q');
  auto chunks = chunk("#\n" + payload + "\n## Real\ntext\n");

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].kind(), "markdown_intro");
  EXPECT_EQ(chunks[0].end_line(), 2);
  EXPECT_EQ(chunks[1].entity_name(), "Real");
  EXPECT_EQ(chunks[1].start_line(), 3);
}

TEST_F(MarkdownChunkerTest, HashWithoutSpaceIsNotAHeading) {
  auto chunks = chunk("#hashtag\n#   \nplain\n");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_EQ(chunks[0].kind(), "size_based_chunk");
}

TEST_F(MarkdownChunkerTest, CrLfHeadings) {
  auto chunks = chunk("# One\r\nx\r\n# Two\r\ny\r\n");
  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0].entity_name(), "One");
  EXPECT_EQ(chunks[1].entity_name(), "Two");
  EXPECT_EQ(chunks[1].start_line(), 3);
}

TEST_F(MarkdownChunkerTest, EmptyDocumentHasNoChunks) {
  EXPECT_TRUE(chunk("").empty());
}

}  // namespace rag_tests
