#include <gtest/gtest.h>

#include "rag_core/types/chunk.hpp"
#include "rag_core/types/file.hpp"

namespace rag_tests {

using rag_core::Chunk;
using rag_core::ContentCategory;

TEST(ContentCategoryTest, RoundTripsThroughStrings) {
  EXPECT_EQ(rag_core::to_string(ContentCategory::Code), "code");
  EXPECT_EQ(rag_core::to_string(ContentCategory::Documentation), "documentation");
  EXPECT_EQ(rag_core::to_string(ContentCategory::Configuration), "configuration");
  EXPECT_EQ(rag_core::to_string(ContentCategory::Unknown), "unknown");

  EXPECT_EQ(rag_core::content_category_from_string("code"), ContentCategory::Code);
  EXPECT_EQ(rag_core::content_category_from_string("bogus"), ContentCategory::Unknown);
}

TEST(ChunkTest, EstimatesTokensFromWhitespaceWords) {
  Chunk chunk({.content = "def add(a, b):\n    return a + b\n",
               .file_path = "math.py",
               .category = ContentCategory::Code});

  EXPECT_EQ(chunk.token_estimate(), 7u);
  EXPECT_EQ(Chunk::estimate_tokens(""), 0u);
  EXPECT_EQ(Chunk::estimate_tokens("   \n\t "), 0u);
}

TEST(ChunkTest, AbsentFieldsStayEmpty) {
  Chunk chunk({.content = "%PDF", .file_path = "manual.pdf",
               .category = ContentCategory::Documentation});

  EXPECT_FALSE(chunk.start_line().has_value());
  EXPECT_FALSE(chunk.end_line().has_value());
  EXPECT_FALSE(chunk.parent_name().has_value());
  EXPECT_FALSE(chunk.entity_name().has_value());
  EXPECT_TRUE(chunk.metadata().is_object());
  EXPECT_EQ(chunk.kind(), "");
}

TEST(ChunkTest, NonObjectMetadataBecomesEmptyObject) {
  Chunk chunk({.content = "x", .file_path = "a.txt", .metadata = nlohmann::json::array()});
  EXPECT_TRUE(chunk.metadata().is_object());
  EXPECT_TRUE(chunk.metadata().empty());
}

TEST(ChunkTest, RejectsInvertedLineRange) {
  EXPECT_THROW(Chunk({.content = "x", .file_path = "a.py", .start_line = 5, .end_line = 2}),
               std::invalid_argument);
}

TEST(ChunkTest, KindComesFromMetadata) {
  Chunk chunk({.content = "x",
               .file_path = "a.py",
               .start_line = 1,
               .end_line = 1,
               .metadata = {{"kind", "function"}}});
  EXPECT_EQ(chunk.kind(), "function");
}

}  // namespace rag_tests
