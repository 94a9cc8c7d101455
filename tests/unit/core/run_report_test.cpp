#include <gtest/gtest.h>

#include "rag_core/run_report.hpp"
#include "utilities_test.hpp"

namespace rag_tests {

using rag_core::Chunk;
using rag_core::ContentCategory;
using rag_core::RunContext;

namespace {

rag_core::FileOutcome outcome_for(size_t sequence, const std::string& path,
                                  ContentCategory category, std::vector<Chunk> chunks) {
  rag_core::FileOutcome outcome;
  outcome.sequence = sequence;
  outcome.record = rag_core::FileRecord{path, category, "python", "hash-" + path, chunks.size()};
  outcome.chunks = std::move(chunks);
  return outcome;
}

}  // namespace

TEST(RunReportTest, ChunkRecordUsesNullForAbsentFields) {
  Chunk chunk({.content = "%PDF",
               .file_path = "manual.pdf",
               .category = ContentCategory::Documentation,
               .language = "pdf",
               .metadata = {{"kind", "whole_file"}}});

  nlohmann::json j = chunk;
  EXPECT_EQ(j["content"], "%PDF");
  EXPECT_EQ(j["file_path"], "manual.pdf");
  EXPECT_EQ(j["chunk_type"], "documentation");
  EXPECT_TRUE(j["start_line"].is_null());
  EXPECT_TRUE(j["end_line"].is_null());
  EXPECT_EQ(j["language"], "pdf");
  EXPECT_TRUE(j["parent"].is_null());
  EXPECT_TRUE(j["name"].is_null());
  EXPECT_EQ(j["token_count"], 1);
  EXPECT_EQ(j["metadata"]["kind"], "whole_file");
}

TEST(RunReportTest, MethodChunkCarriesParentAndName) {
  Chunk chunk({.content = "def run(self):\n    pass",
               .file_path = "a.py",
               .category = ContentCategory::Code,
               .language = "python",
               .start_line = 3,
               .end_line = 4,
               .parent_name = "Job",
               .entity_name = "run"});

  nlohmann::json j = chunk;
  EXPECT_EQ(j["start_line"], 3);
  EXPECT_EQ(j["end_line"], 4);
  EXPECT_EQ(j["parent"], "Job");
  EXPECT_EQ(j["name"], "run");
}

TEST(RunReportTest, ErrorRecordFieldNames) {
  rag_core::ParseErrorRecord record{"a.java", "java", "Syntax Error in Unknown", 7, "Unknown",
                                    {{"column", 3}}};
  nlohmann::json j = record;
  EXPECT_EQ(j["file_path"], "a.java");
  EXPECT_EQ(j["language"], "java");
  EXPECT_EQ(j["error_msg"], "Syntax Error in Unknown");
  EXPECT_EQ(j["line_number"], 7);
  EXPECT_EQ(j["function_name"], "Unknown");
  EXPECT_EQ(j["metadata"]["column"], 3);
}

TEST(RunReportTest, RunReportHasRepositoryStatsFilesAndChunks) {
  RunContext context("demo");
  context.reserve_sequences(2);
  context.merge(outcome_for(1, "b.py", ContentCategory::Code,
                            {TestUtilities::create_test_chunk("second", "b.py")}));
  context.merge(outcome_for(0, "a.py", ContentCategory::Code,
                            {TestUtilities::create_test_chunk("first", "a.py")}));
  rag_core::FileOutcome failed;
  failed.failed = true;
  context.merge(std::move(failed));

  nlohmann::json report = rag_core::build_run_report(context);
  EXPECT_EQ(report["repository"], "demo");
  EXPECT_EQ(report["stats"]["files_processed"], 2);
  EXPECT_EQ(report["stats"]["chunks_created"], 2);
  EXPECT_EQ(report["stats"]["files_by_type"]["code"], 2);
  EXPECT_EQ(report["stats"]["chunks_by_type"]["code"], 2);
  EXPECT_EQ(report["stats"]["errors"], 1);
  EXPECT_TRUE(report["stats"].contains("processing_time"));

  // Ordered by sequence, not by merge order
  ASSERT_EQ(report["chunks"].size(), 2u);
  EXPECT_EQ(report["chunks"][0]["content"], "first");
  EXPECT_EQ(report["chunks"][1]["content"], "second");
  ASSERT_EQ(report["files"].size(), 2u);
  EXPECT_EQ(report["files"][0]["file_path"], "a.py");
  EXPECT_EQ(report["files"][0]["category"], "code");
  EXPECT_EQ(report["files"][0]["content_hash"], "hash-a.py");
  EXPECT_EQ(report["files"][0]["chunk_count"], 1);
}

TEST(RunReportTest, SyntaxErrorReportGroupsByLanguage) {
  RunContext context("demo");
  context.error_tracker().add_error("a.py", "python", "invalid syntax", 1);
  context.error_tracker().add_error("b.go", "go", "Syntax Error in Unknown", 2);

  nlohmann::json report = context.error_tracker().report();
  EXPECT_TRUE(report["has_syntax_errors"].get<bool>());
  EXPECT_EQ(report["error_count"], 2);
  EXPECT_EQ(report["errors"].size(), 2u);
  EXPECT_EQ(report["errors_by_language"]["python"].size(), 1u);
  EXPECT_EQ(report["errors_by_language"]["go"][0]["error_msg"], "Syntax Error in Unknown");
  EXPECT_EQ(report["summary"], "Found 2 syntax errors across 2 languages: python, go");
}

class RunReportFileTest : public TempRepositoryTestBase {};

TEST_F(RunReportFileTest, WritesBothReportsUnderOutputDirectory) {
  RunContext context("demo");
  const auto output_dir = repo_root_ / "out" / "nested";

  auto chunks_path = rag_core::write_run_report(context, output_dir);
  auto errors_path = rag_core::write_syntax_error_report(context, output_dir);

  EXPECT_EQ(chunks_path, output_dir / "demo_chunks.json");
  EXPECT_EQ(errors_path, output_dir / "demo_syntax_errors.json");

  auto chunks_json = nlohmann::json::parse(TestUtilities::read_file(chunks_path));
  EXPECT_EQ(chunks_json["repository"], "demo");
  EXPECT_TRUE(chunks_json["chunks"].is_array());

  auto errors_json = nlohmann::json::parse(TestUtilities::read_file(errors_path));
  EXPECT_FALSE(errors_json["has_syntax_errors"].get<bool>());
  EXPECT_EQ(errors_json["summary"], "No syntax errors were detected in the codebase.");
  EXPECT_TRUE(errors_json["errors_by_language"].is_object());
}

}  // namespace rag_tests
