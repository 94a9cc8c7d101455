#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "rag_core/chunkers/chunker_factory.hpp"
#include "rag_core/file_classifier.hpp"
#include "rag_core/parsing/structural_parser.hpp"
#include "rag_core/run_context.hpp"

namespace rag_core {

class RepositoryError : public std::exception {
 public:
  explicit RepositoryError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// {.git, node_modules, venv, env, .env, build, dist}
const std::vector<std::string>& default_exclude_dirs();

struct ProcessorOptions {
  ChunkingOptions chunking;
  std::vector<std::string> exclude_dirs = default_exclude_dirs();
  size_t num_workers = 1;
  bool verbose = false;
};

/**
 * @brief Lists every regular file under @p root, relative to it and sorted.
 *
 * An exclude entry names a directory relative to the root ("build",
 * "docs/generated"); the walk does not descend into it. Nested directories
 * that merely share the name are still listed.
 */
std::vector<std::string> list_files(const std::filesystem::path& root,
                                    const std::vector<std::string>& exclude_dirs);

// Reads the whole file and drops invalid UTF-8. Throws RepositoryError if it can't be opened.
std::string read_file(const std::filesystem::path& path);

/**
 * @class RepositoryProcessor
 * @brief Walks a repository and turns every file into chunks.
 *
 * Each file is classified, handed to the chunker for its ChunkerKind and its
 * results are merged into the caller's RunContext. Failures stay with the file
 * that caused them: they are logged and counted, and the walk goes on.
 */
class RepositoryProcessor {
 public:
  explicit RepositoryProcessor(std::filesystem::path repo_path, ProcessorOptions options = {});

  RepositoryProcessor(const RepositoryProcessor&) = delete;
  RepositoryProcessor& operator=(const RepositoryProcessor&) = delete;

  /**
   * @brief Processes one file given relative to the repository root.
   *
   * Missing files and directories are logged and yield no chunks. Errors are
   * counted in the context instead of being thrown.
   */
  std::vector<Chunk> process_file(const std::string& relative_path, RunContext& context) const;

  /**
   * @brief Processes every listed file using options().num_workers threads.
   * @return All chunks of the run in file order.
   * @throw RepositoryError if the root is missing or not a directory.
   */
  std::vector<Chunk> process_repository(RunContext& context) const;

  const std::filesystem::path& repo_path() const { return repo_path_; }
  const ProcessorOptions& options() const { return options_; }
  const FileClassifier& classifier() const { return classifier_; }

 private:
  FileOutcome build_outcome(const std::string& relative_path, size_t sequence) const;

  std::filesystem::path repo_path_;
  ProcessorOptions options_;
  ParserRegistry parsers_;
  FileClassifier classifier_;
  ChunkerFactory factory_;
};

}  // namespace rag_core
