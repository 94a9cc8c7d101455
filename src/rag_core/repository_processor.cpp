#include "rag_core/repository_processor.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <thread>
#include <unordered_set>

#include "rag_core/content_hash.hpp"
#include "rag_core/text_utils.hpp"

namespace rag_core {

namespace {

std::string normalize_exclude(const std::string& entry) {
  std::string normalized = std::filesystem::path(entry).lexically_normal().generic_string();
  while (!normalized.empty() && normalized.back() == '/') {
    normalized.pop_back();
  }
  return normalized;
}

}  // namespace

const std::vector<std::string>& default_exclude_dirs() {
  static const std::vector<std::string> excludes = {".git", "node_modules", "venv", "env",
                                                    ".env", "build",        "dist"};
  return excludes;
}

std::vector<std::string> list_files(const std::filesystem::path& root,
                                    const std::vector<std::string>& exclude_dirs) {
  std::unordered_set<std::string> excluded;
  for (const auto& entry : exclude_dirs) {
    excluded.insert(normalize_exclude(entry));
  }

  std::vector<std::string> files;
  const auto opts = std::filesystem::directory_options::skip_permission_denied;
  for (auto it = std::filesystem::recursive_directory_iterator(root, opts);
       it != std::filesystem::recursive_directory_iterator(); ++it) {
    const std::string relative = it->path().lexically_relative(root).generic_string();

    std::error_code ec;
    if (it->is_directory(ec)) {
      if (excluded.count(relative) > 0) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!it->is_regular_file(ec)) continue;
    files.push_back(relative);
  }

  std::sort(files.begin(), files.end());
  return files;
}

std::string read_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    throw RepositoryError("Failed to open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return text::sanitize_utf8(buffer.str());
}

RepositoryProcessor::RepositoryProcessor(std::filesystem::path repo_path, ProcessorOptions options)
    : repo_path_(std::move(repo_path)),
      options_(std::move(options)),
      parsers_(ParserRegistry::with_default_grammars()),
      classifier_(options_.verbose),
      factory_(options_.chunking, parsers_) {}

FileOutcome RepositoryProcessor::build_outcome(const std::string& relative_path,
                                               size_t sequence) const {
  FileOutcome outcome;
  outcome.sequence = sequence;

  const std::filesystem::path full_path = repo_path_ / relative_path;
  std::error_code ec;
  if (!std::filesystem::exists(full_path, ec)) {
    std::cerr << "[RepositoryProcessor] File not found: " << full_path.string() << std::endl;
    return outcome;
  }
  if (std::filesystem::is_directory(full_path, ec)) {
    std::cerr << "[RepositoryProcessor] Skipping directory: " << full_path.string() << std::endl;
    return outcome;
  }

  try {
    const auto started = std::chrono::steady_clock::now();

    std::string content = read_file(full_path);
    const FileClassification classification = classifier_.classify(relative_path);
    const ContentChunker& chunker = factory_.get_chunker_for(classification);

    SyntaxErrorTracker file_errors;
    outcome.chunks = chunker.chunk(relative_path, content, classification, file_errors);
    outcome.errors = file_errors.errors();

    FileRecord record;
    record.file_path = relative_path;
    record.category = classification.category;
    record.language = classification.language;
    record.content_hash = compute_content_hash(content);
    record.chunk_count = outcome.chunks.size();
    outcome.record = std::move(record);

    if (options_.verbose) {
      const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started);
      std::cout << "[RepositoryProcessor] " << relative_path << ": "
                << outcome.chunks.size() << " chunks via " << to_string(chunker.kind())
                << " (" << elapsed.count() << " ms)" << std::endl;
    }
  } catch (const std::exception& e) {
    std::cerr << "[RepositoryProcessor] Error processing " << relative_path << ": " << e.what()
              << std::endl;
    outcome.chunks.clear();
    outcome.errors.clear();
    outcome.record.reset();
    outcome.failed = true;
  }
  return outcome;
}

std::vector<Chunk> RepositoryProcessor::process_file(const std::string& relative_path,
                                                     RunContext& context) const {
  FileOutcome outcome = build_outcome(relative_path, context.reserve_sequences(1));
  std::vector<Chunk> chunks = outcome.chunks;
  context.merge(std::move(outcome));
  return chunks;
}

std::vector<Chunk> RepositoryProcessor::process_repository(RunContext& context) const {
  std::error_code ec;
  if (!std::filesystem::exists(repo_path_, ec)) {
    throw RepositoryError("Repository path does not exist: " + repo_path_.string());
  }
  if (!std::filesystem::is_directory(repo_path_, ec)) {
    throw RepositoryError("Repository path is not a directory: " + repo_path_.string());
  }

  const auto started = std::chrono::steady_clock::now();

  std::vector<std::string> files;
  try {
    files = list_files(repo_path_, options_.exclude_dirs);
  } catch (const std::filesystem::filesystem_error& e) {
    throw RepositoryError(std::string("Failed to walk repository: ") + e.what());
  }
  std::cout << "[RepositoryProcessor] Processing " << files.size() << " files in "
            << repo_path_.string() << std::endl;

  const size_t first_sequence = context.reserve_sequences(files.size());
  std::atomic<size_t> next_index{0};
  auto run_worker = [&]() {
    while (true) {
      const size_t index = next_index.fetch_add(1);
      if (index >= files.size()) {
        return;
      }
      context.merge(build_outcome(files[index], first_sequence + index));
    }
  };

  const size_t num_workers = std::max<size_t>(1, std::min(options_.num_workers, files.size()));
  if (num_workers == 1) {
    run_worker();
  } else {
    std::vector<std::thread> workers;
    workers.reserve(num_workers);
    for (size_t i = 0; i < num_workers; ++i) {
      workers.emplace_back(run_worker);
    }
    for (auto& worker : workers) {
      worker.join();
    }
  }

  const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
  context.set_processing_time(elapsed.count());

  const RunStatistics stats = context.statistics();
  std::cout << "[RepositoryProcessor] Processed " << stats.files_processed << " files, created "
            << stats.chunks_created << " chunks in " << elapsed.count() << "s ("
            << stats.errors << " errors)" << std::endl;

  return context.chunks();
}

}  // namespace rag_core
