#pragma once

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "rag_core/repository_processor.hpp"

namespace rag_cli {

class Config {
 public:
  std::string ollama_url;
  std::string embedding_model;
  int num_workers;

  // Chunking, in code points
  int chunk_size;
  int code_overlap;
  int documentation_overlap;

  std::vector<std::string> exclude_dirs;
  std::string output_dir;

  int embedding_batch_size;
  int top_k;
  bool verbose;

  // Load configuration from a JSON file at the given path
  static Config from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("Config must be a JSON object");
    }

    Config config;
    config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
    config.embedding_model =
        json_config.value("embedding_model", std::string("mxbai-embed-large"));
    config.output_dir = json_config.value("output_dir", std::string("./output"));
    config.verbose = json_config.value("verbose", false);

    config.num_workers = int_or_default(json_config, "num_workers", 1);
    config.chunk_size = int_or_default(json_config, "chunk_size", 1500);
    config.code_overlap = int_or_default(json_config, "code_overlap", 200);
    config.documentation_overlap = int_or_default(json_config, "documentation_overlap", 250);
    config.embedding_batch_size = int_or_default(json_config, "embedding_batch_size", 32);
    config.top_k = int_or_default(json_config, "top_k", 5);

    if (json_config.contains("exclude_dirs")) {
      try {
        config.exclude_dirs = json_config.at("exclude_dirs").get<std::vector<std::string>>();
      } catch (const std::exception& e) {
        throw std::runtime_error(std::string("exclude_dirs must be a list of strings: ") +
                                 e.what());
      }
    } else {
      config.exclude_dirs = rag_core::default_exclude_dirs();
    }

    config.validate();
    return config;
  }

  rag_core::ProcessorOptions processor_options() const {
    rag_core::ProcessorOptions options;
    options.chunking.chunk_size = static_cast<size_t>(chunk_size);
    options.chunking.code_overlap = static_cast<size_t>(code_overlap);
    options.chunking.documentation_overlap = static_cast<size_t>(documentation_overlap);
    options.exclude_dirs = exclude_dirs;
    options.num_workers = static_cast<size_t>(num_workers);
    options.verbose = verbose;
    return options;
  }

 private:
  static int int_or_default(const nlohmann::json& json_config, const char* key, int fallback) {
    try {
      if (json_config.contains(key)) {
        return json_config.at(key).get<int>();
      }
    } catch (const std::exception&) {
      // Fallback to default if wrong type provided
    }
    return fallback;
  }

  void validate() const {
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (output_dir.empty()) {
      throw std::runtime_error("output_dir cannot be empty");
    }
    if (num_workers <= 0) {
      throw std::runtime_error("num_workers must be greater than 0");
    }
    if (chunk_size <= 0) {
      throw std::runtime_error("chunk_size must be greater than 0");
    }
    if (code_overlap < 0 || code_overlap >= chunk_size) {
      throw std::runtime_error("code_overlap must be in [0, chunk_size)");
    }
    if (documentation_overlap < 0 || documentation_overlap >= chunk_size) {
      throw std::runtime_error("documentation_overlap must be in [0, chunk_size)");
    }
    if (embedding_batch_size <= 0) {
      throw std::runtime_error("embedding_batch_size must be greater than 0");
    }
    if (top_k <= 0) {
      throw std::runtime_error("top_k must be greater than 0");
    }
  }
};

}  // namespace rag_cli
