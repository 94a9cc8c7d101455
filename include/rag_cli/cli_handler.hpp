#pragma once

#include <functional>
#include <memory>
#include <string>

#include "rag_cli/config.hpp"
#include "rag_core/llm/ollama_client.hpp"
#include "rag_core/run_context.hpp"
#include "rag_core/services/search_service.hpp"

namespace rag_cli
{

  enum class Command
  {
    Process,
    Classify,
    Search,
    Help
  };

  struct CliOptions
  {
    Command command = Command::Help;
    std::string repo_path;
    std::string file_path;
    std::string query;
    std::string config_path;
    std::string output_dir;  // overrides Config::output_dir when set
    int top_k = 0;           // 0 means Config::top_k
    int num_workers = 0;     // 0 means Config::num_workers
    bool verbose = false;
  };

  class CliError : public std::exception
  {
  public:
    explicit CliError(const std::string &message) : message_(message) {}

    const char *what() const noexcept override
    {
      return message_.c_str();
    }

  private:
    std::string message_;
  };

  using EmbedderFactory =
      std::function<std::unique_ptr<rag_core::EmbeddingProvider>(const Config &)>;

  class CliHandler
  {
  public:
    // The default factory connects to Ollama at config.ollama_url
    explicit CliHandler(Config config, EmbedderFactory embedder_factory = {});

    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    static CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command; failures surface as exceptions
    void execute_command(const CliOptions &options);

    const Config &config() const { return config_; }

    // Directory name of the repository, used to name the report files
    static std::string repository_name(const std::string &repo_path);

  private:
    Config config_;
    EmbedderFactory embedder_factory_;

    // Command handlers
    void handle_process_command(const CliOptions &options);
    void handle_classify_command(const CliOptions &options);
    void handle_search_command(const CliOptions &options);
    void handle_help_command(const CliOptions &options);

    // Helper methods
    rag_core::ProcessorOptions processor_options(const CliOptions &options) const;
    void print_run_summary(const rag_core::RunContext &context);
    void print_search_hits(const std::vector<rag_core::SearchHit> &hits);
    void print_help();
  };

}
