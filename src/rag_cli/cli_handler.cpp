#include "rag_cli/cli_handler.hpp"

#include <filesystem>
#include <iomanip>  // Required for std::fixed and std::setprecision
#include <iostream>

#include "rag_core/file_classifier.hpp"
#include "rag_core/parsing/structural_parser.hpp"
#include "rag_core/repository_processor.hpp"
#include "rag_core/run_report.hpp"

namespace rag_cli {

namespace {

int parse_positive_int(const std::string& flag, const std::string& value) {
    int parsed = 0;
    try {
        size_t consumed = 0;
        parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw CliError(flag + " expects a number, got: " + value);
        }
    } catch (const std::logic_error&) {
        throw CliError(flag + " expects a number, got: " + value);
    }
    if (parsed <= 0) {
        throw CliError(flag + " must be greater than 0");
    }
    return parsed;
}

std::string line_range(const rag_core::Chunk& chunk) {
    if (!chunk.start_line() || !chunk.end_line()) {
        return "";
    }
    return ":" + std::to_string(*chunk.start_line()) + "-" + std::to_string(*chunk.end_line());
}

}  // namespace

CliHandler::CliHandler(Config config, EmbedderFactory embedder_factory)
    : config_(std::move(config)), embedder_factory_(std::move(embedder_factory)) {
    if (!embedder_factory_) {
        embedder_factory_ = [](const Config& cfg) -> std::unique_ptr<rag_core::EmbeddingProvider> {
            return std::make_unique<rag_core::OllamaClient>(cfg.ollama_url, cfg.embedding_model);
        };
    }
}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;

    if (argc < 2) {
        options.command = Command::Help;
        return options;
    }

    std::string command = argv[1];
    if (command == "process" || command == "p") {
        options.command = Command::Process;
    } else if (command == "classify" || command == "c") {
        options.command = Command::Classify;
    } else if (command == "search" || command == "s") {
        options.command = Command::Search;
    } else if (command == "help" || command == "h" || command == "--help" || command == "-h") {
        options.command = Command::Help;
        return options;
    } else {
        throw CliError("Unknown command: " + command);
    }

    for (int i = 2; i < argc; ++i) {
        std::string flag = argv[i];
        if (flag == "--verbose" || flag == "-v") {
            options.verbose = true;
            continue;
        }
        if (i + 1 >= argc) {
            throw CliError("Missing value for " + flag);
        }
        std::string value = argv[++i];

        if (flag == "--repo" || flag == "-r") {
            options.repo_path = value;
        } else if (flag == "--file" || flag == "-f") {
            options.file_path = value;
        } else if (flag == "--query" || flag == "-q") {
            options.query = value;
        } else if (flag == "--config" || flag == "-c") {
            options.config_path = value;
        } else if (flag == "--output" || flag == "-o") {
            options.output_dir = value;
        } else if (flag == "--top-k" || flag == "-k") {
            options.top_k = parse_positive_int(flag, value);
        } else if (flag == "--workers" || flag == "-w") {
            options.num_workers = parse_positive_int(flag, value);
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    if (options.command == Command::Process && options.repo_path.empty()) {
        throw CliError("Process command requires a repository. Usage: process --repo <path>");
    }
    if (options.command == Command::Classify && options.file_path.empty()) {
        throw CliError("Classify command requires a file path. Usage: classify --file <path>");
    }
    if (options.command == Command::Search) {
        if (options.repo_path.empty() || options.query.empty()) {
            throw CliError(
                "Search command requires a repository and a query. Usage: search --repo <path> "
                "--query <query>");
        }
    }

    return options;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Process:
            handle_process_command(options);
            break;
        case Command::Classify:
            handle_classify_command(options);
            break;
        case Command::Search:
            handle_search_command(options);
            break;
        case Command::Help:
            handle_help_command(options);
            break;
    }
}

std::string CliHandler::repository_name(const std::string& repo_path) {
    std::filesystem::path path = std::filesystem::path(repo_path).lexically_normal();
    if (path.filename().empty()) {
        path = path.parent_path();
    }
    std::string name = path.filename().string();
    if (name.empty() || name == "." || name == "..") {
        std::error_code ec;
        auto absolute = std::filesystem::weakly_canonical(std::filesystem::absolute(repo_path), ec);
        name = ec ? std::string() : absolute.filename().string();
    }
    return name.empty() ? "repository" : name;
}

rag_core::ProcessorOptions CliHandler::processor_options(const CliOptions& options) const {
    rag_core::ProcessorOptions processor = config_.processor_options();
    if (options.num_workers > 0) {
        processor.num_workers = static_cast<size_t>(options.num_workers);
    }
    processor.verbose = processor.verbose || options.verbose;
    return processor;
}

void CliHandler::handle_process_command(const CliOptions& options) {
    std::cout << "Processing repository: " << options.repo_path << std::endl;

    rag_core::RepositoryProcessor processor(options.repo_path, processor_options(options));
    rag_core::RunContext context(repository_name(options.repo_path));
    processor.process_repository(context);

    const std::string output_dir =
        options.output_dir.empty() ? config_.output_dir : options.output_dir;
    const auto chunks_path = rag_core::write_run_report(context, output_dir);
    const auto errors_path = rag_core::write_syntax_error_report(context, output_dir);

    print_run_summary(context);
    std::cout << "Chunks written to: " << chunks_path.string() << std::endl;
    std::cout << "Syntax error report written to: " << errors_path.string() << std::endl;
}

void CliHandler::handle_classify_command(const CliOptions& options) {
    rag_core::FileClassifier classifier(options.verbose || config_.verbose);
    const auto classification = classifier.classify(options.file_path);
    const auto parsers = rag_core::ParserRegistry::with_default_grammars();

    std::cout << options.file_path << std::endl;
    std::cout << "  Category: " << rag_core::to_string(classification.category) << std::endl;
    std::cout << "  Language: " << classification.language << std::endl;
    std::cout << "  Chunker:  "
              << rag_core::to_string(
                     rag_core::FileClassifier::resolve_chunker_kind(classification, parsers))
              << std::endl;
}

void CliHandler::handle_search_command(const CliOptions& options) {
    const int top_k = options.top_k > 0 ? options.top_k : config_.top_k;
    std::cout << "Search for: " << options.query << " (top_k: " << top_k << ")" << std::endl;

    rag_core::RepositoryProcessor processor(options.repo_path, processor_options(options));
    rag_core::RunContext context(repository_name(options.repo_path));
    const auto chunks = processor.process_repository(context);

    auto embedder = embedder_factory_(config_);
    rag_core::SearchService search_service(*embedder,
                                           static_cast<size_t>(config_.embedding_batch_size));
    search_service.build_index(chunks);
    print_search_hits(search_service.search(options.query, top_k));
}

void CliHandler::handle_help_command(const CliOptions& options) {
    print_help();
}

void CliHandler::print_run_summary(const rag_core::RunContext& context) {
    const auto stats = context.statistics();
    std::cout << "\nRepository: " << context.repository_name() << std::endl;
    std::cout << "  Files processed: " << stats.files_processed << std::endl;
    for (const auto& [category, count] : stats.files_by_type) {
        std::cout << "    " << category << ": " << count << std::endl;
    }
    std::cout << "  Chunks created:  " << stats.chunks_created << std::endl;
    for (const auto& [category, count] : stats.chunks_by_type) {
        std::cout << "    " << category << ": " << count << std::endl;
    }
    std::cout << "  Errors:          " << stats.errors << std::endl;
    std::cout << "  Processing time: " << std::fixed << std::setprecision(2)
              << stats.processing_time << "s" << std::endl;
    std::cout << "  " << context.error_tracker().report().summary << std::endl;
}

void CliHandler::print_search_hits(const std::vector<rag_core::SearchHit>& hits) {
    if (hits.empty()) {
        std::cout << "No results found." << std::endl;
        return;
    }

    std::cout << "\nFound " << hits.size() << " results:\n" << std::endl;
    for (size_t i = 0; i < hits.size(); ++i) {
        const auto& hit = hits[i];
        std::cout << i + 1 << ". " << hit.chunk.file_path() << line_range(hit.chunk);
        if (hit.chunk.entity_name()) {
            std::cout << " (" << *hit.chunk.entity_name() << ")";
        }
        std::cout << std::endl;
        std::cout << "   Score: " << std::fixed << std::setprecision(4) << hit.score << std::endl;

        std::string preview = hit.chunk.content().substr(0, 200);
        if (hit.chunk.content().size() > 200) {
            preview += "...";
        }
        std::cout << "   " << preview << "\n" << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << R"(
repo_rag - Repository chunking and semantic search

Usage: repo_rag <command> [options]

Commands:
  process, p    Chunk every file of a repository and write the JSON reports
    --repo, -r <path>      Repository root
    --output, -o <dir>     Report directory (default: config output_dir)
    --workers, -w <num>    Worker threads (default: config num_workers)

  classify, c   Show how a single path is classified and chunked
    --file, -f <path>      Repository-relative path

  search, s     Chunk a repository, embed it and run a semantic query
    --repo, -r <path>      Repository root
    --query, -q <query>    Search query
    --top-k, -k <num>      Number of results to return (default: config top_k)

  help, h       Show this help message

Common options:
  --config, -c <file>      JSON config file
  --verbose, -v            Per-file logging

Environment Variables:
  REPO_RAG_CONFIG  Config file used when --config is not given

Examples:
  repo_rag process --repo ./my-project --output ./out
  repo_rag classify --file src/main.py
  repo_rag search --repo ./my-project --query "where are tokens refreshed" -k 3
)" << std::endl;
}

}  // namespace rag_cli
