#include <cstdlib>
#include <iostream>

#include "rag_cli/cli_handler.hpp"

int main(int argc, char *argv[])
{
  try
  {
    rag_cli::CliOptions options = rag_cli::CliHandler::parse_arguments(argc, argv);

    // --config wins over the environment; without either the defaults apply
    std::string config_path = options.config_path;
    if (config_path.empty())
    {
      const char *env_config = std::getenv("REPO_RAG_CONFIG");
      config_path = env_config ? env_config : "";
    }
    rag_cli::Config config = config_path.empty()
                                 ? rag_cli::Config::from_json(nlohmann::json::object())
                                 : rag_cli::Config::from_file(config_path);

    rag_cli::CliHandler handler(std::move(config));
    handler.execute_command(options);
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
