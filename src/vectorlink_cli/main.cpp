#include <cstdlib>
#include <iostream>
#include <string>

#include "vectorlink_cli/cli_handler.hpp"
#include "vectorlink_core/errors.hpp"

int main(int argc, char *argv[])
{
  try
  {
    // Credential comes from the environment, never from the config file
    const char *api_key = std::getenv("VECTORLINK_API_KEY");
    std::string credential = api_key ? api_key : "";

    vectorlink_cli::CliHandler handler(credential);

    vectorlink_cli::CliOptions options = handler.parse_arguments(argc, argv);

    handler.execute_command(options);
  }
  catch (const vectorlink_core::VectorizationError &e)
  {
    std::cerr << "Error: [" << e.category() << "] " << e.what() << std::endl;
    return 1;
  }
  catch (const std::exception &e)
  {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
