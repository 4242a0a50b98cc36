#pragma once

#include <string>

#include "vectorlink_cli/config.hpp"

namespace vectorlink_cli
{

  enum class Command
  {
    Vectorize,
    Status,
    Help
  };

  struct CliOptions
  {
    Command command;
    std::string operations_path;
    std::string domain;
    std::string staging_root; // empty means "use the config value"
    std::string config_path;  // empty means "vectorlinkrc.json if present"
    bool verbose;
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

  class CliHandler
  {
  public:
    // credential is passed through to the embedding service untouched
    explicit CliHandler(const std::string &credential);

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]);

    // Execute command
    void execute_command(const CliOptions &options);

    // Resolve the effective configuration for a command
    Config load_config(const CliOptions &options) const;

    static constexpr const char *DEFAULT_CONFIG_FILE = "vectorlinkrc.json";

  private:
    std::string credential_;

    // Command handlers
    void handle_vectorize_command(const CliOptions &options);
    void handle_status_command(const CliOptions &options);
    void print_help();
  };

}
