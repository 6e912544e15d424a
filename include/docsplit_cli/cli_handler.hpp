#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docsplit_cli/config.hpp"
#include "docsplit_core/llm/enrichment_client.hpp"

namespace docsplit_cli
{

  enum class Command
  {
    Chunk,
    Stats,
    Boundary,
    Help
  };

  struct CliOptions
  {
    Command command;
    std::vector<std::string> file_paths;
    std::string config_path;
    std::string document_id;
    size_t position;
    size_t window;
    bool no_enrich;
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
    explicit CliHandler(std::ostream &out = std::cout, std::ostream &err = std::cerr);

    // Disable copy constructor and assignment
    CliHandler(const CliHandler &) = delete;
    CliHandler &operator=(const CliHandler &) = delete;

    // Parse command line arguments
    CliOptions parse_arguments(int argc, char *argv[]) const;

    // Execute command
    void execute_command(const CliOptions &options);

  private:
    std::ostream &out_;
    std::ostream &err_;

    // Command handlers
    void handle_chunk_command(const CliOptions &options);
    void handle_stats_command(const CliOptions &options);
    void handle_boundary_command(const CliOptions &options);
    void handle_help_command();

    // Helper methods
    AppConfig load_config(const CliOptions &options) const;
    docsplit_core::EnrichmentClientPtr make_enrichment_client(const AppConfig &config,
                                                             const CliOptions &options) const;
    static std::string read_file(const std::string &path);
    static std::string document_id_for(const CliOptions &options, const std::string &path);
    static size_t parse_size(const std::string &flag, const std::string &value);
    void print_json(const nlohmann::json &value);
  };

}
