#include "vectorlink_cli/cli_handler.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

#include "vectorlink_core/chunking/tokenizer.hpp"
#include "vectorlink_core/llm/ollama_client.hpp"
#include "vectorlink_core/services/vectorization_service.hpp"
#include "vectorlink_core/storage/checkpoint.hpp"
#include "vectorlink_core/storage/vector_store.hpp"

namespace vectorlink_cli {

CliHandler::CliHandler(const std::string& credential) : credential_(credential) {}

CliOptions CliHandler::parse_arguments(int argc, char* argv[]) {
    CliOptions options;
    options.command = Command::Help;
    options.verbose = false;

    if (argc < 2) {
        return options;
    }

    std::string command = argv[1];

    if (command == "vectorize" || command == "v") {
        options.command = Command::Vectorize;
    } else if (command == "status" || command == "s") {
        options.command = Command::Status;
    } else if (command == "help" || command == "--help" || command == "-h") {
        return options;
    } else {
        throw CliError("Unknown command: " + command + ". Run 'vectorlink help' for usage.");
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

        if (flag == "--operations" || flag == "-o") {
            options.operations_path = value;
        } else if (flag == "--domain" || flag == "-d") {
            options.domain = value;
        } else if (flag == "--root" || flag == "-r") {
            options.staging_root = value;
        } else if (flag == "--config" || flag == "-c") {
            options.config_path = value;
        } else {
            throw CliError("Unknown option: " + flag);
        }
    }

    if (options.domain.empty()) {
        throw CliError("A domain is required. Usage: " + command + " --domain <name>");
    }
    if (options.command == Command::Vectorize && options.operations_path.empty()) {
        throw CliError("Vectorize command requires an operation log. Usage: vectorize --operations <path> --domain <name>");
    }

    return options;
}

Config CliHandler::load_config(const CliOptions& options) const {
    Config config;
    if (!options.config_path.empty()) {
        config = Config::from_file(options.config_path);
    } else if (std::filesystem::exists(DEFAULT_CONFIG_FILE)) {
        config = Config::from_file(DEFAULT_CONFIG_FILE);
    } else {
        config = Config::from_json(nlohmann::json::object());
    }

    if (!options.staging_root.empty()) {
        config.staging_root = options.staging_root;
    }
    if (options.verbose) {
        config.verbose = true;
    }
    return config;
}

void CliHandler::execute_command(const CliOptions& options) {
    switch (options.command) {
        case Command::Vectorize:
            handle_vectorize_command(options);
            break;
        case Command::Status:
            handle_status_command(options);
            break;
        case Command::Help:
            print_help();
            break;
    }
}

void CliHandler::handle_vectorize_command(const CliOptions& options) {
    Config config = load_config(options);

    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << " (" << config.embedding_dimension
              << " dimensions)" << std::endl;
    std::cout << "Token Limit: " << config.token_limit << ", Concurrency: " << config.concurrency
              << std::endl;

    auto ollama_client = std::make_shared<vectorlink_core::OllamaClient>(
        config.ollama_url, config.embedding_model, config.embedding_dimension);
    auto tokenizer = std::make_shared<vectorlink_core::HeuristicTokenizer>(config.max_item_tokens);

    vectorlink_core::VectorizationOptions vectorization_options;
    vectorization_options.token_limit = config.token_limit;
    vectorization_options.concurrency = config.concurrency;
    vectorization_options.verbose = config.verbose;

    vectorlink_core::VectorizationService service(ollama_client, tokenizer, vectorization_options);
    vectorlink_core::VectorizationResult result = service.index_from_operations_file(
        credential_, options.operations_path, config.staging_root, options.domain);

    std::cout << "Domain:          " << options.domain << std::endl;
    std::cout << "Vectors stored:  " << result.final_cursor << std::endl;
    std::cout << "Added this run:  " << result.records_written() << std::endl;
    std::cout << "Failures:        " << result.failures << std::endl;
}

void CliHandler::handle_status_command(const CliOptions& options) {
    Config config = load_config(options);
    const auto paths = vectorlink_core::StagingPaths::for_domain(config.staging_root, options.domain);

    std::optional<uint64_t> cursor = vectorlink_core::Checkpoint::peek(paths.progress);

    const uint64_t records =
        vectorlink_core::VectorStore::record_count(paths.vectors, config.embedding_dimension);

    std::cout << "Domain:          " << options.domain << std::endl;
    std::cout << "Staging:         " << paths.directory.string() << std::endl;
    if (cursor) {
        std::cout << "Checkpoint:      " << *cursor << std::endl;
    } else {
        std::cout << "Checkpoint:      0 (not initialized)" << std::endl;
    }
    std::cout << "Vector records:  " << records << std::endl;

    if (cursor && records < *cursor) {
        std::cerr << "Warning: vector file holds fewer records than the checkpoint claims." << std::endl;
    }
}

void CliHandler::print_help() {
    std::cout << "vectorlink - resumable text-to-vector staging\n\n"
              << "Usage:\n"
              << "  vectorlink vectorize --operations <log.jsonl> --domain <name> [--root <dir>] [--config <file>] [--verbose]\n"
              << "  vectorlink status --domain <name> [--root <dir>] [--config <file>]\n"
              << "  vectorlink help\n\n"
              << "Environment:\n"
              << "  VECTORLINK_API_KEY   credential handed to the embedding service\n\n"
              << "Configuration is read from --config, else ./" << DEFAULT_CONFIG_FILE
              << " when present, else built-in defaults." << std::endl;
}

}  // namespace vectorlink_cli
