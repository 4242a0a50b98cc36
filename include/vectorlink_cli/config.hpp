#pragma once

#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "vectorlink_core/llm/model_dimensions.hpp"

namespace vectorlink_cli {

class Config {
 public:
  std::string ollama_url;
  std::string embedding_model;
  size_t embedding_dimension;

  // Chunking and dispatch
  size_t token_limit;
  size_t max_item_tokens;
  size_t concurrency;

  std::string staging_root;
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
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename + "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct configuration from a JSON object (useful for tests)
  static Config from_json(const nlohmann::json& json_config) {
    if (!json_config.is_object()) {
      throw std::runtime_error("config must be a JSON object");
    }

    Config config;
    try {
      // Apply defaults when keys are missing
      config.ollama_url = json_config.value("ollama_url", std::string("http://localhost:11434"));
      config.embedding_model = json_config.value("embedding_model", std::string("mxbai-embed-large"));
      config.staging_root = json_config.value("staging_root", std::string("."));
      config.verbose = json_config.value("verbose", false);
    } catch (const nlohmann::json::exception& e) {
      throw std::runtime_error(std::string("Invalid config value: ") + e.what());
    }

    config.token_limit = read_count(json_config, "token_limit", 1'000'000);
    config.max_item_tokens = read_count(json_config, "max_item_tokens", 8191);
    config.concurrency = read_count(json_config, "concurrency", 10);

    // Without an explicit dimension we need to know the model
    if (json_config.contains("embedding_dimension")) {
      config.embedding_dimension = read_count(json_config, "embedding_dimension", 0);
    } else {
      auto known = vectorlink_core::known_embedding_dimension(config.embedding_model);
      if (!known) {
        throw std::runtime_error("embedding_dimension is required for unknown model '" +
                                 config.embedding_model + "'");
      }
      config.embedding_dimension = *known;
    }

    config.validate();
    return config;
  }

 private:
  static size_t read_count(const nlohmann::json& json_config, const std::string& key, size_t fallback) {
    if (!json_config.contains(key)) {
      return fallback;
    }
    const auto& value = json_config.at(key);
    if (!value.is_number_integer()) {
      throw std::runtime_error(key + " must be an integer");
    }
    const long long parsed = value.get<long long>();
    if (parsed <= 0) {
      throw std::runtime_error(key + " must be greater than 0");
    }
    return static_cast<size_t>(parsed);
  }

  void validate() const {
    if (ollama_url.empty()) {
      throw std::runtime_error("ollama_url cannot be empty");
    }
    if (embedding_model.empty()) {
      throw std::runtime_error("embedding_model cannot be empty");
    }
    if (staging_root.empty()) {
      throw std::runtime_error("staging_root cannot be empty");
    }
    if (embedding_dimension == 0) {
      throw std::runtime_error("embedding_dimension must be greater than 0");
    }
  }
};

}  // namespace vectorlink_cli
