#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "vectorlink_core/llm/embedding_client.hpp"

namespace vectorlink_core {

class OllamaClient : public EmbeddingClient {
 public:
  OllamaClient(const std::string &ollama_url, const std::string &embedding_model, size_t dimension);
  ~OllamaClient() override = default;

  // Disable copy constructor and assignment
  OllamaClient(const OllamaClient &) = delete;
  OllamaClient &operator=(const OllamaClient &) = delete;

  // The credential is unused: a local Ollama server does not authenticate.
  EmbeddingBatch get_embeddings(const std::string &credential,
                                const std::vector<std::string> &texts) override;

  size_t dimension() const override {
    return dimension_;
  }

  virtual bool is_server_available();

 private:
  std::string ollama_url_;
  std::string embedding_model_;
  size_t dimension_;

  // Helper methods
  void setup_server_connection();
  Embedding extract_embedding(const nlohmann::json &json_response) const;
};

}  // namespace vectorlink_core
