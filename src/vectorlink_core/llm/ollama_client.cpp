#include "vectorlink_core/llm/ollama_client.hpp"

#include <iostream>
#include <stdexcept>

#include "ollama.hpp"
#include "vectorlink_core/errors.hpp"

namespace vectorlink_core {

namespace {

// Ollama error texts that are about one input rather than the model or the server.
constexpr const char *INPUT_REJECTION_MARKERS[] = {
    "context length",
    "input length",
    "invalid input",
};

bool is_input_rejection(const std::string &message) {
  for (const char *marker : INPUT_REJECTION_MARKERS) {
    if (message.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

// "mxbai-embed-large" matches a listed "mxbai-embed-large:latest"
bool model_is_listed(const std::vector<std::string> &models, const std::string &model) {
  for (const auto &listed : models) {
    if (listed == model) {
      return true;
    }
    if (model.find(':') == std::string::npos && listed == model + ":latest") {
      return true;
    }
  }
  return false;
}

}  // namespace

OllamaClient::OllamaClient(const std::string &ollama_url,
                           const std::string &embedding_model,
                           size_t dimension)
    : ollama_url_(ollama_url), embedding_model_(embedding_model), dimension_(dimension) {
  if (dimension_ == 0) {
    throw std::invalid_argument("OllamaClient needs a positive embedding dimension.");
  }
  setup_server_connection();
}

void OllamaClient::setup_server_connection() {
  if (!is_server_available()) {
    throw EmbeddingError(EmbeddingErrorKind::Transport,
                         "Ollama server is not running at " + ollama_url_);
  }

  std::vector<std::string> models;
  try {
    Ollama server(ollama_url_);
    models = server.list_models();
  } catch (const ollama::exception &e) {
    throw EmbeddingError(EmbeddingErrorKind::Transport,
                         "Could not list models at " + ollama_url_ + ": " + std::string(e.what()));
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError(EmbeddingErrorKind::Service,
                         "Malformed model list from " + ollama_url_ + ": " + std::string(e.what()));
  }
  if (!model_is_listed(models, embedding_model_)) {
    throw EmbeddingError(EmbeddingErrorKind::Service,
                         "Model " + embedding_model_ + " is not available at " + ollama_url_ +
                             " (try `ollama pull " + embedding_model_ + "`)");
  }
}

// One Ollama instance per call: the library's shared client is not safe to use
// from the scheduler's concurrent units.
EmbeddingBatch OllamaClient::get_embeddings(const std::string & /*credential*/,
                                            const std::vector<std::string> &texts) {
  Ollama server(ollama_url_);
  EmbeddingBatch batch{.embeddings = {}, .failures = 0};
  batch.embeddings.reserve(texts.size());

  for (const auto &text : texts) {
    try {
      ollama::response response = server.generate_embeddings(embedding_model_, text);
      batch.embeddings.push_back(extract_embedding(response.as_json()));
    } catch (const ollama::exception &e) {
      const std::string message = e.what();
      if (!server.is_running()) {
        throw EmbeddingError(EmbeddingErrorKind::Transport,
                             "Ollama server at " + ollama_url_ + " became unreachable: " + message);
      }
      if (!is_input_rejection(message)) {
        // Model missing, server-side failure, ...: every later item would fail the same way.
        throw EmbeddingError(EmbeddingErrorKind::Service,
                             "Embedding request to model " + embedding_model_ + " failed: " + message);
      }
      // Only this input was rejected; keep the slot so offsets stay aligned.
      std::cerr << "[OllamaClient] Warning: embedding rejected for one item: " << message
                << std::endl;
      batch.embeddings.emplace_back(dimension_, 0.0f);
      ++batch.failures;
    }
  }

  if (texts.size() > 1 && batch.failures == texts.size()) {
    throw EmbeddingError(EmbeddingErrorKind::Service,
                         "Model " + embedding_model_ + " rejected all " +
                             std::to_string(texts.size()) + " items of the batch");
  }
  return batch;
}

Embedding OllamaClient::extract_embedding(const nlohmann::json &json_response) const {
  if (!json_response.contains("embeddings")) {
    throw EmbeddingError(EmbeddingErrorKind::Service,
                         "Response does not contain embeddings field");
  }

  const auto &embeddings = json_response["embeddings"];
  if (!embeddings.is_array() || embeddings.empty()) {
    throw EmbeddingError(EmbeddingErrorKind::Service, "Embeddings field is not a non-empty array");
  }

  Embedding embedding;
  try {
    // Array of arrays - take the first embedding vector
    embedding = embeddings[0].is_array() ? embeddings[0].get<Embedding>()
                                         : embeddings.get<Embedding>();
  } catch (const nlohmann::json::exception &e) {
    throw EmbeddingError(EmbeddingErrorKind::Service,
                         "Embeddings field is malformed: " + std::string(e.what()));
  }

  if (embedding.size() != dimension_) {
    throw EmbeddingError(EmbeddingErrorKind::Service,
                         "Model " + embedding_model_ + " returned dimension " +
                             std::to_string(embedding.size()) + ", expected " +
                             std::to_string(dimension_));
  }
  return embedding;
}

bool OllamaClient::is_server_available() {
  Ollama server(ollama_url_);
  return server.is_running();
}

}  // namespace vectorlink_core
