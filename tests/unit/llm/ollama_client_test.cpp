#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "ollama.hpp"
#include "vectorlink_core/errors.hpp"
#include "vectorlink_core/llm/ollama_client.hpp"

namespace vectorlink_tests {

using namespace vectorlink_core;

namespace {

constexpr const char *TEST_MODEL = "test-embedder";

// Minimal stand-in for an Ollama server: "/", "/api/tags" and "/api/embed".
class FakeOllamaServer {
 public:
  FakeOllamaServer() {
    server_.Get("/", [](const httplib::Request &, httplib::Response &res) {
      res.set_content("Ollama is running", "text/plain");
    });

    server_.Get("/api/tags", [this](const httplib::Request &, httplib::Response &res) {
      nlohmann::json models = nlohmann::json::array();
      if (model_present) {
        models.push_back(nlohmann::json{{"name", std::string(TEST_MODEL) + ":latest"}});
      }
      res.set_content(nlohmann::json{{"models", models}}.dump(), "application/json");
    });

    server_.Post("/api/embed", [this](const httplib::Request &req, httplib::Response &res) {
      const auto body = nlohmann::json::parse(req.body);
      const auto &input = body["input"];
      const std::string text =
          input.is_array() ? input[0].get<std::string>() : input.get<std::string>();
      const std::string model = body["model"].get<std::string>();

      if (!model_present || model != TEST_MODEL) {
        res.status = 404;
        res.set_content(
            nlohmann::json{{"error", "model \"" + model + "\" not found, try pulling it first"}}.dump(),
            "application/json");
        return;
      }
      if (text.rfind("REJECT", 0) == 0) {
        res.status = 400;
        res.set_content(nlohmann::json{{"error", "the input length exceeds the context length"}}.dump(),
                        "application/json");
        return;
      }

      const size_t dimension = short_vectors ? 2 : 3;
      nlohmann::json reply;
      reply["model"] = model;
      reply["embeddings"] = nlohmann::json::array({embedding_for(text, dimension)});
      res.set_content(reply.dump(), "application/json");
    });

    port_ = server_.bind_to_any_port("127.0.0.1");
    thread_ = std::thread([this]() { server_.listen_after_bind(); });
    while (!server_.is_running()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
  }

  ~FakeOllamaServer() {
    server_.stop();
    thread_.join();
  }

  std::string url() const {
    return "http://127.0.0.1:" + std::to_string(port_);
  }

  static std::vector<float> embedding_for(const std::string &text, size_t dimension = 3) {
    std::vector<float> embedding(dimension);
    for (size_t d = 0; d < dimension; ++d) {
      embedding[d] = static_cast<float>(text.size()) + 0.5f * static_cast<float>(d);
    }
    return embedding;
  }

  std::atomic<bool> model_present{true};
  std::atomic<bool> short_vectors{false};

 private:
  httplib::Server server_;
  std::thread thread_;
  int port_ = 0;
};

}  // namespace

class OllamaClientTest : public ::testing::Test {
 protected:
  FakeOllamaServer fake_;
};

TEST_F(OllamaClientTest, EmbedsEveryTextInOrder) {
  OllamaClient client(fake_.url(), TEST_MODEL, 3);

  auto batch = client.get_embeddings("ignored", {"alpha", "be", "gamma ray"});

  EXPECT_EQ(batch.failures, 0u);
  ASSERT_EQ(batch.embeddings.size(), 3u);
  EXPECT_EQ(batch.embeddings[0], FakeOllamaServer::embedding_for("alpha"));
  EXPECT_EQ(batch.embeddings[1], FakeOllamaServer::embedding_for("be"));
  EXPECT_EQ(batch.embeddings[2], FakeOllamaServer::embedding_for("gamma ray"));
}

TEST_F(OllamaClientTest, RejectedInputKeepsAZeroSlotAndIsCounted) {
  OllamaClient client(fake_.url(), TEST_MODEL, 3);

  auto batch = client.get_embeddings("ignored", {"alpha", "REJECT me", "beta"});

  EXPECT_EQ(batch.failures, 1u);
  ASSERT_EQ(batch.embeddings.size(), 3u);
  EXPECT_EQ(batch.embeddings[0], FakeOllamaServer::embedding_for("alpha"));
  EXPECT_EQ(batch.embeddings[1], (Embedding{0.0f, 0.0f, 0.0f}));
  EXPECT_EQ(batch.embeddings[2], FakeOllamaServer::embedding_for("beta"));
}

TEST_F(OllamaClientTest, SingleRejectedInputIsNotFatal) {
  OllamaClient client(fake_.url(), TEST_MODEL, 3);

  auto batch = client.get_embeddings("ignored", {"REJECT"});
  EXPECT_EQ(batch.failures, 1u);
  EXPECT_EQ(batch.embeddings.size(), 1u);
}

TEST_F(OllamaClientTest, WholeBatchRejectedIsServiceError) {
  OllamaClient client(fake_.url(), TEST_MODEL, 3);

  try {
    client.get_embeddings("ignored", {"REJECT a", "REJECT b"});
    FAIL() << "expected EmbeddingError";
  } catch (const EmbeddingError &e) {
    EXPECT_EQ(e.kind(), EmbeddingErrorKind::Service);
  }
}

TEST_F(OllamaClientTest, UnknownModelIsRejectedAtConstruction) {
  try {
    OllamaClient client(fake_.url(), "no-such-model", 3);
    FAIL() << "expected EmbeddingError";
  } catch (const EmbeddingError &e) {
    EXPECT_EQ(e.kind(), EmbeddingErrorKind::Service);
    EXPECT_NE(std::string(e.what()).find("no-such-model"), std::string::npos);
  }
}

TEST_F(OllamaClientTest, ModelErrorDuringEmbeddingIsServiceErrorNotPlaceholders) {
  OllamaClient client(fake_.url(), TEST_MODEL, 3);
  fake_.model_present = false;

  try {
    client.get_embeddings("ignored", {"alpha"});
    FAIL() << "expected EmbeddingError";
  } catch (const EmbeddingError &e) {
    EXPECT_EQ(e.kind(), EmbeddingErrorKind::Service);
  }
}

TEST_F(OllamaClientTest, WrongDimensionIsServiceError) {
  OllamaClient client(fake_.url(), TEST_MODEL, 3);
  fake_.short_vectors = true;

  EXPECT_THROW(client.get_embeddings("ignored", {"alpha"}), EmbeddingError);
}

TEST(OllamaClientConnectionTest, UnreachableServerIsTransportError) {
  // Nothing listens on the discard port
  try {
    OllamaClient client("http://127.0.0.1:9", "mxbai-embed-large", 1024);
    FAIL() << "expected EmbeddingError";
  } catch (const EmbeddingError &e) {
    EXPECT_EQ(e.kind(), EmbeddingErrorKind::Transport);
    EXPECT_STREQ(e.category(), "embedding/transport");
    EXPECT_EQ(kind_to_string(e.kind()), "transport");
  }
}

TEST(OllamaClientConnectionTest, ZeroDimensionIsRejectedBeforeConnecting) {
  EXPECT_THROW(OllamaClient("http://127.0.0.1:9", "mxbai-embed-large", 0), std::invalid_argument);
}

}  // namespace vectorlink_tests
