#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "vectorlink_core/chunking/tokenizer.hpp"
#include "vectorlink_core/llm/embedding_client.hpp"
#include "vectorlink_core/source/text_item_stream.hpp"
#include "vectorlink_core/storage/checkpoint.hpp"
#include "vectorlink_core/storage/vector_store.hpp"

namespace vectorlink_core {

// Called after every durable batch with the new cursor and the batch length.
using ProgressUpdater = std::function<void(uint64_t cursor, size_t batch_length)>;

struct VectorizationOptions {
  size_t token_limit = 1'000'000;
  size_t concurrency = 10;
  bool verbose = false;
};

struct VectorizationResult {
  size_t failures;
  uint64_t start_cursor;
  uint64_t final_cursor;

  uint64_t records_written() const {
    return final_cursor - start_cursor;
  }
};

// Per-domain working area: <root>/.staging/<domain>/{vectors,progress}
struct StagingPaths {
  std::filesystem::path directory;
  std::filesystem::path vectors;
  std::filesystem::path progress;

  // Throws std::invalid_argument for an empty domain or one that is not a single path component.
  static StagingPaths for_domain(const std::filesystem::path &root, const std::string &domain);
};

class VectorizationService {
 public:
  VectorizationService(std::shared_ptr<EmbeddingClient> embedding_client,
                       std::shared_ptr<Tokenizer> tokenizer,
                       VectorizationOptions options);

  virtual ~VectorizationService() = default;

  /**
   * @brief Embeds every item past the checkpoint and appends the vectors to the store.
   *
   * For each chunk result, in dispatch order: write its vectors at the
   * current cursor, then advance the checkpoint by the chunk length. Any
   * error stops the run; whatever was checkpointed before it stays valid.
   *
   * @return total failures reported by the embedding client, plus the cursor range covered.
   */
  VectorizationResult vectorize_from_operations(const std::string &credential,
                                                VectorStore &store,
                                                TextItemStream &items,
                                                Checkpoint &checkpoint,
                                                const ProgressUpdater &on_progress = {});

  // Opens (creating as needed) the staging files for a domain and runs the log through it.
  VectorizationResult index_from_operations_file(const std::string &credential,
                                                 const std::filesystem::path &operations_path,
                                                 const std::filesystem::path &staging_root,
                                                 const std::string &domain,
                                                 const ProgressUpdater &on_progress = {});

 private:
  std::shared_ptr<EmbeddingClient> embedding_client_;
  std::shared_ptr<Tokenizer> tokenizer_;
  VectorizationOptions options_;
};

}  // namespace vectorlink_core
