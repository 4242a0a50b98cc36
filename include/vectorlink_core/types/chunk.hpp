#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace vectorlink_core {

using Embedding = std::vector<float>;

// Token-bounded group of text items, the unit of one embedding request.
struct Chunk {
  size_t sequence;
  size_t token_count;
  std::vector<std::string> items;
};

// What the embedding boundary hands back for one chunk, aligned with chunk.items.
struct EmbeddingBatch {
  std::vector<Embedding> embeddings;
  size_t failures;
};

struct ChunkResult {
  size_t sequence;
  size_t item_count;
  EmbeddingBatch batch;
};

}  // namespace vectorlink_core
