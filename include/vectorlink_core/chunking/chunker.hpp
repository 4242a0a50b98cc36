#pragma once

#include <optional>
#include <string>
#include <vector>

#include "vectorlink_core/chunking/tokenizer.hpp"
#include "vectorlink_core/source/text_item_stream.hpp"
#include "vectorlink_core/types/chunk.hpp"

namespace vectorlink_core {

/**
 * @class Chunker
 * @brief Groups an ordered stream of text items into chunks under a token budget.
 *
 * Items are never split or reordered. When the next item would push the
 * pending chunk over the budget, the pending chunk is emitted and the item
 * starts a new one. An item that exceeds the budget on its own becomes a
 * single-item chunk. Whatever is pending when the upstream runs dry is
 * emitted as the final chunk.
 */
class Chunker {
 public:
  Chunker(TextItemStream &items, const Tokenizer &tokenizer, size_t token_limit);

  Chunker(const Chunker &) = delete;
  Chunker &operator=(const Chunker &) = delete;

  // Pulls upstream until a chunk completes. std::nullopt once everything is flushed.
  std::optional<Chunk> next();

  void set_verbose(bool verbose) {
    verbose_ = verbose;
  }

 private:
  Chunk take_pending(std::vector<std::string> replacement, size_t replacement_tokens);

  TextItemStream &items_;
  const Tokenizer &tokenizer_;
  size_t token_limit_;

  std::vector<std::string> pending_;
  size_t pending_tokens_ = 0;
  size_t next_sequence_ = 0;
  bool exhausted_ = false;
  bool verbose_ = false;
};

}  // namespace vectorlink_core
