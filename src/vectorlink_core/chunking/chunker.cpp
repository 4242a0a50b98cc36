#include "vectorlink_core/chunking/chunker.hpp"

#include <iostream>
#include <stdexcept>

namespace vectorlink_core {

Chunker::Chunker(TextItemStream &items, const Tokenizer &tokenizer, size_t token_limit)
    : items_(items), tokenizer_(tokenizer), token_limit_(token_limit) {
  if (token_limit_ == 0) {
    throw std::invalid_argument("Chunker token limit must be greater than 0.");
  }
}

std::optional<Chunk> Chunker::next() {
  if (exhausted_) {
    return std::nullopt;
  }

  while (auto item = items_.next()) {
    const size_t tokens = tokenizer_.count_tokens(*item);
    if (!pending_.empty() && pending_tokens_ + tokens > token_limit_) {
      std::vector<std::string> fresh;
      fresh.push_back(std::move(*item));
      return take_pending(std::move(fresh), tokens);
    }
    pending_.push_back(std::move(*item));
    pending_tokens_ += tokens;
  }

  exhausted_ = true;
  if (pending_.empty()) {
    return std::nullopt;
  }
  return take_pending({}, 0);
}

Chunk Chunker::take_pending(std::vector<std::string> replacement, size_t replacement_tokens) {
  Chunk chunk{.sequence = next_sequence_++,
              .token_count = pending_tokens_,
              .items = std::move(pending_)};
  pending_ = std::move(replacement);
  pending_tokens_ = replacement_tokens;

  if (verbose_) {
    std::cout << "[Chunker] collected " << chunk.items.size() << " strings ("
              << chunk.token_count << " tokens)" << std::endl;
  }
  return chunk;
}

}  // namespace vectorlink_core
