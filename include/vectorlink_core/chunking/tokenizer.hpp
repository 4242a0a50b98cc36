#pragma once

#include <cstddef>
#include <string>

namespace vectorlink_core {

// Must return the same count for the same text on every run.
class Tokenizer {
 public:
  virtual ~Tokenizer() = default;

  virtual size_t count_tokens(const std::string &text) const = 0;
};

/**
 * @brief Estimates token counts from the number of UTF-8 code points.
 *
 * The count is capped at max_item_tokens: the embedding service truncates
 * longer inputs, so that is the number of tokens it will actually consume.
 */
class HeuristicTokenizer : public Tokenizer {
 public:
  explicit HeuristicTokenizer(size_t max_item_tokens = DEFAULT_MAX_ITEM_TOKENS);

  size_t count_tokens(const std::string &text) const override;

  static constexpr size_t DEFAULT_MAX_ITEM_TOKENS = 8191;
  static constexpr float CHAR_PER_TOKEN_ESTIMATE = 3.5f;

 private:
  size_t max_item_tokens_;
};

}  // namespace vectorlink_core
